// src/common/network/https/include/ConnectionThrottle.hpp
#pragma once

#include "common/utils/threading/CancellationToken.hpp"
#include <condition_variable>
#include <cstddef>
#include <mutex>

namespace objfetch::network::https
{
    /**
     * @brief 동시 HTTP 요청 수 제한 (카운팅 게이트)
     *
     * 프로세스 시작 시 한 번 생성하여 모든 HttpRequestor에 참조로 전달한다.
     * 논리 클라이언트 수와 무관하게 원격 서버로 나가는 전체 연결 수를 묶어 둔다.
     */
    class ConnectionThrottle
    {
    private:
        const size_t capacity_;
        size_t available_;
        mutable std::mutex mutex_;
        std::condition_variable cv_;

    public:
        /**
         * @param capacity 최대 동시 요청 수 (0이면 std::invalid_argument)
         */
        explicit ConnectionThrottle(size_t capacity);
        ~ConnectionThrottle() = default;

        ConnectionThrottle(const ConnectionThrottle&) = delete;
        ConnectionThrottle& operator=(const ConnectionThrottle&) = delete;
        ConnectionThrottle(ConnectionThrottle&&) = delete;
        ConnectionThrottle& operator=(ConnectionThrottle&&) = delete;

        /**
         * @brief 프로세서 수 기반 기본 용량 (최소 1)
         */
        static size_t DefaultCapacity();

        /**
         * @brief 슬롯 획득 (빈 슬롯이 생기거나 취소될 때까지 대기)
         *
         * @throws utils::OperationCanceledException 슬롯을 얻기 전에 취소된 경우.
         *         이때 슬롯은 점유하지 않는다.
         */
        void Acquire(const utils::CancellationToken& token);

        /**
         * @brief 슬롯을 즉시 얻을 수 있을 때만 획득
         */
        bool TryAcquire();

        /**
         * @brief 슬롯 반환. 대기하거나 실패하지 않는다.
         */
        void Release();

        size_t AvailableCount() const;
        size_t Capacity() const { return capacity_; }
    };

} // namespace objfetch::network::https
