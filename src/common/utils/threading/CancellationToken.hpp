// src/common/utils/threading/CancellationToken.hpp
#pragma once

#include <atomic>
#include <cstdint>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <stdexcept>
#include <utility>

namespace objfetch::utils
{
    /**
     * @brief 호출자가 요청한 취소로 작업이 중단되었을 때 발생
     *
     * 재시도 대상이 아니며 값으로 변환하지 않고 그대로 전파한다.
     */
    class OperationCanceledException : public std::runtime_error
    {
    public:
        OperationCanceledException()
            : std::runtime_error("The operation was canceled.") {}

        explicit OperationCanceledException(const std::string& msg)
            : std::runtime_error(msg) {}
    };

    namespace detail
    {
        struct CancellationState
        {
            std::atomic<bool> cancelled{false};
            std::mutex mutex;
            // 콜백 실행과 등록 해제를 직렬화
            std::mutex callback_mutex;
            std::map<uint64_t, std::function<void()>> callbacks;
            uint64_t next_id = 1;
        };
    }

    /**
     * @brief 콜백 등록 핸들 (RAII)
     *
     * 소멸 시 등록을 해제한다. 해제가 끝난 뒤에는 콜백이 실행 중이지 않음이 보장된다.
     * 콜백 안에서 자기 자신의 등록을 해제하면 안 된다.
     */
    class CancellationRegistration
    {
    private:
        std::shared_ptr<detail::CancellationState> state_;
        uint64_t id_ = 0;

    public:
        CancellationRegistration() = default;

        CancellationRegistration(std::shared_ptr<detail::CancellationState> state, uint64_t id)
            : state_(std::move(state)), id_(id) {}

        ~CancellationRegistration() { Unregister(); }

        CancellationRegistration(const CancellationRegistration&) = delete;
        CancellationRegistration& operator=(const CancellationRegistration&) = delete;

        CancellationRegistration(CancellationRegistration&& other) noexcept
            : state_(std::move(other.state_)), id_(other.id_)
        {
            other.id_ = 0;
        }

        CancellationRegistration& operator=(CancellationRegistration&& other) noexcept
        {
            if (this != &other) {
                Unregister();
                state_ = std::move(other.state_);
                id_ = other.id_;
                other.id_ = 0;
            }
            return *this;
        }

        void Unregister()
        {
            if (!state_ || id_ == 0) {
                return;
            }

            std::lock_guard<std::mutex> callback_lock(state_->callback_mutex);
            std::lock_guard<std::mutex> lock(state_->mutex);
            state_->callbacks.erase(id_);
            id_ = 0;
        }
    };

    /**
     * @brief 취소 신호 관찰용 토큰 (복사 가능, 가벼움)
     *
     * 기본 생성된 토큰은 절대 취소되지 않는다.
     */
    class CancellationToken
    {
    private:
        std::shared_ptr<detail::CancellationState> state_;

        friend class CancellationSource;
        explicit CancellationToken(std::shared_ptr<detail::CancellationState> state)
            : state_(std::move(state)) {}

    public:
        CancellationToken() = default;

        static CancellationToken None() { return CancellationToken(); }

        bool CanBeCanceled() const { return state_ != nullptr; }

        bool IsCancellationRequested() const
        {
            return state_ && state_->cancelled.load(std::memory_order_acquire);
        }

        void ThrowIfCancellationRequested() const
        {
            if (IsCancellationRequested()) {
                throw OperationCanceledException();
            }
        }

        /**
         * @brief 취소 시 실행할 콜백 등록
         *
         * 이미 취소된 상태면 호출 스레드에서 즉시 실행한다.
         * 콜백은 취소를 요청한 스레드에서 실행되므로 짧게 유지해야 한다.
         */
        CancellationRegistration Register(std::function<void()> callback) const
        {
            if (!state_) {
                return CancellationRegistration();
            }

            {
                std::lock_guard<std::mutex> lock(state_->mutex);
                if (!state_->cancelled.load(std::memory_order_acquire)) {
                    uint64_t id = state_->next_id++;
                    state_->callbacks.emplace(id, std::move(callback));
                    return CancellationRegistration(state_, id);
                }
            }

            callback();
            return CancellationRegistration();
        }
    };

    /**
     * @brief 취소 신호 발행자
     */
    class CancellationSource
    {
    private:
        std::shared_ptr<detail::CancellationState> state_;

    public:
        CancellationSource() : state_(std::make_shared<detail::CancellationState>()) {}

        CancellationSource(const CancellationSource&) = delete;
        CancellationSource& operator=(const CancellationSource&) = delete;

        CancellationToken Token() const { return CancellationToken(state_); }

        bool IsCancellationRequested() const
        {
            return state_->cancelled.load(std::memory_order_acquire);
        }

        /**
         * @brief 취소 요청 (여러 번 호출해도 콜백은 한 번만 실행)
         */
        void Cancel()
        {
            std::lock_guard<std::mutex> callback_lock(state_->callback_mutex);

            std::map<uint64_t, std::function<void()>> pending;
            {
                std::lock_guard<std::mutex> lock(state_->mutex);
                if (state_->cancelled.exchange(true, std::memory_order_acq_rel)) {
                    return;
                }
                pending.swap(state_->callbacks);
            }

            for (auto& entry : pending) {
                entry.second();
            }
        }
    };

} // namespace objfetch::utils
