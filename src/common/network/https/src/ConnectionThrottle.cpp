// src/common/network/https/src/ConnectionThrottle.cpp
#include "common/network/https/include/ConnectionThrottle.hpp"
#include "common/utils/logger/Logger.hpp"
#include <stdexcept>
#include <thread>

namespace objfetch::network::https
{
    ConnectionThrottle::ConnectionThrottle(size_t capacity)
        : capacity_(capacity)
        , available_(capacity)
    {
        if (capacity == 0) {
            throw std::invalid_argument("ConnectionThrottle capacity must be greater than 0");
        }
    }

    size_t ConnectionThrottle::DefaultCapacity()
    {
        unsigned int processors = std::thread::hardware_concurrency();
        return processors == 0 ? 1 : static_cast<size_t>(processors);
    }

    void ConnectionThrottle::Acquire(const utils::CancellationToken& token)
    {
        token.ThrowIfCancellationRequested();

        // 등록은 mutex_ 밖에서 해야 한다 (이미 취소된 경우 콜백이 즉시 실행됨)
        utils::CancellationRegistration registration = token.Register([this]() {
            std::lock_guard<std::mutex> lock(mutex_);
            cv_.notify_all();
        });

        {
            std::unique_lock<std::mutex> lock(mutex_);
            cv_.wait(lock, [this, &token]() {
                return available_ > 0 || token.IsCancellationRequested();
            });

            if (!token.IsCancellationRequested()) {
                --available_;
                return;
            }
        }

        throw utils::OperationCanceledException();
    }

    bool ConnectionThrottle::TryAcquire()
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (available_ == 0) {
            return false;
        }
        --available_;
        return true;
    }

    void ConnectionThrottle::Release()
    {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            if (available_ >= capacity_) {
                LOG_WARN("ConnectionThrottle", "Release without matching acquire ignored");
                return;
            }
            ++available_;
        }
        cv_.notify_all();
    }

    size_t ConnectionThrottle::AvailableCount() const
    {
        std::lock_guard<std::mutex> lock(mutex_);
        return available_;
    }

} // namespace objfetch::network::https
