// src/common/network/https/src/RetryConfig.cpp
#include "common/network/https/include/RetryConfig.hpp"
#include <stdexcept>

namespace objfetch::network::https
{
    RetryConfig RetryConfig::FromConfig(const env::EnvConfig& config)
    {
        RetryConfig retry_config;
        retry_config.max_retries = config.GetUInt32Or(env::Keys::HTTP_MAX_RETRIES, DEFAULT_MAX_RETRIES);

        uint32_t timeout_seconds = config.GetUInt32Or(env::Keys::HTTP_TIMEOUT_SECONDS, DEFAULT_TIMEOUT_SECONDS);
        if (timeout_seconds == 0) {
            throw std::runtime_error(std::string("Invalid value for key '") + env::Keys::HTTP_TIMEOUT_SECONDS + "': must be positive");
        }
        retry_config.timeout = std::chrono::seconds(timeout_seconds);

        return retry_config;
    }
}
