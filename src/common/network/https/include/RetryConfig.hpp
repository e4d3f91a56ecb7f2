// src/common/network/https/include/RetryConfig.hpp
#pragma once

#include "common/env/EnvConfig.hpp"
#include <chrono>
#include <cstdint>

namespace objfetch::network::https
{
    /**
     * @brief 재시도 루프와 전송 타임아웃 설정
     *
     * max_retries 는 재시도 루프(호출자)가 사용하고, timeout 은 요청 하나의 전체 제한 시간이다.
     */
    struct RetryConfig
    {
        static constexpr uint32_t DEFAULT_MAX_RETRIES = 6;
        static constexpr uint32_t DEFAULT_TIMEOUT_SECONDS = 600;

        uint32_t max_retries = DEFAULT_MAX_RETRIES;
        std::chrono::seconds timeout{DEFAULT_TIMEOUT_SECONDS};

        static RetryConfig FromConfig(const env::EnvConfig& config);
    };
}
