// src/common/auth/include/StaticCredentialBackend.hpp
#pragma once
#include "ICredentialBackend.hpp"
#include <cstdint>
#include <mutex>
#include <string>

namespace objfetch::auth
{
    /**
     * @brief 설정에 주어진 사용자명/비밀번호로 동작하는 인증 백엔드
     *
     * - 사용자명이 비어 있으면 익명 모드
     * - 첫 Revoke 는 갱신으로 본다. 설정값을 다시 읽어 같은 토큰을 한 번 더 내준다
     * - 성공 없이 BACKOFF_AFTER_REVOKES 번 거절되면 backing-off 상태가 되고 토큰을 내주지 않는다
     * - ConfirmCredentialsWorked 가 오면 거절 횟수를 초기화하고 backing-off 해제
     *
     * 저장소 영속화는 하지 않는다.
     */
    class StaticCredentialBackend : public ICredentialBackend
    {
    private:
        const bool is_anonymous_;
        const std::string token_;

        mutable std::mutex mutex_;
        uint32_t revokes_since_success_ = 0;
        uint32_t revoke_count_ = 0;

    public:
        static constexpr uint32_t BACKOFF_AFTER_REVOKES = 2;

        StaticCredentialBackend(const std::string& username, const std::string& password);

        static StaticCredentialBackend Anonymous() { return StaticCredentialBackend("", ""); }

        /**
         * @brief "user:password" 를 Base64 인코딩한 Basic 토큰 생성
         */
        static std::string EncodeBasicToken(const std::string& username, const std::string& password);

        bool IsAnonymous() const override { return is_anonymous_; }
        bool IsBackingOff() const override;

        bool TryGetCredentials(
            tracing::ITracer& tracer,
            std::string& credential_string,
            std::string& error_message
        ) override;

        void ConfirmCredentialsWorked(const std::string& credential_string) override;
        void Revoke(const std::string& credential_string) override;

        uint32_t GetRevokeCount() const;

        StaticCredentialBackend(const StaticCredentialBackend&) = delete;
        StaticCredentialBackend& operator=(const StaticCredentialBackend&) = delete;
    };
}
