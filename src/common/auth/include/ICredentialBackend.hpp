// src/common/auth/include/ICredentialBackend.hpp
#pragma once
#include "common/tracing/include/ITracer.hpp"
#include <string>

namespace objfetch::auth
{
    /**
     * @brief 인증 토큰 공급자 인터페이스
     *
     * 토큰은 Basic 스킴에 그대로 실리는 불투명 문자열이다.
     * 여러 요청 스레드에서 동시에 호출되므로 구현체가 내부에서 직렬화해야 한다.
     */
    class ICredentialBackend
    {
    public:
        virtual ~ICredentialBackend() = default;

        /**
         * @brief 익명 모드 여부 (토큰을 시도하지 않음)
         */
        virtual bool IsAnonymous() const = 0;

        /**
         * @brief 최근에 이미 토큰을 갱신했고 당분간 다시 갱신하지 않는 상태인지
         */
        virtual bool IsBackingOff() const = 0;

        /**
         * @brief 토큰 획득
         *
         * @param tracer 진단 이벤트 기록용
         * @param credential_string 성공 시 토큰 (출력)
         * @param error_message 실패 시 사유 (출력)
         * @return 성공 여부
         */
        virtual bool TryGetCredentials(
            tracing::ITracer& tracer,
            std::string& credential_string,
            std::string& error_message
        ) = 0;

        /**
         * @brief 토큰으로 요청이 성공했음을 알림
         */
        virtual void ConfirmCredentialsWorked(const std::string& credential_string) = 0;

        /**
         * @brief 토큰 폐기 (서버가 거부함)
         */
        virtual void Revoke(const std::string& credential_string) = 0;
    };
}
