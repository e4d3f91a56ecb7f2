// src/common/auth/include/ICertificatePasswordProvider.hpp
#pragma once
#include "common/tracing/include/ITracer.hpp"
#include <string>

namespace objfetch::auth
{
    /**
     * @brief 클라이언트 인증서 비밀번호 공급자
     */
    class ICertificatePasswordProvider
    {
    public:
        virtual ~ICertificatePasswordProvider() = default;

        /**
         * @param cert_id 인증서 식별자 (파일 경로)
         * @param password 성공 시 비밀번호 (출력)
         * @param error_message 실패 시 사유 (출력)
         * @return 성공 여부
         */
        virtual bool TryGetCertificatePassword(
            tracing::ITracer& tracer,
            const std::string& cert_id,
            std::string& password,
            std::string& error_message
        ) = 0;
    };
}
