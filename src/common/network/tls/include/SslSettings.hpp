// src/common/network/tls/include/SslSettings.hpp
#pragma once

#include "common/env/EnvConfig.hpp"
#include <string>

namespace objfetch::network::tls
{
    /**
     * @brief 요청 실행기가 사용하는 TLS 관련 설정
     */
    struct SslSettings
    {
        // false 면 서버 인증서를 검증하지 않는다
        bool ssl_verify = true;

        // 클라이언트 인증서 식별자 (파일 경로 또는 저장소 주체 이름). 비어 있으면 사용 안 함
        std::string ssl_certificate;

        // 인증서 비밀번호를 git credential helper 에서 가져와야 하는지
        bool ssl_cert_password_protected = false;

        // 사용자 인증서 저장소 디렉토리
        std::string certificate_store_path;

        bool HasClientCertificate() const { return !ssl_certificate.empty(); }

        static SslSettings FromConfig(const env::EnvConfig& config);

        /**
         * @brief $XDG_DATA_HOME/objfetch/certs, 없으면 ~/.local/share/objfetch/certs
         */
        static std::string DefaultCertificateStorePath();
    };
}
