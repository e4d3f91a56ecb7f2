// src/common/network/tls/include/TlsContext.hpp
#pragma once

#include "common/network/tls/include/ClientCertificate.hpp"
#include <openssl/ssl.h>
#include <openssl/err.h>
#include <string>

namespace objfetch::network::tls
{
    /**
     * @brief TLS 최소 버전
     */
    enum class TlsVersion
    {
        TLS_1_2 = 0,
        TLS_1_3 = 1
    };

    /**
     * @brief 클라이언트 TLS 설정
     */
    struct TlsConfig
    {
        TlsVersion min_version = TlsVersion::TLS_1_2;

        // 서버 인증서 검증 여부 (false 면 어떤 서버 인증서든 수락)
        bool verify_peer = true;

        // 암호화 스위트 (비어있으면 OpenSSL 기본값 사용)
        std::string cipher_list;
        std::string cipher_suites;

        int verify_depth = 10;

        static TlsConfig CreateSecureClientConfig(bool verify_peer = true);
    };

    /**
     * @brief 클라이언트 TLS Context 래퍼
     *
     * OpenSSL SSL_CTX를 RAII 방식으로 관리한다.
     * 신뢰 저장소는 시스템 기본 경로를 사용하고, 클라이언트 인증서는 선택적으로 붙인다.
     */
    class TlsContext
    {
    private:
        SSL_CTX* ctx = nullptr;
        TlsConfig config;
        bool is_initialized = false;
        bool has_certificate = false;

    public:
        TlsContext() = default;
        ~TlsContext();

        TlsContext(const TlsContext&) = delete;
        TlsContext& operator=(const TlsContext&) = delete;
        TlsContext(TlsContext&& other) noexcept;
        TlsContext& operator=(TlsContext&& other) noexcept;

        /**
         * @brief TLS Context 초기화
         */
        bool Initialize(const TlsConfig& config);

        /**
         * @brief 상호 TLS 용 클라이언트 인증서 설정
         *
         * 인증서, 개인키, 체인을 모두 context 에 등록하고 키-인증서 매칭을 확인한다.
         */
        bool UseClientCertificate(const ClientCertificate& certificate);

        bool IsInitialized() const { return is_initialized; }
        bool HasCertificate() const { return has_certificate; }
        bool VerifiesPeer() const { return config.verify_peer; }
        SSL_CTX* GetContext() const { return ctx; }
        const TlsConfig& GetConfig() const { return config; }

        static std::string GetLastError();

        /**
         * @brief 프로세스 시작 시 한 번 호출
         */
        static void GlobalInit();

    private:
        bool SetCipherList();
        bool SetTlsVersion();
        bool ConfigureVerification();

        static int VerifyCallback(int preverify_ok, X509_STORE_CTX* ctx);
    };

    namespace CipherSuites
    {
        constexpr const char* STRONG_TLS_1_2 =
            "ECDHE-ECDSA-AES256-GCM-SHA384:"
            "ECDHE-RSA-AES256-GCM-SHA384:"
            "ECDHE-ECDSA-AES128-GCM-SHA256:"
            "ECDHE-RSA-AES128-GCM-SHA256";

        constexpr const char* STRONG_TLS_1_3 =
            "TLS_AES_256_GCM_SHA384:"
            "TLS_AES_128_GCM_SHA256:"
            "TLS_CHACHA20_POLY1305_SHA256";
    }

} // namespace objfetch::network::tls
