// src/common/network/tls/include/ClientCertificate.hpp
#pragma once

#include <openssl/evp.h>
#include <openssl/x509.h>
#include <memory>
#include <optional>
#include <stdexcept>
#include <string>

namespace objfetch::network::tls
{
    struct X509Deleter
    {
        void operator()(X509* cert) const { X509_free(cert); }
    };

    struct EvpPkeyDeleter
    {
        void operator()(EVP_PKEY* key) const { EVP_PKEY_free(key); }
    };

    struct X509StackDeleter
    {
        void operator()(STACK_OF(X509)* chain) const { sk_X509_pop_free(chain, X509_free); }
    };

    using X509Ptr = std::unique_ptr<X509, X509Deleter>;
    using EvpPkeyPtr = std::unique_ptr<EVP_PKEY, EvpPkeyDeleter>;
    using X509StackPtr = std::unique_ptr<STACK_OF(X509), X509StackDeleter>;

    /**
     * @brief 인증서 데이터를 해석하지 못했을 때 (형식 오류, 비밀번호 불일치 등)
     */
    class CertificateParseException : public std::runtime_error
    {
    public:
        explicit CertificateParseException(const std::string& message)
            : std::runtime_error(message) {}
    };

    /**
     * @brief 클라이언트 인증서 (인증서 + 개인키 + 선택적 CA 체인)
     *
     * OpenSSL 객체를 소유한다. 복사는 Clone()으로 참조 카운트를 올려서 한다.
     */
    class ClientCertificate
    {
    private:
        X509Ptr certificate_;
        EvpPkeyPtr private_key_;
        X509StackPtr chain_;

    public:
        ClientCertificate(X509Ptr certificate, EvpPkeyPtr private_key, X509StackPtr chain = nullptr);

        ClientCertificate(ClientCertificate&&) noexcept = default;
        ClientCertificate& operator=(ClientCertificate&&) noexcept = default;
        ClientCertificate(const ClientCertificate&) = delete;
        ClientCertificate& operator=(const ClientCertificate&) = delete;

        ClientCertificate Clone() const;

        /**
         * @brief PKCS#12 (DER) 번들 해석
         * @throws CertificateParseException
         */
        static ClientCertificate FromPkcs12(const std::string& der, const std::optional<std::string>& password);

        /**
         * @brief PEM 해석 (첫 인증서 + 개인키, 나머지 인증서는 체인)
         *
         * 개인키가 암호화되어 있는데 비밀번호가 없으면 프롬프트 없이 실패한다.
         * @throws CertificateParseException
         */
        static ClientCertificate FromPem(const std::string& pem, const std::optional<std::string>& password);

        /**
         * @brief "-----BEGIN" 으로 시작하면 PEM, 아니면 PKCS#12 로 해석
         */
        static ClientCertificate FromBundle(const std::string& data, const std::optional<std::string>& password);

        X509* GetCertificate() const { return certificate_.get(); }
        EVP_PKEY* GetPrivateKey() const { return private_key_.get(); }
        STACK_OF(X509)* GetChain() const { return chain_.get(); }

        /**
         * @brief 주체 이름 (RFC2253 한 줄 표기, 예: "CN=build-agent,O=Contoso")
         */
        std::string GetSubject() const;

        /**
         * @brief 현재 시각이 유효 기간 안에 있는지
         */
        bool IsWithinValidityPeriod() const;

        /**
         * @brief 시스템 기본 신뢰 저장소 기준 체인 + 유효 기간 검증
         */
        bool Verify() const;

        /**
         * @brief OpenSSL 에러 큐를 비우면서 마지막 에러 문자열 반환
         */
        static std::string ConsumeOpenSslErrors();
    };
}
