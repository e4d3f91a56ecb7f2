// src/common/network/tls/src/TlsContext.cpp
#include "common/network/tls/include/TlsContext.hpp"
#include "common/utils/logger/Logger.hpp"
#include <openssl/x509v3.h>

namespace objfetch::network::tls
{
    // ========================================
    // TlsConfig 구현
    // ========================================

    TlsConfig TlsConfig::CreateSecureClientConfig(bool verify_peer)
    {
        TlsConfig config;
        config.min_version = TlsVersion::TLS_1_2;
        config.verify_peer = verify_peer;
        config.cipher_list = CipherSuites::STRONG_TLS_1_2;
        config.cipher_suites = CipherSuites::STRONG_TLS_1_3;
        return config;
    }

    // ========================================
    // TlsContext 구현
    // ========================================

    TlsContext::~TlsContext()
    {
        if (ctx) {
            SSL_CTX_free(ctx);
            ctx = nullptr;
        }
    }

    TlsContext::TlsContext(TlsContext&& other) noexcept
        : ctx(other.ctx)
        , config(std::move(other.config))
        , is_initialized(other.is_initialized)
        , has_certificate(other.has_certificate)
    {
        other.ctx = nullptr;
        other.is_initialized = false;
        other.has_certificate = false;
    }

    TlsContext& TlsContext::operator=(TlsContext&& other) noexcept
    {
        if (this != &other) {
            if (ctx) {
                SSL_CTX_free(ctx);
            }

            ctx = other.ctx;
            config = std::move(other.config);
            is_initialized = other.is_initialized;
            has_certificate = other.has_certificate;

            other.ctx = nullptr;
            other.is_initialized = false;
            other.has_certificate = false;
        }
        return *this;
    }

    bool TlsContext::Initialize(const TlsConfig& cfg)
    {
        if (is_initialized) {
            LOG_ERROR("TLS", "Already initialized");
            return false;
        }

        config = cfg;

        ctx = SSL_CTX_new(TLS_client_method());
        if (!ctx) {
            LOG_ERRORF("TLS", "Failed to create client context: %s", GetLastError().c_str());
            return false;
        }

        if (!SetTlsVersion() || !SetCipherList() || !ConfigureVerification()) {
            SSL_CTX_free(ctx);
            ctx = nullptr;
            return false;
        }

        is_initialized = true;
        return true;
    }

    bool TlsContext::UseClientCertificate(const ClientCertificate& certificate)
    {
        if (!is_initialized) {
            LOG_ERROR("TLS", "Context not initialized");
            return false;
        }

        if (!certificate.GetPrivateKey()) {
            LOG_ERRORF("TLS", "Client certificate has no private key: %s",
                       certificate.GetSubject().c_str());
            return false;
        }

        if (SSL_CTX_use_certificate(ctx, certificate.GetCertificate()) != 1) {
            LOG_ERRORF("TLS", "Failed to use certificate: %s", GetLastError().c_str());
            return false;
        }

        if (SSL_CTX_use_PrivateKey(ctx, certificate.GetPrivateKey()) != 1) {
            LOG_ERRORF("TLS", "Failed to use private key: %s", GetLastError().c_str());
            return false;
        }

        // 키-인증서 매칭 확인
        if (!SSL_CTX_check_private_key(ctx)) {
            LOG_ERROR("TLS", "Private key does not match certificate");
            return false;
        }

        STACK_OF(X509)* chain = certificate.GetChain();
        if (chain) {
            // SSL_CTX_set1_chain 은 참조를 올리므로 소유권은 그대로
            if (SSL_CTX_set1_chain(ctx, chain) != 1) {
                LOG_WARNF("TLS", "Failed to attach certificate chain: %s", GetLastError().c_str());
            }
        }

        has_certificate = true;
        LOG_INFOF("TLS", "Client certificate configured: %s", certificate.GetSubject().c_str());
        return true;
    }

    std::string TlsContext::GetLastError()
    {
        char buf[256];
        ERR_error_string_n(ERR_get_error(), buf, sizeof(buf));
        return std::string(buf);
    }

    void TlsContext::GlobalInit()
    {
        OPENSSL_init_ssl(OPENSSL_INIT_LOAD_SSL_STRINGS | OPENSSL_INIT_LOAD_CRYPTO_STRINGS, nullptr);
    }

    bool TlsContext::SetCipherList()
    {
        if (!config.cipher_list.empty()) {
            if (SSL_CTX_set_cipher_list(ctx, config.cipher_list.c_str()) != 1) {
                LOG_ERRORF("TLS", "Failed to set cipher list: %s", GetLastError().c_str());
                return false;
            }
        }

        if (!config.cipher_suites.empty()) {
            if (SSL_CTX_set_ciphersuites(ctx, config.cipher_suites.c_str()) != 1) {
                LOG_ERRORF("TLS", "Failed to set cipher suites: %s", GetLastError().c_str());
                return false;
            }
        }

        return true;
    }

    bool TlsContext::SetTlsVersion()
    {
        int min_version = (config.min_version == TlsVersion::TLS_1_3)
                          ? TLS1_3_VERSION : TLS1_2_VERSION;

        if (SSL_CTX_set_min_proto_version(ctx, min_version) != 1) {
            LOG_ERRORF("TLS", "Failed to set min TLS version: %s", GetLastError().c_str());
            return false;
        }
        return true;
    }

    bool TlsContext::ConfigureVerification()
    {
        if (!config.verify_peer) {
            LOG_WARN("TLS", "Server certificate verification is disabled");
            SSL_CTX_set_verify(ctx, SSL_VERIFY_NONE, nullptr);
            return true;
        }

        if (SSL_CTX_set_default_verify_paths(ctx) != 1) {
            LOG_ERRORF("TLS", "Failed to load default trust store: %s", GetLastError().c_str());
            return false;
        }

        SSL_CTX_set_verify(ctx, SSL_VERIFY_PEER, VerifyCallback);
        SSL_CTX_set_verify_depth(ctx, config.verify_depth);
        return true;
    }

    int TlsContext::VerifyCallback(int preverify_ok, X509_STORE_CTX* store_ctx)
    {
        if (!preverify_ok) {
            char buf[256] = {0};
            X509* err_cert = X509_STORE_CTX_get_current_cert(store_ctx);
            int err = X509_STORE_CTX_get_error(store_ctx);
            int depth = X509_STORE_CTX_get_error_depth(store_ctx);

            if (err_cert) {
                X509_NAME_oneline(X509_get_subject_name(err_cert), buf, sizeof(buf));
            }

            LOG_WARNF("TLS", "Certificate verification failed: subject=%s error=%s depth=%d",
                      buf, X509_verify_cert_error_string(err), depth);
        }

        return preverify_ok;
    }

} // namespace objfetch::network::tls
