// src/common/network/tls/src/ClientCertificate.cpp
#include "common/network/tls/include/ClientCertificate.hpp"
#include <openssl/bio.h>
#include <openssl/err.h>
#include <openssl/pem.h>
#include <openssl/pkcs12.h>
#include <openssl/x509_vfy.h>
#include <algorithm>
#include <cstring>
#include <stdexcept>

namespace objfetch::network::tls
{
    namespace
    {
        struct X509StoreDeleter
        {
            void operator()(X509_STORE* store) const { X509_STORE_free(store); }
        };

        struct X509StoreCtxDeleter
        {
            void operator()(X509_STORE_CTX* ctx) const { X509_STORE_CTX_free(ctx); }
        };

        struct BioDeleter
        {
            void operator()(BIO* bio) const { BIO_free(bio); }
        };

        struct Pkcs12Deleter
        {
            void operator()(PKCS12* p12) const { PKCS12_free(p12); }
        };

        using BioPtr = std::unique_ptr<BIO, BioDeleter>;

        BioPtr NewMemoryBio(const std::string& data)
        {
            BioPtr bio(BIO_new_mem_buf(data.data(), static_cast<int>(data.size())));
            if (!bio) {
                throw CertificateParseException("Failed to create BIO: " + ClientCertificate::ConsumeOpenSslErrors());
            }
            return bio;
        }

        // 비밀번호가 없으면 터미널 프롬프트 대신 실패를 돌려준다
        int PemPasswordCallback(char* buf, int size, int /*rwflag*/, void* userdata)
        {
            const auto* password = static_cast<const std::string*>(userdata);
            if (!password || size <= 0) {
                return -1;
            }
            int length = static_cast<int>(std::min(password->size(), static_cast<size_t>(size)));
            std::memcpy(buf, password->data(), static_cast<size_t>(length));
            return length;
        }
    }

    ClientCertificate::ClientCertificate(X509Ptr certificate, EvpPkeyPtr private_key, X509StackPtr chain)
        : certificate_(std::move(certificate))
        , private_key_(std::move(private_key))
        , chain_(std::move(chain))
    {
        if (!certificate_) {
            throw std::invalid_argument("ClientCertificate requires a certificate");
        }
    }

    ClientCertificate ClientCertificate::Clone() const
    {
        X509_up_ref(certificate_.get());
        X509Ptr certificate(certificate_.get());

        EvpPkeyPtr private_key;
        if (private_key_) {
            EVP_PKEY_up_ref(private_key_.get());
            private_key.reset(private_key_.get());
        }

        X509StackPtr chain;
        if (chain_) {
            chain.reset(X509_chain_up_ref(chain_.get()));
        }

        return ClientCertificate(std::move(certificate), std::move(private_key), std::move(chain));
    }

    ClientCertificate ClientCertificate::FromPkcs12(const std::string& der, const std::optional<std::string>& password)
    {
        BioPtr bio = NewMemoryBio(der);

        std::unique_ptr<PKCS12, Pkcs12Deleter> p12(d2i_PKCS12_bio(bio.get(), nullptr));
        if (!p12) {
            throw CertificateParseException("Not a PKCS#12 bundle: " + ConsumeOpenSslErrors());
        }

        EVP_PKEY* raw_key = nullptr;
        X509* raw_cert = nullptr;
        STACK_OF(X509)* raw_chain = nullptr;
        const char* pass = password ? password->c_str() : nullptr;

        if (PKCS12_parse(p12.get(), pass, &raw_key, &raw_cert, &raw_chain) != 1) {
            throw CertificateParseException("Failed to decrypt PKCS#12 bundle: " + ConsumeOpenSslErrors());
        }

        EvpPkeyPtr private_key(raw_key);
        X509Ptr certificate(raw_cert);
        X509StackPtr chain(raw_chain);

        if (!certificate) {
            throw CertificateParseException("PKCS#12 bundle contains no certificate");
        }
        if (!private_key) {
            throw CertificateParseException("PKCS#12 bundle contains no private key");
        }
        if (chain && sk_X509_num(chain.get()) == 0) {
            chain.reset();
        }

        return ClientCertificate(std::move(certificate), std::move(private_key), std::move(chain));
    }

    ClientCertificate ClientCertificate::FromPem(const std::string& pem, const std::optional<std::string>& password)
    {
        BioPtr cert_bio = NewMemoryBio(pem);

        X509Ptr certificate(PEM_read_bio_X509(cert_bio.get(), nullptr, nullptr, nullptr));
        if (!certificate) {
            throw CertificateParseException("PEM data contains no certificate: " + ConsumeOpenSslErrors());
        }

        X509StackPtr chain;
        X509* extra = nullptr;
        while ((extra = PEM_read_bio_X509(cert_bio.get(), nullptr, nullptr, nullptr)) != nullptr) {
            if (!chain) {
                chain.reset(sk_X509_new_null());
                if (!chain) {
                    X509_free(extra);
                    throw CertificateParseException("Failed to allocate certificate chain");
                }
            }
            if (sk_X509_push(chain.get(), extra) <= 0) {
                X509_free(extra);
                throw CertificateParseException("Failed to append certificate to chain");
            }
        }
        // 마지막 PEM_read 의 "no start line" 에러 제거
        ERR_clear_error();

        BioPtr key_bio = NewMemoryBio(pem);
        const std::string* pass = password ? &*password : nullptr;
        EvpPkeyPtr private_key(PEM_read_bio_PrivateKey(key_bio.get(), nullptr, PemPasswordCallback,
                                                       const_cast<std::string*>(pass)));
        if (!private_key) {
            throw CertificateParseException("Failed to read private key: " + ConsumeOpenSslErrors());
        }

        if (X509_check_private_key(certificate.get(), private_key.get()) != 1) {
            throw CertificateParseException("Private key does not match certificate: " + ConsumeOpenSslErrors());
        }

        return ClientCertificate(std::move(certificate), std::move(private_key), std::move(chain));
    }

    ClientCertificate ClientCertificate::FromBundle(const std::string& data, const std::optional<std::string>& password)
    {
        if (data.find("-----BEGIN") != std::string::npos) {
            return FromPem(data, password);
        }
        return FromPkcs12(data, password);
    }

    std::string ClientCertificate::GetSubject() const
    {
        std::unique_ptr<BIO, BioDeleter> bio(BIO_new(BIO_s_mem()));
        if (!bio) {
            return "";
        }

        X509_NAME* subject = X509_get_subject_name(certificate_.get());
        if (X509_NAME_print_ex(bio.get(), subject, 0, XN_FLAG_RFC2253) < 0) {
            return "";
        }

        char* data = nullptr;
        long length = BIO_get_mem_data(bio.get(), &data);
        if (length <= 0 || data == nullptr) {
            return "";
        }
        return std::string(data, static_cast<size_t>(length));
    }

    bool ClientCertificate::IsWithinValidityPeriod() const
    {
        const ASN1_TIME* not_before = X509_get0_notBefore(certificate_.get());
        const ASN1_TIME* not_after = X509_get0_notAfter(certificate_.get());

        // X509_cmp_current_time: 0 이면 에러
        int before_cmp = X509_cmp_current_time(not_before);
        int after_cmp = X509_cmp_current_time(not_after);
        return before_cmp < 0 && after_cmp > 0;
    }

    bool ClientCertificate::Verify() const
    {
        std::unique_ptr<X509_STORE, X509StoreDeleter> store(X509_STORE_new());
        std::unique_ptr<X509_STORE_CTX, X509StoreCtxDeleter> ctx(X509_STORE_CTX_new());
        if (!store || !ctx) {
            ConsumeOpenSslErrors();
            return false;
        }

        if (X509_STORE_set_default_paths(store.get()) != 1) {
            ConsumeOpenSslErrors();
            return false;
        }

        if (X509_STORE_CTX_init(ctx.get(), store.get(), certificate_.get(), chain_.get()) != 1) {
            ConsumeOpenSslErrors();
            return false;
        }

        bool verified = X509_verify_cert(ctx.get()) == 1;
        ConsumeOpenSslErrors();
        return verified;
    }

    std::string ClientCertificate::ConsumeOpenSslErrors()
    {
        std::string message;
        unsigned long code = 0;
        while ((code = ERR_get_error()) != 0) {
            char buf[256];
            ERR_error_string_n(code, buf, sizeof(buf));
            message = buf;
        }
        return message;
    }
}
