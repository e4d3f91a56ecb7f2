// src/common/auth/src/StaticCredentialBackend.cpp
#include "common/auth/include/StaticCredentialBackend.hpp"
#include "common/utils/logger/Logger.hpp"
#include <openssl/evp.h>
#include <stdexcept>
#include <vector>

namespace objfetch::auth
{
    StaticCredentialBackend::StaticCredentialBackend(const std::string& username, const std::string& password)
        : is_anonymous_(username.empty())
        , token_(username.empty() ? std::string() : EncodeBasicToken(username, password))
    {
    }

    std::string StaticCredentialBackend::EncodeBasicToken(const std::string& username, const std::string& password)
    {
        std::string plain = username + ":" + password;

        // Base64: 4 * ceil(n / 3) + NUL
        std::vector<unsigned char> encoded(4 * ((plain.size() + 2) / 3) + 1);
        int length = EVP_EncodeBlock(
            encoded.data(),
            reinterpret_cast<const unsigned char*>(plain.data()),
            static_cast<int>(plain.size()));

        if (length < 0) {
            throw std::runtime_error("Failed to encode basic credential");
        }

        return std::string(reinterpret_cast<const char*>(encoded.data()), static_cast<size_t>(length));
    }

    bool StaticCredentialBackend::IsBackingOff() const
    {
        std::lock_guard<std::mutex> lock(mutex_);
        return revokes_since_success_ >= BACKOFF_AFTER_REVOKES;
    }

    bool StaticCredentialBackend::TryGetCredentials(
        tracing::ITracer& tracer,
        std::string& credential_string,
        std::string& error_message
    ) {
        std::lock_guard<std::mutex> lock(mutex_);

        if (is_anonymous_) {
            error_message = "No credential is configured";
            return false;
        }

        if (revokes_since_success_ >= BACKOFF_AFTER_REVOKES) {
            error_message = "Credential was rejected by the server and no replacement is available";
            tracing::EventMetadata metadata;
            metadata["RevokeCount"] = revoke_count_;
            tracer.RelatedEvent(tracing::EventLevel::WARNING, "CredentialUnavailable", metadata);
            return false;
        }

        credential_string = token_;
        return true;
    }

    void StaticCredentialBackend::ConfirmCredentialsWorked(const std::string& credential_string)
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (credential_string == token_) {
            revokes_since_success_ = 0;
        }
    }

    void StaticCredentialBackend::Revoke(const std::string& credential_string)
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (is_anonymous_ || credential_string != token_) {
            return;
        }

        ++revoke_count_;
        ++revokes_since_success_;
        LOG_WARNF("StaticCredentialBackend", "Credential revoked (count=%u, since last success=%u)",
                  revoke_count_, revokes_since_success_);
    }

    uint32_t StaticCredentialBackend::GetRevokeCount() const
    {
        std::lock_guard<std::mutex> lock(mutex_);
        return revoke_count_;
    }
}
