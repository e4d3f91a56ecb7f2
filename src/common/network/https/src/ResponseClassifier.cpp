// src/common/network/https/src/ResponseClassifier.cpp
#include "common/network/https/include/ResponseClassifier.hpp"
#include "common/network/https/include/HttpTypes.hpp"

namespace objfetch::network::https
{
    namespace
    {
        std::string StatusPrefix(int status_code)
        {
            return "Server returned error code " + std::to_string(status_code) +
                   " (" + HttpStatusToString(status_code) + ")";
        }

        Classification Make(ErrorKind kind, int status_code, bool should_retry, std::string message)
        {
            Classification classification;
            classification.should_retry = should_retry;
            classification.error.kind = kind;
            classification.error.status_code = status_code;
            classification.error.message = std::move(message);
            return classification;
        }
    }

    bool ResponseClassifier::ShouldRetry(int status_code)
    {
        return status_code == HttpStatus::REQUEST_TIMEOUT ||
               status_code == HttpStatus::UNAUTHORIZED ||
               (status_code >= 500 && status_code < 600);
    }

    bool ResponseClassifier::IsCredentialRejection(int status_code)
    {
        return status_code == HttpStatus::UNAUTHORIZED ||
               status_code == HttpStatus::BAD_REQUEST ||
               status_code == HttpStatus::REDIRECT;
    }

    bool ResponseClassifier::RequiresCredentialRevocation(int status_code, bool is_anonymous)
    {
        if (status_code == HttpStatus::UNAUTHORIZED && is_anonymous) {
            return false;
        }
        return IsCredentialRejection(status_code);
    }

    Classification ResponseClassifier::ClassifyStatus(
        int status_code,
        const std::string& server_message,
        bool is_anonymous,
        bool is_backing_off)
    {
        bool should_retry = ShouldRetry(status_code);

        if (status_code == HttpStatus::UNAUTHORIZED && is_anonymous) {
            return Make(ErrorKind::SERVER_ERROR, status_code, false,
                        "Anonymous request was rejected with a 401");
        }

        if (IsCredentialRejection(status_code)) {
            if (!is_backing_off) {
                return Make(ErrorKind::SERVER_ERROR, status_code, should_retry,
                            StatusPrefix(status_code) +
                            ". Your PAT may be expired and we are asking for a new one. Original error message from server: " +
                            server_message);
            }

            return Make(ErrorKind::SERVER_ERROR, status_code, should_retry,
                        StatusPrefix(status_code) +
                        " after successfully renewing your PAT. You may not have access to this repo. Original error message from server: " +
                        server_message);
        }

        return Make(ErrorKind::SERVER_ERROR, status_code, should_retry,
                    StatusPrefix(status_code) + ". Original error message from server: " + server_message);
    }

    Classification ResponseClassifier::ClassifyCredentialUnavailable(const std::string& error_message)
    {
        return Make(ErrorKind::AUTHENTICATION_UNAVAILABLE, HttpStatus::UNAUTHORIZED, true, error_message);
    }

    Classification ResponseClassifier::ClassifyTimeout(const std::string& uri)
    {
        return Make(ErrorKind::TIMEOUT, HttpStatus::REQUEST_TIMEOUT, true,
                    "Request to " + uri + " timed out");
    }

    Classification ResponseClassifier::ClassifyCertificateTrustFailure(const std::string& error_message)
    {
        return Make(ErrorKind::CERTIFICATE_TRUST_REJECTED, HttpStatus::UNAUTHORIZED, false, error_message);
    }

    Classification ResponseClassifier::ClassifyTransportFailure(const std::string& error_message)
    {
        return Make(ErrorKind::TRANSPORT_FAILURE, HttpStatus::INTERNAL_SERVER_ERROR, true, error_message);
    }
}
