// src/common/network/https/src/RequestAttemptResult.cpp
#include "common/network/https/include/RequestAttemptResult.hpp"
#include "common/utils/logger/Logger.hpp"
#include <stdexcept>

namespace objfetch::network::https
{
    RequestAttemptResult::~RequestAttemptResult()
    {
        if (!closed_) {
            Close();
        }
    }

    RequestAttemptResult::RequestAttemptResult(RequestAttemptResult&& other) noexcept
        : status_code_(other.status_code_)
        , should_retry_(other.should_retry_)
        , error_(std::move(other.error_))
        , content_type_(std::move(other.content_type_))
        , response_(std::move(other.response_))
        , release_(std::move(other.release_))
        , closed_(other.closed_)
    {
        other.release_ = nullptr;
        other.closed_ = true;
    }

    RequestAttemptResult& RequestAttemptResult::operator=(RequestAttemptResult&& other) noexcept
    {
        if (this != &other) {
            if (!closed_) {
                Close();
            }

            status_code_ = other.status_code_;
            should_retry_ = other.should_retry_;
            error_ = std::move(other.error_);
            content_type_ = std::move(other.content_type_);
            response_ = std::move(other.response_);
            release_ = std::move(other.release_);
            closed_ = other.closed_;

            other.release_ = nullptr;
            other.closed_ = true;
        }
        return *this;
    }

    RequestAttemptResult RequestAttemptResult::Success(
        int status_code,
        std::string content_type,
        std::unique_ptr<IHttpResponse> response,
        ReleaseAction release)
    {
        RequestAttemptResult result;
        result.status_code_ = status_code;
        result.should_retry_ = false;
        result.content_type_ = std::move(content_type);
        result.response_ = std::move(response);
        result.release_ = std::move(release);
        return result;
    }

    RequestAttemptResult RequestAttemptResult::Failure(
        AttemptError error,
        bool should_retry,
        std::unique_ptr<IHttpResponse> response,
        ReleaseAction release)
    {
        RequestAttemptResult result;
        result.status_code_ = error.status_code;
        result.should_retry_ = should_retry;
        result.error_ = std::move(error);
        result.response_ = std::move(response);
        result.release_ = std::move(release);
        return result;
    }

    IHttpResponse& RequestAttemptResult::Body()
    {
        if (error_) {
            throw std::logic_error("Failed request attempt has no body");
        }
        if (closed_ || !response_) {
            throw std::logic_error("Request attempt result is already closed");
        }
        return *response_;
    }

    bool RequestAttemptResult::Close()
    {
        if (closed_) {
            LOG_DEBUG("RequestAttemptResult", "Close called on an already closed result");
            return false;
        }
        closed_ = true;

        response_.reset();

        ReleaseAction release = std::move(release_);
        release_ = nullptr;
        if (release) {
            release();
        }
        return true;
    }
}
