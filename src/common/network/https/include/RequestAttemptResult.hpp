// src/common/network/https/include/RequestAttemptResult.hpp
#pragma once

#include "common/network/https/include/IHttpTransport.hpp"
#include <functional>
#include <memory>
#include <optional>
#include <string>

namespace objfetch::network::https
{
    /**
     * @brief 요청 시도 실패 종류
     *
     * 취소는 여기에 없다. 취소는 utils::OperationCanceledException 으로 전파된다.
     */
    enum class ErrorKind
    {
        AUTHENTICATION_UNAVAILABLE = 0,   // 자격 증명을 얻지 못함 (재시도 가능)
        SERVER_ERROR = 1,                 // 200 이 아닌 HTTP 응답
        TIMEOUT = 2,                      // 설정된 시간 초과 (재시도 가능)
        CERTIFICATE_TRUST_REJECTED = 3,   // TLS 인증서 신뢰 거부 (재시도 불가)
        TRANSPORT_FAILURE = 4             // 그 밖의 네트워크 실패 (재시도 가능)
    };

    inline const char* ErrorKindToString(ErrorKind kind)
    {
        switch (kind) {
            case ErrorKind::AUTHENTICATION_UNAVAILABLE: return "AuthenticationUnavailable";
            case ErrorKind::SERVER_ERROR: return "ServerError";
            case ErrorKind::TIMEOUT: return "Timeout";
            case ErrorKind::CERTIFICATE_TRUST_REJECTED: return "CertificateTrustRejected";
            case ErrorKind::TRANSPORT_FAILURE: return "TransportFailure";
            default: return "Unknown";
        }
    }

    struct AttemptError
    {
        ErrorKind kind = ErrorKind::TRANSPORT_FAILURE;
        int status_code = 0;
        std::string message;
    };

    /**
     * @brief 요청 시도 하나의 결과
     *
     * 성공 결과는 응답 본문 스트림과 스로틀 슬롯 반환 동작을 함께 소유한다.
     * Close() 가 둘을 정확히 한 번 정리하고, 호출되지 않았으면 소멸자가 정리한다.
     * 이동만 가능하다.
     */
    class RequestAttemptResult
    {
    public:
        using ReleaseAction = std::function<void()>;

    private:
        int status_code_ = 0;
        bool should_retry_ = false;
        std::optional<AttemptError> error_;
        std::string content_type_;

        std::unique_ptr<IHttpResponse> response_;
        ReleaseAction release_;
        bool closed_ = false;

        RequestAttemptResult() = default;

    public:
        ~RequestAttemptResult();

        RequestAttemptResult(RequestAttemptResult&& other) noexcept;
        RequestAttemptResult& operator=(RequestAttemptResult&& other) noexcept;
        RequestAttemptResult(const RequestAttemptResult&) = delete;
        RequestAttemptResult& operator=(const RequestAttemptResult&) = delete;

        /**
         * @brief 200 응답. release 는 Close() 에서 응답을 정리한 뒤 호출된다
         */
        static RequestAttemptResult Success(
            int status_code,
            std::string content_type,
            std::unique_ptr<IHttpResponse> response,
            ReleaseAction release
        );

        /**
         * @brief 실패 결과. 넘겨받은 응답과 release 도 Close() 에서 정리한다
         */
        static RequestAttemptResult Failure(
            AttemptError error,
            bool should_retry,
            std::unique_ptr<IHttpResponse> response = nullptr,
            ReleaseAction release = nullptr
        );

        int StatusCode() const { return status_code_; }
        bool Succeeded() const { return !error_.has_value(); }
        bool ShouldRetry() const { return should_retry_; }
        const std::optional<AttemptError>& Error() const { return error_; }
        const std::string& ContentType() const { return content_type_; }

        /**
         * @brief 성공 결과의 본문 스트림
         * @throws std::logic_error 실패 결과이거나 이미 닫힌 경우
         */
        IHttpResponse& Body();

        /**
         * @brief 응답 정리 + 슬롯 반환
         * @return 이미 닫혀 있었으면 false (아무것도 하지 않음)
         */
        bool Close();

        bool IsClosed() const { return closed_; }
    };
}
