// src/common/network/https/src/HttpRequestor.cpp
#include "common/network/https/include/HttpRequestor.hpp"
#include "common/network/https/include/BeastHttpTransport.hpp"
#include "common/network/https/include/ProductInfo.hpp"
#include "common/network/https/include/TransportException.hpp"
#include "common/utils/logger/Logger.hpp"
#include <chrono>
#include <cstdio>
#include <stdexcept>

namespace objfetch::network::https
{
    using std::chrono::steady_clock;

    namespace
    {
        constexpr const char* FED_AUTH_REDIRECT_SUPPRESS = "Suppress";
        constexpr const char* JSON_CONTENT_TYPE = "application/json; charset=utf-8";

        double ElapsedMs(steady_clock::time_point start)
        {
            return std::chrono::duration<double, std::milli>(steady_clock::now() - start).count();
        }

        std::string FormatMs(double ms)
        {
            char buf[64];
            std::snprintf(buf, sizeof(buf), "%.4f", ms);
            return std::string(buf);
        }
    }

    HttpRequestor::HttpRequestor(
        tracing::ITracer& tracer,
        const RetryConfig& retry_config,
        auth::ICredentialBackend& credentials,
        ConnectionThrottle& throttle,
        const tls::SslSettings& ssl_settings,
        auth::ICertificatePasswordProvider& password_provider,
        tls::CertificateLoader::StoreFactory store_factory)
        : tracer_(tracer)
        , retry_config_(retry_config)
        , credentials_(credentials)
        , throttle_(throttle)
        , user_agent_(ProductInfo::Current().ToUserAgent())
    {
        tls_context_ = std::make_unique<tls::TlsContext>();
        if (!tls_context_->Initialize(tls::TlsConfig::CreateSecureClientConfig(ssl_settings.ssl_verify))) {
            throw std::runtime_error("Failed to initialize TLS context: " + tls::TlsContext::GetLastError());
        }

        if (ssl_settings.HasClientCertificate()) {
            ConfigureClientCertificate(ssl_settings, password_provider, std::move(store_factory));
        }

        transport_ = std::make_unique<BeastHttpTransport>(*tls_context_, retry_config_.timeout);

        LOG_INFOF("HttpRequestor", "Initialized (user agent: %s, timeout: %llds, ssl verify: %s, client certificate: %s)",
                  user_agent_.c_str(),
                  static_cast<long long>(retry_config_.timeout.count()),
                  ssl_settings.ssl_verify ? "on" : "off",
                  has_client_certificate_ ? "yes" : "no");
    }

    HttpRequestor::HttpRequestor(
        tracing::ITracer& tracer,
        const RetryConfig& retry_config,
        auth::ICredentialBackend& credentials,
        ConnectionThrottle& throttle,
        std::unique_ptr<IHttpTransport> transport)
        : tracer_(tracer)
        , retry_config_(retry_config)
        , credentials_(credentials)
        , throttle_(throttle)
        , user_agent_(ProductInfo::Current().ToUserAgent())
        , transport_(std::move(transport))
    {
        if (!transport_) {
            throw std::invalid_argument("Transport cannot be null");
        }
    }

    int64_t HttpRequestor::GetNewRequestId()
    {
        return ++request_count_;
    }

    void HttpRequestor::ConfigureClientCertificate(
        const tls::SslSettings& ssl_settings,
        auth::ICertificatePasswordProvider& password_provider,
        tls::CertificateLoader::StoreFactory store_factory)
    {
        if (!store_factory) {
            store_factory = tls::CertificateLoader::DirectoryStoreFactory(ssl_settings.certificate_store_path);
        }
        certificate_loader_ = std::make_unique<tls::CertificateLoader>(tracer_, std::move(store_factory));

        const std::string& cert_id = ssl_settings.ssl_certificate;
        auto password_source = [&]() -> std::optional<std::string> {
            if (!ssl_settings.ssl_cert_password_protected) {
                return std::nullopt;
            }

            std::string password;
            std::string error_message;
            if (password_provider.TryGetCertificatePassword(tracer_, cert_id, password, error_message)) {
                return password;
            }

            LOG_WARNF("HttpRequestor", "Could not get password for certificate %s: %s",
                      cert_id.c_str(), error_message.c_str());
            return std::nullopt;
        };

        // 서버 인증서를 검증하는 설정이면 클라이언트 인증서도 유효한 것만 사용
        std::optional<tls::ClientCertificate> certificate =
            certificate_loader_->Resolve(cert_id, password_source, ssl_settings.ssl_verify);

        if (certificate) {
            has_client_certificate_ = tls_context_->UseClientCertificate(*certificate);
        }
    }

    HttpRequest HttpRequestor::BuildRequest(
        const Uri& uri,
        HttpMethod method,
        const std::optional<std::string>& body,
        const std::string& auth_string,
        const std::string& accept_type) const
    {
        HttpRequest request;
        request.method = method;
        request.uri = uri;

        // 인증 실패 시 대화형 로그인 페이지로 리다이렉트하지 말고 401 을 돌려달라는 요청
        request.headers[HeaderNames::FED_AUTH_REDIRECT] = FED_AUTH_REDIRECT_SUPPRESS;
        request.headers[HeaderNames::USER_AGENT] = user_agent_;

        if (!auth_string.empty()) {
            request.headers[HeaderNames::AUTHORIZATION] = "Basic " + auth_string;
        }

        if (!accept_type.empty()) {
            request.headers[HeaderNames::ACCEPT] = accept_type;
        }

        if (body) {
            request.headers[HeaderNames::CONTENT_TYPE] = JSON_CONTENT_TYPE;
            request.body = *body;
        }

        return request;
    }

    RequestAttemptResult HttpRequestor::SendRequest(
        int64_t request_id,
        const Uri& uri,
        HttpMethod method,
        const std::optional<std::string>& body,
        const utils::CancellationToken& cancellation_token,
        const std::string& accept_type)
    {
        const bool is_anonymous = credentials_.IsAnonymous();

        std::string auth_string;
        std::string error_message;
        if (!is_anonymous && !credentials_.TryGetCredentials(tracer_, auth_string, error_message)) {
            LOG_WARNF("HttpRequestor", "Request %lld not sent, credentials unavailable: %s",
                      static_cast<long long>(request_id), error_message.c_str());
            Classification classification = ResponseClassifier::ClassifyCredentialUnavailable(error_message);
            return RequestAttemptResult::Failure(std::move(classification.error), classification.should_retry);
        }

        HttpRequest request = BuildRequest(uri, method, body, auth_string, accept_type);

        tracing::EventMetadata response_metadata;
        response_metadata["RequestId"] = request_id;
        response_metadata["availableConnections"] = throttle_.AvailableCount();

        auto wait_start = steady_clock::now();
        throttle_.Acquire(cancellation_token);
        double connection_wait_ms = ElapsedMs(wait_start);
        double response_wait_ms = 0.0;

        std::optional<RequestAttemptResult> result;
        try {
            result.emplace(ExecuteAttempt(request, is_anonymous, auth_string, cancellation_token,
                                          response_metadata, response_wait_ms));
        } catch (...) {
            // 결과가 만들어지지 않았으므로 슬롯 반환은 여기서 한다. 응답은 이미 해제됨
            // 텔레메트리가 던져도 슬롯은 돌려줘야 하므로 반환이 먼저
            throttle_.Release();
            EmitNetworkResponse(response_metadata, connection_wait_ms, response_wait_ms);
            throw;
        }

        EmitNetworkResponse(response_metadata, connection_wait_ms, response_wait_ms);
        return std::move(*result);
    }

    RequestAttemptResult HttpRequestor::ExecuteAttempt(
        const HttpRequest& request,
        bool is_anonymous,
        const std::string& auth_string,
        const utils::CancellationToken& cancellation_token,
        tracing::EventMetadata& response_metadata,
        double& response_wait_ms)
    {
        std::unique_ptr<IHttpResponse> response;

        auto send_start = steady_clock::now();
        try {
            response = transport_->Send(request, cancellation_token);
            response_wait_ms = ElapsedMs(send_start);
        } catch (const RequestAbortedException& e) {
            response_wait_ms = ElapsedMs(send_start);
            response_metadata["FailedStage"] = TransportStageToString(e.GetStage());

            // 실제 취소였으면 취소로 전파, 아니면 타임아웃
            cancellation_token.ThrowIfCancellationRequested();
            return CloseFailure(ResponseClassifier::ClassifyTimeout(request.uri.ToString()), nullptr);
        } catch (const utils::OperationCanceledException&) {
            response_wait_ms = ElapsedMs(send_start);
            cancellation_token.ThrowIfCancellationRequested();
            return CloseFailure(ResponseClassifier::ClassifyTimeout(request.uri.ToString()), nullptr);
        } catch (const CertificateTrustException& e) {
            response_wait_ms = ElapsedMs(send_start);
            response_metadata["FailedStage"] = TransportStageToString(e.GetStage());
            LOG_ERRORF("HttpRequestor", "Certificate rejected for %s: %s", request.uri.ToString().c_str(), e.what());
            return CloseFailure(ResponseClassifier::ClassifyCertificateTrustFailure(e.what()), nullptr);
        } catch (const TransportException& e) {
            response_wait_ms = ElapsedMs(send_start);
            response_metadata["FailedStage"] = TransportStageToString(e.GetStage());
            LOG_WARNF("HttpRequestor", "Transport failure for %s: %s", request.uri.ToString().c_str(), e.what());
            return CloseFailure(ResponseClassifier::ClassifyTransportFailure(e.what()), nullptr);
        }

        if (!response) {
            throw std::logic_error("Transport returned no response");
        }

        const int status_code = response->StatusCode();
        response_metadata["CacheName"] = response->GetHeader(HeaderNames::CACHE_NAME);
        response_metadata["StatusCode"] = status_code;

        if (status_code == HttpStatus::OK) {
            std::string content_type = response->GetHeader(HeaderNames::CONTENT_TYPE);
            response_metadata["ContentType"] = content_type;

            credentials_.ConfirmCredentialsWorked(auth_string);

            return RequestAttemptResult::Success(
                status_code,
                std::move(content_type),
                std::move(response),
                [&throttle = throttle_]() { throttle.Release(); }
            );
        }

        std::string server_message;
        try {
            server_message = response->ReadAllAsString();
        } catch (const TransportException& e) {
            cancellation_token.ThrowIfCancellationRequested();
            server_message = std::string("<failed to read response body: ") + e.what() + ">";
        }

        // Revoke 가 백엔드 상태를 바꾸므로 IsBackingOff 는 그 다음에 읽는다
        if (ResponseClassifier::RequiresCredentialRevocation(status_code, is_anonymous)) {
            credentials_.Revoke(auth_string);
        }

        Classification classification = ResponseClassifier::ClassifyStatus(
            status_code, server_message, is_anonymous, credentials_.IsBackingOff());

        LOG_DEBUGF("HttpRequestor", "%s returned %d (retry: %s)",
                   request.uri.ToString().c_str(), status_code, classification.should_retry ? "yes" : "no");

        return CloseFailure(std::move(classification), std::move(response));
    }

    RequestAttemptResult HttpRequestor::CloseFailure(Classification classification, std::unique_ptr<IHttpResponse> response)
    {
        RequestAttemptResult result = RequestAttemptResult::Failure(
            std::move(classification.error),
            classification.should_retry,
            std::move(response),
            [&throttle = throttle_]() { throttle.Release(); }
        );
        result.Close();
        return result;
    }

    void HttpRequestor::EmitNetworkResponse(
        tracing::EventMetadata& response_metadata,
        double connection_wait_ms,
        double response_wait_ms)
    {
        response_metadata["connectionWaitTimeMS"] = FormatMs(connection_wait_ms);
        response_metadata["responseWaitTimeMS"] = FormatMs(response_wait_ms);

        tracer_.RelatedEvent(tracing::EventLevel::INFORMATIONAL, "NetworkResponse", response_metadata);
    }

} // namespace objfetch::network::https
