// src/common/network/https/include/HttpRequestor.hpp
#pragma once

#include "common/auth/include/ICertificatePasswordProvider.hpp"
#include "common/auth/include/ICredentialBackend.hpp"
#include "common/network/https/include/ConnectionThrottle.hpp"
#include "common/network/https/include/HttpTypes.hpp"
#include "common/network/https/include/IHttpTransport.hpp"
#include "common/network/https/include/RequestAttemptResult.hpp"
#include "common/network/https/include/ResponseClassifier.hpp"
#include "common/network/https/include/RetryConfig.hpp"
#include "common/network/tls/include/CertificateLoader.hpp"
#include "common/network/tls/include/SslSettings.hpp"
#include "common/network/tls/include/TlsContext.hpp"
#include "common/tracing/include/ITracer.hpp"
#include "common/utils/threading/CancellationToken.hpp"
#include <atomic>
#include <cstdint>
#include <memory>
#include <optional>
#include <string>

namespace objfetch::network::https
{
    /**
     * @brief 인증 + 동시성 제한이 붙은 HTTP 요청 실행기
     *
     * SendRequest 한 번이 요청 시도 하나다. 재시도 루프는 호출자가 RequestAttemptResult::ShouldRetry()
     * 를 보고 결정한다.
     *
     * 흐름:
     *   1. 자격 증명 획득 (익명이 아니면). 실패하면 네트워크 없이 401 + 재시도 권고
     *   2. 요청 구성 (FedAuth 리다이렉트 억제, User-Agent, Basic 인증, Accept, JSON 본문)
     *   3. 스로틀 슬롯 획득 (취소 가능)
     *   4. 전송, 헤더까지 수신
     *   5. 200 이면 본문 스트림을 가진 성공 결과 반환 (슬롯은 결과를 닫을 때 반환)
     *      그 밖의 상태/전송 실패는 분류 후 슬롯을 즉시 반환한 실패 결과 반환
     *   6. NetworkResponse 텔레메트리 기록
     *
     * 취소는 값이 아니라 utils::OperationCanceledException 으로 전파된다.
     * 여러 스레드에서 동시에 SendRequest 를 호출해도 된다.
     *
     * 성공 결과는 이 객체보다 오래 살아도 된다. 결과가 참조하는 것은 ConnectionThrottle 뿐이다.
     */
    class HttpRequestor
    {
    private:
        inline static std::atomic<int64_t> request_count_{0};

        tracing::ITracer& tracer_;
        RetryConfig retry_config_;
        auth::ICredentialBackend& credentials_;
        ConnectionThrottle& throttle_;
        std::string user_agent_;

        // 저장소 핸들은 로더가 소유하고 requestor 와 함께 해제된다
        std::unique_ptr<tls::CertificateLoader> certificate_loader_;
        std::unique_ptr<tls::TlsContext> tls_context_;
        std::unique_ptr<IHttpTransport> transport_;
        bool has_client_certificate_ = false;

    public:
        /**
         * @brief TLS context, 클라이언트 인증서, Beast 전송까지 구성
         *
         * 클라이언트 인증서를 찾지 못하면 텔레메트리에 남기고 인증서 없이 진행한다.
         *
         * @param store_factory 비어 있으면 ssl_settings.certificate_store_path 디렉토리 저장소
         * @throws std::runtime_error TLS context 초기화 실패
         */
        HttpRequestor(
            tracing::ITracer& tracer,
            const RetryConfig& retry_config,
            auth::ICredentialBackend& credentials,
            ConnectionThrottle& throttle,
            const tls::SslSettings& ssl_settings,
            auth::ICertificatePasswordProvider& password_provider,
            tls::CertificateLoader::StoreFactory store_factory = nullptr
        );

        /**
         * @brief 전송 계층 주입 (테스트, 프록시 등)
         */
        HttpRequestor(
            tracing::ITracer& tracer,
            const RetryConfig& retry_config,
            auth::ICredentialBackend& credentials,
            ConnectionThrottle& throttle,
            std::unique_ptr<IHttpTransport> transport
        );

        ~HttpRequestor() = default;

        HttpRequestor(const HttpRequestor&) = delete;
        HttpRequestor& operator=(const HttpRequestor&) = delete;

        /**
         * @brief 프로세스 전체에서 단조 증가하는 요청 ID
         */
        static int64_t GetNewRequestId();

        /**
         * @brief 요청 시도 하나 실행
         *
         * @param request_id 텔레메트리 상관 ID (보통 GetNewRequestId())
         * @param body 있으면 UTF-8 JSON 본문으로 전송
         * @param accept_type 비어 있지 않으면 Accept 헤더
         * @return 결과. 성공 결과는 호출자가 Close() 해야 슬롯이 반환된다 (소멸자도 닫는다)
         * @throws utils::OperationCanceledException 취소 신호가 실제로 발생한 경우
         */
        RequestAttemptResult SendRequest(
            int64_t request_id,
            const Uri& uri,
            HttpMethod method,
            const std::optional<std::string>& body,
            const utils::CancellationToken& cancellation_token,
            const std::string& accept_type = ""
        );

        const RetryConfig& GetRetryConfig() const { return retry_config_; }
        const std::string& GetUserAgent() const { return user_agent_; }
        bool HasClientCertificate() const { return has_client_certificate_; }

    private:
        HttpRequest BuildRequest(
            const Uri& uri,
            HttpMethod method,
            const std::optional<std::string>& body,
            const std::string& auth_string,
            const std::string& accept_type
        ) const;

        /**
         * @brief 슬롯을 잡은 상태에서 전송하고 결과를 만든다
         *
         * 반환된 결과가 슬롯 반환 책임을 가진다. 예외로 빠져나가면 호출자가 반환한다.
         */
        RequestAttemptResult ExecuteAttempt(
            const HttpRequest& request,
            bool is_anonymous,
            const std::string& auth_string,
            const utils::CancellationToken& cancellation_token,
            tracing::EventMetadata& response_metadata,
            double& response_wait_ms
        );

        /**
         * @brief 슬롯 반환까지 끝낸 실패 결과
         */
        RequestAttemptResult CloseFailure(Classification classification, std::unique_ptr<IHttpResponse> response);

        void EmitNetworkResponse(
            tracing::EventMetadata& response_metadata,
            double connection_wait_ms,
            double response_wait_ms
        );

        void ConfigureClientCertificate(
            const tls::SslSettings& ssl_settings,
            auth::ICertificatePasswordProvider& password_provider,
            tls::CertificateLoader::StoreFactory store_factory
        );
    };

} // namespace objfetch::network::https
