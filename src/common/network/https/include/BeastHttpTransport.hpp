// src/common/network/https/include/BeastHttpTransport.hpp
#pragma once

#include "common/network/https/include/IHttpTransport.hpp"
#include "common/network/tls/include/TlsContext.hpp"
#include <boost/asio/ssl/context.hpp>
#include <chrono>
#include <memory>

namespace objfetch::network::https
{
    /**
     * @brief Boost.Beast 기반 HTTPS/1.1 전송
     *
     * 요청마다 연결을 새로 맺고, 응답 헤더까지만 읽은 뒤 연결을 응답 객체에 넘긴다.
     * 본문은 응답 객체에서 필요할 때 읽으며 응답 객체가 소멸하면 연결을 닫는다.
     *
     * - 전송 시작부터 헤더 수신까지 timeout 하나로 제한한다.
     * - 본문 읽기는 호출마다 timeout 을 새로 건다.
     * - 취소 신호가 오면 진행 중인 소켓 작업을 중단한다.
     *
     * 여러 스레드에서 동시에 Send 를 호출해도 된다.
     */
    class BeastHttpTransport : public IHttpTransport
    {
    private:
        boost::asio::ssl::context ssl_context_;
        bool verify_peer_;
        std::chrono::seconds timeout_;

    public:
        /**
         * @param tls_context 초기화된 클라이언트 TLS context (SSL_CTX 는 참조 카운트로 공유)
         * @param timeout 요청 하나의 제한 시간
         */
        BeastHttpTransport(const tls::TlsContext& tls_context, std::chrono::seconds timeout);
        ~BeastHttpTransport() override = default;

        BeastHttpTransport(const BeastHttpTransport&) = delete;
        BeastHttpTransport& operator=(const BeastHttpTransport&) = delete;

        std::unique_ptr<IHttpResponse> Send(
            const HttpRequest& request,
            const utils::CancellationToken& cancellation_token
        ) override;

        std::chrono::seconds GetTimeout() const { return timeout_; }
    };
}
