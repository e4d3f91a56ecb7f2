// src/common/network/https/src/BeastHttpTransport.cpp
#include "common/network/https/include/BeastHttpTransport.hpp"
#include "common/network/https/include/TransportException.hpp"
#include "common/utils/logger/Logger.hpp"
#include <boost/asio/io_context.hpp>
#include <boost/asio/ip/address.hpp>
#include <boost/asio/ip/tcp.hpp>
#include <boost/asio/post.hpp>
#include <boost/beast/core.hpp>
#include <boost/beast/http.hpp>
#include <boost/beast/ssl.hpp>
#include <boost/none.hpp>
#include <openssl/err.h>
#include <openssl/ssl.h>
#include <condition_variable>
#include <memory>
#include <mutex>
#include <system_error>
#include <thread>

namespace objfetch::network::https
{
    namespace beast = boost::beast;
    namespace http = beast::http;
    namespace net = boost::asio;
    namespace ssl = boost::asio::ssl;
    using tcp = net::ip::tcp;
    using std::chrono::steady_clock;

    namespace
    {
        SSL_CTX* ShareNativeContext(const tls::TlsContext& tls_context)
        {
            SSL_CTX* ctx = tls_context.GetContext();
            if (!tls_context.IsInitialized() || !ctx) {
                throw std::invalid_argument("TLS context is not initialized");
            }

            // ssl::context 가 소유권을 가져가므로 참조를 하나 더 잡는다
            SSL_CTX_up_ref(ctx);
            return ctx;
        }

        http::verb ToVerb(HttpMethod method)
        {
            switch (method) {
                case HttpMethod::GET: return http::verb::get;
                case HttpMethod::POST: return http::verb::post;
                case HttpMethod::PUT: return http::verb::put;
                case HttpMethod::HEAD: return http::verb::head;
                case HttpMethod::DELETE_: return http::verb::delete_;
                default: return http::verb::get;
            }
        }

        bool IsIpLiteral(const std::string& host)
        {
            beast::error_code ec;
            net::ip::make_address(host, ec);
            return !ec;
        }

        bool IsCertificateTrustError(const beast::error_code& ec)
        {
            if (ec.category() != net::error::get_ssl_category()) {
                return false;
            }

            switch (ERR_GET_REASON(static_cast<unsigned long>(ec.value()))) {
                case SSL_R_CERTIFICATE_VERIFY_FAILED:
                case SSL_R_SSLV3_ALERT_BAD_CERTIFICATE:
                case SSL_R_SSLV3_ALERT_CERTIFICATE_UNKNOWN:
                case SSL_R_TLSV1_ALERT_UNKNOWN_CA:
                    return true;
                default:
                    return false;
            }
        }

        struct ResolveState
        {
            std::mutex mutex;
            std::condition_variable cv;
            bool done = false;
            beast::error_code ec;
            tcp::resolver::results_type endpoints;
        };

        /**
         * @brief deadline 까지만 기다리는 이름 해석
         *
         * getaddrinfo 는 중단할 수 없으므로 전용 스레드에서 돌리고, 시간 초과나 취소 시에는
         * 스레드를 떼어 두고 먼저 돌아온다. 결과는 공유 상태에 남았다가 스레드와 함께 정리된다.
         */
        tcp::resolver::results_type ResolveWithDeadline(
            const std::string& host,
            uint16_t port,
            steady_clock::time_point deadline,
            const utils::CancellationToken& token)
        {
            auto state = std::make_shared<ResolveState>();

            try {
                std::thread([state, host, port]() {
                    net::io_context ioc;
                    tcp::resolver resolver(ioc);
                    beast::error_code ec;
                    auto results = resolver.resolve(host, std::to_string(port), ec);

                    std::lock_guard<std::mutex> lock(state->mutex);
                    state->ec = ec;
                    state->endpoints = std::move(results);
                    state->done = true;
                    state->cv.notify_all();
                }).detach();
            } catch (const std::system_error& e) {
                throw TransportException(TransportStage::RESOLVE,
                    std::string("Failed to start name resolution: ") + e.what());
            }

            utils::CancellationRegistration wake = token.Register([state]() {
                std::lock_guard<std::mutex> lock(state->mutex);
                state->cv.notify_all();
            });

            std::unique_lock<std::mutex> lock(state->mutex);
            bool finished = state->cv.wait_until(lock, deadline, [&]() {
                return state->done || token.IsCancellationRequested();
            });

            if (token.IsCancellationRequested()) {
                throw RequestAbortedException(TransportStage::RESOLVE, "Request was canceled during Resolve");
            }
            if (!finished) {
                throw RequestAbortedException(TransportStage::RESOLVE, "Request timed out during Resolve");
            }
            if (state->ec) {
                throw TransportException(TransportStage::RESOLVE, "Resolve failed: " + state->ec.message());
            }

            return state->endpoints;
        }

        /**
         * @brief 연결 하나 + 헤더까지 읽은 응답
         *
         * 모든 소켓 작업은 자체 io_context 에서 호출 스레드가 직접 돌린다.
         * 취소 콜백은 io_context 에 post 하므로 소켓은 한 스레드에서만 만진다.
         */
        class BeastHttpResponse final : public IHttpResponse
        {
        private:
            net::io_context ioc_;
            beast::ssl_stream<beast::tcp_stream> stream_;
            beast::flat_buffer buffer_;
            http::response_parser<http::buffer_body> parser_;

            utils::CancellationToken token_;
            std::chrono::seconds timeout_;

            // 반드시 마지막 멤버 (가장 먼저 해제되어야 함)
            utils::CancellationRegistration registration_;

        public:
            BeastHttpResponse(ssl::context& ssl_context,
                              const utils::CancellationToken& token,
                              std::chrono::seconds timeout)
                : stream_(ioc_, ssl_context)
                , token_(token)
                , timeout_(timeout)
            {
                parser_.body_limit(boost::none);

                registration_ = token_.Register([this]() {
                    net::post(ioc_, [this]() { CancelPending(); });
                });
            }

            ~BeastHttpResponse() override
            {
                registration_.Unregister();

                beast::error_code ec;
                auto& socket = beast::get_lowest_layer(stream_).socket();
                // NOLINTNEXTLINE(bugprone-unused-return-value)
                socket.shutdown(tcp::socket::shutdown_both, ec);
                // NOLINTNEXTLINE(bugprone-unused-return-value)
                socket.close(ec);
            }

            /**
             * @brief 연결, 핸드셰이크, 요청 전송, 응답 헤더 수신
             */
            void Execute(const HttpRequest& request, bool verify_peer)
            {
                const auto deadline = steady_clock::now() + timeout_;
                const std::string& host = request.uri.host;

                // 1. 이름 해석 (같은 deadline 으로 제한)
                ThrowIfCanceled(TransportStage::RESOLVE);
                tcp::resolver::results_type endpoints =
                    ResolveWithDeadline(host, request.uri.port, deadline, token_);

                // 2. TCP 연결
                ThrowIfCanceled(TransportStage::CONNECT);
                beast::get_lowest_layer(stream_).expires_at(deadline);
                beast::error_code ec = Run([&](auto handler) {
                    beast::get_lowest_layer(stream_).async_connect(endpoints, handler);
                });
                Check(ec, TransportStage::CONNECT);

                // 3. TLS 핸드셰이크 (SNI + 호스트 이름 검증)
                SSL* ssl = stream_.native_handle();
                if (!IsIpLiteral(host) && !SSL_set_tlsext_host_name(ssl, host.c_str())) {
                    throw TransportException(TransportStage::HANDSHAKE,
                        "Failed to set SNI host name: " + tls::TlsContext::GetLastError());
                }
                if (verify_peer && SSL_set1_host(ssl, host.c_str()) != 1) {
                    throw TransportException(TransportStage::HANDSHAKE,
                        "Failed to set expected host name: " + tls::TlsContext::GetLastError());
                }

                ThrowIfCanceled(TransportStage::HANDSHAKE);
                beast::get_lowest_layer(stream_).expires_at(deadline);
                ec = Run([&](auto handler) {
                    stream_.async_handshake(ssl::stream_base::client, handler);
                });
                if (ec && verify_peer && !IsAborted(ec) && SSL_get_verify_result(ssl) != X509_V_OK) {
                    long verify_result = SSL_get_verify_result(ssl);
                    ERR_clear_error();
                    throw CertificateTrustException(std::string("The remote certificate was rejected: ") +
                                                    X509_verify_cert_error_string(verify_result));
                }
                if (ec && !IsAborted(ec) && IsCertificateTrustError(ec)) {
                    ERR_clear_error();
                    throw CertificateTrustException("The client certificate was rejected: " + ec.message());
                }
                Check(ec, TransportStage::HANDSHAKE);

                // 4. 요청 전송
                http::request<http::string_body> beast_request{ToVerb(request.method), request.uri.target, 11};
                beast_request.set(http::field::host, request.uri.HostHeader());
                for (const auto& [name, value] : request.headers) {
                    beast_request.set(name, value);
                }
                if (request.body) {
                    beast_request.body() = *request.body;
                }
                beast_request.prepare_payload();

                ThrowIfCanceled(TransportStage::WRITE);
                beast::get_lowest_layer(stream_).expires_at(deadline);
                ec = Run([&](auto handler) {
                    http::async_write(stream_, beast_request, handler);
                });
                Check(ec, TransportStage::WRITE);

                // 5. 응답 헤더만 수신
                if (request.method == HttpMethod::HEAD) {
                    parser_.skip(true);
                }

                ThrowIfCanceled(TransportStage::READ);
                beast::get_lowest_layer(stream_).expires_at(deadline);
                ec = Run([&](auto handler) {
                    http::async_read_header(stream_, buffer_, parser_, handler);
                });
                Check(ec, TransportStage::READ);

                LOG_DEBUGF("BeastHttpTransport", "%s %s -> %d",
                           HttpMethodToString(request.method), request.uri.ToString().c_str(), StatusCode());
            }

            int StatusCode() const override
            {
                return static_cast<int>(parser_.get().result_int());
            }

            std::string GetHeader(const std::string& name) const override
            {
                const auto& header = parser_.get();
                auto it = header.find(name);
                if (it == header.end()) {
                    return "";
                }
                return std::string(it->value());
            }

            size_t ReadSome(char* buffer, size_t size) override
            {
                if (size == 0) {
                    return 0;
                }

                while (!parser_.is_done()) {
                    parser_.get().body().data = buffer;
                    parser_.get().body().size = size;

                    ThrowIfCanceled(TransportStage::READ);
                    beast::get_lowest_layer(stream_).expires_after(timeout_);
                    beast::error_code ec = Run([&](auto handler) {
                        http::async_read(stream_, buffer_, parser_, handler);
                    });

                    // 버퍼가 가득 찬 경우
                    if (ec == http::error::need_buffer) {
                        ec = {};
                    }
                    Check(ec, TransportStage::READ);

                    size_t read = size - parser_.get().body().size;
                    if (read > 0) {
                        return read;
                    }
                }
                return 0;
            }

        private:
            template <typename Start>
            beast::error_code Run(Start&& start)
            {
                beast::error_code result = net::error::operation_aborted;
                bool completed = false;

                start([&result, &completed](beast::error_code ec, auto&&...) {
                    result = ec;
                    completed = true;
                });

                ioc_.restart();
                ioc_.run();

                if (!completed) {
                    return net::error::operation_aborted;
                }
                return result;
            }

            void CancelPending()
            {
                beast::get_lowest_layer(stream_).cancel();
            }

            bool IsAborted(const beast::error_code& ec) const
            {
                return ec == beast::error::timeout ||
                       ec == net::error::operation_aborted ||
                       token_.IsCancellationRequested();
            }

            void ThrowIfCanceled(TransportStage stage) const
            {
                if (token_.IsCancellationRequested()) {
                    throw RequestAbortedException(stage,
                        std::string("Request was canceled before ") + TransportStageToString(stage));
                }
            }

            void Check(const beast::error_code& ec, TransportStage stage) const
            {
                if (!ec) {
                    return;
                }

                const char* stage_name = TransportStageToString(stage);

                if (ec == beast::error::timeout) {
                    throw RequestAbortedException(stage, std::string("Request timed out during ") + stage_name);
                }

                if (ec == net::error::operation_aborted || token_.IsCancellationRequested()) {
                    throw RequestAbortedException(stage, std::string("Request was canceled during ") + stage_name);
                }

                ERR_clear_error();
                throw TransportException(stage, std::string(stage_name) + " failed: " + ec.message());
            }
        };
    }

    BeastHttpTransport::BeastHttpTransport(const tls::TlsContext& tls_context, std::chrono::seconds timeout)
        : ssl_context_(ShareNativeContext(tls_context))
        , verify_peer_(tls_context.VerifiesPeer())
        , timeout_(timeout)
    {
        if (timeout_.count() <= 0) {
            throw std::invalid_argument("Transport timeout must be positive");
        }
    }

    std::unique_ptr<IHttpResponse> BeastHttpTransport::Send(
        const HttpRequest& request,
        const utils::CancellationToken& cancellation_token)
    {
        auto response = std::make_unique<BeastHttpResponse>(ssl_context_, cancellation_token, timeout_);
        response->Execute(request, verify_peer_);
        return response;
    }
}
