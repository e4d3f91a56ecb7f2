// src/fetcher/main.cpp
#include "common/auth/include/GitCertificatePasswordProvider.hpp"
#include "common/auth/include/StaticCredentialBackend.hpp"
#include "common/env/EnvManager.hpp"
#include "common/network/https/include/ConnectionThrottle.hpp"
#include "common/network/https/include/HttpRequestor.hpp"
#include "common/network/https/include/ProductInfo.hpp"
#include "common/network/https/include/TransportException.hpp"
#include "common/network/tls/include/SslSettings.hpp"
#include "common/network/tls/include/TlsContext.hpp"
#include "common/tracing/include/LoggerTracer.hpp"
#include "common/utils/logger/Logger.hpp"
#include "common/utils/threading/CancellationToken.hpp"
#include <signal.h>
#include <atomic>
#include <fstream>
#include <iostream>
#include <thread>
#include <vector>

using namespace objfetch;
using namespace objfetch::env;
using namespace objfetch::network::https;
using namespace objfetch::network::tls;

namespace
{
    constexpr int EXIT_TERMINAL_FAILURE = 1;
    constexpr int EXIT_RETRYABLE_FAILURE = 2;
    constexpr int EXIT_INTERRUPTED = 130;

    constexpr size_t COPY_BUFFER_SIZE = 64 * 1024;

    /**
     * @brief SIGINT/SIGTERM 을 전용 스레드에서 받아 취소 신호로 바꾼다
     *
     * 시그널은 생성 시점에 모든 스레드에서 막히므로 이 객체는 다른 스레드보다 먼저 만들어야 한다.
     */
    class SignalCanceller
    {
    private:
        utils::CancellationSource& source_;
        sigset_t signals_;
        std::atomic<bool> stop_{false};
        std::thread watcher_;

    public:
        explicit SignalCanceller(utils::CancellationSource& source)
            : source_(source)
        {
            sigemptyset(&signals_);
            sigaddset(&signals_, SIGINT);
            sigaddset(&signals_, SIGTERM);
            pthread_sigmask(SIG_BLOCK, &signals_, nullptr);

            watcher_ = std::thread([this]() { Watch(); });
        }

        ~SignalCanceller()
        {
            stop_.store(true);
            if (watcher_.joinable()) {
                watcher_.join();
            }
        }

        SignalCanceller(const SignalCanceller&) = delete;
        SignalCanceller& operator=(const SignalCanceller&) = delete;

    private:
        void Watch()
        {
            struct timespec poll_interval = {0, 200 * 1000 * 1000};
            while (!stop_.load()) {
                int signal = sigtimedwait(&signals_, nullptr, &poll_interval);
                if (signal > 0) {
                    LOG_INFOF("objfetch", "Received signal %d, canceling request...", signal);
                    source_.Cancel();
                    return;
                }
            }
        }
    };

    void PrintUsage(const char* program_name) {
        LOG_INFOF("objfetch", "Usage: %s [--env ENVIRONMENT] [--output FILE] [--accept TYPE] [--head] URL", program_name);
        LOG_INFO("objfetch", "");
        LOG_INFO("objfetch", "Options:");
        LOG_INFO("objfetch", "  --env ENV       Environment name (env/.env.ENV) or config file path. Default: local");
        LOG_INFO("objfetch", "  --output FILE   Write the response body to FILE instead of stdout");
        LOG_INFO("objfetch", "  --accept TYPE   Accept header value");
        LOG_INFO("objfetch", "  --head          Send HEAD instead of GET (no body is written)");
        LOG_INFO("objfetch", "");
        LOG_INFO("objfetch", "Exit codes: 0 success, 1 failure, 2 retryable failure, 130 interrupted");
        LOG_INFO("objfetch", "");
        LOG_INFO("objfetch", "Examples:");
        LOG_INFOF("objfetch", "  %s https://example.com/objects/info", program_name);
        LOG_INFOF("objfetch", "  %s --env production --output pack.bin https://example.com/objects/pack", program_name);
    }

    /**
     * @brief 성공 결과의 본문을 out 으로 복사
     * @return 복사한 바이트 수
     */
    uint64_t CopyBody(IHttpResponse& body, std::ostream& out) {
        std::vector<char> buffer(COPY_BUFFER_SIZE);
        uint64_t total = 0;

        while (true) {
            size_t read = body.ReadSome(buffer.data(), buffer.size());
            if (read == 0) {
                break;
            }

            out.write(buffer.data(), static_cast<std::streamsize>(read));
            if (!out) {
                throw std::runtime_error("Failed to write response body");
            }
            total += read;
        }

        out.flush();
        return total;
    }
}

int main(int argc, char* argv[]) {
    // 명령행 인자 파싱
    std::string env_type = "local";
    std::string output_path;
    std::string accept_type;
    std::string url;
    HttpMethod method = HttpMethod::GET;

    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];

        if (arg == "--help" || arg == "-h") {
            PrintUsage(argv[0]);
            return 0;
        } else if (arg == "--env" && i + 1 < argc) {
            env_type = argv[++i];
        } else if (arg == "--output" && i + 1 < argc) {
            output_path = argv[++i];
        } else if (arg == "--accept" && i + 1 < argc) {
            accept_type = argv[++i];
        } else if (arg == "--head") {
            method = HttpMethod::HEAD;
        } else if (!arg.empty() && arg[0] != '-' && url.empty()) {
            url = arg;
        } else {
            LOG_ERRORF("objfetch", "Error: unexpected argument '%s'", arg.c_str());
            PrintUsage(argv[0]);
            return EXIT_TERMINAL_FAILURE;
        }
    }

    if (url.empty()) {
        LOG_ERROR("objfetch", "Error: URL is required");
        PrintUsage(argv[0]);
        return EXIT_TERMINAL_FAILURE;
    }

    // 본문을 stdout 으로 쓰면 로그는 stderr 로
    if (output_path.empty()) {
        utils::Logger::Instance().SetConsoleStderrOnly(true);
    }

    // 환경 설정 로드
    if (!EnvManager::Instance().Initialize(env_type)) {
        LOG_ERRORF("objfetch", "Failed to load environment: %s", env_type.c_str());
        return EXIT_TERMINAL_FAILURE;
    }

    utils::CancellationSource cancellation;
    SignalCanceller signal_canceller(cancellation);

    // 본문을 쓰는 쪽이 먼저 죽으면 쓰기 오류로 처리한다
    signal(SIGPIPE, SIG_IGN);

    try {
        const EnvConfig& config = Config::Get();

        // LOG_FILE 이 비어 있으면 콘솔만
        std::string log_file = config.GetStringOr(Keys::LOG_FILE, "");
        utils::Logger::Instance().Initialize(log_file.c_str());

        LOG_INFO("objfetch", "=== objfetch ===");
        LOG_INFOF("objfetch", "Version: %s (build %s %s)", OBJFETCH_VERSION, __DATE__, __TIME__);
        EnvManager::Instance().LogLoadedConfig();

        Uri uri = Uri::Parse(url);

        TlsContext::GlobalInit();

        size_t max_connections = config.GetUInt32Or(
            Keys::HTTP_MAX_CONNECTIONS, static_cast<uint32_t>(ConnectionThrottle::DefaultCapacity()));
        ConnectionThrottle throttle(max_connections);

        tracing::LoggerTracer tracer("objfetch");
        auth::StaticCredentialBackend credentials(
            config.GetStringOr(Keys::CREDENTIAL_USERNAME, ""),
            config.GetStringOr(Keys::CREDENTIAL_PASSWORD, ""));
        auth::GitCertificatePasswordProvider password_provider(config.GetStringOr(Keys::GIT_BINARY, "git"));

        HttpRequestor requestor(
            tracer,
            RetryConfig::FromConfig(config),
            credentials,
            throttle,
            SslSettings::FromConfig(config),
            password_provider);

        LOG_INFOF("objfetch", "%s %s", HttpMethodToString(method), uri.ToString().c_str());

        RequestAttemptResult result = requestor.SendRequest(
            HttpRequestor::GetNewRequestId(),
            uri,
            method,
            std::nullopt,
            cancellation.Token(),
            accept_type);

        if (!result.Succeeded()) {
            const AttemptError& error = *result.Error();
            LOG_ERRORF("objfetch", "Request failed [%s] status %d: %s",
                       ErrorKindToString(error.kind), result.StatusCode(), error.message.c_str());
            LOG_ERRORF("objfetch", "Retry recommended: %s", result.ShouldRetry() ? "yes" : "no");
            return result.ShouldRetry() ? EXIT_RETRYABLE_FAILURE : EXIT_TERMINAL_FAILURE;
        }

        uint64_t written = 0;
        if (method != HttpMethod::HEAD) {
            if (output_path.empty()) {
                written = CopyBody(result.Body(), std::cout);
            } else {
                std::ofstream out(output_path, std::ios::binary | std::ios::trunc);
                if (!out.is_open()) {
                    LOG_ERRORF("objfetch", "Failed to open output file: %s", output_path.c_str());
                    return EXIT_TERMINAL_FAILURE;
                }
                written = CopyBody(result.Body(), out);
            }
        }
        result.Close();

        LOG_INFOF("objfetch", "Done: %llu bytes (%s)",
                  static_cast<unsigned long long>(written),
                  result.ContentType().empty() ? "no content type" : result.ContentType().c_str());
        return 0;

    } catch (const utils::OperationCanceledException& e) {
        LOG_WARNF("objfetch", "Interrupted: %s", e.what());
        return EXIT_INTERRUPTED;
    } catch (const RequestAbortedException& e) {
        // 본문을 읽는 중 중단
        if (cancellation.IsCancellationRequested()) {
            LOG_WARNF("objfetch", "Interrupted: %s", e.what());
            return EXIT_INTERRUPTED;
        }
        LOG_ERRORF("objfetch", "Body transfer aborted: %s", e.what());
        return EXIT_RETRYABLE_FAILURE;
    } catch (const TransportException& e) {
        LOG_ERRORF("objfetch", "Body transfer failed: %s", e.what());
        return EXIT_RETRYABLE_FAILURE;
    } catch (const ConfigMissingException& e) {
        LOG_ERRORF("objfetch", "Configuration error: %s", e.what());
        return EXIT_TERMINAL_FAILURE;
    } catch (const std::exception& e) {
        LOG_ERRORF("objfetch", "Fatal error: %s", e.what());
        return EXIT_TERMINAL_FAILURE;
    }
}
