// tests/unit/https/http_requestor_test.cpp
#include <gtest/gtest.h>
#include "common/auth/include/StaticCredentialBackend.hpp"
#include "common/network/https/include/HttpRequestor.hpp"
#include "common/network/https/include/TransportException.hpp"
#include "support/TestDoubles.hpp"
#include <chrono>
#include <future>
#include <thread>

using namespace objfetch::network::https;
using objfetch::test_support::FakeCredentialBackend;
using objfetch::test_support::FakeHttpResponse;
using objfetch::test_support::FakeHttpTransport;
using objfetch::test_support::RecordingTracer;
using objfetch::utils::CancellationSource;
using objfetch::utils::CancellationToken;
using objfetch::utils::OperationCanceledException;

// ========== 테스트 Fixture ==========

class HttpRequestorTest : public ::testing::Test {
protected:
    static constexpr size_t kCapacity = 2;

    RecordingTracer tracer;
    FakeCredentialBackend credentials;
    ConnectionThrottle throttle{kCapacity};
    FakeHttpTransport* transport = nullptr;
    std::unique_ptr<HttpRequestor> requestor;
    Uri uri = Uri::Parse("https://example.com/repo/gvfs/objects");

    void UseTransport(FakeHttpTransport::Behavior behavior) {
        auto owned = std::make_unique<FakeHttpTransport>(std::move(behavior));
        transport = owned.get();
        requestor = std::make_unique<HttpRequestor>(tracer, RetryConfig(), credentials, throttle, std::move(owned));
    }

    void RespondWith(int status, std::string body, std::map<std::string, std::string> headers = {}) {
        UseTransport([=](const HttpRequest&, const CancellationToken&) -> std::unique_ptr<IHttpResponse> {
            return std::make_unique<FakeHttpResponse>(status, body, headers);
        });
    }

    void ThrowOnSend(std::function<void()> thrower) {
        UseTransport([thrower](const HttpRequest&, const CancellationToken&) -> std::unique_ptr<IHttpResponse> {
            thrower();
            return nullptr;
        });
    }

    RequestAttemptResult Send(const CancellationToken& token = CancellationToken::None(),
                              const std::optional<std::string>& body = std::nullopt,
                              const std::string& accept = "") {
        return requestor->SendRequest(HttpRequestor::GetNewRequestId(), uri, HttpMethod::GET, body, token, accept);
    }

    size_t NetworkResponseCount() const {
        return tracer.Named("NetworkResponse").size();
    }
};

// ========== 성공 경로 ==========

TEST_F(HttpRequestorTest, SuccessHoldsSlotUntilClosed) {
    RespondWith(200, "objects", {{"Content-Type", "application/x-git-packfile"}});

    RequestAttemptResult result = Send();

    ASSERT_TRUE(result.Succeeded());
    EXPECT_EQ(result.StatusCode(), 200);
    EXPECT_FALSE(result.ShouldRetry());
    EXPECT_EQ(result.ContentType(), "application/x-git-packfile");
    EXPECT_EQ(throttle.AvailableCount(), kCapacity - 1);

    EXPECT_EQ(result.Body().ReadAllAsString(), "objects");
    EXPECT_TRUE(result.Close());
    EXPECT_EQ(throttle.AvailableCount(), kCapacity);

    EXPECT_FALSE(result.Close());
    EXPECT_EQ(throttle.AvailableCount(), kCapacity);

    EXPECT_EQ(credentials.confirm_calls, 1);
    EXPECT_EQ(credentials.last_confirmed, credentials.token);
    EXPECT_EQ(credentials.revoke_calls, 0);
}

TEST_F(HttpRequestorTest, DroppingSuccessResultReleasesSlot) {
    RespondWith(200, "objects");
    {
        RequestAttemptResult result = Send();
        EXPECT_EQ(throttle.AvailableCount(), kCapacity - 1);
    }
    EXPECT_EQ(throttle.AvailableCount(), kCapacity);
}

TEST_F(HttpRequestorTest, SuccessResultOutlivesRequestor) {
    RespondWith(200, "objects");

    RequestAttemptResult result = Send();
    requestor.reset();
    transport = nullptr;

    EXPECT_EQ(throttle.AvailableCount(), kCapacity - 1);
    EXPECT_EQ(result.Body().ReadAllAsString(), "objects");
    EXPECT_TRUE(result.Close());
    EXPECT_EQ(throttle.AvailableCount(), kCapacity);
}

TEST_F(HttpRequestorTest, UnclosedResultOutlivesRequestor) {
    RespondWith(200, "objects");
    {
        RequestAttemptResult result = Send();
        requestor.reset();
        transport = nullptr;
    }
    EXPECT_EQ(throttle.AvailableCount(), kCapacity);
}

TEST_F(HttpRequestorTest, BuildsAuthenticatedRequestHeaders) {
    RespondWith(200, "");

    RequestAttemptResult result = Send(CancellationToken::None(), std::string("{\"objectIds\":[]}"), "application/json");
    result.Close();

    ASSERT_EQ(transport->requests.size(), 1u);
    const HttpRequest& request = transport->requests.front();

    EXPECT_EQ(request.method, HttpMethod::GET);
    EXPECT_EQ(request.uri.host, "example.com");
    EXPECT_EQ(request.GetHeader("X-TFS-FedAuthRedirect"), "Suppress");
    EXPECT_EQ(request.GetHeader("authorization"), "Basic " + credentials.token);
    EXPECT_EQ(request.GetHeader("Accept"), "application/json");
    EXPECT_EQ(request.GetHeader("Content-Type"), "application/json; charset=utf-8");
    EXPECT_FALSE(request.GetHeader("User-Agent").empty());
    EXPECT_EQ(request.GetHeader("User-Agent"), requestor->GetUserAgent());
    ASSERT_TRUE(request.body.has_value());
    EXPECT_EQ(*request.body, "{\"objectIds\":[]}");
}

TEST_F(HttpRequestorTest, AnonymousRequestHasNoAuthorization) {
    credentials.anonymous = true;
    RespondWith(200, "");

    RequestAttemptResult result = Send();
    result.Close();

    EXPECT_EQ(credentials.get_calls, 0);
    ASSERT_EQ(transport->requests.size(), 1u);
    EXPECT_TRUE(transport->requests.front().GetHeader("Authorization").empty());
    EXPECT_TRUE(transport->requests.front().GetHeader("Accept").empty());
    EXPECT_FALSE(transport->requests.front().body.has_value());
}

TEST_F(HttpRequestorTest, RequestIdsIncrease) {
    int64_t first = HttpRequestor::GetNewRequestId();
    int64_t second = HttpRequestor::GetNewRequestId();
    EXPECT_GT(second, first);
}

// ========== 인증 실패 ==========

TEST_F(HttpRequestorTest, ConfiguredCredentialIsRenewedBeforeBackingOff) {
    objfetch::auth::StaticCredentialBackend configured("user", "pat");
    HttpRequestor local(tracer, RetryConfig(), configured, throttle,
        std::make_unique<FakeHttpTransport>([](const HttpRequest&, const CancellationToken&) -> std::unique_ptr<IHttpResponse> {
            return std::make_unique<FakeHttpResponse>(401, "denied", std::map<std::string, std::string>{});
        }));

    auto send = [&]() {
        return local.SendRequest(HttpRequestor::GetNewRequestId(), uri, HttpMethod::GET,
                                 std::nullopt, CancellationToken::None(), "");
    };

    RequestAttemptResult first = send();
    ASSERT_TRUE(first.Error().has_value());
    EXPECT_TRUE(first.ShouldRetry());
    EXPECT_NE(first.Error()->message.find("asking for a new one"), std::string::npos);

    RequestAttemptResult second = send();
    ASSERT_TRUE(second.Error().has_value());
    EXPECT_TRUE(second.ShouldRetry());
    EXPECT_NE(second.Error()->message.find("You may not have access to this repo"), std::string::npos);

    RequestAttemptResult third = send();
    ASSERT_TRUE(third.Error().has_value());
    EXPECT_EQ(third.Error()->kind, ErrorKind::AUTHENTICATION_UNAVAILABLE);
    EXPECT_EQ(configured.GetRevokeCount(), 2u);
    EXPECT_EQ(throttle.AvailableCount(), kCapacity);
}

TEST_F(HttpRequestorTest, UnauthorizedRevokesOnceAndAsksForNewCredential) {
    RespondWith(401, "token expired");

    RequestAttemptResult result = Send();

    EXPECT_FALSE(result.Succeeded());
    EXPECT_TRUE(result.ShouldRetry());
    EXPECT_EQ(result.StatusCode(), 401);
    EXPECT_EQ(credentials.revoke_calls, 1);
    EXPECT_EQ(credentials.last_revoked, credentials.token);
    EXPECT_EQ(credentials.confirm_calls, 0);
    EXPECT_NE(result.Error()->message.find("asking for a new one"), std::string::npos);
    EXPECT_NE(result.Error()->message.find("token expired"), std::string::npos);

    EXPECT_TRUE(result.IsClosed());
    EXPECT_EQ(throttle.AvailableCount(), kCapacity);
}

TEST_F(HttpRequestorTest, UnauthorizedAfterRenewalReportsMissingAccess) {
    credentials.revoke_sets_backoff = true;
    RespondWith(401, "");

    RequestAttemptResult result = Send();

    EXPECT_EQ(credentials.revoke_calls, 1);
    EXPECT_TRUE(result.ShouldRetry());
    EXPECT_NE(result.Error()->message.find("You may not have access to this repo"), std::string::npos);
}

TEST_F(HttpRequestorTest, AnonymousUnauthorizedIsTerminalWithoutRevoke) {
    credentials.anonymous = true;
    RespondWith(401, "");

    RequestAttemptResult result = Send();

    EXPECT_FALSE(result.ShouldRetry());
    EXPECT_EQ(result.Error()->message, "Anonymous request was rejected with a 401");
    EXPECT_EQ(credentials.revoke_calls, 0);
    EXPECT_EQ(throttle.AvailableCount(), kCapacity);
}

TEST_F(HttpRequestorTest, BadRequestRevokesWithoutRetry) {
    RespondWith(400, "bad");

    RequestAttemptResult result = Send();

    EXPECT_FALSE(result.ShouldRetry());
    EXPECT_EQ(result.StatusCode(), 400);
    EXPECT_EQ(credentials.revoke_calls, 1);
}

TEST_F(HttpRequestorTest, CredentialsUnavailableSkipsNetwork) {
    credentials.credentials_available = false;
    RespondWith(200, "");

    RequestAttemptResult result = Send();

    EXPECT_FALSE(result.Succeeded());
    EXPECT_TRUE(result.ShouldRetry());
    EXPECT_EQ(result.StatusCode(), 401);
    EXPECT_EQ(result.Error()->kind, ErrorKind::AUTHENTICATION_UNAVAILABLE);
    EXPECT_EQ(result.Error()->message, credentials.unavailable_message);

    EXPECT_TRUE(transport->requests.empty());
    EXPECT_EQ(throttle.AvailableCount(), kCapacity);
    EXPECT_EQ(NetworkResponseCount(), 0u);
}

// ========== 서버 에러 ==========

TEST_F(HttpRequestorTest, ServerErrorIsRetryableAndReleasesImmediately) {
    bool destroyed = false;
    UseTransport([&destroyed](const HttpRequest&, const CancellationToken&) -> std::unique_ptr<IHttpResponse> {
        auto response = std::make_unique<FakeHttpResponse>(503, "maintenance");
        response->TrackDestruction(&destroyed);
        return response;
    });

    RequestAttemptResult result = Send();

    EXPECT_TRUE(result.ShouldRetry());
    EXPECT_EQ(result.Error()->kind, ErrorKind::SERVER_ERROR);
    EXPECT_EQ(result.Error()->message,
              "Server returned error code 503 (ServiceUnavailable). Original error message from server: maintenance");
    EXPECT_TRUE(destroyed);
    EXPECT_EQ(throttle.AvailableCount(), kCapacity);
    EXPECT_EQ(credentials.revoke_calls, 0);
}

TEST_F(HttpRequestorTest, NotFoundIsTerminal) {
    RespondWith(404, "");

    RequestAttemptResult result = Send();

    EXPECT_FALSE(result.ShouldRetry());
    EXPECT_EQ(result.StatusCode(), 404);
    EXPECT_EQ(throttle.AvailableCount(), kCapacity);
}

TEST_F(HttpRequestorTest, ErrorBodyReadFailureIsFoldedIntoMessage) {
    UseTransport([](const HttpRequest&, const CancellationToken&) -> std::unique_ptr<IHttpResponse> {
        auto response = std::make_unique<FakeHttpResponse>(500, "");
        response->FailReadsWith([]() {
            throw TransportException(TransportStage::READ, "connection reset");
        });
        return response;
    });

    RequestAttemptResult result = Send();

    EXPECT_TRUE(result.ShouldRetry());
    EXPECT_EQ(result.StatusCode(), 500);
    EXPECT_NE(result.Error()->message.find("<failed to read response body: connection reset>"), std::string::npos);
    EXPECT_EQ(throttle.AvailableCount(), kCapacity);
}

// ========== 전송 실패 ==========

TEST_F(HttpRequestorTest, AbortWithoutCancellationIsTimeout) {
    ThrowOnSend([]() {
        throw RequestAbortedException(TransportStage::READ, "Request timed out during Read");
    });

    RequestAttemptResult result = Send();

    EXPECT_TRUE(result.ShouldRetry());
    EXPECT_EQ(result.StatusCode(), 408);
    EXPECT_EQ(result.Error()->kind, ErrorKind::TIMEOUT);
    EXPECT_EQ(result.Error()->message, "Request to " + uri.ToString() + " timed out");
    EXPECT_EQ(throttle.AvailableCount(), kCapacity);

    auto events = tracer.Named("NetworkResponse");
    ASSERT_EQ(events.size(), 1u);
    EXPECT_EQ(events.front().metadata["FailedStage"], "Read");
}

TEST_F(HttpRequestorTest, AbortAfterCancellationPropagatesCancellation) {
    CancellationSource source;
    UseTransport([&source](const HttpRequest&, const CancellationToken&) -> std::unique_ptr<IHttpResponse> {
        source.Cancel();
        throw RequestAbortedException(TransportStage::CONNECT, "Request was canceled during Connect");
    });

    EXPECT_THROW(Send(source.Token()), OperationCanceledException);
    EXPECT_EQ(throttle.AvailableCount(), kCapacity);
    EXPECT_EQ(NetworkResponseCount(), 1u);
}

TEST_F(HttpRequestorTest, CertificateTrustFailureIsTerminal) {
    ThrowOnSend([]() {
        throw CertificateTrustException("The remote certificate was rejected: unable to get local issuer certificate");
    });

    RequestAttemptResult result = Send();

    EXPECT_FALSE(result.ShouldRetry());
    EXPECT_EQ(result.StatusCode(), 401);
    EXPECT_EQ(result.Error()->kind, ErrorKind::CERTIFICATE_TRUST_REJECTED);
    EXPECT_EQ(credentials.revoke_calls, 0);
    EXPECT_EQ(throttle.AvailableCount(), kCapacity);
}

TEST_F(HttpRequestorTest, OtherTransportFailureIsRetryable500) {
    ThrowOnSend([]() {
        throw TransportException(TransportStage::CONNECT, "Connect failed: Connection refused");
    });

    RequestAttemptResult result = Send();

    EXPECT_TRUE(result.ShouldRetry());
    EXPECT_EQ(result.StatusCode(), 500);
    EXPECT_EQ(result.Error()->kind, ErrorKind::TRANSPORT_FAILURE);
    EXPECT_EQ(result.Error()->message, "Connect failed: Connection refused");
    EXPECT_EQ(throttle.AvailableCount(), kCapacity);
}

TEST_F(HttpRequestorTest, UnexpectedExceptionReleasesSlotAndPropagates) {
    ThrowOnSend([]() { throw std::runtime_error("boom"); });

    EXPECT_THROW(Send(), std::runtime_error);
    EXPECT_EQ(throttle.AvailableCount(), kCapacity);
    EXPECT_EQ(NetworkResponseCount(), 1u);
}

TEST_F(HttpRequestorTest, FailingTelemetryStillReleasesSlot) {
    tracer.FailEvents(true);

    ThrowOnSend([]() { throw std::logic_error("transport bug"); });
    EXPECT_THROW(Send(), std::runtime_error);
    EXPECT_EQ(throttle.AvailableCount(), kCapacity);

    RespondWith(503, "busy");
    EXPECT_THROW(Send(), std::runtime_error);
    EXPECT_EQ(throttle.AvailableCount(), kCapacity);

    RespondWith(200, "objects");
    EXPECT_THROW(Send(), std::runtime_error);
    EXPECT_EQ(throttle.AvailableCount(), kCapacity);
}

// ========== 취소 / 스로틀 ==========

TEST_F(HttpRequestorTest, CancelWhileWaitingForSlotTakesNoSlot) {
    RespondWith(200, "");
    ASSERT_TRUE(throttle.TryAcquire());
    ASSERT_TRUE(throttle.TryAcquire());

    CancellationSource source;
    auto pending = std::async(std::launch::async, [&]() {
        return Send(source.Token());
    });

    std::this_thread::sleep_for(std::chrono::milliseconds(50));
    source.Cancel();

    EXPECT_THROW(pending.get(), OperationCanceledException);
    EXPECT_TRUE(transport->requests.empty());
    EXPECT_EQ(throttle.AvailableCount(), 0u);
    EXPECT_EQ(NetworkResponseCount(), 0u);

    throttle.Release();
    throttle.Release();
}

TEST_F(HttpRequestorTest, WaitsForSlotHeldByOpenResult) {
    RespondWith(200, "");

    RequestAttemptResult first = Send();
    RequestAttemptResult second = Send();
    EXPECT_EQ(throttle.AvailableCount(), 0u);

    auto third = std::async(std::launch::async, [&]() { return Send(); });
    EXPECT_EQ(third.wait_for(std::chrono::milliseconds(100)), std::future_status::timeout);

    first.Close();
    RequestAttemptResult third_result = third.get();
    EXPECT_TRUE(third_result.Succeeded());

    second.Close();
    third_result.Close();
    EXPECT_EQ(throttle.AvailableCount(), kCapacity);
}

// ========== 텔레메트리 ==========

TEST_F(HttpRequestorTest, EmitsNetworkResponseTelemetry) {
    RespondWith(200, "", {{"Content-Type", "application/json"}, {"X-Cache-Name", "cache-01"}});

    int64_t request_id = HttpRequestor::GetNewRequestId();
    RequestAttemptResult result = requestor->SendRequest(
        request_id, uri, HttpMethod::GET, std::nullopt, CancellationToken::None());
    result.Close();

    auto events = tracer.Named("NetworkResponse");
    ASSERT_EQ(events.size(), 1u);

    const auto& event = events.front();
    EXPECT_EQ(event.level, objfetch::tracing::EventLevel::INFORMATIONAL);
    EXPECT_EQ(event.metadata["RequestId"].get<int64_t>(), request_id);
    EXPECT_EQ(event.metadata["availableConnections"].get<size_t>(), kCapacity);
    EXPECT_EQ(event.metadata["StatusCode"].get<int>(), 200);
    EXPECT_EQ(event.metadata["CacheName"], "cache-01");
    EXPECT_EQ(event.metadata["ContentType"], "application/json");

    std::string wait = event.metadata["connectionWaitTimeMS"].get<std::string>();
    size_t dot = wait.find('.');
    ASSERT_NE(dot, std::string::npos);
    EXPECT_EQ(wait.size() - dot - 1, 4u);
    EXPECT_TRUE(event.metadata.contains("responseWaitTimeMS"));
}

TEST_F(HttpRequestorTest, RejectsNullTransport) {
    EXPECT_THROW(HttpRequestor(tracer, RetryConfig(), credentials, throttle, nullptr), std::invalid_argument);
}
