// tests/unit/https/request_attempt_result_test.cpp
#include <gtest/gtest.h>
#include "common/network/https/include/RequestAttemptResult.hpp"
#include "support/TestDoubles.hpp"

using namespace objfetch::network::https;
using objfetch::test_support::FakeHttpResponse;

namespace
{
    std::unique_ptr<FakeHttpResponse> MakeResponse(bool* destroyed) {
        auto response = std::make_unique<FakeHttpResponse>(200, "payload");
        response->TrackDestruction(destroyed);
        return response;
    }
}

TEST(RequestAttemptResultTest, SuccessExposesBodyUntilClosed) {
    bool destroyed = false;
    int releases = 0;

    RequestAttemptResult result = RequestAttemptResult::Success(
        200, "application/octet-stream", MakeResponse(&destroyed), [&]() { ++releases; });

    EXPECT_TRUE(result.Succeeded());
    EXPECT_FALSE(result.ShouldRetry());
    EXPECT_EQ(result.StatusCode(), 200);
    EXPECT_EQ(result.ContentType(), "application/octet-stream");
    EXPECT_EQ(result.Body().ReadAllAsString(), "payload");

    EXPECT_TRUE(result.Close());
    EXPECT_TRUE(destroyed);
    EXPECT_EQ(releases, 1);
    EXPECT_THROW(result.Body(), std::logic_error);
}

TEST(RequestAttemptResultTest, SecondCloseIsNoOp) {
    int releases = 0;
    RequestAttemptResult result = RequestAttemptResult::Success(
        200, "", std::make_unique<FakeHttpResponse>(200, ""), [&]() { ++releases; });

    EXPECT_TRUE(result.Close());
    EXPECT_FALSE(result.Close());
    EXPECT_TRUE(result.IsClosed());
    EXPECT_EQ(releases, 1);
}

TEST(RequestAttemptResultTest, DestructorReleasesOpenResult) {
    bool destroyed = false;
    int releases = 0;
    {
        RequestAttemptResult result = RequestAttemptResult::Success(
            200, "", MakeResponse(&destroyed), [&]() { ++releases; });
    }
    EXPECT_TRUE(destroyed);
    EXPECT_EQ(releases, 1);
}

TEST(RequestAttemptResultTest, MoveTransfersReleaseResponsibility) {
    int releases = 0;
    RequestAttemptResult source = RequestAttemptResult::Success(
        200, "", std::make_unique<FakeHttpResponse>(200, "x"), [&]() { ++releases; });

    RequestAttemptResult target = std::move(source);
    EXPECT_TRUE(source.IsClosed());
    EXPECT_FALSE(source.Close());
    EXPECT_EQ(releases, 0);

    EXPECT_EQ(target.Body().ReadAllAsString(), "x");
    EXPECT_TRUE(target.Close());
    EXPECT_EQ(releases, 1);
}

TEST(RequestAttemptResultTest, MoveAssignmentClosesPreviousResult) {
    int first_releases = 0;
    int second_releases = 0;

    RequestAttemptResult result = RequestAttemptResult::Success(
        200, "", std::make_unique<FakeHttpResponse>(200, ""), [&]() { ++first_releases; });
    result = RequestAttemptResult::Success(
        200, "", std::make_unique<FakeHttpResponse>(200, ""), [&]() { ++second_releases; });

    EXPECT_EQ(first_releases, 1);
    EXPECT_EQ(second_releases, 0);

    result.Close();
    EXPECT_EQ(second_releases, 1);
}

TEST(RequestAttemptResultTest, FailureCarriesErrorAndHasNoBody) {
    AttemptError error;
    error.kind = ErrorKind::SERVER_ERROR;
    error.status_code = 503;
    error.message = "busy";

    RequestAttemptResult result = RequestAttemptResult::Failure(error, true);

    EXPECT_FALSE(result.Succeeded());
    EXPECT_TRUE(result.ShouldRetry());
    EXPECT_EQ(result.StatusCode(), 503);
    ASSERT_TRUE(result.Error().has_value());
    EXPECT_EQ(result.Error()->message, "busy");
    EXPECT_THROW(result.Body(), std::logic_error);
}
