// tests/unit/cancellation_token_test.cpp
#include <gtest/gtest.h>
#include "common/utils/threading/CancellationToken.hpp"
#include <atomic>
#include <thread>

using namespace objfetch::utils;

TEST(CancellationTokenTest, DefaultTokenIsNeverCanceled) {
    CancellationToken token = CancellationToken::None();
    EXPECT_FALSE(token.CanBeCanceled());
    EXPECT_FALSE(token.IsCancellationRequested());
    EXPECT_NO_THROW(token.ThrowIfCancellationRequested());

    int calls = 0;
    CancellationRegistration registration = token.Register([&]() { ++calls; });
    EXPECT_EQ(calls, 0);
}

TEST(CancellationTokenTest, CancelIsObservedByAllTokens) {
    CancellationSource source;
    CancellationToken first = source.Token();
    CancellationToken second = first;

    EXPECT_TRUE(first.CanBeCanceled());
    EXPECT_FALSE(second.IsCancellationRequested());

    source.Cancel();

    EXPECT_TRUE(first.IsCancellationRequested());
    EXPECT_TRUE(second.IsCancellationRequested());
    EXPECT_THROW(second.ThrowIfCancellationRequested(), OperationCanceledException);
}

TEST(CancellationTokenTest, CallbacksRunOnceOnCancel) {
    CancellationSource source;
    int calls = 0;
    CancellationRegistration registration = source.Token().Register([&]() { ++calls; });

    source.Cancel();
    source.Cancel();

    EXPECT_EQ(calls, 1);
}

TEST(CancellationTokenTest, RegisterAfterCancelRunsImmediately) {
    CancellationSource source;
    source.Cancel();

    int calls = 0;
    CancellationRegistration registration = source.Token().Register([&]() { ++calls; });
    EXPECT_EQ(calls, 1);
}

TEST(CancellationTokenTest, UnregisteredCallbackIsNotRun) {
    CancellationSource source;
    int calls = 0;
    {
        CancellationRegistration registration = source.Token().Register([&]() { ++calls; });
    }

    source.Cancel();
    EXPECT_EQ(calls, 0);
}

TEST(CancellationTokenTest, CancelFromAnotherThreadWakesWaiter) {
    CancellationSource source;
    std::atomic<bool> fired{false};
    CancellationRegistration registration = source.Token().Register([&]() { fired.store(true); });

    std::thread canceller([&]() { source.Cancel(); });
    canceller.join();

    EXPECT_TRUE(fired.load());
    EXPECT_TRUE(source.IsCancellationRequested());
}
