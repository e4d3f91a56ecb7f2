// tests/unit/logger_tracer_test.cpp
#include <gtest/gtest.h>
#include "common/tracing/include/LoggerTracer.hpp"
#include "common/utils/logger/Logger.hpp"
#include <string>
#include <vector>

using namespace objfetch::tracing;
using objfetch::utils::Logger;
using objfetch::utils::LogLevel;

class LoggerTracerTest : public ::testing::Test {
protected:
    std::vector<std::string> lines;

    void SetUp() override {
        Logger::Instance().SetConsoleEnabled(false);
        Logger::Instance().SetSink([this](LogLevel, const std::string& line) {
            lines.push_back(line);
        });
    }

    void TearDown() override {
        Logger::Instance().SetSink(nullptr);
        Logger::Instance().SetConsoleEnabled(true);
    }
};

TEST_F(LoggerTracerTest, RenderProducesSingleJsonLine) {
    EventMetadata metadata;
    metadata["RequestId"] = 7;
    metadata["StatusCode"] = 200;

    std::string line = LoggerTracer::Render("objfetch", EventLevel::INFORMATIONAL, "NetworkResponse", metadata);

    EXPECT_EQ(line.find('\n'), std::string::npos);

    EventMetadata parsed = EventMetadata::parse(line);
    EXPECT_EQ(parsed["component"], "objfetch");
    EXPECT_EQ(parsed["event"], "NetworkResponse");
    EXPECT_EQ(parsed["level"], "Informational");
    EXPECT_EQ(parsed["metadata"]["RequestId"], 7);
    EXPECT_EQ(parsed["metadata"]["StatusCode"], 200);
}

TEST_F(LoggerTracerTest, RenderReplacesInvalidUtf8) {
    EventMetadata metadata;
    metadata["Exception"] = std::string("bad \xff\xfe bytes");

    std::string line;
    EXPECT_NO_THROW(line = LoggerTracer::Render("objfetch", EventLevel::ERROR, "Error", metadata));
    EXPECT_NO_THROW(EventMetadata::parse(line));
}

TEST_F(LoggerTracerTest, RenderTreatsNullMetadataAsEmptyObject) {
    std::string line = LoggerTracer::Render("objfetch", EventLevel::WARNING, "Something", EventMetadata());
    EventMetadata parsed = EventMetadata::parse(line);
    EXPECT_TRUE(parsed["metadata"].is_object());
    EXPECT_TRUE(parsed["metadata"].empty());
}

TEST_F(LoggerTracerTest, RelatedErrorIsLoggedWithMessage) {
    LoggerTracer tracer("objfetch");

    EventMetadata metadata;
    metadata["Exception"] = "mac verify failure";
    tracer.RelatedError(metadata, "Error, while loading certificate from disk");

    ASSERT_EQ(lines.size(), 1u);
    const std::string& line = lines.front();
    EXPECT_NE(line.find("[ERROR]"), std::string::npos);
    EXPECT_NE(line.find("[Trace]"), std::string::npos);

    std::string json = line.substr(line.find('{'));
    EventMetadata parsed = EventMetadata::parse(json);
    EXPECT_EQ(parsed["event"], "Error");
    EXPECT_EQ(parsed["metadata"]["ErrorMessage"], "Error, while loading certificate from disk");
    EXPECT_EQ(parsed["metadata"]["Exception"], "mac verify failure");
}

TEST_F(LoggerTracerTest, RelatedErrorWithoutMetadata) {
    LoggerTracer tracer("objfetch");
    tracer.RelatedError("Certificate client-cert not found");

    ASSERT_EQ(lines.size(), 1u);
    EXPECT_NE(lines.front().find("Certificate client-cert not found"), std::string::npos);
}
