// src/common/tracing/src/LoggerTracer.cpp
#include "common/tracing/include/LoggerTracer.hpp"
#include "common/utils/logger/Logger.hpp"

namespace objfetch::tracing
{
    using utils::LogLevel;

    namespace
    {
        LogLevel ToLogLevel(EventLevel level)
        {
            switch (level) {
                case EventLevel::VERBOSE: return LogLevel::DEBUG;
                case EventLevel::INFORMATIONAL: return LogLevel::INFO;
                case EventLevel::WARNING: return LogLevel::WARN;
                case EventLevel::ERROR: return LogLevel::ERROR;
                case EventLevel::CRITICAL: return LogLevel::FATAL;
                default: return LogLevel::INFO;
            }
        }
    }

    LoggerTracer::LoggerTracer(std::string component)
        : component_(std::move(component))
    {
    }

    void LoggerTracer::RelatedEvent(EventLevel level, const std::string& event_name, const EventMetadata& metadata)
    {
        std::string line = Render(component_, level, event_name, metadata);
        utils::Logger::Instance().Log(ToLogLevel(level), "Trace", line.c_str());
    }

    void LoggerTracer::RelatedError(const EventMetadata& metadata, const std::string& message)
    {
        EventMetadata error_metadata = metadata.is_object() ? metadata : EventMetadata::object();
        error_metadata["ErrorMessage"] = message;
        RelatedEvent(EventLevel::ERROR, "Error", error_metadata);
    }

    void LoggerTracer::RelatedError(const std::string& message)
    {
        RelatedError(EventMetadata::object(), message);
    }

    std::string LoggerTracer::Render(
        const std::string& component,
        EventLevel level,
        const std::string& event_name,
        const EventMetadata& metadata
    ) {
        EventMetadata record = {
            {"component", component},
            {"event", event_name},
            {"level", EventLevelToString(level)},
            {"metadata", metadata.is_null() ? EventMetadata::object() : metadata}
        };

        return record.dump(-1, ' ', false, nlohmann::json::error_handler_t::replace);
    }
}
