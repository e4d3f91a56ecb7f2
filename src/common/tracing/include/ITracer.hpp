// src/common/tracing/include/ITracer.hpp
#pragma once
#include <nlohmann/json.hpp>
#include <string>

namespace objfetch::tracing
{
    /**
     * @brief 구조화 이벤트 메타데이터 (JSON object)
     */
    using EventMetadata = nlohmann::json;

    enum class EventLevel
    {
        VERBOSE = 0,
        INFORMATIONAL = 1,
        WARNING = 2,
        ERROR = 3,
        CRITICAL = 4
    };

    inline const char* EventLevelToString(EventLevel level)
    {
        switch (level) {
            case EventLevel::VERBOSE: return "Verbose";
            case EventLevel::INFORMATIONAL: return "Informational";
            case EventLevel::WARNING: return "Warning";
            case EventLevel::ERROR: return "Error";
            case EventLevel::CRITICAL: return "Critical";
            default: return "Unknown";
        }
    }

    /**
     * @brief 텔레메트리 수신자 인터페이스
     *
     * 저장 방식과 전송 방식은 구현체가 결정한다.
     * 여러 스레드에서 동시에 호출될 수 있다.
     */
    class ITracer
    {
    public:
        virtual ~ITracer() = default;

        virtual void RelatedEvent(EventLevel level, const std::string& event_name, const EventMetadata& metadata) = 0;

        virtual void RelatedError(const EventMetadata& metadata, const std::string& message) = 0;

        virtual void RelatedError(const std::string& message) = 0;
    };
}
