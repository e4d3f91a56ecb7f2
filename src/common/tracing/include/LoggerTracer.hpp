// src/common/tracing/include/LoggerTracer.hpp
#pragma once
#include "ITracer.hpp"
#include <string>

namespace objfetch::tracing
{
    /**
     * @brief Logger로 이벤트를 내보내는 ITracer 구현
     *
     * 각 레코드를 한 줄 JSON으로 직렬화하여 "Trace" 카테고리로 기록한다.
     *   {"event":"NetworkResponse","level":"Informational","metadata":{...}}
     */
    class LoggerTracer : public ITracer
    {
    private:
        std::string component_;

    public:
        explicit LoggerTracer(std::string component);

        void RelatedEvent(EventLevel level, const std::string& event_name, const EventMetadata& metadata) override;
        void RelatedError(const EventMetadata& metadata, const std::string& message) override;
        void RelatedError(const std::string& message) override;

        /**
         * @brief 레코드 직렬화 (잘못된 UTF-8은 치환, 예외 없음)
         */
        static std::string Render(const std::string& component, EventLevel level,
                                  const std::string& event_name, const EventMetadata& metadata);
    };
}
