// src/common/network/https/include/TransportException.hpp
#pragma once

#include <stdexcept>
#include <string>

namespace objfetch::network::https
{
    /**
     * @brief 전송 단계 (실패 위치 기록용)
     */
    enum class TransportStage
    {
        RESOLVE = 0,
        CONNECT = 1,
        HANDSHAKE = 2,
        WRITE = 3,
        READ = 4
    };

    inline const char* TransportStageToString(TransportStage stage)
    {
        switch (stage) {
            case TransportStage::RESOLVE: return "Resolve";
            case TransportStage::CONNECT: return "Connect";
            case TransportStage::HANDSHAKE: return "Handshake";
            case TransportStage::WRITE: return "Write";
            case TransportStage::READ: return "Read";
            default: return "Unknown";
        }
    }

    /**
     * @brief 상태 코드를 받기 전에 발생한 저수준 전송 실패
     */
    class TransportException : public std::runtime_error
    {
    private:
        TransportStage stage_;

    public:
        TransportException(TransportStage stage, const std::string& message)
            : std::runtime_error(message), stage_(stage) {}

        TransportStage GetStage() const { return stage_; }
    };

    /**
     * @brief 요청이 중단됨 (설정된 타임아웃 또는 취소 신호)
     *
     * 실제 취소 요청이 있었는지는 호출자가 자신의 CancellationToken 으로 구분한다.
     */
    class RequestAbortedException : public TransportException
    {
    public:
        RequestAbortedException(TransportStage stage, const std::string& message)
            : TransportException(stage, message) {}
    };

    /**
     * @brief TLS 인증서 신뢰 거부 (서버 인증서 검증 실패, 클라이언트 인증서 거부 등)
     */
    class CertificateTrustException : public TransportException
    {
    public:
        explicit CertificateTrustException(const std::string& message)
            : TransportException(TransportStage::HANDSHAKE, message) {}
    };
}
