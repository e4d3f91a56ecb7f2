// src/common/network/https/include/IHttpTransport.hpp
#pragma once

#include "common/network/https/include/HttpTypes.hpp"
#include "common/utils/threading/CancellationToken.hpp"
#include <cstddef>
#include <memory>
#include <string>

namespace objfetch::network::https
{
    /**
     * @brief 헤더까지 읽은 응답
     *
     * 본문은 ReadSome 으로 필요할 때 읽는다. 소멸자에서 연결을 정리한다.
     */
    class IHttpResponse
    {
    public:
        virtual ~IHttpResponse() = default;

        virtual int StatusCode() const = 0;

        /**
         * @return 헤더 값 (여러 개면 첫 번째), 없으면 빈 문자열
         */
        virtual std::string GetHeader(const std::string& name) const = 0;

        /**
         * @brief 본문 일부 읽기
         * @return 읽은 바이트 수, 본문 끝이면 0
         * @throws TransportException
         */
        virtual size_t ReadSome(char* buffer, size_t size) = 0;

        /**
         * @brief 남은 본문 전체를 문자열로 읽기
         */
        virtual std::string ReadAllAsString();
    };

    /**
     * @brief HTTPS 전송 계층
     */
    class IHttpTransport
    {
    public:
        virtual ~IHttpTransport() = default;

        /**
         * @brief 요청을 보내고 응답 헤더까지 읽는다
         *
         * @throws RequestAbortedException 타임아웃 또는 취소
         * @throws CertificateTrustException TLS 인증서 신뢰 실패
         * @throws TransportException 그 밖의 네트워크 실패
         */
        virtual std::unique_ptr<IHttpResponse> Send(
            const HttpRequest& request,
            const utils::CancellationToken& cancellation_token
        ) = 0;
    };

    inline std::string IHttpResponse::ReadAllAsString()
    {
        std::string body;
        char buffer[8192];
        size_t n = 0;
        while ((n = ReadSome(buffer, sizeof(buffer))) > 0) {
            body.append(buffer, n);
        }
        return body;
    }
}
