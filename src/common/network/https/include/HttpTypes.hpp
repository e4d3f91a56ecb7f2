// src/common/network/https/include/HttpTypes.hpp
#pragma once

#include <cstdint>
#include <map>
#include <optional>
#include <stdexcept>
#include <string>

namespace objfetch::network::https
{
    enum class HttpMethod
    {
        GET = 0,
        POST = 1,
        PUT = 2,
        HEAD = 3,
        DELETE_ = 4
    };

    const char* HttpMethodToString(HttpMethod method);

    /**
     * @brief 자주 쓰는 상태 코드
     */
    namespace HttpStatus
    {
        constexpr int OK = 200;
        constexpr int REDIRECT = 302;
        constexpr int BAD_REQUEST = 400;
        constexpr int UNAUTHORIZED = 401;
        constexpr int FORBIDDEN = 403;
        constexpr int NOT_FOUND = 404;
        constexpr int REQUEST_TIMEOUT = 408;
        constexpr int INTERNAL_SERVER_ERROR = 500;
        constexpr int SERVICE_UNAVAILABLE = 503;
    }

    /**
     * @brief 상태 코드 이름 (예: 401 -> "Unauthorized"). 모르는 코드는 숫자 문자열
     */
    std::string HttpStatusToString(int status_code);

    namespace HeaderNames
    {
        constexpr const char* AUTHORIZATION = "Authorization";
        constexpr const char* USER_AGENT = "User-Agent";
        constexpr const char* ACCEPT = "Accept";
        constexpr const char* CONTENT_TYPE = "Content-Type";
        constexpr const char* CACHE_NAME = "X-Cache-Name";
        constexpr const char* FED_AUTH_REDIRECT = "X-TFS-FedAuthRedirect";
    }

    /**
     * @brief https URI (scheme://host[:port]/target)
     */
    struct Uri
    {
        std::string scheme;
        std::string host;
        uint16_t port = 443;
        std::string target = "/";

        /**
         * @throws std::invalid_argument 형식 오류 또는 https 가 아닌 scheme
         */
        static Uri Parse(const std::string& text);

        /**
         * @brief 기본 포트면 생략한 host 헤더 값
         */
        std::string HostHeader() const;

        std::string ToString() const;
    };

    /**
     * @brief 전송 계층에 넘기는 요청
     *
     * 헤더 이름 비교는 대소문자를 구분하지 않는다 (Beast 가 처리).
     */
    struct HttpRequest
    {
        HttpMethod method = HttpMethod::GET;
        Uri uri;
        std::map<std::string, std::string> headers;
        std::optional<std::string> body;

        std::string GetHeader(const std::string& name) const;
    };
}
