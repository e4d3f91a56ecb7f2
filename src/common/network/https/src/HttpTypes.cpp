// src/common/network/https/src/HttpTypes.cpp
#include "common/network/https/include/HttpTypes.hpp"
#include <algorithm>
#include <cctype>

namespace objfetch::network::https
{
    const char* HttpMethodToString(HttpMethod method)
    {
        switch (method) {
            case HttpMethod::GET: return "GET";
            case HttpMethod::POST: return "POST";
            case HttpMethod::PUT: return "PUT";
            case HttpMethod::HEAD: return "HEAD";
            case HttpMethod::DELETE_: return "DELETE";
            default: return "UNKNOWN";
        }
    }

    std::string HttpStatusToString(int status_code)
    {
        switch (status_code) {
            case 200: return "OK";
            case 201: return "Created";
            case 204: return "NoContent";
            case 206: return "PartialContent";
            case 301: return "MovedPermanently";
            case 302: return "Redirect";
            case 304: return "NotModified";
            case 307: return "TemporaryRedirect";
            case 400: return "BadRequest";
            case 401: return "Unauthorized";
            case 403: return "Forbidden";
            case 404: return "NotFound";
            case 405: return "MethodNotAllowed";
            case 408: return "RequestTimeout";
            case 409: return "Conflict";
            case 429: return "TooManyRequests";
            case 500: return "InternalServerError";
            case 501: return "NotImplemented";
            case 502: return "BadGateway";
            case 503: return "ServiceUnavailable";
            case 504: return "GatewayTimeout";
            default: return std::to_string(status_code);
        }
    }

    Uri Uri::Parse(const std::string& text)
    {
        size_t scheme_end = text.find("://");
        if (scheme_end == std::string::npos || scheme_end == 0) {
            throw std::invalid_argument("Invalid URI (missing scheme): " + text);
        }

        Uri uri;
        uri.scheme = text.substr(0, scheme_end);
        std::transform(uri.scheme.begin(), uri.scheme.end(), uri.scheme.begin(),
                       [](unsigned char c) { return static_cast<char>(std::tolower(c)); });

        if (uri.scheme != "https") {
            throw std::invalid_argument("Unsupported URI scheme '" + uri.scheme + "': " + text);
        }

        size_t authority_start = scheme_end + 3;
        size_t path_start = text.find_first_of("/?", authority_start);
        std::string authority = text.substr(authority_start,
            path_start == std::string::npos ? std::string::npos : path_start - authority_start);

        if (path_start != std::string::npos) {
            uri.target = text.substr(path_start);
            if (uri.target.front() == '?') {
                uri.target.insert(uri.target.begin(), '/');
            }
        }

        // userinfo 는 지원하지 않음
        if (authority.find('@') != std::string::npos) {
            throw std::invalid_argument("URI userinfo is not supported: " + text);
        }

        size_t colon = authority.rfind(':');
        size_t bracket = authority.rfind(']');
        if (colon != std::string::npos && (bracket == std::string::npos || colon > bracket)) {
            std::string port_text = authority.substr(colon + 1);
            authority = authority.substr(0, colon);

            if (port_text.empty() || port_text.size() > 5 ||
                !std::all_of(port_text.begin(), port_text.end(), [](unsigned char c) { return std::isdigit(c); })) {
                throw std::invalid_argument("Invalid URI port: " + text);
            }

            unsigned long port = std::stoul(port_text);
            if (port == 0 || port > 65535) {
                throw std::invalid_argument("Invalid URI port: " + text);
            }
            uri.port = static_cast<uint16_t>(port);
        }

        if (authority.empty()) {
            throw std::invalid_argument("Invalid URI (missing host): " + text);
        }
        // IPv6 리터럴 "[::1]" 은 괄호 없이 저장
        if (authority.size() > 2 && authority.front() == '[' && authority.back() == ']') {
            authority = authority.substr(1, authority.size() - 2);
        }
        uri.host = authority;

        return uri;
    }

    std::string Uri::HostHeader() const
    {
        std::string host_part = host.find(':') != std::string::npos ? "[" + host + "]" : host;
        if (port == 443) {
            return host_part;
        }
        return host_part + ":" + std::to_string(port);
    }

    std::string Uri::ToString() const
    {
        return scheme + "://" + HostHeader() + target;
    }

    std::string HttpRequest::GetHeader(const std::string& name) const
    {
        auto equals_ignore_case = [](const std::string& a, const std::string& b) {
            return a.size() == b.size() &&
                   std::equal(a.begin(), a.end(), b.begin(), [](unsigned char x, unsigned char y) {
                       return std::tolower(x) == std::tolower(y);
                   });
        };

        for (const auto& [key, value] : headers) {
            if (equals_ignore_case(key, name)) {
                return value;
            }
        }
        return "";
    }
}
