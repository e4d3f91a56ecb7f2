// src/common/env/EnvConfig.hpp
#pragma once
#include <string>
#include <unordered_map>
#include <vector>
#include <cstdint>
#include <stdexcept>

namespace objfetch::env
{
    // 설정 누락 예외
    class ConfigMissingException : public std::runtime_error {
    public:
        explicit ConfigMissingException(const std::string& key)
            : std::runtime_error("Required config missing: " + key) {}
    };

    // 설정 키
    namespace Keys
    {
        constexpr const char* HTTP_TIMEOUT_SECONDS = "HTTP_TIMEOUT_SECONDS";
        constexpr const char* HTTP_MAX_RETRIES = "HTTP_MAX_RETRIES";
        constexpr const char* HTTP_MAX_CONNECTIONS = "HTTP_MAX_CONNECTIONS";
        constexpr const char* SSL_VERIFY = "SSL_VERIFY";
        constexpr const char* SSL_CERT = "SSL_CERT";
        constexpr const char* SSL_CERT_PASSWORD_PROTECTED = "SSL_CERT_PASSWORD_PROTECTED";
        constexpr const char* SSL_CERT_STORE = "SSL_CERT_STORE";
        constexpr const char* GIT_BINARY = "GIT_BINARY";
        constexpr const char* CREDENTIAL_USERNAME = "CREDENTIAL_USERNAME";
        constexpr const char* CREDENTIAL_PASSWORD = "CREDENTIAL_PASSWORD";
        constexpr const char* LOG_FILE = "LOG_FILE";
    }

    class EnvConfig
    {
    private:
        std::unordered_map<std::string, std::string> config_map;
        std::string env_type;
        bool is_loaded = false;

    public:
        EnvConfig() = default;
        ~EnvConfig() = default;

        // 환경 설정 파일 로드 (KEY=VALUE, '#' 주석)
        bool LoadFromFile(const std::string& file_path);
        bool LoadFromEnv(const std::string& env_name);  // env/.env.{env_name}

        // 필수 값 (없으면 ConfigMissingException)
        std::string GetString(const std::string& key) const;
        uint32_t GetUInt32(const std::string& key) const;
        bool GetBool(const std::string& key) const;

        // 선택 값 (없거나 비어 있으면 기본값, 형식 오류는 예외)
        std::string GetStringOr(const std::string& key, const std::string& default_value) const;
        uint32_t GetUInt32Or(const std::string& key, uint32_t default_value) const;
        bool GetBoolOr(const std::string& key, bool default_value) const;

        // 콤마로 구분된 배열 (필수)
        std::vector<std::string> GetStringArray(const std::string& key) const;

        bool HasKey(const std::string& key) const;

        // 코드에서 직접 값을 넣을 때 (테스트, CLI 인자)
        void Set(const std::string& key, const std::string& value);

        std::string GetEnvType() const { return env_type; }
        bool IsLoaded() const { return is_loaded; }

        // 여러 필수 키 한번에 검증
        void ValidateRequired(const std::vector<std::string>& required_keys) const;

    private:
        bool ParseLine(const std::string& line);
    };
} // namespace objfetch::env
