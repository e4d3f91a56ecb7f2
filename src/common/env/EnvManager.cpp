// src/common/env/EnvManager.cpp
#include "EnvManager.hpp"
#include "common/utils/logger/Logger.hpp"
#include <filesystem>
#include <stdexcept>

namespace objfetch::env
{
    std::unique_ptr<EnvManager> EnvManager::instance = nullptr;
    std::mutex EnvManager::instance_mutex;

    namespace
    {
        bool LoadInto(EnvConfig& config, const std::string& env_or_path)
        {
            std::error_code ec;
            if (std::filesystem::is_regular_file(env_or_path, ec)) {
                return config.LoadFromFile(env_or_path);
            }
            return config.LoadFromEnv(env_or_path);
        }
    }

    EnvManager& EnvManager::Instance()
    {
        std::lock_guard<std::mutex> lock(instance_mutex);

        if (!instance) {
            // private 생성자라 make_unique 사용 불가
            instance = std::unique_ptr<EnvManager>(new EnvManager());
        }

        return *instance;
    }

    bool EnvManager::Initialize(const std::string& env_or_path)
    {
        std::lock_guard<std::mutex> lock(config_mutex);

        if (is_initialized) {
            LOG_WARNF("EnvManager", "Already initialized from %s, requested %s",
                      source_path.c_str(), env_or_path.c_str());
            return source_path == env_or_path;
        }

        auto config = std::make_unique<EnvConfig>();
        if (!LoadInto(*config, env_or_path)) {
            LOG_ERRORF("EnvManager", "Failed to load environment configuration: %s", env_or_path.c_str());
            return false;
        }

        env_config = std::move(config);
        source_path = env_or_path;
        is_initialized = true;
        LOG_INFOF("EnvManager", "Initialized with environment: %s", env_or_path.c_str());
        return true;
    }

    bool EnvManager::IsInitialized() const
    {
        std::lock_guard<std::mutex> lock(config_mutex);
        return is_initialized;
    }

    const EnvConfig& EnvManager::GetConfig() const
    {
        EnsureInitialized();
        return *env_config;
    }

    void EnvManager::EnsureInitialized() const
    {
        std::lock_guard<std::mutex> lock(config_mutex);
        if (!is_initialized || !env_config) {
            throw std::runtime_error(
                "EnvManager not initialized. Call EnvManager::Instance().Initialize(env) first."
            );
        }
    }

    bool EnvManager::Reload()
    {
        std::lock_guard<std::mutex> lock(config_mutex);

        if (!is_initialized || !env_config) {
            LOG_ERROR("EnvManager", "Cannot reload: EnvManager not initialized");
            return false;
        }

        auto config = std::make_unique<EnvConfig>();
        if (!LoadInto(*config, source_path)) {
            LOG_ERRORF("EnvManager", "Failed to reload environment configuration: %s", source_path.c_str());
            return false;
        }

        env_config = std::move(config);
        LOG_INFO("EnvManager", "Configuration reloaded");
        return true;
    }

    void EnvManager::LogLoadedConfig() const
    {
        const EnvConfig& config = GetConfig();

        // 비밀번호 등 민감 정보는 제외
        const char* safe_keys[] = {
            Keys::HTTP_TIMEOUT_SECONDS, Keys::HTTP_MAX_RETRIES, Keys::HTTP_MAX_CONNECTIONS,
            Keys::SSL_VERIFY, Keys::SSL_CERT, Keys::SSL_CERT_PASSWORD_PROTECTED,
            Keys::SSL_CERT_STORE, Keys::GIT_BINARY, Keys::CREDENTIAL_USERNAME, Keys::LOG_FILE
        };

        for (const char* key : safe_keys) {
            if (config.HasKey(key)) {
                LOG_INFOF("EnvManager", "  %s = %s", key, config.GetStringOr(key, "").c_str());
            }
        }
    }

} // namespace objfetch::env
