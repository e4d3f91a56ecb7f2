// src/common/env/EnvManager.hpp
#pragma once
#include "EnvConfig.hpp"
#include <memory>
#include <mutex>
#include <string>

namespace objfetch::env
{
    /**
     * @brief 글로벌 설정 관리자 (싱글톤)
     *
     * 프로세스 시작 시 한 번 초기화하고 이후에는 읽기 전용으로 사용한다.
     */
    class EnvManager
    {
    private:
        static std::unique_ptr<EnvManager> instance;
        static std::mutex instance_mutex;

        std::unique_ptr<EnvConfig> env_config;
        std::string source_path;
        mutable std::mutex config_mutex;

        bool is_initialized = false;

        EnvManager() = default;

    public:
        ~EnvManager() = default;

        EnvManager(const EnvManager&) = delete;
        EnvManager& operator=(const EnvManager&) = delete;
        EnvManager(EnvManager&&) = delete;
        EnvManager& operator=(EnvManager&&) = delete;

        static EnvManager& Instance();

        /**
         * @brief 환경 이름 또는 파일 경로로 초기화
         *
         * @param env_or_path 기존 파일 경로면 그 파일을, 아니면 env/.env.{env_or_path} 를 읽는다
         * @return 초기화 성공 여부
         */
        bool Initialize(const std::string& env_or_path);

        bool IsInitialized() const;

        /**
         * @return EnvConfig 참조 (초기화되지 않았으면 예외 발생)
         */
        const EnvConfig& GetConfig() const;

        /**
         * @brief 같은 소스에서 설정 재로드
         */
        bool Reload();

        /**
         * @brief 로드된 설정 요약 로그 (비밀 값 제외)
         */
        void LogLoadedConfig() const;

    private:
        void EnsureInitialized() const;
    };

    namespace Config
    {
        inline const EnvConfig& Get() {
            return EnvManager::Instance().GetConfig();
        }

        inline bool IsInitialized() {
            return EnvManager::Instance().IsInitialized();
        }
    }

} // namespace objfetch::env
