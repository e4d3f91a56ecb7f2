// src/common/auth/include/GitCertificatePasswordProvider.hpp
#pragma once
#include "common/auth/include/ICertificatePasswordProvider.hpp"
#include <optional>
#include <string>

namespace objfetch::auth
{
    /**
     * @brief git credential helper 로 인증서 비밀번호 조회
     *
     * `git credential fill` 에 다음을 넘기고 출력의 password= 줄을 읽는다.
     *
     *   protocol=cert
     *   path=<cert_id>
     *   username=
     *
     * git 이 설정된 credential helper 를 호출하므로 저장소(키체인 등)는 helper 가 결정한다.
     */
    class GitCertificatePasswordProvider : public ICertificatePasswordProvider
    {
    private:
        std::string git_binary_;

    public:
        explicit GitCertificatePasswordProvider(std::string git_binary = "git");

        bool TryGetCertificatePassword(
            tracing::ITracer& tracer,
            const std::string& cert_id,
            std::string& password,
            std::string& error_message
        ) override;

        const std::string& GetGitBinary() const { return git_binary_; }

        static std::string BuildCredentialRequest(const std::string& cert_id);

        /**
         * @brief credential 출력에서 password 값 추출 (없으면 nullopt)
         */
        static std::optional<std::string> ParsePassword(const std::string& output);

    private:
        /**
         * @brief git credential fill 실행
         * @return 종료 코드 0 이면 true
         */
        bool RunCredentialFill(const std::string& input, std::string& output, std::string& error_message) const;
    };
}
