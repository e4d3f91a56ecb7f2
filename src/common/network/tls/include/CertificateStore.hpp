// src/common/network/tls/include/CertificateStore.hpp
#pragma once

#include "common/network/tls/include/ClientCertificate.hpp"
#include <memory>
#include <stdexcept>
#include <string>
#include <vector>

namespace objfetch::network::tls
{
    /**
     * @brief 인증서 저장소를 열거나 읽지 못했을 때
     */
    class CertificateStoreException : public std::runtime_error
    {
    public:
        explicit CertificateStoreException(const std::string& message)
            : std::runtime_error(message) {}
    };

    /**
     * @brief 사용자 인증서 저장소 (읽기 전용)
     */
    class ICertificateStore
    {
    public:
        virtual ~ICertificateStore() = default;

        /**
         * @brief 주체 이름으로 인증서 검색
         *
         * @param subject_name 대소문자 무시 부분 일치
         * @param valid_only true 면 체인 검증과 유효 기간을 통과한 인증서만
         * @return 일치하는 인증서 (찾은 순서대로)
         */
        virtual std::vector<ClientCertificate> FindBySubjectName(const std::string& subject_name, bool valid_only) const = 0;

        virtual std::string GetLocation() const = 0;
    };

    /**
     * @brief 디렉토리 기반 저장소
     *
     * 디렉토리 안의 *.pem, *.crt 파일마다 인증서 하나와 암호화되지 않은 개인키를 담는다.
     * 개인키가 없는 파일은 클라이언트 인증에 쓸 수 없으므로 건너뛴다.
     */
    class DirectoryCertificateStore : public ICertificateStore
    {
    private:
        std::string directory_;
        std::vector<ClientCertificate> certificates_;

        explicit DirectoryCertificateStore(std::string directory);

    public:
        /**
         * @brief 기존 디렉토리만 연다 (생성하지 않음)
         * @throws CertificateStoreException 디렉토리가 없거나 읽을 수 없을 때
         */
        static std::unique_ptr<DirectoryCertificateStore> Open(const std::string& directory);

        std::vector<ClientCertificate> FindBySubjectName(const std::string& subject_name, bool valid_only) const override;

        std::string GetLocation() const override { return directory_; }

        size_t Size() const { return certificates_.size(); }

    private:
        void LoadEntries();
    };
}
