// src/common/network/tls/include/CertificateLoader.hpp
#pragma once

#include "common/network/tls/include/CertificateStore.hpp"
#include "common/network/tls/include/ClientCertificate.hpp"
#include "common/tracing/include/ITracer.hpp"
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <string>

namespace objfetch::network::tls
{
    /**
     * @brief 클라이언트 인증서 식별자 해석기
     *
     * 식별자가 존재하는 파일이면 디스크에서 읽고, 아니면 주체 이름으로 보고 저장소에서 찾는다.
     * 어떤 실패도 호출자에게 던지지 않고 텔레메트리에 남긴 뒤 "없음"으로 처리한다.
     *
     * 저장소는 첫 검색 시 한 번만 열고 이 객체가 살아 있는 동안 유지한다.
     */
    class CertificateLoader
    {
    public:
        using StoreFactory = std::function<std::unique_ptr<ICertificateStore>()>;
        using PasswordSource = std::function<std::optional<std::string>()>;

    private:
        tracing::ITracer& tracer_;
        StoreFactory store_factory_;

        std::once_flag store_once_;
        std::unique_ptr<ICertificateStore> store_;

    public:
        CertificateLoader(tracing::ITracer& tracer, StoreFactory store_factory);

        CertificateLoader(const CertificateLoader&) = delete;
        CertificateLoader& operator=(const CertificateLoader&) = delete;

        /**
         * @brief 인증서 식별자 해석
         *
         * @param cert_id 파일 경로 또는 저장소 주체 이름
         * @param password_source 파일을 읽을 때만 호출된다. nullopt 면 비밀번호 없이 읽는다
         * @param require_valid true 면 검증에 실패한 인증서는 없는 것으로 본다
         * @return 인증서, 없으면 nullopt
         */
        std::optional<ClientCertificate> Resolve(
            const std::string& cert_id,
            const PasswordSource& password_source,
            bool require_valid
        );

        bool IsStoreOpened() const { return store_ != nullptr; }

        /**
         * @brief 기본 저장소 팩토리 (DirectoryCertificateStore::Open)
         */
        static StoreFactory DirectoryStoreFactory(const std::string& directory);

    private:
        std::optional<ClientCertificate> LoadFromFile(
            const std::string& path,
            const PasswordSource& password_source,
            bool require_valid
        );

        ICertificateStore& GetStore();
    };
}
