// src/common/network/tls/src/CertificateLoader.cpp
#include "common/network/tls/include/CertificateLoader.hpp"
#include "common/utils/logger/Logger.hpp"
#include <filesystem>
#include <fstream>
#include <sstream>

namespace objfetch::network::tls
{
    namespace
    {
        std::string ReadCertificateFile(const std::string& path)
        {
            std::ifstream file(path, std::ios::binary);
            if (!file.is_open()) {
                throw CertificateParseException("Failed to open certificate file: " + path);
            }

            std::stringstream buffer;
            buffer << file.rdbuf();
            return buffer.str();
        }
    }

    CertificateLoader::CertificateLoader(tracing::ITracer& tracer, StoreFactory store_factory)
        : tracer_(tracer)
        , store_factory_(std::move(store_factory))
    {
        if (!store_factory_) {
            throw std::invalid_argument("Certificate store factory cannot be null");
        }
    }

    CertificateLoader::StoreFactory CertificateLoader::DirectoryStoreFactory(const std::string& directory)
    {
        return [directory]() -> std::unique_ptr<ICertificateStore> {
            return DirectoryCertificateStore::Open(directory);
        };
    }

    std::optional<ClientCertificate> CertificateLoader::Resolve(
        const std::string& cert_id,
        const PasswordSource& password_source,
        bool require_valid)
    {
        std::error_code ec;
        if (std::filesystem::is_regular_file(cert_id, ec)) {
            return LoadFromFile(cert_id, password_source, require_valid);
        }

        try {
            std::vector<ClientCertificate> matches = GetStore().FindBySubjectName(cert_id, require_valid);
            if (!matches.empty()) {
                LOG_INFOF("CertificateLoader", "Using certificate %s from store",
                          matches.front().GetSubject().c_str());
                return std::optional<ClientCertificate>(std::move(matches.front()));
            }
        } catch (const CertificateStoreException& e) {
            tracing::EventMetadata metadata;
            metadata["Exception"] = e.what();
            tracer_.RelatedError(metadata, "Error, while searching for certificate in store");
            return std::nullopt;
        }

        tracer_.RelatedError("Certificate " + cert_id + " not found");
        return std::nullopt;
    }

    std::optional<ClientCertificate> CertificateLoader::LoadFromFile(
        const std::string& path,
        const PasswordSource& password_source,
        bool require_valid)
    {
        try {
            std::optional<std::string> password;
            if (password_source) {
                password = password_source();
            }

            ClientCertificate certificate = ClientCertificate::FromBundle(ReadCertificateFile(path), password);

            if (require_valid && !certificate.Verify()) {
                LOG_DEBUGF("CertificateLoader", "Certificate %s failed verification, ignoring", path.c_str());
                return std::nullopt;
            }

            LOG_INFOF("CertificateLoader", "Loaded certificate %s from %s",
                      certificate.GetSubject().c_str(), path.c_str());
            return std::optional<ClientCertificate>(std::move(certificate));
        } catch (const CertificateParseException& e) {
            tracing::EventMetadata metadata;
            metadata["Exception"] = e.what();
            tracer_.RelatedError(metadata, "Error, while loading certificate from disk");
            return std::nullopt;
        }
    }

    ICertificateStore& CertificateLoader::GetStore()
    {
        // 팩토리가 던지면 once_flag 가 세팅되지 않아 다음 호출에서 다시 시도한다
        std::call_once(store_once_, [this]() {
            store_ = store_factory_();
            if (!store_) {
                throw CertificateStoreException("Certificate store factory returned no store");
            }
        });
        return *store_;
    }
}
