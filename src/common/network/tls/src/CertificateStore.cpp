// src/common/network/tls/src/CertificateStore.cpp
#include "common/network/tls/include/CertificateStore.hpp"
#include "common/utils/logger/Logger.hpp"
#include <algorithm>
#include <cctype>
#include <filesystem>
#include <fstream>
#include <sstream>

namespace objfetch::network::tls
{
    namespace
    {
        std::string ToLower(std::string value)
        {
            std::transform(value.begin(), value.end(), value.begin(),
                           [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
            return value;
        }

        bool IsCertificateFile(const std::filesystem::path& path)
        {
            std::string extension = ToLower(path.extension().string());
            return extension == ".pem" || extension == ".crt";
        }

        std::string ReadPemFile(const std::filesystem::path& path)
        {
            std::ifstream file(path, std::ios::binary);
            if (!file.is_open()) {
                return "";
            }

            std::stringstream buffer;
            buffer << file.rdbuf();
            return buffer.str();
        }
    }

    DirectoryCertificateStore::DirectoryCertificateStore(std::string directory)
        : directory_(std::move(directory))
    {
    }

    std::unique_ptr<DirectoryCertificateStore> DirectoryCertificateStore::Open(const std::string& directory)
    {
        std::error_code ec;
        if (!std::filesystem::is_directory(directory, ec)) {
            throw CertificateStoreException("Certificate store does not exist: " + directory);
        }

        // private 생성자라 make_unique 사용 불가
        auto store = std::unique_ptr<DirectoryCertificateStore>(new DirectoryCertificateStore(directory));
        store->LoadEntries();

        LOG_DEBUGF("CertificateStore", "Opened %s with %zu certificate(s)", directory.c_str(), store->Size());
        return store;
    }

    void DirectoryCertificateStore::LoadEntries()
    {
        std::error_code ec;
        std::filesystem::directory_iterator it(directory_, ec);
        if (ec) {
            throw CertificateStoreException("Failed to read certificate store " + directory_ + ": " + ec.message());
        }

        // 범위 for 의 증가 연산은 예외를 던지므로 error_code 로 순회
        std::vector<std::filesystem::path> paths;
        for (; it != std::filesystem::directory_iterator(); it.increment(ec)) {
            std::error_code entry_ec;
            if (it->is_regular_file(entry_ec) && IsCertificateFile(it->path())) {
                paths.push_back(it->path());
            }
        }
        if (ec) {
            throw CertificateStoreException("Failed to read certificate store " + directory_ + ": " + ec.message());
        }

        // 디렉토리 순회 순서는 보장되지 않으므로 정렬
        std::sort(paths.begin(), paths.end());

        for (const auto& path : paths) {
            std::string pem = ReadPemFile(path);
            if (pem.empty()) {
                LOG_WARNF("CertificateStore", "Skipping unreadable entry %s", path.string().c_str());
                continue;
            }

            try {
                certificates_.push_back(ClientCertificate::FromPem(pem, std::nullopt));
            } catch (const CertificateParseException& e) {
                LOG_DEBUGF("CertificateStore", "Skipping %s: %s", path.string().c_str(), e.what());
            }
        }
    }

    std::vector<ClientCertificate> DirectoryCertificateStore::FindBySubjectName(const std::string& subject_name, bool valid_only) const
    {
        std::vector<ClientCertificate> matches;
        std::string needle = ToLower(subject_name);

        for (const auto& certificate : certificates_) {
            if (ToLower(certificate.GetSubject()).find(needle) == std::string::npos) {
                continue;
            }

            if (valid_only && !certificate.Verify()) {
                continue;
            }

            matches.push_back(certificate.Clone());
        }

        return matches;
    }
}
