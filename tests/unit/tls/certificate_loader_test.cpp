// tests/unit/tls/certificate_loader_test.cpp
#include <gtest/gtest.h>
#include "common/network/tls/include/CertificateLoader.hpp"
#include "common/network/tls/include/CertificateStore.hpp"
#include "common/network/tls/include/ClientCertificate.hpp"
#include "common/network/tls/include/TlsContext.hpp"
#include "support/TempDir.hpp"
#include "support/TestCertificates.hpp"
#include "support/TestDoubles.hpp"
#include <algorithm>
#include <filesystem>

using namespace objfetch::network::tls;
using objfetch::test_support::RecordingTracer;
using objfetch::test_support::TempDir;
using objfetch::test_support::GenerateKey;
using objfetch::test_support::MakeSelfSigned;
using objfetch::test_support::ToPem;
using objfetch::test_support::ToPkcs12;

// ========== Helper 함수 ==========

namespace
{
    bool Contains(const std::vector<std::string>& messages, const std::string& needle) {
        return std::any_of(messages.begin(), messages.end(), [&](const std::string& message) {
            return message.find(needle) != std::string::npos;
        });
    }
}

// ========== 테스트 Fixture ==========

class CertificateLoaderTest : public ::testing::Test {
protected:
    void SetUp() override {
        key = GenerateKey();
        cert = MakeSelfSigned(key.get(), "objfetch-client");
        store_dir = (temp.Path() / "store").string();
        std::filesystem::create_directory(store_dir);
    }

    CertificateLoader::StoreFactory CountingStoreFactory() {
        return [this]() -> std::unique_ptr<ICertificateStore> {
            ++store_opens;
            return DirectoryCertificateStore::Open(store_dir);
        };
    }

    CertificateLoader::PasswordSource Password(const std::string& password) {
        return [this, password]() -> std::optional<std::string> {
            ++password_requests;
            return password;
        };
    }

    TempDir temp;
    RecordingTracer tracer;
    EvpPkeyPtr key;
    X509Ptr cert;
    std::string store_dir;
    int store_opens = 0;
    int password_requests = 0;
};

// ========== 디스크 ==========

TEST_F(CertificateLoaderTest, LoadsPasswordProtectedPkcs12FromDisk) {
    std::string path = temp.Write("client.p12", ToPkcs12(cert.get(), key.get(), "s3cret"));

    CertificateLoader loader(tracer, CountingStoreFactory());
    auto certificate = loader.Resolve(path, Password("s3cret"), false);

    ASSERT_TRUE(certificate.has_value());
    EXPECT_NE(certificate->GetSubject().find("CN=objfetch-client"), std::string::npos);
    EXPECT_NE(certificate->GetPrivateKey(), nullptr);
    EXPECT_EQ(password_requests, 1);
    EXPECT_EQ(store_opens, 0);
    EXPECT_FALSE(loader.IsStoreOpened());
    EXPECT_TRUE(tracer.ErrorMessages().empty());
}

TEST_F(CertificateLoaderTest, WrongPasswordIsReportedAndAbsorbed) {
    std::string path = temp.Write("client.p12", ToPkcs12(cert.get(), key.get(), "s3cret"));

    CertificateLoader loader(tracer, CountingStoreFactory());
    auto certificate = loader.Resolve(path, Password("wrong"), false);

    EXPECT_FALSE(certificate.has_value());
    EXPECT_EQ(store_opens, 0);

    auto errors = tracer.Named("Error");
    ASSERT_EQ(errors.size(), 1u);
    EXPECT_EQ(errors.front().error_message, "Error, while loading certificate from disk");
    EXPECT_TRUE(errors.front().metadata.contains("Exception"));
}

TEST_F(CertificateLoaderTest, LoadsUnencryptedPemWithoutPassword) {
    std::string path = temp.Write("client.pem", ToPem(cert.get(), key.get()));

    CertificateLoader loader(tracer, CountingStoreFactory());
    auto certificate = loader.Resolve(path, nullptr, false);

    ASSERT_TRUE(certificate.has_value());
    EXPECT_TRUE(certificate->IsWithinValidityPeriod());
}

TEST_F(CertificateLoaderTest, RequireValidRejectsUntrustedCertificate) {
    std::string path = temp.Write("client.pem", ToPem(cert.get(), key.get()));

    CertificateLoader loader(tracer, CountingStoreFactory());
    auto certificate = loader.Resolve(path, nullptr, true);

    EXPECT_FALSE(certificate.has_value());
    EXPECT_TRUE(tracer.ErrorMessages().empty());
}

TEST_F(CertificateLoaderTest, CorruptFileIsReported) {
    std::string path = temp.Write("client.p12", "definitely not a certificate");

    CertificateLoader loader(tracer, CountingStoreFactory());
    EXPECT_FALSE(loader.Resolve(path, nullptr, false).has_value());
    EXPECT_TRUE(Contains(tracer.ErrorMessages(), "Error, while loading certificate from disk"));
}

// ========== 저장소 ==========

TEST_F(CertificateLoaderTest, FindsCertificateInStoreBySubject) {
    temp.Write("store/objfetch-client.pem", ToPem(cert.get(), key.get()));

    CertificateLoader loader(tracer, CountingStoreFactory());
    auto certificate = loader.Resolve("OBJFETCH-CLIENT", Password("unused"), false);

    ASSERT_TRUE(certificate.has_value());
    EXPECT_NE(certificate->GetSubject().find("objfetch-client"), std::string::npos);
    EXPECT_EQ(password_requests, 0);
    EXPECT_TRUE(loader.IsStoreOpened());
}

TEST_F(CertificateLoaderTest, StoreIsOpenedOnce) {
    CertificateLoader loader(tracer, CountingStoreFactory());

    EXPECT_FALSE(loader.Resolve("first", nullptr, false).has_value());
    EXPECT_FALSE(loader.Resolve("second", nullptr, false).has_value());
    EXPECT_EQ(store_opens, 1);
}

TEST_F(CertificateLoaderTest, NotFoundIsReported) {
    CertificateLoader loader(tracer, CountingStoreFactory());
    auto certificate = loader.Resolve("missing-cert", nullptr, false);

    EXPECT_FALSE(certificate.has_value());
    std::vector<std::string> expected = {"Certificate missing-cert not found"};
    EXPECT_EQ(tracer.ErrorMessages(), expected);
}

TEST_F(CertificateLoaderTest, StoreOpenFailureIsReported) {
    CertificateLoader loader(tracer, CertificateLoader::DirectoryStoreFactory((temp.Path() / "absent").string()));
    auto certificate = loader.Resolve("objfetch-client", nullptr, false);

    EXPECT_FALSE(certificate.has_value());
    auto errors = tracer.Named("Error");
    ASSERT_EQ(errors.size(), 1u);
    EXPECT_EQ(errors.front().error_message, "Error, while searching for certificate in store");
}

TEST_F(CertificateLoaderTest, StoreRequireValidSkipsUntrusted) {
    temp.Write("store/objfetch-client.pem", ToPem(cert.get(), key.get()));

    CertificateLoader loader(tracer, CountingStoreFactory());
    EXPECT_FALSE(loader.Resolve("objfetch-client", nullptr, true).has_value());
    EXPECT_TRUE(Contains(tracer.ErrorMessages(), "not found"));
}

TEST_F(CertificateLoaderTest, RejectsNullStoreFactory) {
    EXPECT_THROW(CertificateLoader(tracer, nullptr), std::invalid_argument);
}

// ========== DirectoryCertificateStore / ClientCertificate ==========

TEST_F(CertificateLoaderTest, DirectoryStoreSkipsUnusableEntries) {
    EvpPkeyPtr other_key = GenerateKey();
    X509Ptr other = MakeSelfSigned(other_key.get(), "other-client");

    temp.Write("store/a.pem", ToPem(cert.get(), key.get()));
    temp.Write("store/b.crt", ToPem(other.get(), other_key.get()));
    temp.Write("store/c.pem", "garbage");
    temp.Write("store/d.txt", ToPem(cert.get(), key.get()));

    auto store = DirectoryCertificateStore::Open(store_dir);
    EXPECT_EQ(store->Size(), 2u);
    EXPECT_EQ(store->GetLocation(), store_dir);
    EXPECT_EQ(store->FindBySubjectName("client", false).size(), 2u);
    EXPECT_EQ(store->FindBySubjectName("other", false).size(), 1u);
    EXPECT_TRUE(store->FindBySubjectName("nobody", false).empty());
}

TEST_F(CertificateLoaderTest, DirectoryStoreToleratesOddEntries) {
    temp.Write("store/a.pem", ToPem(cert.get(), key.get()));
    std::filesystem::create_symlink(temp.Path() / "missing.pem", std::filesystem::path(store_dir) / "dangling.pem");
    std::filesystem::create_directory(std::filesystem::path(store_dir) / "nested.crt");

    std::unique_ptr<DirectoryCertificateStore> store;
    ASSERT_NO_THROW(store = DirectoryCertificateStore::Open(store_dir));
    EXPECT_EQ(store->Size(), 1u);
}

TEST_F(CertificateLoaderTest, StorePathThatIsAFileIsReported) {
    std::string not_a_directory = temp.Write("store.pem", ToPem(cert.get(), key.get()));

    EXPECT_THROW(DirectoryCertificateStore::Open(not_a_directory), CertificateStoreException);

    CertificateLoader loader(tracer, CertificateLoader::DirectoryStoreFactory(not_a_directory));
    EXPECT_FALSE(loader.Resolve("objfetch-client", nullptr, false).has_value());
    std::vector<std::string> expected = {"Error, while searching for certificate in store"};
    EXPECT_EQ(tracer.ErrorMessages(), expected);
}

TEST_F(CertificateLoaderTest, ExpiredCertificateIsOutsideValidity) {
    X509Ptr expired = MakeSelfSigned(key.get(), "expired", -7200, -3600);
    ClientCertificate certificate(std::move(expired), nullptr);
    EXPECT_FALSE(certificate.IsWithinValidityPeriod());
}

TEST_F(CertificateLoaderTest, CloneSharesUnderlyingObjects) {
    ClientCertificate original = ClientCertificate::FromPem(ToPem(cert.get(), key.get()), std::nullopt);
    ClientCertificate copy = original.Clone();

    EXPECT_EQ(copy.GetCertificate(), original.GetCertificate());
    EXPECT_EQ(copy.GetPrivateKey(), original.GetPrivateKey());
    EXPECT_EQ(copy.GetSubject(), original.GetSubject());
}

TEST_F(CertificateLoaderTest, TlsContextAcceptsLoadedCertificate) {
    TlsContext::GlobalInit();
    ClientCertificate certificate = ClientCertificate::FromPem(ToPem(cert.get(), key.get()), std::nullopt);

    TlsContext context;
    ASSERT_TRUE(context.Initialize(TlsConfig::CreateSecureClientConfig(false)));
    EXPECT_FALSE(context.VerifiesPeer());
    EXPECT_FALSE(context.HasCertificate());

    EXPECT_TRUE(context.UseClientCertificate(certificate));
    EXPECT_TRUE(context.HasCertificate());
}
