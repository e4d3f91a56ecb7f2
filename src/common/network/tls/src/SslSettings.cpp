// src/common/network/tls/src/SslSettings.cpp
#include "common/network/tls/include/SslSettings.hpp"
#include <cstdlib>

namespace objfetch::network::tls
{
    SslSettings SslSettings::FromConfig(const env::EnvConfig& config)
    {
        SslSettings settings;
        settings.ssl_verify = config.GetBoolOr(env::Keys::SSL_VERIFY, true);
        settings.ssl_certificate = config.GetStringOr(env::Keys::SSL_CERT, "");
        settings.ssl_cert_password_protected = config.GetBoolOr(env::Keys::SSL_CERT_PASSWORD_PROTECTED, false);
        settings.certificate_store_path = config.GetStringOr(env::Keys::SSL_CERT_STORE, DefaultCertificateStorePath());
        return settings;
    }

    std::string SslSettings::DefaultCertificateStorePath()
    {
        const char* xdg_data_home = std::getenv("XDG_DATA_HOME");
        if (xdg_data_home && *xdg_data_home) {
            return std::string(xdg_data_home) + "/objfetch/certs";
        }

        const char* home = std::getenv("HOME");
        if (home && *home) {
            return std::string(home) + "/.local/share/objfetch/certs";
        }

        return ".objfetch/certs";
    }
}
