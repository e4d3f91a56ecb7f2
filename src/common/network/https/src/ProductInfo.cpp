// src/common/network/https/src/ProductInfo.cpp
#include "common/network/https/include/ProductInfo.hpp"
#include <filesystem>
#include <fstream>

namespace objfetch::network::https
{
    namespace
    {
        std::string ResolveExecutableName()
        {
            std::error_code ec;
            std::filesystem::path exe = std::filesystem::read_symlink("/proc/self/exe", ec);
            if (!ec && !exe.filename().empty()) {
                return exe.filename().string();
            }

            // /proc 가 없는 환경
            std::ifstream comm("/proc/self/comm");
            std::string name;
            if (comm && std::getline(comm, name) && !name.empty()) {
                return name;
            }
            return "objfetch";
        }
    }

    std::string ProductInfo::ToUserAgent() const
    {
        return name + "/" + version;
    }

    const ProductInfo& ProductInfo::Current()
    {
        static const ProductInfo info{ResolveExecutableName(), OBJFETCH_VERSION};
        return info;
    }
}
