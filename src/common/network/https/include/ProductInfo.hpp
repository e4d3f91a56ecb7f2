// src/common/network/https/include/ProductInfo.hpp
#pragma once

#include <string>

#ifndef OBJFETCH_VERSION
    #define OBJFETCH_VERSION "0.0.0"
#endif

namespace objfetch::network::https
{
    /**
     * @brief User-Agent 에 들어갈 제품 이름과 버전
     */
    struct ProductInfo
    {
        std::string name;
        std::string version;

        /**
         * @return "name/version"
         */
        std::string ToUserAgent() const;

        /**
         * @brief 현재 프로세스 기준 (실행 파일 이름 + 빌드 버전). 처음 호출에서 한 번만 계산한다
         */
        static const ProductInfo& Current();
    };
}
