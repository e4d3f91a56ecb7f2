// src/common/network/https/include/ResponseClassifier.hpp
#pragma once

#include "common/network/https/include/RequestAttemptResult.hpp"
#include <string>

namespace objfetch::network::https
{
    /**
     * @brief 분류 결과 (재시도 권고 + 에러)
     */
    struct Classification
    {
        bool should_retry = false;
        AttemptError error;
    };

    /**
     * @brief 응답 상태 코드 / 전송 실패 분류기
     *
     * 상태를 갖지 않는다. 자격 증명 백엔드의 상태(anonymous, backing off)는
     * 호출 시점에 읽은 값을 인자로 받는다.
     */
    class ResponseClassifier
    {
    public:
        /**
         * @brief 408, 401, 5xx 는 재시도
         */
        static bool ShouldRetry(int status_code);

        /**
         * @brief 자격 증명 문제로 볼 수 있는 상태 (401, 400, 302)
         */
        static bool IsCredentialRejection(int status_code);

        /**
         * @brief 실행기가 분류 전에 Revoke 를 호출해야 하는지
         *
         * anonymous 요청의 401 은 폐기할 자격 증명이 없으므로 제외한다.
         */
        static bool RequiresCredentialRevocation(int status_code, bool is_anonymous);

        /**
         * @brief 200 이 아닌 HTTP 응답 분류
         *
         * @param server_message 서버가 보낸 에러 본문
         * @param is_backing_off Revoke 이후에 읽은 백엔드 상태
         */
        static Classification ClassifyStatus(
            int status_code,
            const std::string& server_message,
            bool is_anonymous,
            bool is_backing_off
        );

        /**
         * @brief 자격 증명을 얻지 못해 요청하지 않음 (401, 재시도)
         */
        static Classification ClassifyCredentialUnavailable(const std::string& error_message);

        /**
         * @brief 취소 신호 없이 중단된 요청 (408, 재시도)
         */
        static Classification ClassifyTimeout(const std::string& uri);

        /**
         * @brief TLS 인증서 신뢰 거부 (401, 재시도 안 함)
         */
        static Classification ClassifyCertificateTrustFailure(const std::string& error_message);

        /**
         * @brief 그 밖의 전송 실패 (500, 재시도)
         */
        static Classification ClassifyTransportFailure(const std::string& error_message);
    };
}
