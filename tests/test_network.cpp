/**
 * @file test_network.cpp
 * @brief 네트워크 레이어 단위 테스트
 *
 * 테스트 대상:
 *   - HttpRequest/HttpResponse 기본값
 *   - HttpClient::buildUrl 쿼리 인코딩
 *   - 전송 실패가 예외 없이 데이터로 보고되는지
 */

#include <gtest/gtest.h>
#include <gmock/gmock.h>

#include "network/http_client.h"

using namespace dappscan::network;

// ============================================================
// HttpClient 테스트
// ============================================================

class HttpClientTest : public ::testing::Test {
protected:
    void SetUp() override {
        // libcurl 전역 초기화
        HttpClient::globalInit();
    }

    void TearDown() override {
        HttpClient::globalCleanup();
    }
};

// 1. 요청 기본값: 짧은 타임아웃, 재시도 없음
TEST_F(HttpClientTest, RequestDefaults) {
    HttpRequest request;

    EXPECT_EQ(request.method, HttpMethod::GET);
    EXPECT_TRUE(request.verify_ssl)
        << "기본 SSL 검증은 활성화되어야 합니다";
    EXPECT_EQ(request.connect_timeout.count(), 5000);
    EXPECT_EQ(request.transfer_timeout.count(), 10000)
        << "외부 호출 타임아웃은 10초 이하여야 합니다";
    EXPECT_EQ(request.retries, 0)
        << "기본적으로 재시도하지 않아야 합니다";
    EXPECT_FALSE(request.progress);
}

// 2. 쿼리 없는 URL은 그대로
TEST_F(HttpClientTest, BuildUrlWithoutQuery) {
    EXPECT_EQ(HttpClient::buildUrl("https://api.etherscan.io/v2/api", {}),
              "https://api.etherscan.io/v2/api");
}

// 3. 쿼리 순서 유지 + 퍼센트 인코딩
TEST_F(HttpClientTest, BuildUrlEncodesQueryInOrder) {
    auto url = HttpClient::buildUrl("https://api.example.com/api", {
        {"module", "proxy"},
        {"action", "eth_getCode"},
        {"tag", "latest block"},
        {"key", "a&b=c"},
    });

    EXPECT_EQ(url, "https://api.example.com/api?module=proxy&action=eth_getCode"
                   "&tag=latest%20block&key=a%26b%3Dc");
}

// 3-1. 비예약 문자만 그대로, UTF-8 바이트와 예약 문자는 대문자 %XX
TEST_F(HttpClientTest, BuildUrlEncodesReservedAndUtf8) {
    auto url = HttpClient::buildUrl("https://api.example.com/api", {
        {"q", "A-z_0.9~"},
        {"path", "/a+b?#"},
        {"name", "caf\xC3\xA9"},
    });

    EXPECT_EQ(url, "https://api.example.com/api?q=A-z_0.9~"
                   "&path=%2Fa%2Bb%3F%23&name=caf%C3%A9");
}

// 4. 기존 쿼리가 있으면 & 로 이어붙임
TEST_F(HttpClientTest, BuildUrlAppendsToExistingQuery) {
    auto url = HttpClient::buildUrl("https://www.4byte.directory/api/v1/signatures/?format=json",
                                    {{"hex_signature", "0xa9059cbb"}});

    EXPECT_EQ(url, "https://www.4byte.directory/api/v1/signatures/?format=json"
                   "&hex_signature=0xa9059cbb");
}

// 5. 지원하지 않는 프로토콜은 예외 없이 실패 응답
TEST_F(HttpClientTest, UnsupportedSchemeReportsFailure) {
    HttpClient client;
    auto response = client.get("nosuchscheme://example.invalid/");

    EXPECT_FALSE(response.success);
    EXPECT_FALSE(response.isOk());
    EXPECT_FALSE(response.aborted);
    EXPECT_NE(response.curl_error_code, 0);
    EXPECT_FALSE(response.error_message.empty());
}

// 6. 2xx가 아니면 isOk()는 false
TEST_F(HttpClientTest, IsOkRequires2xx) {
    HttpResponse response;
    response.success = true;
    response.status_code = 404;
    EXPECT_FALSE(response.isOk());

    response.status_code = 200;
    EXPECT_TRUE(response.isOk());

    response.success = false;
    EXPECT_FALSE(response.isOk());
}
