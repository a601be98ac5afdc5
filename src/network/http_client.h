#pragma once

/**
 * @file http_client.h
 * @brief HTTP/HTTPS 클라이언트 (libcurl 래퍼)
 *
 * 컨트랙트 코드 소스(Etherscan, JSON-RPC)와 시그니처 DB 조회에 사용하는
 * 동기 HTTP 클라이언트입니다. 짧은 타임아웃, 쿼리 파라미터 인코딩,
 * 진행률 콜백을 통한 전송 중단(스캔 취소)을 지원합니다.
 */

#include <string>
#include <memory>
#include <functional>
#include <vector>
#include <utility>
#include <optional>
#include <chrono>

namespace dappscan::network {

/**
 * @brief HTTP 메서드
 */
enum class HttpMethod {
    GET,
    POST
};

/**
 * @brief 진행률 콜백
 * @param downloaded 다운로드된 바이트
 * @param total 전체 바이트 (알 수 없으면 0)
 * @return false를 반환하면 전송 중단
 */
using ProgressCallback = std::function<bool(size_t downloaded, size_t total)>;

/**
 * @brief HTTP 요청 구조체
 */
struct HttpRequest {
    HttpMethod method{HttpMethod::GET};
    std::string url;
    std::vector<std::pair<std::string, std::string>> query;   ///< URL 쿼리 파라미터 (순서 유지)
    std::string body;
    std::string content_type;

    // 타임아웃 설정 (외부 호출은 5~10초)
    std::chrono::milliseconds connect_timeout{5000};
    std::chrono::milliseconds transfer_timeout{10000};

    bool verify_ssl{true};

    /// 실패 시 재시도 횟수 (기본 0 = 재시도 없음)
    int retries{0};

    /// 전송 중 주기적으로 호출, false면 중단 (스캔 데드라인)
    ProgressCallback progress;
};

/**
 * @brief HTTP 응답 구조체
 */
struct HttpResponse {
    int status_code{0};
    std::string body;

    // 에러 정보
    bool success{false};
    bool aborted{false};                ///< 진행률 콜백에 의해 중단됨
    std::string error_message;
    int curl_error_code{0};

    /**
     * @brief 응답 성공 여부 (2xx)
     */
    [[nodiscard]] bool isOk() const {
        return success && status_code >= 200 && status_code < 300;
    }
};

/**
 * @brief HTTP 클라이언트
 *
 * 인스턴스마다 CURL easy 핸들 하나를 소유합니다.
 * 같은 인스턴스에 대한 동시 호출은 내부 뮤텍스로 직렬화되므로,
 * 병렬 작업은 작업마다 별도 인스턴스를 사용합니다.
 */
class HttpClient {
public:
    HttpClient();
    ~HttpClient();

    // 복사 금지, 이동 허용
    HttpClient(const HttpClient&) = delete;
    HttpClient& operator=(const HttpClient&) = delete;
    HttpClient(HttpClient&&) noexcept;
    HttpClient& operator=(HttpClient&&) noexcept;

    /**
     * @brief libcurl 전역 초기화 (프로세스당 한 번)
     */
    static void globalInit();

    /**
     * @brief libcurl 전역 정리
     */
    static void globalCleanup();

    /**
     * @brief HTTP 요청 실행 (동기, retries만큼 재시도)
     */
    [[nodiscard]] HttpResponse send(const HttpRequest& request);

    /**
     * @brief 간편 GET 요청
     */
    [[nodiscard]] HttpResponse get(const std::string& url);

    /**
     * @brief 쿼리 파라미터를 붙인 전체 URL 생성 (퍼센트 인코딩)
     */
    [[nodiscard]] static std::string buildUrl(
        const std::string& base,
        const std::vector<std::pair<std::string, std::string>>& query
    );

private:
    [[nodiscard]] HttpResponse perform(const HttpRequest& request);

    struct Impl;
    std::unique_ptr<Impl> impl_;
};

} // namespace dappscan::network
