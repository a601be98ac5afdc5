/**
 * @file http_client.cpp
 * @brief HTTP/HTTPS 클라이언트 구현 (libcurl 래퍼)
 */

#include "http_client.h"

#include <curl/curl.h>

#include <QByteArray>
#include <QUrl>

#include <iostream>
#include <mutex>

namespace dappscan::network {

/// 리다이렉션 최대 횟수
constexpr long kMaxRedirects = 5;

/**
 * @brief HttpClient 내부 구현 (PIMPL)
 */
struct HttpClient::Impl {
    CURL* curl{nullptr};
    std::string user_agent{"DappScan/1.0"};
    std::mutex mutex;
};

// ============================================================
// libcurl 콜백 함수들
// ============================================================

static size_t writeCallback(char* ptr, size_t size, size_t nmemb, void* userdata) {
    auto* response_body = static_cast<std::string*>(userdata);
    size_t total_size = size * nmemb;
    response_body->append(ptr, total_size);
    return total_size;
}

struct ProgressData {
    ProgressCallback callback;
};

static int progressCallback(void* clientp, curl_off_t dltotal, curl_off_t dlnow,
                            curl_off_t /*ultotal*/, curl_off_t /*ulnow*/) {
    auto* data = static_cast<ProgressData*>(clientp);
    if (data && data->callback) {
        bool should_continue = data->callback(
            static_cast<size_t>(dlnow),
            static_cast<size_t>(dltotal)
        );
        return should_continue ? 0 : 1;  // 0=계속, 1=중단
    }
    return 0;
}

// ============================================================
// 전역 초기화/정리
// ============================================================

void HttpClient::globalInit() {
    curl_global_init(CURL_GLOBAL_ALL);
    std::cout << "[HttpClient] libcurl 전역 초기화 완료" << std::endl;
}

void HttpClient::globalCleanup() {
    curl_global_cleanup();
    std::cout << "[HttpClient] libcurl 전역 정리 완료" << std::endl;
}

// ============================================================
// 생성자/소멸자
// ============================================================

HttpClient::HttpClient() : impl_(std::make_unique<Impl>()) {
    impl_->curl = curl_easy_init();
    if (!impl_->curl) {
        std::cerr << "[HttpClient] CURL 핸들 생성 실패!" << std::endl;
    }
}

HttpClient::~HttpClient() {
    if (impl_ && impl_->curl) {
        curl_easy_cleanup(impl_->curl);
    }
}

HttpClient::HttpClient(HttpClient&&) noexcept = default;
HttpClient& HttpClient::operator=(HttpClient&&) noexcept = default;

// ============================================================
// URL 구성
// ============================================================

std::string HttpClient::buildUrl(
    const std::string& base,
    const std::vector<std::pair<std::string, std::string>>& query
) {
    if (query.empty()) return base;

    // 비예약 문자(영숫자, -._~) 외에는 모두 %XX
    auto encode = [](const std::string& in) {
        return QUrl::toPercentEncoding(QByteArray::fromStdString(in)).toStdString();
    };

    std::string url = base;
    url += (base.find('?') == std::string::npos) ? '?' : '&';
    bool first = true;
    for (const auto& [key, value] : query) {
        if (!first) url += '&';
        url += encode(key) + "=" + encode(value);
        first = false;
    }
    return url;
}

// ============================================================
// 요청 실행
// ============================================================

HttpResponse HttpClient::send(const HttpRequest& request) {
    HttpResponse response = perform(request);

    for (int attempt = 0; attempt < request.retries && !response.isOk() && !response.aborted; ++attempt) {
        std::cerr << "[HttpClient] 재시도 " << (attempt + 1) << "/" << request.retries
                  << " (URL: " << request.url << ")" << std::endl;
        response = perform(request);
    }

    return response;
}

HttpResponse HttpClient::perform(const HttpRequest& request) {
    std::lock_guard<std::mutex> lock(impl_->mutex);

    HttpResponse response;

    if (!impl_->curl) {
        response.success = false;
        response.error_message = "CURL 핸들이 초기화되지 않았습니다.";
        return response;
    }

    curl_easy_reset(impl_->curl);

    std::string full_url = buildUrl(request.url, request.query);
    curl_easy_setopt(impl_->curl, CURLOPT_URL, full_url.c_str());

    switch (request.method) {
        case HttpMethod::GET:
            curl_easy_setopt(impl_->curl, CURLOPT_HTTPGET, 1L);
            break;
        case HttpMethod::POST:
            curl_easy_setopt(impl_->curl, CURLOPT_POST, 1L);
            curl_easy_setopt(impl_->curl, CURLOPT_POSTFIELDS, request.body.c_str());
            curl_easy_setopt(impl_->curl, CURLOPT_POSTFIELDSIZE,
                             static_cast<long>(request.body.size()));
            break;
    }

    curl_easy_setopt(impl_->curl, CURLOPT_USERAGENT, impl_->user_agent.c_str());

    struct curl_slist* header_list = nullptr;
    if (!request.content_type.empty()) {
        std::string ct = "Content-Type: " + request.content_type;
        header_list = curl_slist_append(header_list, ct.c_str());
    }

    if (header_list) {
        curl_easy_setopt(impl_->curl, CURLOPT_HTTPHEADER, header_list);
    }

    std::string response_body;
    curl_easy_setopt(impl_->curl, CURLOPT_WRITEFUNCTION, writeCallback);
    curl_easy_setopt(impl_->curl, CURLOPT_WRITEDATA, &response_body);

    curl_easy_setopt(impl_->curl, CURLOPT_CONNECTTIMEOUT_MS,
                     static_cast<long>(request.connect_timeout.count()));
    curl_easy_setopt(impl_->curl, CURLOPT_TIMEOUT_MS,
                     static_cast<long>(request.transfer_timeout.count()));
    // 워커 스레드에서 호출되므로 SIGALRM 기반 DNS 타임아웃 사용 금지
    curl_easy_setopt(impl_->curl, CURLOPT_NOSIGNAL, 1L);

    curl_easy_setopt(impl_->curl, CURLOPT_SSL_VERIFYPEER, request.verify_ssl ? 1L : 0L);
    curl_easy_setopt(impl_->curl, CURLOPT_SSL_VERIFYHOST, request.verify_ssl ? 2L : 0L);

    curl_easy_setopt(impl_->curl, CURLOPT_FOLLOWLOCATION, 1L);
    curl_easy_setopt(impl_->curl, CURLOPT_MAXREDIRS, kMaxRedirects);

    ProgressData prog_data{request.progress};
    if (request.progress) {
        curl_easy_setopt(impl_->curl, CURLOPT_XFERINFOFUNCTION, progressCallback);
        curl_easy_setopt(impl_->curl, CURLOPT_XFERINFODATA, &prog_data);
        curl_easy_setopt(impl_->curl, CURLOPT_NOPROGRESS, 0L);
    }

    CURLcode res = curl_easy_perform(impl_->curl);

    if (res == CURLE_OK) {
        response.success = true;

        long http_code = 0;
        curl_easy_getinfo(impl_->curl, CURLINFO_RESPONSE_CODE, &http_code);
        response.status_code = static_cast<int>(http_code);
    } else {
        response.success = false;
        response.aborted = (res == CURLE_ABORTED_BY_CALLBACK);
        response.curl_error_code = static_cast<int>(res);
        response.error_message = curl_easy_strerror(res);
        std::cerr << "[HttpClient] 요청 실패: " << response.error_message
                  << " (URL: " << request.url << ")" << std::endl;
    }

    response.body = std::move(response_body);

    if (header_list) {
        curl_slist_free_all(header_list);
    }

    return response;
}

HttpResponse HttpClient::get(const std::string& url) {
    HttpRequest req;
    req.method = HttpMethod::GET;
    req.url = url;
    return send(req);
}

} // namespace dappscan::network
