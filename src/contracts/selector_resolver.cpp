/**
 * @file selector_resolver.cpp
 * @brief 함수 셀렉터 해석기 구현
 */

#include "selector_resolver.h"
#include "network/http_client.h"

#include <QByteArray>
#include <QJsonArray>
#include <QJsonDocument>
#include <QJsonObject>

#include <algorithm>
#include <cctype>
#include <iostream>
#include <mutex>
#include <thread>
#include <unordered_map>

namespace dappscan::contracts {

namespace {

/// 자주 쓰이는 셀렉터 (ERC-20 / 소유권 / 프록시 / 일반 패턴)
const std::unordered_map<std::string, std::string>& commonSelectors() {
    static const std::unordered_map<std::string, std::string> table = {
        {"0xa9059cbb", "transfer(address,uint256)"},
        {"0x23b872dd", "transferFrom(address,address,uint256)"},
        {"0x095ea7b3", "approve(address,uint256)"},
        {"0x70a08231", "balanceOf(address)"},
        {"0x18160ddd", "totalSupply()"},
        {"0x8da5cb5b", "owner()"},
        {"0xf2fde38b", "transferOwnership(address)"},
        {"0x715018a6", "renounceOwnership()"},
        {"0x40c10f19", "mint(address,uint256)"},
        {"0x42966c68", "burn(uint256)"},
        {"0x06fdde03", "name()"},
        {"0x95d89b41", "symbol()"},
        {"0x313ce567", "decimals()"},
        {"0xa0712d68", "mint(uint256)"},
        {"0xd0def521", "message()"},
        {"0x12065fe0", "getBalance()"},
        {"0x3ccfd60b", "withdraw()"},
        {"0x2e1a7d4d", "withdraw(uint256)"},
        {"0xf14fcbc8", "deposit()"},
        {"0x1249c58b", "mint()"},
        {"0xff1e7774", "claim()"},
        {"0x4e71d92d", "claim()"},
        {"0x379607f5", "claim(uint256)"},
        {"0x5312ea8e", "claim(address)"},
        {"0x2e17de78", "setImplementation(address)"},
        {"0x5c60da1b", "implementation()"},
        {"0x8f283970", "changeAdmin(address)"},
        {"0xf851a440", "admin()"},
    };
    return table;
}

std::string normalizeSelector(const std::string& selector) {
    std::string out;
    out.reserve(selector.size());
    for (char c : selector) {
        out += static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
    }
    if (out.rfind("0x", 0) != 0) {
        out = "0x" + out;
    }
    return out;
}

/**
 * @brief 외부 조회 게이트 (프로세스 전역)
 *
 * 동시 분석 작업 수와 관계없이 외부 조회를 한 번에 하나씩,
 * 이전 조회 완료 후 delay만큼 지난 뒤에 실행합니다.
 */
class LookupGate {
public:
    template <typename Fn>
    auto run(std::chrono::milliseconds delay, Fn&& fn) {
        std::lock_guard<std::mutex> lock(mutex_);
        auto now = std::chrono::steady_clock::now();
        if (has_last_ && now < last_ + delay) {
            std::this_thread::sleep_for(last_ + delay - now);
        }
        auto result = fn();
        last_ = std::chrono::steady_clock::now();
        has_last_ = true;
        return result;
    }

private:
    std::mutex mutex_;
    std::chrono::steady_clock::time_point last_{};
    bool has_last_{false};
};

LookupGate& lookupGate() {
    static LookupGate gate;
    return gate;
}

} // namespace

// ============================================================
// FourByteDirectoryLookup
// ============================================================

FourByteDirectoryLookup::FourByteDirectoryLookup(
    std::string api_url,
    std::chrono::milliseconds timeout,
    std::shared_ptr<const core::ScanDeadline> deadline,
    int retries
)
    : api_url_(std::move(api_url))
    , timeout_(timeout)
    , deadline_(std::move(deadline))
    , retries_(retries) {}

LookupResult FourByteDirectoryLookup::lookup(const std::string& selector) {
    LookupResult result;

    network::HttpClient client;
    network::HttpRequest request;
    request.url = api_url_;
    request.query.emplace_back("hex_signature", selector);
    request.transfer_timeout = timeout_;
    request.connect_timeout = timeout_;
    request.retries = retries_;
    if (deadline_) {
        auto deadline = deadline_;
        request.progress = [deadline](size_t, size_t) { return !deadline->expired(); };
    }

    auto response = client.send(request);
    if (!response.isOk()) {
        result.error = response.error_message.empty()
            ? "HTTP " + std::to_string(response.status_code)
            : response.error_message;
        return result;
    }

    QJsonParseError parse_error{};
    auto doc = QJsonDocument::fromJson(QByteArray::fromStdString(response.body), &parse_error);
    if (parse_error.error != QJsonParseError::NoError || !doc.isObject()) {
        result.error = "invalid JSON response";
        return result;
    }

    result.success = true;
    for (const auto& entry : doc.object().value("results").toArray()) {
        auto text = entry.toObject().value("text_signature").toString();
        if (!text.isEmpty()) {
            result.signatures.push_back(text.toStdString());
        }
    }
    return result;
}

// ============================================================
// SelectorResolver
// ============================================================

SelectorResolver::SelectorResolver(std::shared_ptr<SignatureLookup> lookup,
                                   SelectorResolverConfig config)
    : lookup_(std::move(lookup))
    , config_(config) {}

std::optional<std::string> SelectorResolver::knownSignature(const std::string& selector) {
    const auto& table = commonSelectors();
    auto it = table.find(normalizeSelector(selector));
    if (it == table.end()) return std::nullopt;
    return it->second;
}

std::string SelectorResolver::resolve(const std::string& selector) {
    std::string normalized = normalizeSelector(selector);

    if (auto known = knownSignature(normalized)) {
        return *known;
    }

    if (!lookup_) {
        return "Unknown function: " + normalized;
    }

    LookupResult result;
    try {
        result = lookupGate().run(config_.lookup_delay, [&]() {
            external_lookups_.fetch_add(1, std::memory_order_relaxed);
            return lookup_->lookup(normalized);
        });
    } catch (const std::exception& e) {
        result.success = false;
        result.error = e.what();
    }

    if (!result.success) {
        std::cerr << "[SelectorResolver] 디코딩 실패 " << normalized << ": " << result.error << std::endl;
        return "Failed to decode: " + normalized;
    }

    if (result.signatures.empty()) {
        std::cout << "[SelectorResolver] 알 수 없는 셀렉터: " << normalized << std::endl;
        return "Unknown function: " + normalized;
    }

    // 첫 번째 후보를 가장 표준적인 시그니처로 사용
    std::cout << "[SelectorResolver] 디코딩: " << normalized << " -> " << result.signatures.front() << std::endl;
    return result.signatures.front();
}

std::vector<std::string> SelectorResolver::resolveAll(const std::vector<std::string>& selectors) {
    std::vector<std::string> functions;
    if (selectors.empty()) return functions;

    size_t count = std::min(selectors.size(), config_.max_lookups_per_batch);
    std::cout << "[SelectorResolver] 셀렉터 " << selectors.size() << "개 중 "
              << count << "개 디코딩" << std::endl;

    functions.reserve(count);
    for (size_t i = 0; i < count; ++i) {
        functions.push_back(resolve(selectors[i]));
    }
    return functions;
}

size_t SelectorResolver::externalLookupCount() const {
    return external_lookups_.load(std::memory_order_relaxed);
}

} // namespace dappscan::contracts
