/**
 * @file interaction_prober.cpp
 * @brief dApp 프론트엔드 상호작용 탐색기 구현
 */

#include "interaction_prober.h"

#include <QDateTime>
#include <QString>
#include <QUrl>

#include <algorithm>
#include <iostream>
#include <regex>
#include <set>
#include <sstream>
#include <unordered_set>

namespace dappscan::probe {

using core::ProbeFailure;
using core::ScanPhase;

namespace {

constexpr size_t kMaxListedUrls = 10;
constexpr size_t kMaxControlTextLength = 100;
constexpr size_t kMaxSignatureParams = 100;

/**
 * @brief 세션 소유권: 모든 종료 경로에서 close()
 */
class SessionGuard {
public:
    explicit SessionGuard(std::unique_ptr<BrowserSession> session)
        : session_(std::move(session)) {}

    ~SessionGuard() {
        if (session_) {
            session_->close();
        }
    }

    SessionGuard(const SessionGuard&) = delete;
    SessionGuard& operator=(const SessionGuard&) = delete;

    BrowserSession* operator->() const { return session_.get(); }
    BrowserSession& operator*() const { return *session_; }

private:
    std::unique_ptr<BrowserSession> session_;
};

/// 순서를 유지하며 중복 제거 후 상한 적용
std::vector<std::string> uniqueCapped(const std::vector<std::string>& items, size_t cap) {
    std::vector<std::string> out;
    std::unordered_set<std::string> seen;
    for (const auto& item : items) {
        if (out.size() >= cap) break;
        if (seen.insert(item).second) {
            out.push_back(item);
        }
    }
    return out;
}

std::string trim(const std::string& s) {
    auto begin = s.find_first_not_of(" \t\r\n");
    if (begin == std::string::npos) return "";
    auto end = s.find_last_not_of(" \t\r\n");
    return s.substr(begin, end - begin + 1);
}

} // namespace

const char* controlRiskName(ControlRisk risk) {
    switch (risk) {
        case ControlRisk::Safe:    return "safe";
        case ControlRisk::Warning: return "warning";
        case ControlRisk::Danger:  return "danger";
        case ControlRisk::Unknown: return "unknown";
    }
    return "unknown";
}

InteractionProber::InteractionProber(SessionFactory factory,
                                     ProbeConfig config,
                                     std::shared_ptr<const core::ScanDeadline> deadline)
    : factory_(std::move(factory))
    , config_(config)
    , deadline_(std::move(deadline)) {}

std::string InteractionProber::selectorFor(const InteractiveElement& element) {
    if (!element.id.empty()) {
        return "#" + element.id;
    }

    std::istringstream classes(element.classes);
    std::string first_class;
    if (classes >> first_class) {
        return "." + first_class;
    }

    std::string escaped;
    for (char c : element.text) {
        if (c == '"' || c == '\\') escaped += '\\';
        escaped += c;
    }
    return element.tag_name + ":contains(\"" + escaped + "\")";
}

std::vector<std::string> InteractionProber::extractAddresses(const std::string& text) {
    static const std::regex address_re("0x[a-fA-F0-9]{40}");

    std::vector<std::string> out;
    for (auto it = std::sregex_iterator(text.begin(), text.end(), address_re);
         it != std::sregex_iterator(); ++it) {
        auto address = it->str();
        std::transform(address.begin(), address.end(), address.begin(), ::tolower);
        out.push_back(std::move(address));
    }
    return out;
}

std::vector<InteractiveElement> InteractionProber::collectControls(
    const std::vector<ControlCandidate>& candidates, size_t max_controls) {
    std::vector<InteractiveElement> out;
    for (const auto& candidate : candidates) {
        if (out.size() >= max_controls) break;

        auto text = trim(candidate.text);
        if (text.empty() || text.size() >= kMaxControlTextLength) {
            continue;
        }

        InteractiveElement element;
        element.text = std::move(text);
        element.tag_name = candidate.tag;
        element.classes = candidate.classes;
        element.id = candidate.id;
        out.push_back(std::move(element));
    }
    return out;
}

std::string InteractionProber::formatSignature(const WalletCall& call) {
    return call.method + ": " + call.params.substr(0, kMaxSignatureParams) + "...";
}

std::chrono::milliseconds InteractionProber::loadTimeout() const {
    auto timeout = config_.page_load_timeout;
    if (deadline_) {
        timeout = std::min(timeout, deadline_->remaining());
    }
    return timeout;
}

void InteractionProber::checkDeadline(const char* stage) const {
    if (deadline_ && deadline_->expired()) {
        throw ProbeFailure(ScanPhase::Timeout, std::string("scan deadline exceeded during ") + stage);
    }
}

FrontendFindings InteractionProber::probe(const std::string& url) {
    std::cout << "[InteractionProber] 프론트엔드 분석 시작: " << url << std::endl;

    checkDeadline("session launch");

    std::unique_ptr<BrowserSession> created;
    try {
        created = factory_ ? factory_() : nullptr;
    } catch (const std::exception& e) {
        throw ProbeFailure(ScanPhase::SessionLaunch, e.what());
    }
    if (!created) {
        throw ProbeFailure(ScanPhase::SessionLaunch, "browser session could not be created");
    }
    SessionGuard session(std::move(created));

    auto wallet = std::make_shared<MockWallet>();
    session->setConsoleSink([wallet](const std::string& message) {
        wallet->handleChannelMessage(message);
    });
    session->injectBeforeLoad("dappscan-wallet", wallet->injectionScript());

    std::cout << "[InteractionProber] 페이지 로드: " << url << std::endl;
    auto nav = session->navigate(url, loadTimeout());
    if (!nav.ok) {
        checkDeadline("page load");
        throw ProbeFailure(ScanPhase::PageLoad,
                           nav.timed_out ? "navigation timeout exceeded" : nav.error);
    }

    session->wait(config_.settle_delay);
    checkDeadline("settle");

    const auto baseline_url = session->currentUrl();

    FrontendFindings findings;
    findings.url = url;
    findings.buttons = collectControls(session->queryControls(), config_.max_controls);

    size_t tested = std::min(findings.buttons.size(), config_.max_tested);
    std::cout << "[InteractionProber] 상호작용 요소 " << tested << "개 테스트" << std::endl;

    bool page_intact = true;
    for (size_t i = 0; i < tested; ++i) {
        checkDeadline("control testing");
        if (!page_intact) {
            // 원래 페이지를 잃은 뒤의 클릭은 다른 페이지를 분류하게 됨
            findings.buttons[i].action = "Could not test";
            findings.buttons[i].risk = ControlRisk::Unknown;
            continue;
        }
        page_intact = testControl(*session, *wallet, findings.buttons[i], url, baseline_url);
    }

    // 페이지 텍스트 + 관찰된 요청 URL에서 주소 추출
    std::set<std::string> addresses;
    for (auto& address : extractAddresses(session->pageText())) {
        addresses.insert(std::move(address));
    }

    const auto requests = session->observedRequests();
    const auto host = QUrl(QString::fromStdString(url)).host().toStdString();

    std::vector<std::string> api_calls;
    std::vector<std::string> external_scripts;
    for (const auto& request : requests) {
        for (auto& address : extractAddresses(request.url)) {
            addresses.insert(std::move(address));
        }
        if (request.kind == ResourceKind::Xhr) {
            api_calls.push_back(request.url);
        }
        if (request.kind == ResourceKind::Script && request.url.find(host) == std::string::npos) {
            external_scripts.push_back(request.url);
        }
    }

    findings.contracts.assign(addresses.begin(), addresses.end());
    findings.api_calls = uniqueCapped(api_calls, kMaxListedUrls);
    findings.external_scripts = uniqueCapped(external_scripts, kMaxListedUrls);
    findings.network_requests = requests.size();

    findings.wallet_interactions = wallet->sessionLog();
    for (const auto& call : findings.wallet_interactions) {
        if (MockWallet::isSignatureBearing(call.method)) {
            findings.signatures.push_back(formatSignature(call));
        }
    }

    findings.timestamp = QDateTime::currentDateTimeUtc().toString(Qt::ISODateWithMs).toStdString();

    std::cout << "[InteractionProber] 프론트엔드 분석 완료" << std::endl;
    std::cout << "[InteractionProber]   - 상호작용 요소 " << findings.buttons.size() << "개" << std::endl;
    std::cout << "[InteractionProber]   - 컨트랙트 주소 후보 " << findings.contracts.size() << "개" << std::endl;
    std::cout << "[InteractionProber]   - API 호출 " << api_calls.size() << "건" << std::endl;
    std::cout << "[InteractionProber]   - 외부 스크립트 " << external_scripts.size() << "개" << std::endl;

    return findings;
}

bool InteractionProber::testControl(BrowserSession& session, MockWallet& wallet,
                                    InteractiveElement& element,
                                    const std::string& url, const std::string& baseline_url) {
    wallet.clearStepLog();
    const auto selector = selectorFor(element);
    bool page_intact = true;

    try {
        if (session.click(selector) != ClickResult::Clicked) {
            element.action = "Could not test";
            element.risk = ControlRisk::Unknown;
            std::cout << "[InteractionProber] 요소를 찾지 못함: " << element.text << std::endl;
            return true;
        }

        session.wait(config_.post_click_wait);

        auto calls = wallet.stepLog();
        if (!calls.empty()) {
            const auto& method = calls.front().method;
            element.action = "Wallet request: " + method;
            element.risk = MockWallet::isStateChanging(method) ? ControlRisk::Danger : ControlRisk::Warning;
        } else if (session.currentUrl() != baseline_url) {
            element.action = "Navigation/redirect";
            element.risk = ControlRisk::Warning;

            auto back = session.navigate(url, loadTimeout());
            wallet.clearStepLog();
            if (!back.ok) {
                std::cerr << "[InteractionProber] 원래 페이지 복귀 실패, 남은 요소는 건너뜀: "
                          << (back.timed_out ? "navigation timeout exceeded" : back.error) << std::endl;
                page_intact = false;
            }
        } else {
            element.action = "UI interaction (modal/state change)";
            element.risk = ControlRisk::Safe;
        }
    } catch (const std::exception& e) {
        std::cerr << "[InteractionProber] 테스트 실패 " << element.text << ": " << e.what() << std::endl;
        element.action = "Could not test";
        element.risk = ControlRisk::Unknown;
        return true;
    }

    std::cout << "[InteractionProber] " << element.text << " → " << element.action
              << " (" << controlRiskName(element.risk) << ")" << std::endl;
    return page_intact;
}

} // namespace dappscan::probe
