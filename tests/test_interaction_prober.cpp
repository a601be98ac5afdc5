/**
 * @file test_interaction_prober.cpp
 * @brief 프론트엔드 상호작용 탐색기 단위 테스트 (가짜 브라우저 세션)
 */

#include <gtest/gtest.h>
#include <gmock/gmock.h>

#include "core/scan_error.h"
#include "probe/interaction_prober.h"

#include <functional>
#include <map>
#include <stdexcept>

using namespace dappscan::probe;
using dappscan::core::ProbeFailure;
using dappscan::core::ScanDeadline;
using dappscan::core::ScanPhase;
using ::testing::ElementsAre;
using ::testing::HasSubstr;
using ::testing::IsEmpty;
using ::testing::SizeIs;
using ::testing::UnorderedElementsAre;

namespace {

const std::string kTarget = "https://dapp.example.com/";

/**
 * @brief 세션 관찰 기록 (세션이 파괴된 뒤에도 테스트에서 확인)
 */
struct SessionTrace {
    int close_calls{0};
    int navigations{0};
    std::vector<std::chrono::milliseconds> load_timeouts;
    std::vector<std::string> clicked;
    std::vector<std::string> injected;
};

/**
 * @brief 스크립트된 가짜 세션
 *
 * 셀렉터별 클릭 동작을 등록하면 click()이 해당 동작을 실행합니다.
 */
class FakeSession : public BrowserSession {
public:
    using ClickAction = std::function<ClickResult(FakeSession&)>;

    explicit FakeSession(std::shared_ptr<SessionTrace> trace) : trace_(std::move(trace)) {}

    void injectBeforeLoad(const std::string& name, const std::string& script) override {
        trace_->injected.push_back(name);
        script_ = script;
    }

    void setConsoleSink(ConsoleSink sink) override { sink_ = std::move(sink); }

    NavigationResult navigate(const std::string& url, std::chrono::milliseconds timeout) override {
        ++trace_->navigations;
        trace_->load_timeouts.push_back(timeout);
        NavigationResult result;
        if (fail_load || (fail_after > 0 && trace_->navigations > fail_after)) {
            result.timed_out = true;
            result.error = "navigation timeout exceeded";
            return result;
        }
        url_ = url;
        result.ok = true;
        return result;
    }

    void wait(std::chrono::milliseconds) override {}

    std::vector<ControlCandidate> queryControls() override { return controls; }

    ClickResult click(const std::string& selector) override {
        trace_->clicked.push_back(selector);
        auto it = actions.find(selector);
        if (it == actions.end()) return ClickResult::Clicked;
        return it->second(*this);
    }

    std::optional<std::string> evaluate(const std::string&) override { return std::nullopt; }
    std::string currentUrl() override { return url_; }
    std::string pageText() override { return page_text; }
    std::vector<RequestRecord> observedRequests() const override { return requests; }

    void close() override { ++trace_->close_calls; }

    // 페이지의 모의 지갑 호출 흉내
    void emitWalletCall(const std::string& method, const std::string& params = "[]") {
        if (sink_) {
            sink_(std::string("__dappscan_wallet__{\"method\":\"") + method
                  + "\",\"params\":" + params + ",\"timestamp\":1}");
        }
    }

    void setUrl(const std::string& url) { url_ = url; }

    bool fail_load{false};
    int fail_after{0};          ///< 0보다 크면 이 횟수 이후의 navigate()는 실패
    std::vector<ControlCandidate> controls;
    std::map<std::string, ClickAction> actions;
    std::string page_text;
    std::vector<RequestRecord> requests;

private:
    std::shared_ptr<SessionTrace> trace_;
    ConsoleSink sink_;
    std::string url_;
    std::string script_;
};

ControlCandidate control(const std::string& text, const std::string& id = "",
                         const std::string& classes = "", const std::string& tag = "button") {
    return ControlCandidate{text, tag, id, classes};
}

ProbeConfig fastConfig() {
    ProbeConfig config;
    config.page_load_timeout = std::chrono::milliseconds{1000};
    config.settle_delay = std::chrono::milliseconds{0};
    config.post_click_wait = std::chrono::milliseconds{0};
    config.quiet_window = std::chrono::milliseconds{0};
    return config;
}

} // namespace

class InteractionProberTest : public ::testing::Test {
protected:
    void SetUp() override {
        trace_ = std::make_shared<SessionTrace>();
        session_ = std::make_unique<FakeSession>(trace_);
    }

    // 세션 소유권을 탐색기에 넘기는 팩토리
    SessionFactory factory() {
        return [this]() -> std::unique_ptr<BrowserSession> { return std::move(session_); };
    }

    std::shared_ptr<SessionTrace> trace_;
    std::unique_ptr<FakeSession> session_;
};

// 1. 클릭 결과 분류: 지갑 요청 / 이동 / UI / 테스트 불가
TEST_F(InteractionProberTest, ClassifiesEachControl) {
    session_->controls = {
        control("Connect Wallet", "connect"),
        control("Approve", "", "btn primary"),
        control("Swap now", "swap"),
        control("Docs", "docs"),
        control("Settings", "settings"),
        control("Ghost", "ghost"),
        control("Broken", "broken"),
    };
    session_->actions["#connect"] = [](FakeSession& s) {
        s.emitWalletCall("eth_requestAccounts");
        return ClickResult::Clicked;
    };
    session_->actions[".btn"] = [](FakeSession& s) {
        s.emitWalletCall("personal_sign", "[\"0x68656c6c6f\"]");
        return ClickResult::Clicked;
    };
    session_->actions["#swap"] = [](FakeSession& s) {
        s.emitWalletCall("eth_sendTransaction", "[{\"to\":\"0x0\"}]");
        return ClickResult::Clicked;
    };
    session_->actions["#docs"] = [](FakeSession& s) {
        s.setUrl("https://docs.example.com/");
        return ClickResult::Clicked;
    };
    session_->actions["#ghost"] = [](FakeSession&) { return ClickResult::NotFound; };
    session_->actions["#broken"] = [](FakeSession&) -> ClickResult {
        throw std::runtime_error("detached node");
    };

    InteractionProber prober(factory(), fastConfig());
    auto findings = prober.probe(kTarget);

    ASSERT_THAT(findings.buttons, SizeIs(7));
    EXPECT_EQ(findings.buttons[0].action, "Wallet request: eth_requestAccounts");
    EXPECT_EQ(findings.buttons[0].risk, ControlRisk::Warning);
    EXPECT_EQ(findings.buttons[1].action, "Wallet request: personal_sign");
    EXPECT_EQ(findings.buttons[1].risk, ControlRisk::Warning);
    EXPECT_EQ(findings.buttons[2].action, "Wallet request: eth_sendTransaction");
    EXPECT_EQ(findings.buttons[2].risk, ControlRisk::Danger);
    EXPECT_EQ(findings.buttons[3].action, "Navigation/redirect");
    EXPECT_EQ(findings.buttons[3].risk, ControlRisk::Warning);
    EXPECT_EQ(findings.buttons[4].action, "UI interaction (modal/state change)");
    EXPECT_EQ(findings.buttons[4].risk, ControlRisk::Safe);
    EXPECT_EQ(findings.buttons[5].action, "Could not test");
    EXPECT_EQ(findings.buttons[5].risk, ControlRisk::Unknown);
    EXPECT_EQ(findings.buttons[6].action, "Could not test");
    EXPECT_EQ(findings.buttons[6].risk, ControlRisk::Unknown);

    // 초기 로드 + 이동 후 복귀
    EXPECT_EQ(trace_->navigations, 2);
    EXPECT_EQ(trace_->close_calls, 1);
    EXPECT_THAT(trace_->injected, ElementsAre("dappscan-wallet"));

    ASSERT_THAT(findings.wallet_interactions, SizeIs(3));
    ASSERT_THAT(findings.signatures, SizeIs(1));
    EXPECT_EQ(findings.signatures[0], "personal_sign: [\"0x68656c6c6f\"]...");
}

// 2. 최대 20개 수집, 앞의 10개만 클릭, 빈/긴 텍스트 제외
TEST_F(InteractionProberTest, CapsControlsAndTests) {
    session_->controls.push_back(control("   "));
    session_->controls.push_back(control(std::string(100, 'x')));
    for (int i = 0; i < 25; ++i) {
        session_->controls.push_back(control("Button " + std::to_string(i), "b" + std::to_string(i)));
    }

    InteractionProber prober(factory(), fastConfig());
    auto findings = prober.probe(kTarget);

    ASSERT_THAT(findings.buttons, SizeIs(20));
    EXPECT_EQ(findings.buttons[0].text, "Button 0");
    EXPECT_THAT(trace_->clicked, SizeIs(10));
    EXPECT_EQ(findings.buttons[10].action, "unknown");
    EXPECT_EQ(findings.buttons[10].risk, ControlRisk::Unknown);
}

// 3. 셀렉터: id → 첫 class → tag:contains
TEST_F(InteractionProberTest, SelectorPreference) {
    InteractiveElement with_id{"Go", "button", "btn big", "go-btn"};
    InteractiveElement with_class{"Go", "a", "  nav-link active", ""};
    InteractiveElement bare{"Say \"hi\"", "button", "", ""};

    EXPECT_EQ(InteractionProber::selectorFor(with_id), "#go-btn");
    EXPECT_EQ(InteractionProber::selectorFor(with_class), ".nav-link");
    EXPECT_EQ(InteractionProber::selectorFor(bare), "button:contains(\"Say \\\"hi\\\"\")");
}

// 4. 페이지 텍스트 + 요청 URL에서 주소 추출 (소문자, 중복 제거)
TEST_F(InteractionProberTest, CollectsContractAddresses) {
    session_->page_text = "Token: 0xA0b86991c6218b36c1d19D4a2e9Eb0cE3606eB48 and again "
                          "0xa0b86991c6218b36c1d19d4a2e9eb0ce3606eb48";
    session_->requests = {
        {"https://api.example.com/token/0xdAC17F958D2ee523a2206206994597C13D831ec7", "GET", ResourceKind::Xhr},
        {"https://dapp.example.com/app.js", "GET", ResourceKind::Script},
    };

    InteractionProber prober(factory(), fastConfig());
    auto findings = prober.probe(kTarget);

    EXPECT_THAT(findings.contracts, UnorderedElementsAre(
        "0xa0b86991c6218b36c1d19d4a2e9eb0ce3606eb48",
        "0xdac17f958d2ee523a2206206994597c13d831ec7"));
    EXPECT_EQ(findings.network_requests, 2u);
}

// 5. API 호출 / 외부 스크립트: 중복 제거, 최대 10개, 대상 호스트 제외
TEST_F(InteractionProberTest, ListsApiCallsAndThirdPartyScripts) {
    for (int i = 0; i < 12; ++i) {
        session_->requests.push_back({"https://cdn" + std::to_string(i) + ".net/lib.js", "GET", ResourceKind::Script});
    }
    session_->requests.push_back({"https://cdn0.net/lib.js", "GET", ResourceKind::Script});
    session_->requests.push_back({"https://dapp.example.com/main.js", "GET", ResourceKind::Script});
    session_->requests.push_back({"https://rpc.example.org/", "POST", ResourceKind::Xhr});
    session_->requests.push_back({"https://rpc.example.org/", "POST", ResourceKind::Xhr});
    session_->requests.push_back({"https://dapp.example.com/logo.png", "GET", ResourceKind::Image});

    InteractionProber prober(factory(), fastConfig());
    auto findings = prober.probe(kTarget);

    ASSERT_THAT(findings.external_scripts, SizeIs(10));
    EXPECT_EQ(findings.external_scripts.front(), "https://cdn0.net/lib.js");
    EXPECT_THAT(findings.api_calls, ElementsAre("https://rpc.example.org/"));
    EXPECT_EQ(findings.network_requests, 17u);
}

// 6. 세션 생성 실패 → ProbeFailure(SessionLaunch)
TEST_F(InteractionProberTest, SessionLaunchFailureIsFatal) {
    InteractionProber failing([]() -> std::unique_ptr<BrowserSession> {
        throw std::runtime_error("no display");
    }, fastConfig());

    try {
        (void)failing.probe(kTarget);
        FAIL() << "ProbeFailure가 발생해야 합니다";
    } catch (const ProbeFailure& e) {
        EXPECT_EQ(e.phase(), ScanPhase::SessionLaunch);
        EXPECT_THAT(e.what(), HasSubstr("no display"));
    }

    InteractionProber null_factory([]() -> std::unique_ptr<BrowserSession> { return nullptr; }, fastConfig());
    EXPECT_THROW((void)null_factory.probe(kTarget), ProbeFailure);
}

// 7. 로드 실패 → ProbeFailure(PageLoad), 세션은 닫힘
TEST_F(InteractionProberTest, PageLoadFailureClosesSession) {
    session_->fail_load = true;
    InteractionProber prober(factory(), fastConfig());

    try {
        (void)prober.probe(kTarget);
        FAIL() << "ProbeFailure가 발생해야 합니다";
    } catch (const ProbeFailure& e) {
        EXPECT_EQ(e.phase(), ScanPhase::PageLoad);
        EXPECT_THAT(e.what(), HasSubstr("Frontend analysis failed"));
    }
    EXPECT_EQ(trace_->close_calls, 1);
}

// 8. 데드라인 만료 → ProbeFailure(Timeout), 세션은 닫힘
TEST_F(InteractionProberTest, ExpiredDeadlineAbortsBetweenControls) {
    auto deadline = std::make_shared<ScanDeadline>(std::chrono::hours{1});
    session_->controls = {control("One", "one"), control("Two", "two")};
    session_->actions["#one"] = [deadline](FakeSession&) {
        deadline->cancel();
        return ClickResult::Clicked;
    };

    InteractionProber prober(factory(), fastConfig(), deadline);
    try {
        (void)prober.probe(kTarget);
        FAIL() << "ProbeFailure가 발생해야 합니다";
    } catch (const ProbeFailure& e) {
        EXPECT_EQ(e.phase(), ScanPhase::Timeout);
    }
    EXPECT_THAT(trace_->clicked, ElementsAre("#one"));
    EXPECT_EQ(trace_->close_calls, 1);
}

// 원래 페이지 복귀 실패: 이동 요소는 분류, 남은 요소는 클릭하지 않고 테스트 불가
TEST_F(InteractionProberTest, FailedReturnSkipsRemainingControls) {
    session_->fail_after = 1;
    session_->controls = {control("Docs", "docs"), control("Connect", "connect"), control("Swap", "swap")};
    session_->actions["#docs"] = [](FakeSession& s) {
        s.setUrl("https://docs.example.com/");
        return ClickResult::Clicked;
    };
    session_->actions["#connect"] = [](FakeSession& s) {
        s.emitWalletCall("eth_requestAccounts");
        return ClickResult::Clicked;
    };

    InteractionProber prober(factory(), fastConfig());
    auto findings = prober.probe(kTarget);

    ASSERT_THAT(findings.buttons, SizeIs(3));
    EXPECT_EQ(findings.buttons[0].action, "Navigation/redirect");
    EXPECT_EQ(findings.buttons[0].risk, ControlRisk::Warning);
    for (size_t i = 1; i < 3; ++i) {
        EXPECT_EQ(findings.buttons[i].action, "Could not test") << i;
        EXPECT_EQ(findings.buttons[i].risk, ControlRisk::Unknown) << i;
    }
    EXPECT_THAT(trace_->clicked, ElementsAre("#docs"));
    EXPECT_THAT(findings.wallet_interactions, IsEmpty());
    EXPECT_EQ(trace_->navigations, 2);
    EXPECT_EQ(trace_->close_calls, 1);
}

// 복귀 로드 시간도 남은 데드라인으로 제한
TEST_F(InteractionProberTest, ReturnNavigationRespectsDeadline) {
    auto deadline = std::make_shared<ScanDeadline>(std::chrono::milliseconds{60000});
    auto config = fastConfig();
    config.page_load_timeout = std::chrono::hours{1};
    session_->controls = {control("Docs", "docs")};
    session_->actions["#docs"] = [](FakeSession& s) {
        s.setUrl("https://docs.example.com/");
        return ClickResult::Clicked;
    };

    InteractionProber prober(factory(), config, deadline);
    (void)prober.probe(kTarget);

    ASSERT_THAT(trace_->load_timeouts, SizeIs(2));
    for (auto timeout : trace_->load_timeouts) {
        EXPECT_LE(timeout.count(), 60000);
    }
}

// 9. 컨트롤이 없는 페이지도 정상 결과
TEST_F(InteractionProberTest, EmptyPageIsValid) {
    InteractionProber prober(factory(), fastConfig());
    auto findings = prober.probe(kTarget);

    EXPECT_THAT(findings.buttons, IsEmpty());
    EXPECT_THAT(findings.contracts, IsEmpty());
    EXPECT_THAT(findings.wallet_interactions, IsEmpty());
    EXPECT_EQ(findings.url, kTarget);
    EXPECT_FALSE(findings.timestamp.empty());
}

// 10. 서명 요약은 params 100자에서 자름
TEST(InteractionProberStaticTest, FormatSignatureTruncatesParams) {
    WalletCall call{"personal_sign", std::string(150, 'a'), 0};
    EXPECT_EQ(InteractionProber::formatSignature(call), "personal_sign: " + std::string(100, 'a') + "...");
}
