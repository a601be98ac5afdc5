#pragma once

/**
 * @file interaction_prober.h
 * @brief dApp 프론트엔드 상호작용 탐색기
 *
 * 샌드박스 세션에 모의 지갑을 주입하고 페이지를 로드한 뒤,
 * 클릭 가능한 요소를 하나씩 눌러 보며 페이지가 무엇을 시도하는지 기록합니다.
 */

#include "browser_session.h"
#include "mock_wallet.h"
#include "core/scan_error.h"

#include <chrono>
#include <memory>
#include <string>
#include <vector>

namespace dappscan::probe {

/**
 * @brief 탐색 타이밍 및 상한 설정
 */
struct ProbeConfig {
    std::chrono::milliseconds page_load_timeout{30000};
    std::chrono::milliseconds settle_delay{3000};       ///< 로드 후 클라이언트 렌더링 대기
    std::chrono::milliseconds post_click_wait{1000};
    std::chrono::milliseconds quiet_window{500};        ///< 네트워크 조용함 판정 구간
    size_t max_controls{20};
    size_t max_tested{10};
};

/**
 * @brief 컨트롤 위험도
 */
enum class ControlRisk {
    Safe,
    Warning,
    Danger,
    Unknown
};

[[nodiscard]] const char* controlRiskName(ControlRisk risk);

/**
 * @brief 탐색된 상호작용 요소
 */
struct InteractiveElement {
    std::string text;
    std::string tag_name;
    std::string classes;
    std::string id;
    std::string action{"unknown"};
    ControlRisk risk{ControlRisk::Unknown};
};

/**
 * @brief 프론트엔드 탐색 결과
 */
struct FrontendFindings {
    std::string url;
    std::string timestamp;                      ///< ISO-8601 UTC
    std::vector<InteractiveElement> buttons;
    std::vector<std::string> signatures;        ///< "<method>: <params>..."
    std::vector<std::string> api_calls;
    std::vector<std::string> external_scripts;
    std::vector<std::string> contracts;         ///< 소문자, 중복 없음
    size_t network_requests{0};
    std::vector<WalletCall> wallet_interactions;
};

class InteractionProber {
public:
    InteractionProber(SessionFactory factory,
                      ProbeConfig config = {},
                      std::shared_ptr<const core::ScanDeadline> deadline = nullptr);

    /**
     * @brief 대상 URL 탐색
     * @throws core::ProbeFailure 세션 생성 실패, 페이지 로드 실패, 데드라인 초과
     */
    [[nodiscard]] FrontendFindings probe(const std::string& url);

    /**
     * @brief 요소에 대한 최선의 셀렉터 (id → 첫 class → tag+text)
     */
    [[nodiscard]] static std::string selectorFor(const InteractiveElement& element);

    /**
     * @brief 텍스트에서 컨트랙트 주소 후보 추출 (소문자)
     */
    [[nodiscard]] static std::vector<std::string> extractAddresses(const std::string& text);

    /**
     * @brief 후보 요소 필터링 (빈 텍스트/100자 이상 제외, 상한 적용)
     */
    [[nodiscard]] static std::vector<InteractiveElement> collectControls(
        const std::vector<ControlCandidate>& candidates, size_t max_controls);

    /**
     * @brief 서명 호출 요약 문자열
     */
    [[nodiscard]] static std::string formatSignature(const WalletCall& call);

private:
    void checkDeadline(const char* stage) const;

    /// 페이지 로드 제한 시간 (남은 데드라인으로 제한)
    [[nodiscard]] std::chrono::milliseconds loadTimeout() const;

    /**
     * @brief 요소 하나 클릭 후 분류
     * @return 원래 페이지로 돌아오지 못했으면 false
     */
    bool testControl(BrowserSession& session, MockWallet& wallet,
                     InteractiveElement& element,
                     const std::string& url, const std::string& baseline_url);

    SessionFactory factory_;
    ProbeConfig config_;
    std::shared_ptr<const core::ScanDeadline> deadline_;
};

} // namespace dappscan::probe
