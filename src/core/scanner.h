#pragma once

/**
 * @file scanner.h
 * @brief 스캔 코디네이터: 프론트엔드 탐색 후 발견된 컨트랙트 분석
 */

#include "scan_config.h"
#include "scan_error.h"
#include "contracts/bytecode_analyzer.h"
#include "probe/browser_session.h"
#include "probe/interaction_prober.h"

#include <atomic>
#include <memory>
#include <string>

namespace dappscan::core {

struct ScanResult {
    probe::FrontendFindings frontend;
    contracts::ContractFindings contracts;
};

/**
 * @brief 외부 협력자 주입 (기본값은 설정 기반 실제 구현)
 */
struct ScanCollaborators {
    std::shared_ptr<contracts::CodeSource> primary;
    std::shared_ptr<contracts::CodeSource> fallback;
    std::shared_ptr<contracts::SignatureLookup> lookup;
};

class Scanner {
public:
    Scanner(ScanConfig config, probe::SessionFactory factory,
            ScanCollaborators collaborators = {});

    /**
     * @brief 대상 URL 스캔
     * @throws ProbeFailure 세션/로드 실패 또는 스캔 데드라인 초과
     */
    [[nodiscard]] ScanResult scanTarget(const std::string& url);

    /**
     * @brief 진행 중인 스캔 취소 요청 (시그널 핸들러에서 호출 가능)
     */
    void cancel() noexcept { cancel_requested_.store(true); }

    [[nodiscard]] const ScanConfig& config() const { return config_; }

private:
    [[nodiscard]] contracts::BytecodeAnalyzer makeAnalyzer(
        const std::shared_ptr<const ScanDeadline>& deadline) const;

    ScanConfig config_;
    probe::SessionFactory factory_;
    ScanCollaborators collaborators_;
    std::atomic<bool> cancel_requested_{false};
};

} // namespace dappscan::core
