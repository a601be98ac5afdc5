#pragma once

/**
 * @file risk_aggregator.h
 * @brief 프론트엔드 + 컨트랙트 분석 결과를 하나의 위험 점수로 집계
 *
 * 순수 함수입니다. 입력이 같으면 결과(점수, 등급, 이슈 순서)도 같습니다.
 */

#include "contracts/bytecode_analyzer.h"
#include "probe/interaction_prober.h"

#include <string>
#include <vector>

namespace dappscan::analysis {

/**
 * @brief 위험 등급
 */
enum class RiskLevel {
    Safe,       ///< 80 이상
    Warning,    ///< 50 이상 80 미만
    Danger      ///< 50 미만
};

[[nodiscard]] const char* riskLevelName(RiskLevel level);

/**
 * @brief 집계 결과
 */
struct RiskSummary {
    RiskLevel level{RiskLevel::Safe};
    int score{100};                     ///< [0, 100]
    std::vector<std::string> issues;
    std::string summary;                ///< 사람이 읽는 한 문장 요약

    bool operator==(const RiskSummary& other) const {
        return level == other.level && score == other.score
            && issues == other.issues && summary == other.summary;
    }
};

class RiskAggregator {
public:
    static constexpr int kDangerControlPenalty = 15;
    static constexpr int kWarningControlPenalty = 5;
    static constexpr int kExternalScriptPenalty = 10;
    static constexpr size_t kExternalScriptThreshold = 3;
    static constexpr int kNoContractPenalty = 20;
    static constexpr int kUnverifiedPenalty = 10;

    [[nodiscard]] static RiskSummary score(const probe::FrontendFindings& frontend,
                                           const contracts::ContractFindings& contracts);

    /**
     * @brief 점수 → 등급 (하한 포함)
     */
    [[nodiscard]] static RiskLevel levelFor(int score);

    /**
     * @brief 컨트랙트 위험 문자열 하나의 감점
     */
    [[nodiscard]] static int findingPenalty(const std::string& finding);

    [[nodiscard]] static std::string levelDescription(RiskLevel level);
};

} // namespace dappscan::analysis
