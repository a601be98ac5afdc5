/**
 * @file risk_aggregator.cpp
 * @brief 위험 점수 집계 구현
 */

#include "risk_aggregator.h"

#include <algorithm>

namespace dappscan::analysis {

using probe::ControlRisk;

const char* riskLevelName(RiskLevel level) {
    switch (level) {
        case RiskLevel::Safe:    return "safe";
        case RiskLevel::Warning: return "warning";
        case RiskLevel::Danger:  return "danger";
    }
    return "unknown";
}

RiskLevel RiskAggregator::levelFor(int score) {
    if (score >= 80) return RiskLevel::Safe;
    if (score >= 50) return RiskLevel::Warning;
    return RiskLevel::Danger;
}

int RiskAggregator::findingPenalty(const std::string& finding) {
    auto mentions = [&finding](const char* word) {
        return finding.find(word) != std::string::npos;
    };

    if (mentions("SELFDESTRUCT") || mentions("Proxy")) return 20;
    if (mentions("DELEGATECALL") || mentions("Dangerous function")) return 15;
    return 5;
}

std::string RiskAggregator::levelDescription(RiskLevel level) {
    switch (level) {
        case RiskLevel::Safe:
            return "This dApp appears to be relatively safe to interact with.";
        case RiskLevel::Warning:
            return "This dApp has some potential security concerns that should be reviewed.";
        case RiskLevel::Danger:
            return "This dApp has significant security risks and should be approached with extreme caution.";
    }
    return "";
}

RiskSummary RiskAggregator::score(const probe::FrontendFindings& frontend,
                                  const contracts::ContractFindings& contracts) {
    RiskSummary result;
    int score = 100;

    auto countRisk = [&frontend](ControlRisk risk) {
        return static_cast<int>(std::count_if(frontend.buttons.begin(), frontend.buttons.end(),
            [risk](const probe::InteractiveElement& e) { return e.risk == risk; }));
    };

    int danger = countRisk(ControlRisk::Danger);
    if (danger > 0) {
        result.issues.push_back(std::to_string(danger) + " high-risk button(s) detected (wallet transactions)");
        score -= danger * kDangerControlPenalty;
    }

    int warning = countRisk(ControlRisk::Warning);
    if (warning > 0) {
        result.issues.push_back(std::to_string(warning) + " medium-risk button(s) detected (signatures/redirects)");
        score -= warning * kWarningControlPenalty;
    }

    if (frontend.external_scripts.size() > kExternalScriptThreshold) {
        result.issues.push_back("High number of external scripts ("
                                + std::to_string(frontend.external_scripts.size()) + ")");
        score -= kExternalScriptPenalty;
    }

    if (contracts.addresses.empty()) {
        result.issues.push_back("No smart contracts detected - may not be a genuine Web3 dApp");
        score -= kNoContractPenalty;
    }

    auto unverified = static_cast<int>(contracts.unverifiedCount());
    if (unverified > 0) {
        result.issues.push_back(std::to_string(unverified) + " unverified contract(s) detected");
        score -= unverified * kUnverifiedPenalty;
    }

    for (const auto& finding : contracts.risks) {
        result.issues.push_back(finding);
        score -= findingPenalty(finding);
    }

    result.score = std::clamp(score, 0, 100);
    result.level = levelFor(result.score);

    if (result.issues.empty()) {
        result.issues.push_back("No significant security issues detected");
    }

    auto verified = contracts.verifiedCount();
    if (verified > 0) {
        result.issues.insert(result.issues.begin(),
                             std::to_string(verified) + " verified contract(s) found");
    }

    result.summary = levelDescription(result.level) + " Security score: "
                   + std::to_string(result.score) + "/100. "
                   + std::to_string(result.issues.size()) + " issue(s) identified.";
    return result;
}

} // namespace dappscan::analysis
