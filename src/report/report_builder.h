#pragma once

/**
 * @file report_builder.h
 * @brief 스캔 보고서 생성 (JSON 객체 + Markdown)
 */

#include "analysis/risk_aggregator.h"
#include "contracts/bytecode_analyzer.h"
#include "probe/interaction_prober.h"

#include <QJsonArray>
#include <QJsonObject>
#include <QString>

#include <cstdint>
#include <string>

namespace dappscan::report {

class ReportBuilder {
public:
    static constexpr const char* kVersion = "1.0.0";

    /**
     * @brief 보고서 생성 (scanId/timestamp 새로 발급, 위험 점수 집계 포함)
     */
    [[nodiscard]] static QJsonObject build(const std::string& url,
                                           const probe::FrontendFindings& frontend,
                                           const contracts::ContractFindings& contracts);

    /**
     * @brief 보고서 생성 (식별자와 시각을 호출자가 지정)
     */
    [[nodiscard]] static QJsonObject build(const std::string& url,
                                           const probe::FrontendFindings& frontend,
                                           const contracts::ContractFindings& contracts,
                                           const analysis::RiskSummary& risk,
                                           const QString& scan_id,
                                           const QString& timestamp);

    /**
     * @brief scan_<base36 ms 타임스탬프>_<base36 6자리 난수>
     */
    [[nodiscard]] static QString generateScanId();

    [[nodiscard]] static std::string toBase36(uint64_t value);

    /**
     * @brief Markdown 보고서 렌더링
     */
    [[nodiscard]] static QString renderMarkdown(const QJsonObject& report);

    [[nodiscard]] static QJsonObject frontendSection(const probe::FrontendFindings& frontend);
    [[nodiscard]] static QJsonObject contractSection(const contracts::ContractFindings& contracts);
    [[nodiscard]] static QJsonObject riskSection(const analysis::RiskSummary& risk);
    [[nodiscard]] static QJsonObject metadataSection();
};

} // namespace dappscan::report
