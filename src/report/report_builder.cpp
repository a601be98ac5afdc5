/**
 * @file report_builder.cpp
 * @brief 스캔 보고서 생성 구현
 */

#include "report_builder.h"

#include <QByteArray>
#include <QDateTime>
#include <QJsonDocument>
#include <QJsonValue>
#include <QRandomGenerator>
#include <QStringList>

#include <algorithm>
#include <iostream>

namespace dappscan::report {

namespace {

constexpr char kBase36Digits[] = "0123456789abcdefghijklmnopqrstuvwxyz";

QJsonArray toJsonArray(const std::vector<std::string>& items) {
    QJsonArray array;
    for (const auto& item : items) {
        array.append(QString::fromStdString(item));
    }
    return array;
}

/// JSON 텍스트 → QJsonValue (스칼라 포함, 파싱 실패 시 원문 문자열)
QJsonValue parseJsonText(const std::string& text) {
    auto doc = QJsonDocument::fromJson(QByteArray::fromStdString("[" + text + "]"));
    if (!doc.isArray() || doc.array().isEmpty()) {
        return QString::fromStdString(text);
    }
    return doc.array().first();
}

QString bulletList(const QJsonArray& items, const QString& prefix = QString()) {
    QStringList lines;
    for (const auto& item : items) {
        lines << "- " + prefix + item.toString();
    }
    return lines.join('\n');
}

} // namespace

std::string ReportBuilder::toBase36(uint64_t value) {
    if (value == 0) return "0";

    std::string out;
    while (value > 0) {
        out.push_back(kBase36Digits[value % 36]);
        value /= 36;
    }
    std::reverse(out.begin(), out.end());
    return out;
}

QString ReportBuilder::generateScanId() {
    auto now = static_cast<uint64_t>(QDateTime::currentMSecsSinceEpoch());

    std::string random;
    for (int i = 0; i < 6; ++i) {
        random.push_back(kBase36Digits[QRandomGenerator::global()->bounded(36)]);
    }
    return QString::fromStdString("scan_" + toBase36(now) + "_" + random);
}

QJsonObject ReportBuilder::frontendSection(const probe::FrontendFindings& frontend) {
    QJsonObject summary;
    summary["buttonsAnalyzed"] = static_cast<int>(frontend.buttons.size());
    summary["walletInteractions"] = static_cast<int>(frontend.wallet_interactions.size());
    summary["externalScripts"] = static_cast<int>(frontend.external_scripts.size());
    summary["apiCalls"] = static_cast<int>(frontend.api_calls.size());

    QJsonArray buttons;
    for (const auto& button : frontend.buttons) {
        QJsonObject obj;
        obj["text"] = QString::fromStdString(button.text);
        obj["action"] = QString::fromStdString(button.action);
        obj["risk"] = probe::controlRiskName(button.risk);
        obj["element"] = QString::fromStdString(button.tag_name);
        buttons.append(obj);
    }

    QJsonArray interactions;
    for (const auto& call : frontend.wallet_interactions) {
        QJsonObject obj;
        obj["method"] = QString::fromStdString(call.method);
        obj["params"] = parseJsonText(call.params);
        obj["timestamp"] = static_cast<double>(call.timestamp);
        interactions.append(obj);
    }

    QJsonObject section;
    section["summary"] = summary;
    section["buttons"] = buttons;
    section["signatures"] = toJsonArray(frontend.signatures);
    section["apiCalls"] = toJsonArray(frontend.api_calls);
    section["externalScripts"] = toJsonArray(frontend.external_scripts);
    section["walletInteractions"] = interactions;
    return section;
}

QJsonObject ReportBuilder::contractSection(const contracts::ContractFindings& contracts) {
    QJsonObject summary;
    summary["contractsFound"] = static_cast<int>(contracts.addresses.size());
    summary["verifiedContracts"] = static_cast<int>(contracts.verifiedCount());
    summary["functionsDetected"] = static_cast<int>(contracts.functions.size());
    summary["risksIdentified"] = static_cast<int>(contracts.risks.size());

    QJsonArray verified;
    for (bool v : contracts.verified) {
        verified.append(v);
    }

    QJsonArray analysis;
    for (const auto& record : contracts.analysis) {
        QJsonObject obj;
        obj["address"] = QString::fromStdString(record.address);
        obj["bytecode"] = QString::fromStdString(record.bytecode);
        obj["verified"] = record.verified;
        obj["sourceCode"] = record.source_code
            ? QJsonValue(QString::fromStdString(*record.source_code))
            : QJsonValue(QJsonValue::Null);
        obj["functions"] = toJsonArray(record.functions);
        obj["risks"] = toJsonArray(record.risks);
        obj["bytecodeLength"] = static_cast<double>(record.bytecode_length);
        obj["isProxy"] = record.is_proxy;
        obj["hasAbi"] = record.has_abi;
        analysis.append(obj);
    }

    QJsonObject section;
    section["summary"] = summary;
    section["addresses"] = toJsonArray(contracts.addresses);
    section["verified"] = verified;
    section["functions"] = toJsonArray(contracts.functions);
    section["risks"] = toJsonArray(contracts.risks);
    section["analysis"] = analysis;
    return section;
}

QJsonObject ReportBuilder::riskSection(const analysis::RiskSummary& risk) {
    QJsonObject section;
    section["level"] = analysis::riskLevelName(risk.level);
    section["score"] = risk.score;
    section["issues"] = toJsonArray(risk.issues);
    section["summary"] = QString::fromStdString(risk.summary);
    return section;
}

QJsonObject ReportBuilder::metadataSection() {
    QJsonObject metadata;
    metadata["analysisMethod"] = "Automated sandboxed browser probing + smart contract bytecode analysis";
    metadata["tools"] = QJsonArray{"Qt WebEngine", "libcurl", "4byte.directory", "Etherscan API"};
    metadata["disclaimers"] = QJsonArray{
        "This analysis is automated and may not catch all security issues",
        "Always verify contracts independently before interacting",
        "This tool does not guarantee the safety of any dApp",
        "Use at your own risk",
    };
    return metadata;
}

QJsonObject ReportBuilder::build(const std::string& url,
                                 const probe::FrontendFindings& frontend,
                                 const contracts::ContractFindings& contracts) {
    auto risk = analysis::RiskAggregator::score(frontend, contracts);
    auto timestamp = QDateTime::currentDateTimeUtc().toString(Qt::ISODateWithMs);
    return build(url, frontend, contracts, risk, generateScanId(), timestamp);
}

QJsonObject ReportBuilder::build(const std::string& url,
                                 const probe::FrontendFindings& frontend,
                                 const contracts::ContractFindings& contracts,
                                 const analysis::RiskSummary& risk,
                                 const QString& scan_id,
                                 const QString& timestamp) {
    std::cout << "[ReportBuilder] 보고서 생성: " << scan_id.toStdString() << std::endl;

    QJsonObject report;
    report["scanId"] = scan_id;
    report["url"] = QString::fromStdString(url);
    report["timestamp"] = timestamp;
    report["version"] = kVersion;
    report["frontendAnalysis"] = frontendSection(frontend);
    report["contractAnalysis"] = contractSection(contracts);
    report["riskSummary"] = riskSection(risk);
    report["metadata"] = metadataSection();

    std::cout << "[ReportBuilder]   - 위험 등급: " << analysis::riskLevelName(risk.level) << std::endl;
    std::cout << "[ReportBuilder]   - 보안 점수: " << risk.score << "/100" << std::endl;
    std::cout << "[ReportBuilder]   - 이슈 " << risk.issues.size() << "개" << std::endl;

    return report;
}

QString ReportBuilder::renderMarkdown(const QJsonObject& report) {
    auto risk = report["riskSummary"].toObject();
    auto frontend = report["frontendAnalysis"].toObject();
    auto frontendSummary = frontend["summary"].toObject();
    auto contracts = report["contractAnalysis"].toObject();
    auto contractSummary = contracts["summary"].toObject();

    QStringList buttons;
    for (const auto& value : frontend["buttons"].toArray()) {
        auto button = value.toObject();
        buttons << QString("- **%1** (%2): %3 - Risk: %4")
                       .arg(button["text"].toString(), button["element"].toString(),
                            button["action"].toString(), button["risk"].toString());
    }

    QStringList addresses;
    auto verified = contracts["verified"].toArray();
    auto addressList = contracts["addresses"].toArray();
    for (int i = 0; i < addressList.size(); ++i) {
        bool isVerified = i < verified.size() && verified[i].toBool();
        addresses << QString("- %1 %2").arg(addressList[i].toString(),
                                            isVerified ? "(Verified)" : "(Unverified)");
    }

    QStringList functions;
    for (const auto& value : contracts["functions"].toArray()) {
        functions << "- `" + value.toString() + "`";
    }

    QString md;
    md += "# Web3 dApp Security Report\n\n";
    md += QString("**URL:** %1  \n").arg(report["url"].toString());
    md += QString("**Scan ID:** %1  \n").arg(report["scanId"].toString());
    md += QString("**Timestamp:** %1  \n").arg(report["timestamp"].toString());
    md += QString("**Tool Version:** %1\n\n").arg(report["version"].toString());

    md += "## Risk Summary\n\n";
    md += QString("**Risk Level:** %1  \n").arg(risk["level"].toString().toUpper());
    md += QString("**Security Score:** %1/100  \n\n").arg(risk["score"].toInt());
    md += risk["summary"].toString() + "\n\n";
    md += "### Issues Identified\n";
    md += bulletList(risk["issues"].toArray()) + "\n\n";

    md += "## Frontend Analysis\n\n";
    md += "### Summary\n";
    md += QString("- **Interactive Elements:** %1\n").arg(frontendSummary["buttonsAnalyzed"].toInt());
    md += QString("- **Wallet Interactions:** %1\n").arg(frontendSummary["walletInteractions"].toInt());
    md += QString("- **External Scripts:** %1\n").arg(frontendSummary["externalScripts"].toInt());
    md += QString("- **API Calls:** %1\n\n").arg(frontendSummary["apiCalls"].toInt());
    md += "### Interactive Elements\n";
    md += buttons.join('\n') + "\n\n";
    md += "### External Scripts\n";
    md += bulletList(frontend["externalScripts"].toArray()) + "\n\n";

    md += "## Smart Contract Analysis\n\n";
    md += "### Summary\n";
    md += QString("- **Contracts Found:** %1\n").arg(contractSummary["contractsFound"].toInt());
    md += QString("- **Verified Contracts:** %1\n").arg(contractSummary["verifiedContracts"].toInt());
    md += QString("- **Functions Detected:** %1\n").arg(contractSummary["functionsDetected"].toInt());
    md += QString("- **Risks Identified:** %1\n\n").arg(contractSummary["risksIdentified"].toInt());
    md += "### Contract Addresses\n";
    md += addresses.join('\n') + "\n\n";
    md += "### Functions Detected\n";
    md += functions.join('\n') + "\n\n";
    md += "### Contract Risks\n";
    md += bulletList(contracts["risks"].toArray()) + "\n\n";

    md += "## Disclaimer\n\n";
    md += bulletList(report["metadata"].toObject()["disclaimers"].toArray()) + "\n\n";
    md += "---\n\n";
    md += QString("*Report generated by DappScan v%1*  \n").arg(report["version"].toString());
    md += QString("*Analysis performed on %1*\n").arg(report["timestamp"].toString());
    return md;
}

} // namespace dappscan::report
