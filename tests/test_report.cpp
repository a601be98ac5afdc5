/**
 * @file test_report.cpp
 * @brief 보고서 생성 / 저장소 단위 테스트
 */

#include <gtest/gtest.h>
#include <gmock/gmock.h>

#include "report/report_builder.h"
#include "report/report_store.h"

#include <QFile>
#include <QJsonDocument>
#include <QRegularExpression>
#include <QTemporaryDir>

using namespace dappscan::report;
using dappscan::analysis::RiskAggregator;
using dappscan::contracts::ContractFindings;
using dappscan::contracts::ContractRecord;
using dappscan::probe::ControlRisk;
using dappscan::probe::FrontendFindings;
using dappscan::probe::InteractiveElement;
using ::testing::HasSubstr;
using ::testing::SizeIs;

namespace {

const char* kAddress = "0xa0b86991c6218b36c1d19d4a2e9eb0ce3606eb48";

FrontendFindings sampleFrontend() {
    FrontendFindings frontend;
    frontend.url = "https://dapp.example.com/";
    frontend.timestamp = "2026-01-01T00:00:00.000Z";

    InteractiveElement connect;
    connect.text = "Connect Wallet";
    connect.tag_name = "button";
    connect.action = "Wallet request: eth_requestAccounts";
    connect.risk = ControlRisk::Warning;
    frontend.buttons.push_back(connect);

    frontend.wallet_interactions.push_back({"eth_requestAccounts", "[]", 1700000000000});
    frontend.wallet_interactions.push_back({"personal_sign", R"(["0x68656c6c6f"])", 1700000000500});
    frontend.signatures.push_back(R"(personal_sign: ["0x68656c6c6f"]...)");
    frontend.external_scripts = {"https://cdn.example.net/web3.min.js"};
    frontend.api_calls = {"https://api.example.com/prices"};
    frontend.contracts = {kAddress};
    return frontend;
}

ContractFindings sampleContracts() {
    ContractRecord record;
    record.address = kAddress;
    record.bytecode = "0x6080";
    record.verified = true;
    record.functions = {"transfer(address,uint256)"};
    record.bytecode_length = 6;
    record.has_abi = true;

    ContractFindings contracts;
    contracts.addresses = {kAddress};
    contracts.verified = {true};
    contracts.analysis = {record};
    contracts.functions = record.functions;
    return contracts;
}

QJsonObject fixedReport(const QString& scan_id = "scan_abc_123456",
                        const QString& timestamp = "2026-01-01T00:00:05.000Z") {
    auto frontend = sampleFrontend();
    auto contracts = sampleContracts();
    auto risk = RiskAggregator::score(frontend, contracts);
    return ReportBuilder::build(frontend.url, frontend, contracts, risk, scan_id, timestamp);
}

} // namespace

// 1. 최상위 키와 고정값
TEST(ReportBuilderTest, BuildsFixedTopLevelShape) {
    auto report = fixedReport();

    EXPECT_EQ(report["scanId"].toString(), "scan_abc_123456");
    EXPECT_EQ(report["url"].toString(), "https://dapp.example.com/");
    EXPECT_EQ(report["timestamp"].toString(), "2026-01-01T00:00:05.000Z");
    EXPECT_EQ(report["version"].toString(), "1.0.0");
    for (const char* key : {"frontendAnalysis", "contractAnalysis", "riskSummary", "metadata"}) {
        EXPECT_TRUE(report[key].isObject()) << key;
    }
}

// 2. 요약 카운트는 목록 길이와 일치
TEST(ReportBuilderTest, SummaryCountsMatchLists) {
    auto report = fixedReport();

    auto frontend = report["frontendAnalysis"].toObject();
    auto summary = frontend["summary"].toObject();
    EXPECT_EQ(summary["buttonsAnalyzed"].toInt(), frontend["buttons"].toArray().size());
    EXPECT_EQ(summary["walletInteractions"].toInt(), 2);
    EXPECT_EQ(summary["externalScripts"].toInt(), 1);
    EXPECT_EQ(summary["apiCalls"].toInt(), 1);

    auto contracts = report["contractAnalysis"].toObject();
    auto contractSummary = contracts["summary"].toObject();
    EXPECT_EQ(contractSummary["contractsFound"].toInt(), 1);
    EXPECT_EQ(contractSummary["verifiedContracts"].toInt(), 1);
    EXPECT_EQ(contractSummary["functionsDetected"].toInt(), 1);
    EXPECT_EQ(contractSummary["risksIdentified"].toInt(), 0);
}

// 3. 버튼 / 지갑 호출 / 분석 레코드 필드
TEST(ReportBuilderTest, SectionRecordsCarryFields) {
    auto report = fixedReport();
    auto frontend = report["frontendAnalysis"].toObject();

    auto button = frontend["buttons"].toArray().first().toObject();
    EXPECT_EQ(button["text"].toString(), "Connect Wallet");
    EXPECT_EQ(button["action"].toString(), "Wallet request: eth_requestAccounts");
    EXPECT_EQ(button["risk"].toString(), "warning");
    EXPECT_EQ(button["element"].toString(), "button");

    auto call = frontend["walletInteractions"].toArray().at(1).toObject();
    EXPECT_EQ(call["method"].toString(), "personal_sign");
    ASSERT_TRUE(call["params"].isArray());
    EXPECT_EQ(call["params"].toArray().first().toString(), "0x68656c6c6f");

    auto record = report["contractAnalysis"].toObject()["analysis"].toArray().first().toObject();
    EXPECT_EQ(record["address"].toString(), kAddress);
    EXPECT_TRUE(record["verified"].toBool());
    EXPECT_TRUE(record["sourceCode"].isNull());
    EXPECT_EQ(record["bytecodeLength"].toInt(), 6);
    EXPECT_FALSE(record["isProxy"].toBool());
    ASSERT_TRUE(record["hasAbi"].isBool());
    EXPECT_TRUE(record["hasAbi"].toBool());
}

// 4. 위험 요약: 1 주의 버튼 + 1 검증 컨트랙트 → 95 / safe
TEST(ReportBuilderTest, RiskSectionReflectsAggregator) {
    auto risk = fixedReport()["riskSummary"].toObject();

    EXPECT_EQ(risk["level"].toString(), "safe");
    EXPECT_EQ(risk["score"].toInt(), 95);
    EXPECT_EQ(risk["issues"].toArray().first().toString(), "1 verified contract(s) found");
    EXPECT_THAT(risk["summary"].toString().toStdString(), HasSubstr("Security score: 95/100."));
}

// 5. scanId 형식
TEST(ReportBuilderTest, ScanIdFormat) {
    static const QRegularExpression pattern("^scan_[0-9a-z]+_[0-9a-z]{6}$");

    auto first = ReportBuilder::generateScanId();
    auto second = ReportBuilder::generateScanId();
    EXPECT_TRUE(pattern.match(first).hasMatch()) << first.toStdString();
    EXPECT_TRUE(pattern.match(second).hasMatch()) << second.toStdString();

    auto built = ReportBuilder::build("https://x.example/", FrontendFindings{}, ContractFindings{});
    EXPECT_TRUE(pattern.match(built["scanId"].toString()).hasMatch());
}

TEST(ReportBuilderTest, Base36) {
    EXPECT_EQ(ReportBuilder::toBase36(0), "0");
    EXPECT_EQ(ReportBuilder::toBase36(35), "z");
    EXPECT_EQ(ReportBuilder::toBase36(36), "10");
    EXPECT_EQ(ReportBuilder::toBase36(1700000000000ULL), "loyw3v28");
}

// 6. Markdown 렌더링
TEST(ReportBuilderTest, RendersMarkdown) {
    auto md = ReportBuilder::renderMarkdown(fixedReport()).toStdString();

    EXPECT_THAT(md, HasSubstr("# Web3 dApp Security Report"));
    EXPECT_THAT(md, HasSubstr("**Scan ID:** scan_abc_123456"));
    EXPECT_THAT(md, HasSubstr("**Risk Level:** SAFE"));
    EXPECT_THAT(md, HasSubstr("**Security Score:** 95/100"));
    EXPECT_THAT(md, HasSubstr("- **Connect Wallet** (button): Wallet request: eth_requestAccounts - Risk: warning"));
    EXPECT_THAT(md, HasSubstr(std::string("- ") + kAddress + " (Verified)"));
    EXPECT_THAT(md, HasSubstr("- `transfer(address,uint256)`"));
    EXPECT_THAT(md, HasSubstr("*Report generated by DappScan v1.0.0*"));
}

// ============================================================
// ReportStore 테스트
// ============================================================

class ReportStoreTest : public ::testing::Test {
protected:
    void SetUp() override {
        ASSERT_TRUE(dir_.isValid());
    }

    QString path(const QString& name) const { return dir_.filePath(name); }

    QTemporaryDir dir_;
};

TEST_F(ReportStoreTest, ParsesFormatNames) {
    EXPECT_TRUE(parseReportFormat("json") == ReportFormat::Json);
    EXPECT_TRUE(parseReportFormat("md") == ReportFormat::Markdown);
    EXPECT_TRUE(parseReportFormat("both") == ReportFormat::Both);
    EXPECT_FALSE(parseReportFormat("html").has_value());
}

// 7. 저장 후 다시 읽으면 같은 객체
TEST_F(ReportStoreTest, SavesBothFormatsAndLoadsBack) {
    ReportStore store(path("nested/reports"));
    auto report = fixedReport();

    auto written = store.save(report, ReportFormat::Both);
    ASSERT_THAT(written, SizeIs(2));
    EXPECT_TRUE(written[0].endsWith("scan_abc_123456.json"));
    EXPECT_TRUE(written[1].endsWith("scan_abc_123456.md"));
    EXPECT_TRUE(QFile::exists(written[1]));

    QString error;
    auto loaded = store.load(written[0], &error);
    ASSERT_TRUE(loaded.has_value()) << error.toStdString();
    EXPECT_EQ(QJsonDocument(*loaded).toJson(QJsonDocument::Compact),
              QJsonDocument(report).toJson(QJsonDocument::Compact));
}

// 8. 목록: 최신순, 읽지 못한 파일은 따로 보고
TEST_F(ReportStoreTest, ListsNewestFirstAndReportsUnreadable) {
    ReportStore store(dir_.path());
    store.save(fixedReport("scan_old_aaaaaa", "2026-01-01T00:00:00.000Z"), ReportFormat::Json);
    store.save(fixedReport("scan_new_bbbbbb", "2026-03-01T00:00:00.000Z"), ReportFormat::Json);
    store.save(fixedReport("scan_mid_cccccc", "2026-02-01T00:00:00.000Z"), ReportFormat::Markdown);

    QFile broken(path("broken.json"));
    ASSERT_TRUE(broken.open(QIODevice::WriteOnly));
    broken.write("{ not json");
    broken.close();

    QFile foreign(path("other.json"));
    ASSERT_TRUE(foreign.open(QIODevice::WriteOnly));
    foreign.write(R"({"hello":"world"})");
    foreign.close();

    auto listing = store.list();
    ASSERT_THAT(listing.reports, SizeIs(2));
    EXPECT_EQ(listing.reports[0].scan_id, "scan_new_bbbbbb");
    EXPECT_EQ(listing.reports[1].scan_id, "scan_old_aaaaaa");
    EXPECT_EQ(listing.reports[0].level, "safe");
    EXPECT_EQ(listing.reports[0].score, 95);
    EXPECT_EQ(listing.reports[0].url, "https://dapp.example.com/");

    ASSERT_THAT(listing.unreadable, SizeIs(2));
    EXPECT_EQ(listing.unreadable[0].file, "broken.json");
    EXPECT_EQ(listing.unreadable[1].file, "other.json");
}

// 9. 없는 디렉터리는 빈 목록
TEST_F(ReportStoreTest, MissingDirectoryListsNothing) {
    ReportStore store(path("does-not-exist"));
    auto listing = store.list();
    EXPECT_TRUE(listing.reports.empty());
    EXPECT_TRUE(listing.unreadable.empty());
}
