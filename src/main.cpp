/**
 * @file main.cpp
 * @brief DappScan 메인 진입점
 *
 * QApplication 초기화, libcurl 전역 초기화, CLI 인수 파싱,
 * 시그널 핸들링을 수행합니다.
 *
 * 명령:
 *   analyze <url>   dApp 스캔 후 보고서 저장
 *     -o, --output <dir>    보고서 디렉토리 (기본: ./reports)
 *     -f, --format <fmt>    json | md | both (기본: json)
 *     --rpc <url>           컨트랙트 조회용 RPC 엔드포인트
 *     --timeout <sec>       전체 스캔 제한 시간
 *     --config <ini>        설정 파일
 *     --verbose             상세 출력
 *   list            저장된 보고서 목록 (최근 10개)
 */

#include <QApplication>
#include <QCommandLineParser>
#include <QCommandLineOption>
#include <QDateTime>
#include <QTimer>
#include <QUrl>

#include <algorithm>
#include <csignal>
#include <iostream>
#include <memory>
#include <string>

#include "core/scan_config.h"
#include "core/scan_error.h"
#include "core/scanner.h"
#include "engine/web_engine_session.h"
#include "network/http_client.h"
#include "report/report_builder.h"
#include "report/report_store.h"

namespace {

// ============================================================
// 전역 상태 (시그널 핸들러에서 접근)
// ============================================================

/// 진행 중인 스캐너 (취소용)
dappscan::core::Scanner* g_scanner = nullptr;

/**
 * @brief UNIX 시그널 핸들러
 *
 * SIGINT(Ctrl+C), SIGTERM 수신 시 진행 중인 스캔을 취소합니다.
 * 세션 정리와 전송 중단은 스캔 쪽에서 처리됩니다.
 */
void signalHandler(int) {
    if (g_scanner) {
        g_scanner->cancel();
    }
}

void installSignalHandlers() {
    std::signal(SIGINT, signalHandler);
    std::signal(SIGTERM, signalHandler);
#ifndef _WIN32
    std::signal(SIGPIPE, SIG_IGN);
#endif
}

const char* levelMarker(const QString& level) {
    if (level == "safe") return "[SAFE]";
    if (level == "warning") return "[WARNING]";
    if (level == "danger") return "[DANGER]";
    return "[?]";
}

// ============================================================
// 명령 구현
// ============================================================

struct AnalyzeOptions {
    QString url;
    QString output;
    dappscan::report::ReportFormat format{dappscan::report::ReportFormat::Json};
    QString rpc;
    int timeoutSeconds{0};
    QString configPath;
    bool verbose{false};
};

void printSummary(const QJsonObject& report) {
    auto risk = report["riskSummary"].toObject();
    auto frontend = report["frontendAnalysis"].toObject()["summary"].toObject();
    auto contracts = report["contractAnalysis"].toObject()["summary"].toObject();

    std::cout << "\nSECURITY SUMMARY\n"
              << "================\n"
              << "URL: " << report["url"].toString().toStdString() << "\n"
              << "Scan ID: " << report["scanId"].toString().toStdString() << "\n"
              << "Timestamp: " << report["timestamp"].toString().toStdString() << "\n\n"
              << levelMarker(risk["level"].toString()) << " Risk Level: "
              << risk["level"].toString().toUpper().toStdString() << "\n"
              << "Security Score: " << risk["score"].toInt() << "/100\n\n";

    auto issues = risk["issues"].toArray();
    if (!issues.isEmpty()) {
        std::cout << "Issues Found:\n";
        for (int i = 0; i < issues.size(); ++i) {
            std::cout << "   " << (i + 1) << ". " << issues[i].toString().toStdString() << "\n";
        }
        std::cout << "\n";
    }

    std::cout << "Frontend Analysis:\n"
              << "   - " << frontend["buttonsAnalyzed"].toInt() << " interactive elements analyzed\n"
              << "   - " << frontend["walletInteractions"].toInt() << " wallet interactions detected\n"
              << "   - " << frontend["externalScripts"].toInt() << " external scripts found\n\n"
              << "Contract Analysis:\n"
              << "   - " << contracts["contractsFound"].toInt() << " contracts discovered\n"
              << "   - " << contracts["verifiedContracts"].toInt() << " verified contracts\n"
              << "   - " << contracts["functionsDetected"].toInt() << " functions identified\n"
              << std::endl;
}

int runAnalyze(const AnalyzeOptions& options) {
    QUrl target(options.url, QUrl::StrictMode);
    if (!target.isValid() || target.scheme().isEmpty() || target.host().isEmpty()) {
        std::cerr << "[DappScan] 잘못된 URL: " << options.url.toStdString() << std::endl;
        return 1;
    }

    auto config = dappscan::core::ScanConfig::load(options.configPath);
    if (!options.rpc.isEmpty()) {
        config.contracts.rpc_url = options.rpc.toStdString();
    }
    if (options.timeoutSeconds > 0) {
        config.scan_timeout = std::min<std::chrono::milliseconds>(
            std::chrono::seconds{options.timeoutSeconds}, dappscan::core::ScanConfig::kMaxDuration);
    }

    if (options.verbose) {
        std::cout << "[DappScan] 설정:" << std::endl;
        std::cout << "  output: " << options.output.toStdString() << std::endl;
        std::cout << "  etherscan: " << config.contracts.etherscan.api_url << std::endl;
        std::cout << "  rpc: " << config.contracts.rpc_url << std::endl;
        std::cout << "  4byte: " << config.contracts.fourbyte_url << std::endl;
        std::cout << "  timeout: " << config.scan_timeout.count() / 1000 << "s" << std::endl;
        std::cout << "  http retries: " << config.http_retries << std::endl;
    }

    DappScan::Engine::SessionOptions session;
    session.quietWindow = config.probe.quiet_window;

    dappscan::core::Scanner scanner(config, DappScan::Engine::makeSessionFactory(session));
    g_scanner = &scanner;

    int exit_code = 1;
    try {
        auto url = target.toString().toStdString();
        auto result = scanner.scanTarget(url);
        auto report = dappscan::report::ReportBuilder::build(url, result.frontend, result.contracts);

        dappscan::report::ReportStore store(options.output);
        store.save(report, options.format);

        printSummary(report);
        exit_code = report["riskSummary"].toObject()["level"].toString() == "danger" ? 1 : 0;
    } catch (const dappscan::core::ProbeFailure& e) {
        std::cerr << "[DappScan] 분석 실패: " << e.what() << std::endl;
    } catch (const std::exception& e) {
        std::cerr << "[DappScan] 분석 실패: " << e.what() << std::endl;
    }

    g_scanner = nullptr;
    return exit_code;
}

int runList(const QString& output) {
    dappscan::report::ReportStore store(output);
    auto listing = store.list();

    if (listing.reports.empty() && listing.unreadable.empty()) {
        std::cout << "No previous scans found." << std::endl;
        return 0;
    }

    std::cout << "Previous Security Scans\n"
              << "=======================\n" << std::endl;

    size_t shown = 0;
    for (const auto& report : listing.reports) {
        if (shown++ >= 10) break;
        auto date = QDateTime::fromString(report.timestamp, Qt::ISODateWithMs).toLocalTime();
        std::cout << levelMarker(report.level) << " " << report.url.toStdString() << "\n"
                  << "   ID: " << report.scan_id.toStdString() << "\n"
                  << "   Date: " << date.toString("yyyy-MM-dd HH:mm:ss").toStdString() << "\n"
                  << "   Score: " << report.score << "/100\n" << std::endl;
    }

    for (const auto& bad : listing.unreadable) {
        std::cout << "Could not read " << bad.file.toStdString() << ": "
                  << bad.error.toStdString() << std::endl;
    }
    return 0;
}

} // anonymous namespace


// ============================================================
// 메인 함수
// ============================================================

int main(int argc, char* argv[]) {
    // 디스플레이 없는 환경에서 WebEngine 실행
    if (qEnvironmentVariableIsEmpty("QT_QPA_PLATFORM")) {
        qputenv("QT_QPA_PLATFORM", "offscreen");
    }
    QCoreApplication::setAttribute(Qt::AA_ShareOpenGLContexts);

    // ---- Qt 애플리케이션 초기화 ----
    QApplication app(argc, argv);
    QApplication::setApplicationName("DappScan");
    QApplication::setApplicationVersion(dappscan::report::ReportBuilder::kVersion);
    QApplication::setOrganizationName("DappScan");

    // ---- CLI 인수 파싱 ----
    QCommandLineParser parser;
    parser.setApplicationDescription("DappScan: Web3 dApp 보안 스캐너");
    parser.addHelpOption();
    parser.addVersionOption();
    parser.addPositionalArgument("command", "analyze <url> | list");
    parser.addPositionalArgument("url", "분석할 dApp URL (analyze)", "[url]");

    QCommandLineOption outputOption({"o", "output"}, "보고서 디렉토리", "dir", "./reports");
    QCommandLineOption formatOption({"f", "format"}, "보고서 형식 (json|md|both)", "format", "json");
    QCommandLineOption rpcOption("rpc", "컨트랙트 조회용 RPC 엔드포인트", "url");
    QCommandLineOption timeoutOption("timeout", "전체 스캔 제한 시간 (초)", "seconds");
    QCommandLineOption configOption("config", "설정 파일 (INI)", "path");
    QCommandLineOption verboseOption("verbose", "상세 출력");
    parser.addOptions({outputOption, formatOption, rpcOption, timeoutOption, configOption, verboseOption});

    parser.process(app);

    const auto args = parser.positionalArguments();
    if (args.isEmpty()) {
        parser.showHelp(1);
    }

    const auto command = args.first();
    if (command == "list") {
        return runList(parser.value(outputOption));
    }

    if (command != "analyze" || args.size() < 2) {
        std::cerr << "[DappScan] 사용법: dappscan analyze <url> | dappscan list" << std::endl;
        return 1;
    }

    AnalyzeOptions options;
    options.url = args.at(1);
    options.output = parser.value(outputOption);
    options.rpc = parser.value(rpcOption);
    options.configPath = parser.value(configOption);
    options.verbose = parser.isSet(verboseOption);

    auto format = dappscan::report::parseReportFormat(parser.value(formatOption).toStdString());
    if (!format) {
        std::cerr << "[DappScan] 알 수 없는 형식: " << parser.value(formatOption).toStdString() << std::endl;
        return 1;
    }
    options.format = *format;

    if (parser.isSet(timeoutOption)) {
        bool ok = false;
        options.timeoutSeconds = parser.value(timeoutOption).toInt(&ok);
        if (!ok || options.timeoutSeconds <= 0) {
            std::cerr << "[DappScan] 잘못된 timeout 값" << std::endl;
            return 1;
        }
    }

    // ---- 시그널 핸들러 설치 ----
    installSignalHandlers();

    // ---- libcurl 전역 초기화 ----
    dappscan::network::HttpClient::globalInit();

    std::cout << "DappScan: Web3 dApp Security Scanner\n"
              << "=====================================\n" << std::endl;

    // 이벤트 루프 안에서 스캔 실행
    int exit_code = 1;
    QTimer::singleShot(0, &app, [&]() {
        exit_code = runAnalyze(options);
        app.exit(exit_code);
    });
    app.exec();

    // ---- 정리 ----
    dappscan::network::HttpClient::globalCleanup();

    std::cout << "[DappScan] 종료 (코드: " << exit_code << ")" << std::endl;
    return exit_code;
}
