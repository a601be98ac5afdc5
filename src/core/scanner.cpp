/**
 * @file scanner.cpp
 * @brief 스캔 코디네이터 구현
 */

#include "scanner.h"

#include <iostream>

namespace dappscan::core {

Scanner::Scanner(ScanConfig config, probe::SessionFactory factory,
                 ScanCollaborators collaborators)
    : config_(std::move(config))
    , factory_(std::move(factory))
    , collaborators_(std::move(collaborators)) {}

contracts::BytecodeAnalyzer Scanner::makeAnalyzer(
    const std::shared_ptr<const ScanDeadline>& deadline) const {
    const auto& c = config_.contracts;

    auto primary = collaborators_.primary;
    if (!primary) {
        auto etherscan = c.etherscan;
        etherscan.retries = config_.http_retries;
        primary = std::make_shared<contracts::EtherscanCodeSource>(etherscan, deadline);
    }

    auto fallback = collaborators_.fallback;
    if (!fallback && !c.rpc_url.empty()) {
        fallback = std::make_shared<contracts::RpcCodeSource>(
            c.rpc_url, c.rpc_timeout, deadline, config_.http_retries);
    }

    auto lookup = collaborators_.lookup;
    if (!lookup) {
        lookup = std::make_shared<contracts::FourByteDirectoryLookup>(
            c.fourbyte_url, c.lookup_timeout, deadline, config_.http_retries);
    }

    auto resolver = std::make_shared<contracts::SelectorResolver>(lookup, c.resolver);
    return contracts::BytecodeAnalyzer(primary, fallback, resolver, c.analyzer);
}

ScanResult Scanner::scanTarget(const std::string& url) {
    cancel_requested_.store(false);
    auto deadline = std::make_shared<ScanDeadline>(config_.scan_timeout, &cancel_requested_);

    std::cout << "[Scanner] 스캔 시작: " << url
              << " (제한 " << config_.scan_timeout.count() / 1000 << "초)" << std::endl;

    ScanResult result;

    std::cout << "[Scanner] 1단계: 프론트엔드 분석" << std::endl;
    probe::InteractionProber prober(factory_, config_.probe, deadline);
    result.frontend = prober.probe(url);

    if (deadline->expired()) {
        throw ProbeFailure(ScanPhase::Timeout, "scan deadline exceeded after frontend analysis");
    }

    std::cout << "[Scanner] 2단계: 컨트랙트 분석" << std::endl;
    auto analyzer = makeAnalyzer(deadline);
    result.contracts = analyzer.analyze(result.frontend.contracts);

    if (deadline->expired()) {
        throw ProbeFailure(ScanPhase::Timeout, "scan deadline exceeded during contract analysis");
    }

    std::cout << "[Scanner] 스캔 완료: " << url << std::endl;
    return result;
}

} // namespace dappscan::core
