/**
 * @file bytecode_analyzer.cpp
 * @brief 스마트 컨트랙트 바이트코드 위험 분석기 구현
 */

#include "bytecode_analyzer.h"
#include "bytecode_heuristics.h"

#include <algorithm>
#include <future>
#include <iostream>
#include <stdexcept>

namespace dappscan::contracts {

namespace {

/**
 * @brief 주소별 작업 결과
 */
struct AddressOutcome {
    std::string address;
    std::optional<ContractRecord> record;   ///< nullopt + error 없음 = EOA 건너뜀
    std::optional<std::string> error;
};

} // namespace

size_t ContractFindings::verifiedCount() const {
    return static_cast<size_t>(std::count(verified.begin(), verified.end(), true));
}

size_t ContractFindings::unverifiedCount() const {
    return verified.size() - verifiedCount();
}

BytecodeAnalyzer::BytecodeAnalyzer(std::shared_ptr<CodeSource> primary,
                                   std::shared_ptr<CodeSource> fallback,
                                   std::shared_ptr<SelectorResolver> resolver,
                                   BytecodeAnalyzerConfig config)
    : primary_(std::move(primary))
    , fallback_(std::move(fallback))
    , resolver_(std::move(resolver))
    , config_(config) {}

std::optional<ContractRecord> BytecodeAnalyzer::analyzeAddress(const std::string& address) {
    if (!primary_) {
        throw std::logic_error("no primary code source configured");
    }

    std::cout << "[BytecodeAnalyzer] 컨트랙트 분석: " << address << std::endl;

    auto code = fetchContractCode(*primary_, fallback_.get(), address);
    if (!code.hasCode()) {
        std::cout << "[BytecodeAnalyzer] 바이트코드 없음: " << address << " (EOA 추정)" << std::endl;
        return std::nullopt;
    }

    ContractRecord record;
    record.address = address;
    record.verified = code.verified;
    record.source_code = code.source_code;
    record.bytecode_length = code.bytecode.size();

    // 검증된 ABI가 있으면 셀렉터 조회 없이 그대로 사용
    if (code.abi) {
        record.functions = abiFunctionSignatures(*code.abi);
        record.has_abi = true;
    }
    if (record.functions.empty() && resolver_) {
        auto selectors = BytecodeHeuristics::extractSelectors(code.bytecode);
        record.functions = resolver_->resolveAll(selectors);
    }

    record.risks = BytecodeHeuristics::analyzeRisks(code.bytecode, record.functions);
    record.is_proxy = BytecodeHeuristics::detectProxy(code.bytecode);
    record.bytecode = std::move(code.bytecode);

    return record;
}

ContractFindings BytecodeAnalyzer::analyze(const std::vector<std::string>& addresses) {
    ContractFindings findings;

    std::cout << "[BytecodeAnalyzer] 주소 " << addresses.size() << "개 컨트랙트 분석 시작" << std::endl;
    if (addresses.empty()) {
        return findings;
    }

    size_t count = std::min(addresses.size(), config_.max_contracts);

    auto runOne = [this](const std::string& address) {
        AddressOutcome outcome;
        outcome.address = address;
        try {
            outcome.record = analyzeAddress(address);
        } catch (const std::exception& e) {
            std::cerr << "[BytecodeAnalyzer] 분석 실패 " << address << ": " << e.what() << std::endl;
            outcome.error = e.what();
        }
        return outcome;
    };

    std::vector<AddressOutcome> outcomes;
    outcomes.reserve(count);

    if (config_.concurrent && count > 1) {
        std::vector<std::future<AddressOutcome>> tasks;
        tasks.reserve(count);
        for (size_t i = 0; i < count; ++i) {
            tasks.push_back(std::async(std::launch::async, runOne, addresses[i]));
        }
        // 입력 순서대로 수집
        for (auto& task : tasks) {
            outcomes.push_back(task.get());
        }
    } else {
        for (size_t i = 0; i < count; ++i) {
            outcomes.push_back(runOne(addresses[i]));
        }
    }

    for (auto& outcome : outcomes) {
        if (outcome.error) {
            findings.risks.push_back("Failed to analyze contract " + outcome.address + ": " + *outcome.error);
            continue;
        }
        if (!outcome.record) {
            continue;
        }

        auto& record = *outcome.record;
        findings.addresses.push_back(record.address);
        findings.verified.push_back(record.verified);
        findings.functions.insert(findings.functions.end(), record.functions.begin(), record.functions.end());
        findings.risks.insert(findings.risks.end(), record.risks.begin(), record.risks.end());
        findings.analysis.push_back(std::move(record));
    }

    std::cout << "[BytecodeAnalyzer] 분석 완료" << std::endl;
    std::cout << "[BytecodeAnalyzer]   - 컨트랙트 " << findings.addresses.size() << "개" << std::endl;
    std::cout << "[BytecodeAnalyzer]   - 함수 " << findings.functions.size() << "개" << std::endl;
    std::cout << "[BytecodeAnalyzer]   - 위험 " << findings.risks.size() << "개" << std::endl;

    return findings;
}

} // namespace dappscan::contracts
