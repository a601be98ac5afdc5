/**
 * @file bytecode_heuristics.cpp
 * @brief 바이트코드 패턴 검사 구현
 */

#include "bytecode_heuristics.h"

#include <algorithm>
#include <array>
#include <cctype>
#include <regex>
#include <unordered_set>
#include <utility>

namespace dappscan::contracts {

namespace {

std::string toLower(const std::string& s) {
    std::string out(s);
    std::transform(out.begin(), out.end(), out.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return out;
}

/// 위험 opcode (검사 순서 고정)
const std::array<std::pair<const char*, const char*>, 4> kDangerousOpcodes = {{
    {"ff", "SELFDESTRUCT - Contract can be destroyed"},
    {"f4", "DELEGATECALL - Dangerous proxy pattern detected"},
    {"f1", "CALL - External calls detected"},
    {"f2", "CALLCODE - Legacy external call pattern"},
}};

const std::array<const char*, 3> kProxyPatterns = {
    "6010600a",        // 프록시 초기화 패턴
    "f4",              // DELEGATECALL
    "60008060208180",  // 프록시 배포 패턴
};

const std::array<const char*, 5> kDangerousFunctionKeywords = {
    "transferownership",
    "selfdestruct",
    "suicide",
    "delegatecall",
    "changeimplementation",
};

} // namespace

std::vector<std::string> BytecodeHeuristics::extractSelectors(const std::string& bytecode) {
    static const std::regex push4(R"(63([a-fA-F0-9]{8}))");

    std::vector<std::string> selectors;
    std::unordered_set<std::string> seen;

    // 매치는 겹치지 않게 진행 (63xxxxxxxx 이후부터 다음 검색)
    for (auto it = std::sregex_iterator(bytecode.begin(), bytecode.end(), push4);
         it != std::sregex_iterator(); ++it) {
        std::string selector = "0x" + toLower((*it)[1].str());
        if (seen.insert(selector).second) {
            selectors.push_back(std::move(selector));
        }
    }
    return selectors;
}

bool BytecodeHeuristics::detectProxy(const std::string& bytecode) {
    std::string lower = toLower(bytecode);
    return std::any_of(kProxyPatterns.begin(), kProxyPatterns.end(),
                       [&lower](const char* pattern) { return lower.find(pattern) != std::string::npos; });
}

std::vector<std::string> BytecodeHeuristics::analyzeRisks(
    const std::string& bytecode,
    const std::vector<std::string>& functions
) {
    std::vector<std::string> risks;
    std::string lower = toLower(bytecode);

    for (const auto& [opcode, description] : kDangerousOpcodes) {
        if (lower.find(opcode) != std::string::npos) {
            risks.emplace_back(description);
        }
    }

    if (detectProxy(bytecode)) {
        risks.emplace_back("Proxy contract detected - Implementation can be changed");
    }

    for (const auto& func : functions) {
        std::string name = toLower(func);
        for (const char* keyword : kDangerousFunctionKeywords) {
            if (name.find(keyword) != std::string::npos) {
                risks.push_back("Dangerous function detected: " + func);
            }
        }
    }

    if (bytecode.size() > kLargeBytecodeThreshold) {
        risks.emplace_back("Large contract size - High complexity detected");
    }

    return risks;
}

} // namespace dappscan::contracts
