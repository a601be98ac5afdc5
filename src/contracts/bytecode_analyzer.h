#pragma once

/**
 * @file bytecode_analyzer.h
 * @brief 스마트 컨트랙트 바이트코드 위험 분석기
 *
 * 프론트엔드에서 발견된 주소마다 코드를 조회하고, 셀렉터를 추출/해석하고,
 * 위험 패턴을 태깅합니다. 주소별 실패는 해당 주소의 위험 문자열로 격리되며
 * 배치 전체는 예외를 던지지 않습니다.
 */

#include "code_source.h"
#include "selector_resolver.h"

#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace dappscan::contracts {

/**
 * @brief 컨트랙트 하나의 분석 결과 (생성 후 불변)
 */
struct ContractRecord {
    std::string address;
    std::string bytecode;
    bool verified{false};
    std::optional<std::string> source_code;
    std::vector<std::string> functions;     ///< 해석된 시그니처 (순서 유지)
    std::vector<std::string> risks;         ///< 위험 설명 (순서 유지)
    size_t bytecode_length{0};
    bool is_proxy{false};
    bool has_abi{false};                    ///< functions를 검증된 ABI에서 얻었는지
};

/**
 * @brief 배치 분석 결과
 *
 * addresses / verified / analysis는 항상 같은 길이이고 위치가 대응합니다.
 * functions / risks는 요약 집계용으로 평탄화된 목록입니다.
 */
struct ContractFindings {
    std::vector<std::string> addresses;
    std::vector<bool> verified;
    std::vector<ContractRecord> analysis;
    std::vector<std::string> functions;
    std::vector<std::string> risks;

    [[nodiscard]] size_t verifiedCount() const;
    [[nodiscard]] size_t unverifiedCount() const;
};

/**
 * @brief 분석기 설정
 */
struct BytecodeAnalyzerConfig {
    size_t max_contracts{5};    ///< 배치당 분석 주소 상한
    bool concurrent{true};      ///< 주소별 병렬 분석
};

class BytecodeAnalyzer {
public:
    /**
     * @param primary 1차 코드 소스 (필수)
     * @param fallback 대체 코드 소스 (nullptr 허용)
     * @param resolver 셀렉터 해석기
     */
    BytecodeAnalyzer(std::shared_ptr<CodeSource> primary,
                     std::shared_ptr<CodeSource> fallback,
                     std::shared_ptr<SelectorResolver> resolver,
                     BytecodeAnalyzerConfig config = {});

    /**
     * @brief 주소 목록 분석 (앞에서부터 max_contracts개)
     */
    [[nodiscard]] ContractFindings analyze(const std::vector<std::string>& addresses);

    /**
     * @brief 주소 하나 분석
     * @return 코드가 없는 주소(EOA)면 std::nullopt
     * @throws 코드 조회/분석 중 발생한 예외를 그대로 전파
     */
    [[nodiscard]] std::optional<ContractRecord> analyzeAddress(const std::string& address);

private:
    std::shared_ptr<CodeSource> primary_;
    std::shared_ptr<CodeSource> fallback_;
    std::shared_ptr<SelectorResolver> resolver_;
    BytecodeAnalyzerConfig config_;
};

} // namespace dappscan::contracts
