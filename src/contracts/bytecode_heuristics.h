#pragma once

/**
 * @file bytecode_heuristics.h
 * @brief 바이트코드 16진수 문자열 패턴 검사 (휴리스틱 패스)
 *
 * 실제 EVM 디스어셈블이 아닌 16진수 텍스트 부분 문자열 검색입니다.
 * 명령어 경계를 고려하지 않으므로 PUSH 데이터나 메타데이터 안의 바이트도
 * 매치되며, 과탐(false positive)을 전제로 합니다.
 * 호출자는 이 인터페이스만 사용하므로 디스어셈블러로 교체할 수 있습니다.
 */

#include <cstddef>
#include <string>
#include <vector>

namespace dappscan::contracts {

/// 복잡도 경고 기준 바이트코드 길이 (16진수 문자 수, 약 25KB)
inline constexpr size_t kLargeBytecodeThreshold = 50000;

class BytecodeHeuristics {
public:
    /**
     * @brief PUSH4(0x63) 뒤 4바이트를 셀렉터 후보로 추출
     * @param bytecode 16진수 문자열 ("0x" 접두 허용)
     * @return "0x" + 8자리 소문자 16진수, 첫 등장 순서, 중복 없음
     */
    [[nodiscard]] static std::vector<std::string> extractSelectors(const std::string& bytecode);

    /**
     * @brief 프록시 패턴 여부
     *
     * 소문자 변환 후 다음 중 하나라도 포함하면 true:
     * "6010600a"(초기화 패턴), "f4"(DELEGATECALL), "60008060208180"(배포 패턴).
     * "f4"만으로도 true가 되는 과대 근사입니다.
     */
    [[nodiscard]] static bool detectProxy(const std::string& bytecode);

    /**
     * @brief 위험 태그 계산
     * @param bytecode 바이트코드 16진수 문자열
     * @param functions 해석된 함수 시그니처 목록
     * @return 순서가 고정된 위험 설명 목록
     */
    [[nodiscard]] static std::vector<std::string> analyzeRisks(
        const std::string& bytecode,
        const std::vector<std::string>& functions
    );
};

} // namespace dappscan::contracts
