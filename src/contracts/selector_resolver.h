#pragma once

/**
 * @file selector_resolver.h
 * @brief 4바이트 함수 셀렉터 → 시그니처 해석기
 *
 * 1. 내장 정적 테이블 조회 (네트워크 호출 없음, 결정적)
 * 2. 외부 시그니처 DB 조회 (4byte.directory, 5초 타임아웃)
 * 3. 실패 시 명시적 플레이스홀더 반환: 예외를 던지지 않음
 *
 * 외부 조회는 프로세스 전역 게이트로 직렬화되며,
 * 호출 사이에 지연을 두어 서비스 요청 제한을 지킵니다.
 */

#include "core/scan_error.h"

#include <atomic>
#include <chrono>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace dappscan::contracts {

/**
 * @brief 시그니처 조회 결과
 */
struct LookupResult {
    bool success{false};                 ///< 조회 자체의 성공 여부 (네트워크/파싱)
    std::vector<std::string> signatures; ///< 후보 시그니처 (비어있을 수 있음)
    std::string error;
};

/**
 * @brief 외부 시그니처 DB 인터페이스
 */
class SignatureLookup {
public:
    virtual ~SignatureLookup() = default;

    /**
     * @brief 셀렉터의 후보 시그니처 조회
     * @param selector "0x" + 8자리 16진수
     */
    [[nodiscard]] virtual LookupResult lookup(const std::string& selector) = 0;
};

/**
 * @brief 4byte.directory 시그니처 조회
 */
class FourByteDirectoryLookup : public SignatureLookup {
public:
    explicit FourByteDirectoryLookup(
        std::string api_url = "https://www.4byte.directory/api/v1/signatures/",
        std::chrono::milliseconds timeout = std::chrono::milliseconds{5000},
        std::shared_ptr<const core::ScanDeadline> deadline = nullptr,
        int retries = 0
    );

    [[nodiscard]] LookupResult lookup(const std::string& selector) override;

private:
    std::string api_url_;
    std::chrono::milliseconds timeout_;
    std::shared_ptr<const core::ScanDeadline> deadline_;
    int retries_;
};

/**
 * @brief 셀렉터 해석기 설정
 */
struct SelectorResolverConfig {
    std::chrono::milliseconds lookup_delay{100};   ///< 외부 조회 사이 지연
    size_t max_lookups_per_batch{10};              ///< 배치당 해석 셀렉터 수 상한
};

/**
 * @brief 셀렉터 해석기
 *
 * 여러 분석 작업에서 동시에 호출될 수 있습니다.
 */
class SelectorResolver {
public:
    /**
     * @param lookup 외부 DB (nullptr이면 정적 테이블만 사용)
     */
    explicit SelectorResolver(std::shared_ptr<SignatureLookup> lookup,
                              SelectorResolverConfig config = {});

    /**
     * @brief 셀렉터 하나 해석
     * @return 시그니처 또는 "Unknown function: <sel>" / "Failed to decode: <sel>"
     */
    [[nodiscard]] std::string resolve(const std::string& selector);

    /**
     * @brief 셀렉터 목록 해석 (앞에서부터 max_lookups_per_batch개)
     */
    [[nodiscard]] std::vector<std::string> resolveAll(const std::vector<std::string>& selectors);

    /**
     * @brief 정적 테이블 조회
     */
    [[nodiscard]] static std::optional<std::string> knownSignature(const std::string& selector);

    /**
     * @brief 외부 조회 누적 횟수
     */
    [[nodiscard]] size_t externalLookupCount() const;

private:
    std::shared_ptr<SignatureLookup> lookup_;
    SelectorResolverConfig config_;
    std::atomic<size_t> external_lookups_{0};
};

} // namespace dappscan::contracts
