#pragma once

/**
 * @file scan_config.h
 * @brief 스캔 설정 (QSettings INI / 기본 저장소 + 환경 변수)
 *
 * 그룹:
 *   probe/      페이지 로드/대기 시간, 컨트롤 상한
 *   contracts/  Etherscan, RPC, 4byte 엔드포인트와 분석 상한
 *   network/    HTTP 타임아웃, 재시도 횟수
 *   scan/       전체 스캔 타임아웃
 */

#include "contracts/bytecode_analyzer.h"
#include "contracts/code_source.h"
#include "contracts/selector_resolver.h"
#include "probe/interaction_prober.h"

#include <QSettings>
#include <QString>

#include <chrono>
#include <optional>
#include <string>

namespace dappscan::core {

/**
 * @brief 컨트랙트 분석 설정
 */
struct AnalyzerConfig {
    contracts::EtherscanConfig etherscan;
    std::string rpc_url{"https://eth.llamarpc.com"};
    std::chrono::milliseconds rpc_timeout{10000};
    std::string fourbyte_url{"https://www.4byte.directory/api/v1/signatures/"};
    std::chrono::milliseconds lookup_timeout{5000};
    contracts::SelectorResolverConfig resolver;
    contracts::BytecodeAnalyzerConfig analyzer;
};

struct ScanConfig {
    probe::ProbeConfig probe;
    AnalyzerConfig contracts;
    int http_retries{0};
    std::chrono::milliseconds scan_timeout{120000};

    /// 시간 설정 상한 (더 큰 값은 이 값으로 제한)
    static constexpr std::chrono::hours kMaxDuration{24};

    /**
     * @brief 설정 로드
     * @param ini_path 비어 있으면 QSettings("DappScan", "Scanner") 사용
     */
    [[nodiscard]] static ScanConfig load(const QString& ini_path = QString());

    /**
     * @brief QSettings에서 읽기 (없는 키는 기본값)
     */
    [[nodiscard]] static ScanConfig fromSettings(QSettings& settings);

    /**
     * @brief 환경 변수 적용 (ETHERSCAN_API_KEY)
     */
    void applyEnvironment();
};

} // namespace dappscan::core
