#pragma once

/**
 * @file code_source.h
 * @brief 컨트랙트 바이트코드/소스 조회 (코드 소스 협력자)
 *
 * 1차 소스(Etherscan 호환 API)는 바이트코드와 검증 여부/소스 코드를 함께 제공하고,
 * 대체 소스(JSON-RPC eth_getCode)는 바이트코드만 제공합니다.
 * 두 구현 모두 실패 시 예외 대신 빈 결과로 저하됩니다.
 */

#include "core/scan_error.h"

#include <memory>
#include <optional>
#include <string>
#include <vector>
#include <chrono>

namespace dappscan::contracts {

/**
 * @brief 조회된 컨트랙트 코드
 */
struct ContractCode {
    std::string address;
    std::string bytecode;                   ///< 0x 접두 16진수 문자열 (없으면 빈 문자열)
    bool verified{false};                   ///< 레지스트리 검증 여부
    std::optional<std::string> source_code; ///< 검증된 소스 코드
    std::optional<std::string> abi;         ///< ABI JSON 텍스트 (검증된 컨트랙트)

    /**
     * @brief 코드가 있는 주소인지 (EOA가 아닌지)
     */
    [[nodiscard]] bool hasCode() const {
        return !bytecode.empty() && bytecode != "0x" && bytecode != "0x0";
    }
};

/**
 * @brief 코드 소스 인터페이스
 */
class CodeSource {
public:
    virtual ~CodeSource() = default;

    /**
     * @brief 주소의 코드 조회
     * @return 조회 실패 또는 코드 없음이면 bytecode가 빈 결과
     */
    [[nodiscard]] virtual ContractCode getCode(const std::string& address) = 0;

    [[nodiscard]] virtual std::string name() const = 0;
};

/**
 * @brief Etherscan 호환 API 설정
 */
struct EtherscanConfig {
    std::string api_url{"https://api.etherscan.io/v2/api"};
    std::string api_key{"YourApiKeyToken"};
    std::string chain_id{"1"};              ///< 빈 문자열이면 chainid 파라미터 생략 (v1 API)
    std::chrono::milliseconds timeout{10000};
    int retries{0};
};

/**
 * @brief 1차 코드 소스: Etherscan 호환 API
 *
 * proxy/eth_getCode로 바이트코드를, contract/getsourcecode로 검증 정보를 조회합니다.
 */
class EtherscanCodeSource : public CodeSource {
public:
    explicit EtherscanCodeSource(EtherscanConfig config,
                                 std::shared_ptr<const core::ScanDeadline> deadline = nullptr);

    [[nodiscard]] ContractCode getCode(const std::string& address) override;
    [[nodiscard]] std::string name() const override { return "Etherscan"; }

private:
    EtherscanConfig config_;
    std::shared_ptr<const core::ScanDeadline> deadline_;
};

/**
 * @brief 대체 코드 소스: 공개 JSON-RPC 노드
 */
class RpcCodeSource : public CodeSource {
public:
    explicit RpcCodeSource(std::string rpc_url,
                           std::chrono::milliseconds timeout = std::chrono::milliseconds{10000},
                           std::shared_ptr<const core::ScanDeadline> deadline = nullptr,
                           int retries = 0);

    [[nodiscard]] ContractCode getCode(const std::string& address) override;
    [[nodiscard]] std::string name() const override { return "JSON-RPC"; }

private:
    std::string rpc_url_;
    std::chrono::milliseconds timeout_;
    std::shared_ptr<const core::ScanDeadline> deadline_;
    int retries_;
};

/**
 * @brief 1차 소스 → 대체 소스 순으로 코드 조회
 *
 * 1차 소스가 코드를 반환하면 그대로 사용하고, 아니면 대체 소스를 시도합니다.
 * 둘 다 실패하면 bytecode가 빈 결과를 반환합니다.
 */
[[nodiscard]] ContractCode fetchContractCode(
    CodeSource& primary,
    CodeSource* fallback,
    const std::string& address
);

/**
 * @brief 16진수 바이트코드 문자열 형식 검사 ("0x" + 짝수 길이 hex)
 */
[[nodiscard]] bool looksLikeBytecode(const std::string& value);

/**
 * @brief ABI JSON에서 함수 시그니처 추출 ("name(type,...)", ABI 순서 유지)
 *
 * tuple 인자는 "(t1,t2)" 형태로 펼칩니다. 파싱할 수 없는 ABI는 빈 목록입니다.
 */
[[nodiscard]] std::vector<std::string> abiFunctionSignatures(const std::string& abi_json);

} // namespace dappscan::contracts
