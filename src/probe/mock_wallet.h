#pragma once

/**
 * @file mock_wallet.h
 * @brief 모의 지갑 프로바이더 (EIP-1193 형태)
 *
 * 페이지에 주입되는 window.ethereum 대체 객체와, 그 호출을 기록하는
 * 호스트 측 로그를 함께 관리합니다.
 *
 * 채널: 주입 스크립트는 호출마다 응답을 돌려주기 전에
 * `__dappscan_wallet__{json}` 형식의 콘솔 메시지를 남기고,
 * 세션이 이를 handleChannelMessage()로 전달합니다.
 * 실제 네트워크로 나가는 호출은 없습니다.
 */

#include <cstdint>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace dappscan::probe {

/**
 * @brief 지원하는 지갑 메서드 (고정 집합)
 */
enum class WalletMethod {
    RequestAccounts,    ///< eth_requestAccounts
    Accounts,           ///< eth_accounts
    ChainId,            ///< eth_chainId
    PersonalSign,       ///< personal_sign
    SignTypedDataV4,    ///< eth_signTypedData_v4
    SendTransaction     ///< eth_sendTransaction
};

[[nodiscard]] const char* walletMethodName(WalletMethod method);
[[nodiscard]] std::optional<WalletMethod> parseWalletMethod(const std::string& name);

/**
 * @brief 지갑 호출 기록 (추가만 가능, 변경/삭제 없음)
 */
struct WalletCall {
    std::string method;
    std::string params;     ///< JSON 텍스트 (없으면 "null")
    int64_t timestamp{0};   ///< epoch 밀리초
};

/**
 * @brief dispatch() 결과
 */
struct WalletResponse {
    enum class Status {
        Ok,
        NoSuchMethod    ///< EIP-1193 4200 Unsupported Method
    };

    Status status{Status::Ok};
    std::string result;     ///< 응답 JSON 텍스트
    int error_code{0};
    std::string error_message;

    [[nodiscard]] bool ok() const { return status == Status::Ok; }
};

class MockWallet {
public:
    static constexpr const char* kChannelPrefix = "__dappscan_wallet__";
    static constexpr const char* kDefaultAccount = "0x742d35Cc6634C0532925a3b8D3Ac92cfF2e5f262";
    static constexpr int kUnsupportedMethodCode = 4200;

    explicit MockWallet(std::string account = kDefaultAccount, std::string chain_id = "0x1");

    /**
     * @brief 지갑 호출 기록만 (응답 없음)
     * @param timestamp 0이면 현재 시각
     */
    void record(const std::string& method,
                const std::string& params = "null",
                int64_t timestamp = 0);

    /**
     * @brief 지갑 호출 처리: 먼저 기록한 뒤 고정 응답 반환
     * @param timestamp 0이면 현재 시각
     */
    [[nodiscard]] WalletResponse dispatch(const std::string& method,
                                          const std::string& params = "null",
                                          int64_t timestamp = 0);

    /**
     * @brief 고정 응답 조회 (기록하지 않음)
     */
    [[nodiscard]] WalletResponse cannedResponse(const std::string& method) const;

    /**
     * @brief 콘솔 채널 메시지 처리
     * @return 채널 메시지였으면 true
     */
    bool handleChannelMessage(const std::string& message);

    /**
     * @brief 페이지 주입용 프로바이더 스크립트
     */
    [[nodiscard]] std::string injectionScript() const;

    /**
     * @brief 현재 단계(클릭 한 번)의 기록
     */
    [[nodiscard]] std::vector<WalletCall> stepLog() const;

    /**
     * @brief 세션 전체 기록
     */
    [[nodiscard]] std::vector<WalletCall> sessionLog() const;

    /**
     * @brief 단계 기록 초기화 (세션 기록은 유지)
     */
    void clearStepLog();

    /**
     * @brief 상태 변경 메서드인지 ("send" 포함)
     */
    [[nodiscard]] static bool isStateChanging(const std::string& method);

    /**
     * @brief 서명 메서드인지 ("sign" 포함)
     */
    [[nodiscard]] static bool isSignatureBearing(const std::string& method);

private:
    std::string account_;
    std::string chain_id_;

    mutable std::mutex mutex_;
    std::vector<WalletCall> step_log_;
    std::vector<WalletCall> session_log_;
};

} // namespace dappscan::probe
