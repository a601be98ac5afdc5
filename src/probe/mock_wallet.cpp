/**
 * @file mock_wallet.cpp
 * @brief 모의 지갑 프로바이더 구현
 */

#include "mock_wallet.h"

#include <QByteArray>
#include <QJsonArray>
#include <QJsonDocument>
#include <QJsonObject>
#include <QJsonValue>

#include <array>
#include <chrono>
#include <iostream>
#include <sstream>

namespace dappscan::probe {

namespace {

constexpr std::array<WalletMethod, 6> kAllMethods = {
    WalletMethod::RequestAccounts,
    WalletMethod::Accounts,
    WalletMethod::ChainId,
    WalletMethod::PersonalSign,
    WalletMethod::SignTypedDataV4,
    WalletMethod::SendTransaction,
};

int64_t nowMillis() {
    return std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::system_clock::now().time_since_epoch()).count();
}

/// 결정적 모의 16진수 값
std::string mockHex(const std::string& seed, size_t hex_chars) {
    std::string out = "0x";
    while (out.size() < hex_chars + 2) {
        out += seed;
    }
    out.resize(hex_chars + 2);
    return out;
}

std::string quoted(const std::string& s) {
    return "\"" + s + "\"";
}

/**
 * @brief QJsonValue → JSON 텍스트 (스칼라 포함)
 */
std::string toJsonText(const QJsonValue& value) {
    if (value.isUndefined()) return "null";
    if (value.isObject()) {
        return QJsonDocument(value.toObject()).toJson(QJsonDocument::Compact).toStdString();
    }
    if (value.isArray()) {
        return QJsonDocument(value.toArray()).toJson(QJsonDocument::Compact).toStdString();
    }
    // 스칼라는 배열로 감싸서 직렬화 후 괄호 제거
    auto text = QJsonDocument(QJsonArray{value}).toJson(QJsonDocument::Compact).toStdString();
    return text.substr(1, text.size() - 2);
}

} // namespace

const char* walletMethodName(WalletMethod method) {
    switch (method) {
        case WalletMethod::RequestAccounts: return "eth_requestAccounts";
        case WalletMethod::Accounts:        return "eth_accounts";
        case WalletMethod::ChainId:         return "eth_chainId";
        case WalletMethod::PersonalSign:    return "personal_sign";
        case WalletMethod::SignTypedDataV4: return "eth_signTypedData_v4";
        case WalletMethod::SendTransaction: return "eth_sendTransaction";
    }
    return "";
}

std::optional<WalletMethod> parseWalletMethod(const std::string& name) {
    for (auto method : kAllMethods) {
        if (name == walletMethodName(method)) return method;
    }
    return std::nullopt;
}

MockWallet::MockWallet(std::string account, std::string chain_id)
    : account_(std::move(account))
    , chain_id_(std::move(chain_id)) {}

WalletResponse MockWallet::cannedResponse(const std::string& method) const {
    WalletResponse response;

    auto parsed = parseWalletMethod(method);
    if (!parsed) {
        response.status = WalletResponse::Status::NoSuchMethod;
        response.error_code = kUnsupportedMethodCode;
        response.error_message = "The Provider does not support the requested method: " + method;
        response.result = "null";
        return response;
    }

    switch (*parsed) {
        case WalletMethod::RequestAccounts:
        case WalletMethod::Accounts:
            response.result = "[" + quoted(account_) + "]";
            break;
        case WalletMethod::ChainId:
            response.result = quoted(chain_id_);
            break;
        case WalletMethod::PersonalSign:
        case WalletMethod::SignTypedDataV4:
            response.result = quoted(mockHex("5167", 130));
            break;
        case WalletMethod::SendTransaction:
            response.result = quoted(mockHex("7a", 64));
            break;
    }
    return response;
}

void MockWallet::record(const std::string& method, const std::string& params, int64_t timestamp) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        WalletCall call{method, params.empty() ? "null" : params, timestamp ? timestamp : nowMillis()};
        step_log_.push_back(call);
        session_log_.push_back(std::move(call));
    }
    std::cout << "[MockWallet] 지갑 요청: " << method << std::endl;
}

WalletResponse MockWallet::dispatch(const std::string& method, const std::string& params, int64_t timestamp) {
    record(method, params, timestamp);
    return cannedResponse(method);
}

bool MockWallet::handleChannelMessage(const std::string& message) {
    const std::string prefix = kChannelPrefix;
    if (message.rfind(prefix, 0) != 0) {
        return false;
    }

    auto payload = message.substr(prefix.size());
    QJsonParseError error{};
    auto doc = QJsonDocument::fromJson(QByteArray::fromStdString(payload), &error);
    if (error.error != QJsonParseError::NoError || !doc.isObject()) {
        std::cerr << "[MockWallet] 채널 메시지 파싱 실패: " << error.errorString().toStdString() << std::endl;
        return true;
    }

    auto obj = doc.object();
    auto method = obj.value("method").toString().toStdString();
    auto params = toJsonText(obj.value("params"));
    auto timestamp = static_cast<int64_t>(obj.value("timestamp").toDouble(0));

    // 응답은 페이지 쪽 스크립트가 직접 돌려줌
    record(method, params, timestamp);
    return true;
}

std::vector<WalletCall> MockWallet::stepLog() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return step_log_;
}

std::vector<WalletCall> MockWallet::sessionLog() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return session_log_;
}

void MockWallet::clearStepLog() {
    std::lock_guard<std::mutex> lock(mutex_);
    step_log_.clear();
}

bool MockWallet::isStateChanging(const std::string& method) {
    return method.find("send") != std::string::npos;
}

bool MockWallet::isSignatureBearing(const std::string& method) {
    return method.find("sign") != std::string::npos;
}

std::string MockWallet::injectionScript() const {
    std::ostringstream responses;
    responses << "{";
    bool first = true;
    for (auto method : kAllMethods) {
        if (!first) responses << ",";
        responses << quoted(walletMethodName(method)) << ":" << cannedResponse(walletMethodName(method)).result;
        first = false;
    }
    responses << "}";

    std::ostringstream js;
    js << R"JS(
(function() {
    'use strict';
    if (window.ethereum && window.ethereum.__dappscanMock) return;
    const CHANNEL = ')JS" << kChannelPrefix << R"JS(';
    const ACCOUNT = ')JS" << account_ << R"JS(';
    const RESPONSES = )JS" << responses.str() << R"JS(;

    // 페이지가 나중에 console.log / JSON을 덮어써도 채널이 유지되도록 주입 시점에 고정
    const channelLog = Function.prototype.bind.call(console.log, console);
    const stringify = JSON.stringify;
    const parse = JSON.parse;
    const now = Date.now.bind(Date);

    function record(method, params) {
        let payload;
        try {
            payload = stringify({ method: String(method), params: params === undefined ? null : params, timestamp: now() });
        } catch (e) {
            payload = stringify({ method: String(method), params: null, timestamp: now() });
        }
        channelLog(CHANNEL + payload);
    }

    const provider = {
        __dappscanMock: true,
        isMetaMask: true,
        networkVersion: ')JS" << std::stoll(chain_id_, nullptr, 16) << R"JS(',
        chainId: ')JS" << chain_id_ << R"JS(',
        selectedAddress: ACCOUNT,
        request: async function(args) {
            const method = args && args.method;
            const params = args ? args.params : undefined;
            record(method, params);
            if (Object.prototype.hasOwnProperty.call(RESPONSES, method)) {
                return parse(stringify(RESPONSES[method]));
            }
            const err = new Error('The Provider does not support the requested method: ' + method);
            err.code = )JS" << kUnsupportedMethodCode << R"JS(;
            throw err;
        },
        on: function() { return provider; },
        removeListener: function() { return provider; },
        enable: function() { return provider.request({ method: 'eth_requestAccounts' }); },
        send: function(methodOrPayload, params) {
            if (methodOrPayload && typeof methodOrPayload === 'object') {
                return provider.request(methodOrPayload);
            }
            return provider.request({ method: methodOrPayload, params: params });
        }
    };

    window.ethereum = provider;
    window.web3 = { currentProvider: provider };
})();
)JS";
    return js.str();
}

} // namespace dappscan::probe
