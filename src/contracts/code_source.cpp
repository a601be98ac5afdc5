/**
 * @file code_source.cpp
 * @brief 컨트랙트 코드 소스 구현 (Etherscan / JSON-RPC)
 */

#include "code_source.h"
#include "network/http_client.h"

#include <QByteArray>
#include <QJsonArray>
#include <QJsonDocument>
#include <QJsonObject>
#include <QStringList>

#include <cctype>
#include <iostream>

namespace dappscan::contracts {

namespace {

QJsonDocument parseJson(const std::string& body) {
    QJsonParseError error{};
    auto doc = QJsonDocument::fromJson(QByteArray::fromStdString(body), &error);
    if (error.error != QJsonParseError::NoError) {
        return {};
    }
    return doc;
}

network::ProgressCallback deadlineCallback(const std::shared_ptr<const core::ScanDeadline>& deadline) {
    if (!deadline) return nullptr;
    return [deadline](size_t, size_t) { return !deadline->expired(); };
}

} // namespace

bool looksLikeBytecode(const std::string& value) {
    if (value.size() < 2 || value[0] != '0' || (value[1] != 'x' && value[1] != 'X')) {
        return false;
    }
    for (size_t i = 2; i < value.size(); ++i) {
        if (!std::isxdigit(static_cast<unsigned char>(value[i]))) return false;
    }
    return true;
}

// ============================================================
// EtherscanCodeSource
// ============================================================

EtherscanCodeSource::EtherscanCodeSource(EtherscanConfig config,
                                         std::shared_ptr<const core::ScanDeadline> deadline)
    : config_(std::move(config))
    , deadline_(std::move(deadline)) {}

ContractCode EtherscanCodeSource::getCode(const std::string& address) {
    ContractCode result;
    result.address = address;

    // 작업마다 별도 핸들 (병렬 분석)
    network::HttpClient client;

    network::HttpRequest request;
    request.url = config_.api_url;
    request.transfer_timeout = config_.timeout;
    request.retries = config_.retries;
    request.progress = deadlineCallback(deadline_);
    if (!config_.chain_id.empty()) {
        request.query.emplace_back("chainid", config_.chain_id);
    }
    request.query.emplace_back("module", "proxy");
    request.query.emplace_back("action", "eth_getCode");
    request.query.emplace_back("address", address);
    request.query.emplace_back("tag", "latest");
    request.query.emplace_back("apikey", config_.api_key);

    auto code_response = client.send(request);
    if (!code_response.isOk()) {
        std::cerr << "[Etherscan] eth_getCode 실패 (" << address << "): "
                  << (code_response.error_message.empty()
                          ? "HTTP " + std::to_string(code_response.status_code)
                          : code_response.error_message)
                  << std::endl;
        return result;
    }

    auto code_doc = parseJson(code_response.body);
    auto code_value = code_doc.object().value("result");
    if (code_value.isString() && looksLikeBytecode(code_value.toString().toStdString())) {
        result.bytecode = code_value.toString().toStdString();
    } else {
        // 오류 응답은 result에 메시지 문자열이 들어옴 (예: Invalid API Key)
        std::cerr << "[Etherscan] 바이트코드 없음 (" << address << "): "
                  << code_value.toString().toStdString() << std::endl;
    }

    // 검증된 소스 코드 조회
    request.query.clear();
    if (!config_.chain_id.empty()) {
        request.query.emplace_back("chainid", config_.chain_id);
    }
    request.query.emplace_back("module", "contract");
    request.query.emplace_back("action", "getsourcecode");
    request.query.emplace_back("address", address);
    request.query.emplace_back("apikey", config_.api_key);

    auto source_response = client.send(request);
    if (!source_response.isOk()) {
        return result;
    }

    auto source_doc = parseJson(source_response.body);
    auto entries = source_doc.object().value("result").toArray();
    if (entries.isEmpty()) {
        return result;
    }

    auto entry = entries.first().toObject();
    auto source = entry.value("SourceCode").toString();
    if (!source.isEmpty()) {
        result.verified = true;
        result.source_code = source.toStdString();

        auto abi = entry.value("ABI").toString();
        if (!abi.isEmpty() && abi != "Contract source code not verified") {
            if (parseJson(abi.toStdString()).isArray()) {
                result.abi = abi.toStdString();
            } else {
                std::cerr << "[Etherscan] ABI 파싱 실패: " << address << std::endl;
            }
        }
    }

    return result;
}

// ============================================================
// RpcCodeSource
// ============================================================

RpcCodeSource::RpcCodeSource(std::string rpc_url,
                             std::chrono::milliseconds timeout,
                             std::shared_ptr<const core::ScanDeadline> deadline,
                             int retries)
    : rpc_url_(std::move(rpc_url))
    , timeout_(timeout)
    , deadline_(std::move(deadline))
    , retries_(retries) {}

ContractCode RpcCodeSource::getCode(const std::string& address) {
    ContractCode result;
    result.address = address;

    QJsonObject payload{
        {"jsonrpc", "2.0"},
        {"method", "eth_getCode"},
        {"params", QJsonArray{QString::fromStdString(address), "latest"}},
        {"id", 1}
    };

    network::HttpClient client;

    network::HttpRequest request;
    request.method = network::HttpMethod::POST;
    request.url = rpc_url_;
    request.body = QJsonDocument(payload).toJson(QJsonDocument::Compact).toStdString();
    request.content_type = "application/json";
    request.transfer_timeout = timeout_;
    request.retries = retries_;
    request.progress = deadlineCallback(deadline_);

    auto response = client.send(request);
    if (!response.isOk()) {
        std::cerr << "[RpcCodeSource] eth_getCode 실패 (" << address << "): "
                  << response.error_message << std::endl;
        return result;
    }

    auto doc = parseJson(response.body);
    auto value = doc.object().value("result");
    if (value.isString() && looksLikeBytecode(value.toString().toStdString())) {
        result.bytecode = value.toString().toStdString();
    }

    return result;
}

// ============================================================
// ABI 시그니처
// ============================================================

namespace {

QString abiParamType(const QJsonObject& param) {
    auto type = param.value("type").toString();
    if (!type.startsWith("tuple")) {
        return type;
    }

    QStringList parts;
    for (const auto& component : param.value("components").toArray()) {
        parts << abiParamType(component.toObject());
    }
    // "tuple[2]" → "(..)[2]"
    return "(" + parts.join(',') + ")" + type.mid(5);
}

} // namespace

std::vector<std::string> abiFunctionSignatures(const std::string& abi_json) {
    std::vector<std::string> signatures;

    auto doc = parseJson(abi_json);
    if (!doc.isArray()) {
        return signatures;
    }

    for (const auto& value : doc.array()) {
        auto entry = value.toObject();
        // type이 없으면 function으로 간주
        if (entry.value("type").toString("function") != "function") {
            continue;
        }
        auto name = entry.value("name").toString();
        if (name.isEmpty()) {
            continue;
        }

        QStringList inputs;
        for (const auto& input : entry.value("inputs").toArray()) {
            inputs << abiParamType(input.toObject());
        }
        signatures.push_back((name + "(" + inputs.join(',') + ")").toStdString());
    }
    return signatures;
}

// ============================================================
// 1차 → 대체 소스 조회
// ============================================================

ContractCode fetchContractCode(CodeSource& primary, CodeSource* fallback, const std::string& address) {
    std::cout << "[CodeSource] 컨트랙트 데이터 조회: " << address << std::endl;

    auto result = primary.getCode(address);
    if (result.hasCode() || !fallback) {
        return result;
    }

    std::cout << "[CodeSource] " << primary.name() << " 결과 없음, "
              << fallback->name() << " 대체 조회" << std::endl;

    // 대체 소스는 바이트코드만 제공 (검증 정보 없음)
    auto fallback_result = fallback->getCode(address);
    fallback_result.address = address;
    return fallback_result;
}

} // namespace dappscan::contracts
