/**
 * @file scan_config.cpp
 * @brief 스캔 설정 로드 구현
 */

#include "scan_config.h"

#include <QFileInfo>
#include <QtGlobal>

#include <algorithm>
#include <iostream>

namespace dappscan::core {

namespace {

constexpr auto kMaxDuration = ScanConfig::kMaxDuration;

std::chrono::milliseconds readMs(QSettings& settings, const QString& key,
                                 std::chrono::milliseconds fallback) {
    bool ok = false;
    auto value = settings.value(key, static_cast<qlonglong>(fallback.count())).toLongLong(&ok);
    if (!ok || value < 0) {
        std::cerr << "[ScanConfig] 잘못된 값, 기본값 사용: " << key.toStdString() << std::endl;
        return fallback;
    }
    return std::min<std::chrono::milliseconds>(std::chrono::milliseconds{value}, kMaxDuration);
}

size_t readCount(QSettings& settings, const QString& key, size_t fallback) {
    bool ok = false;
    auto value = settings.value(key, static_cast<qulonglong>(fallback)).toULongLong(&ok);
    if (!ok) {
        std::cerr << "[ScanConfig] 잘못된 값, 기본값 사용: " << key.toStdString() << std::endl;
        return fallback;
    }
    return static_cast<size_t>(value);
}

std::string readString(QSettings& settings, const QString& key, const std::string& fallback) {
    return settings.value(key, QString::fromStdString(fallback)).toString().toStdString();
}

} // namespace

ScanConfig ScanConfig::fromSettings(QSettings& settings) {
    ScanConfig config;

    settings.beginGroup("probe");
    config.probe.page_load_timeout = readMs(settings, "page_load_timeout_ms", config.probe.page_load_timeout);
    config.probe.settle_delay = readMs(settings, "settle_delay_ms", config.probe.settle_delay);
    config.probe.post_click_wait = readMs(settings, "post_click_wait_ms", config.probe.post_click_wait);
    config.probe.quiet_window = readMs(settings, "quiet_window_ms", config.probe.quiet_window);
    config.probe.max_controls = readCount(settings, "max_controls", config.probe.max_controls);
    config.probe.max_tested = readCount(settings, "max_tested", config.probe.max_tested);
    settings.endGroup();

    auto& c = config.contracts;
    settings.beginGroup("contracts");
    c.etherscan.api_url = readString(settings, "etherscan_url", c.etherscan.api_url);
    c.etherscan.api_key = readString(settings, "etherscan_api_key", c.etherscan.api_key);
    c.etherscan.chain_id = readString(settings, "chain_id", c.etherscan.chain_id);
    c.rpc_url = readString(settings, "rpc_url", c.rpc_url);
    c.fourbyte_url = readString(settings, "fourbyte_url", c.fourbyte_url);
    c.analyzer.max_contracts = readCount(settings, "max_contracts", c.analyzer.max_contracts);
    c.analyzer.concurrent = settings.value("concurrent", c.analyzer.concurrent).toBool();
    c.resolver.lookup_delay = readMs(settings, "lookup_delay_ms", c.resolver.lookup_delay);
    c.resolver.max_lookups_per_batch = readCount(settings, "max_lookups", c.resolver.max_lookups_per_batch);
    settings.endGroup();

    settings.beginGroup("network");
    c.etherscan.timeout = readMs(settings, "etherscan_timeout_ms", c.etherscan.timeout);
    c.rpc_timeout = readMs(settings, "rpc_timeout_ms", c.rpc_timeout);
    c.lookup_timeout = readMs(settings, "lookup_timeout_ms", c.lookup_timeout);
    config.http_retries = settings.value("http_retries", config.http_retries).toInt();
    if (config.http_retries < 0) config.http_retries = 0;
    settings.endGroup();

    settings.beginGroup("scan");
    auto timeout_s = settings.value("timeout_s", static_cast<qlonglong>(
        std::chrono::duration_cast<std::chrono::seconds>(config.scan_timeout).count())).toLongLong();
    if (timeout_s > 0) {
        // 초 → 밀리초 변환 전에 제한
        config.scan_timeout = timeout_s > kMaxDuration.count() * 3600
            ? std::chrono::milliseconds{kMaxDuration}
            : std::chrono::milliseconds{std::chrono::seconds{timeout_s}};
    }
    settings.endGroup();

    c.etherscan.retries = config.http_retries;
    return config;
}

ScanConfig ScanConfig::load(const QString& ini_path) {
    ScanConfig config;
    if (!ini_path.isEmpty()) {
        if (!QFileInfo::exists(ini_path)) {
            std::cerr << "[ScanConfig] 설정 파일 없음, 기본값 사용: " << ini_path.toStdString() << std::endl;
        }
        QSettings settings(ini_path, QSettings::IniFormat);
        config = fromSettings(settings);
    } else {
        QSettings settings("DappScan", "Scanner");
        config = fromSettings(settings);
    }
    config.applyEnvironment();
    return config;
}

void ScanConfig::applyEnvironment() {
    auto key = qEnvironmentVariable("ETHERSCAN_API_KEY");
    if (!key.isEmpty()) {
        contracts.etherscan.api_key = key.toStdString();
    }
}

} // namespace dappscan::core
