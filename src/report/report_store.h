#pragma once

/**
 * @file report_store.h
 * @brief 보고서 파일 저장소 (디렉터리 단위)
 */

#include <QJsonObject>
#include <QString>

#include <optional>
#include <string>
#include <vector>

namespace dappscan::report {

enum class ReportFormat {
    Json,
    Markdown,
    Both
};

/// "json" | "md" | "both"
[[nodiscard]] std::optional<ReportFormat> parseReportFormat(const std::string& name);

/**
 * @brief 저장된 보고서 요약
 */
struct StoredReport {
    QString file;
    QString scan_id;
    QString url;
    QString timestamp;
    QString level;
    int score{0};
};

/**
 * @brief 읽지 못한 파일
 */
struct UnreadableReport {
    QString file;
    QString error;
};

struct ReportListing {
    std::vector<StoredReport> reports;      ///< 최신순
    std::vector<UnreadableReport> unreadable;
};

class ReportStore {
public:
    explicit ReportStore(QString directory);

    /**
     * @brief 보고서 저장 (<scanId>.json / <scanId>.md)
     * @return 기록한 파일 경로 목록
     * @throws std::runtime_error 디렉터리 생성/쓰기 실패
     */
    std::vector<QString> save(const QJsonObject& report, ReportFormat format) const;

    /**
     * @brief JSON 보고서 읽기
     * @param error 실패 사유 (선택)
     */
    [[nodiscard]] std::optional<QJsonObject> load(const QString& path, QString* error = nullptr) const;

    /**
     * @brief 디렉터리의 JSON 보고서 목록 (최신순)
     */
    [[nodiscard]] ReportListing list() const;

    [[nodiscard]] const QString& directory() const { return directory_; }

private:
    void writeFile(const QString& path, const QByteArray& data) const;

    QString directory_;
};

} // namespace dappscan::report
