/**
 * @file report_store.cpp
 * @brief 보고서 파일 저장소 구현
 */

#include "report_store.h"
#include "report_builder.h"

#include <QDir>
#include <QFile>
#include <QFileInfo>
#include <QJsonDocument>
#include <QSaveFile>

#include <algorithm>
#include <iostream>
#include <stdexcept>

namespace dappscan::report {

std::optional<ReportFormat> parseReportFormat(const std::string& name) {
    if (name == "json") return ReportFormat::Json;
    if (name == "md") return ReportFormat::Markdown;
    if (name == "both") return ReportFormat::Both;
    return std::nullopt;
}

ReportStore::ReportStore(QString directory)
    : directory_(std::move(directory)) {}

void ReportStore::writeFile(const QString& path, const QByteArray& data) const {
    QSaveFile file(path);
    if (!file.open(QIODevice::WriteOnly)) {
        throw std::runtime_error("cannot open " + path.toStdString() + ": "
                                 + file.errorString().toStdString());
    }
    file.write(data);
    if (!file.commit()) {
        throw std::runtime_error("cannot write " + path.toStdString() + ": "
                                 + file.errorString().toStdString());
    }
}

std::vector<QString> ReportStore::save(const QJsonObject& report, ReportFormat format) const {
    if (!QDir().mkpath(directory_)) {
        throw std::runtime_error("cannot create report directory: " + directory_.toStdString());
    }

    const QDir dir(directory_);
    const auto scan_id = report["scanId"].toString();
    std::vector<QString> written;

    if (format == ReportFormat::Json || format == ReportFormat::Both) {
        auto path = dir.filePath(scan_id + ".json");
        writeFile(path, QJsonDocument(report).toJson(QJsonDocument::Indented));
        std::cout << "[ReportStore] JSON 보고서 저장: " << path.toStdString() << std::endl;
        written.push_back(path);
    }

    if (format == ReportFormat::Markdown || format == ReportFormat::Both) {
        auto path = dir.filePath(scan_id + ".md");
        writeFile(path, ReportBuilder::renderMarkdown(report).toUtf8());
        std::cout << "[ReportStore] Markdown 보고서 저장: " << path.toStdString() << std::endl;
        written.push_back(path);
    }

    return written;
}

std::optional<QJsonObject> ReportStore::load(const QString& path, QString* error) const {
    QFile file(path);
    if (!file.open(QIODevice::ReadOnly)) {
        if (error) *error = file.errorString();
        return std::nullopt;
    }

    QJsonParseError parseError{};
    auto doc = QJsonDocument::fromJson(file.readAll(), &parseError);
    if (parseError.error != QJsonParseError::NoError) {
        if (error) *error = parseError.errorString();
        return std::nullopt;
    }
    if (!doc.isObject()) {
        if (error) *error = QStringLiteral("report is not a JSON object");
        return std::nullopt;
    }
    return doc.object();
}

ReportListing ReportStore::list() const {
    ReportListing listing;

    QDir dir(directory_);
    if (!dir.exists()) {
        return listing;
    }

    const auto files = dir.entryList({"*.json"}, QDir::Files, QDir::Name);
    for (const auto& name : files) {
        QString error;
        auto report = load(dir.filePath(name), &error);
        if (!report) {
            listing.unreadable.push_back({name, error});
            continue;
        }

        auto risk = (*report)["riskSummary"].toObject();
        if ((*report)["scanId"].toString().isEmpty() || risk.isEmpty()) {
            listing.unreadable.push_back({name, QStringLiteral("missing scanId or riskSummary")});
            continue;
        }

        StoredReport stored;
        stored.file = name;
        stored.scan_id = (*report)["scanId"].toString();
        stored.url = (*report)["url"].toString();
        stored.timestamp = (*report)["timestamp"].toString();
        stored.level = risk["level"].toString();
        stored.score = risk["score"].toInt();
        listing.reports.push_back(std::move(stored));
    }

    // ISO-8601 UTC 문자열은 사전순 = 시간순
    std::stable_sort(listing.reports.begin(), listing.reports.end(),
                     [](const StoredReport& a, const StoredReport& b) {
        return a.timestamp > b.timestamp;
    });

    return listing;
}

} // namespace dappscan::report
