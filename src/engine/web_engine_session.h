#pragma once
#include <QObject>
#include <QWebEngineView>
#include <QWebEnginePage>
#include <QWebEngineProfile>
#include <QWebEngineSettings>
#include <QWebEngineScript>
#include <QWebEngineScriptCollection>
#include <QWebEngineUrlRequestInterceptor>
#include <QMutex>
#include <QSize>
#include <QString>
#include <QVariant>
#include <atomic>
#include <chrono>
#include <memory>
#include <optional>
#include <vector>

#include "probe/browser_session.h"

namespace DappScan {
namespace Engine {

// ============================================================
// ScanWebPage: 콘솔 메시지를 호스트로 전달하는 페이지
// ============================================================
class ScanWebPage : public QWebEnginePage {
    Q_OBJECT
public:
    explicit ScanWebPage(QWebEngineProfile* profile, QObject* parent = nullptr);
    ~ScanWebPage() override;

signals:
    void consoleMessage(int level, const QString& message, int line, const QString& source);

protected:
    void javaScriptConsoleMessage(JavaScriptConsoleMessageLevel level,
                                  const QString& message, int lineNumber,
                                  const QString& sourceID) override;

    // 팝업/새 창은 열지 않음
    QWebEnginePage* createWindow(WebWindowType type) override;
};

// ============================================================
// RequestRecorder: 모든 요청을 기록하는 인터셉터 (차단 없음)
// ============================================================
class RequestRecorder : public QWebEngineUrlRequestInterceptor {
    Q_OBJECT
public:
    explicit RequestRecorder(QObject* parent = nullptr);

    void interceptRequest(QWebEngineUrlRequestInfo& info) override;

    std::vector<dappscan::probe::RequestRecord> records() const;

    // 마지막 요청 이후 경과 시간 (ms)
    qint64 msSinceLastRequest() const;
    void touch();

private:
    mutable QMutex m_mutex;
    std::vector<dappscan::probe::RequestRecord> m_records;
    std::atomic<qint64> m_lastRequestMs{0};
};

// ============================================================
// WebEngineSession: 격리된 Qt WebEngine 브라우징 세션
// ============================================================
struct SessionOptions {
    std::chrono::milliseconds quietWindow{500};
    std::chrono::milliseconds scriptTimeout{5000};
    QSize viewport{1920, 1080};
    QString userAgent = QStringLiteral(
        "Mozilla/5.0 (Windows NT 10.0; Win64; x64) AppleWebKit/537.36 "
        "(KHTML, like Gecko) Chrome/120.0 Safari/537.36");
};

class WebEngineSession : public QObject, public dappscan::probe::BrowserSession {
    Q_OBJECT
public:
    explicit WebEngineSession(const SessionOptions& options, QObject* parent = nullptr);
    ~WebEngineSession() override;

    void injectBeforeLoad(const std::string& name, const std::string& script) override;
    void setConsoleSink(dappscan::probe::ConsoleSink sink) override;

    dappscan::probe::NavigationResult navigate(const std::string& url,
                                               std::chrono::milliseconds timeout) override;
    void wait(std::chrono::milliseconds duration) override;

    std::vector<dappscan::probe::ControlCandidate> queryControls() override;
    dappscan::probe::ClickResult click(const std::string& selector) override;
    std::optional<std::string> evaluate(const std::string& expression) override;

    std::string currentUrl() override;
    std::string pageText() override;
    std::vector<dappscan::probe::RequestRecord> observedRequests() const override;

    void close() override;

private:
    // runJavaScript를 로컬 이벤트 루프로 동기화 (타임아웃 시 std::nullopt)
    std::optional<QVariant> runScript(const QString& source);

    SessionOptions m_options;
    QWebEngineProfile* m_profile = nullptr;
    RequestRecorder* m_recorder = nullptr;
    ScanWebPage* m_page = nullptr;
    QWebEngineView* m_view = nullptr;
    dappscan::probe::ConsoleSink m_sink;

    bool m_loadFinished = false;
    bool m_loadOk = false;
    bool m_closed = false;
};

// QApplication이 실행 중이어야 함 (없으면 세션 생성 시 예외)
dappscan::probe::SessionFactory makeSessionFactory(const SessionOptions& options);

} // namespace Engine
} // namespace DappScan
