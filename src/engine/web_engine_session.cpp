#include "web_engine_session.h"
#include <QApplication>
#include <QDateTime>
#include <QElapsedTimer>
#include <QEventLoop>
#include <QJsonArray>
#include <QJsonDocument>
#include <QJsonObject>
#include <QMutexLocker>
#include <QPointer>
#include <QTimer>
#include <QUrl>
#include <QWebEngineUrlRequestInfo>
#include <iostream>
#include <stdexcept>

namespace DappScan {
namespace Engine {

using dappscan::probe::ClickResult;
using dappscan::probe::ControlCandidate;
using dappscan::probe::NavigationResult;
using dappscan::probe::RequestRecord;
using dappscan::probe::ResourceKind;

namespace {

// 로드 완료 / 조용함 판정 주기
constexpr int kPollIntervalMs = 50;

const char* kControlQuery =
    "button, [role=\"button\"], .btn, input[type=\"submit\"], input[type=\"button\"], "
    "a[href*=\"connect\"], a[href*=\"wallet\"]";

ResourceKind toResourceKind(QWebEngineUrlRequestInfo::ResourceType type)
{
    switch (type) {
    case QWebEngineUrlRequestInfo::ResourceTypeMainFrame:
    case QWebEngineUrlRequestInfo::ResourceTypeSubFrame:
        return ResourceKind::Document;
    case QWebEngineUrlRequestInfo::ResourceTypeScript:
    case QWebEngineUrlRequestInfo::ResourceTypeWorker:
    case QWebEngineUrlRequestInfo::ResourceTypeSharedWorker:
    case QWebEngineUrlRequestInfo::ResourceTypeServiceWorker:
        return ResourceKind::Script;
    case QWebEngineUrlRequestInfo::ResourceTypeStylesheet:
        return ResourceKind::Stylesheet;
    case QWebEngineUrlRequestInfo::ResourceTypeImage:
    case QWebEngineUrlRequestInfo::ResourceTypeFavicon:
        return ResourceKind::Image;
    case QWebEngineUrlRequestInfo::ResourceTypeXhr:
        return ResourceKind::Xhr;
    default:
        return ResourceKind::Other;
    }
}

// JS 문자열 리터럴 (JSON 인코딩)
QString jsStringLiteral(const QString& value)
{
    QString json = QString::fromUtf8(QJsonDocument(QJsonArray{value}).toJson(QJsonDocument::Compact));
    return json.mid(1, json.size() - 2);
}

} // namespace

// ============================================================
// ScanWebPage
// ============================================================

ScanWebPage::ScanWebPage(QWebEngineProfile* profile, QObject* parent)
    : QWebEnginePage(profile, parent)
{
}

ScanWebPage::~ScanWebPage() = default;

void ScanWebPage::javaScriptConsoleMessage(JavaScriptConsoleMessageLevel level,
    const QString& message, int lineNumber, const QString& sourceID)
{
    emit consoleMessage(static_cast<int>(level), message, lineNumber, sourceID);
}

QWebEnginePage* ScanWebPage::createWindow(WebWindowType type)
{
    Q_UNUSED(type)
    return nullptr;
}

// ============================================================
// RequestRecorder
// ============================================================

RequestRecorder::RequestRecorder(QObject* parent)
    : QWebEngineUrlRequestInterceptor(parent)
{
    touch();
}

void RequestRecorder::interceptRequest(QWebEngineUrlRequestInfo& info)
{
    RequestRecord record;
    record.url = info.requestUrl().toString().toStdString();
    record.method = info.requestMethod().toStdString();
    record.kind = toResourceKind(info.resourceType());

    {
        QMutexLocker locker(&m_mutex);
        m_records.push_back(std::move(record));
    }
    touch();
}

std::vector<RequestRecord> RequestRecorder::records() const
{
    QMutexLocker locker(&m_mutex);
    return m_records;
}

qint64 RequestRecorder::msSinceLastRequest() const
{
    return QDateTime::currentMSecsSinceEpoch() - m_lastRequestMs.load();
}

void RequestRecorder::touch()
{
    m_lastRequestMs.store(QDateTime::currentMSecsSinceEpoch());
}

// ============================================================
// WebEngineSession
// ============================================================

WebEngineSession::WebEngineSession(const SessionOptions& options, QObject* parent)
    : QObject(parent)
    , m_options(options)
{
    // 이름 없는 프로필 = off-the-record (쿠키/스토리지 비공유)
    m_profile = new QWebEngineProfile(this);
    m_profile->setHttpUserAgent(m_options.userAgent);

    auto* settings = m_profile->settings();
    settings->setAttribute(QWebEngineSettings::JavascriptEnabled, true);
    settings->setAttribute(QWebEngineSettings::JavascriptCanOpenWindows, false);
    settings->setAttribute(QWebEngineSettings::JavascriptCanAccessClipboard, false);
    settings->setAttribute(QWebEngineSettings::LocalStorageEnabled, true);
    settings->setAttribute(QWebEngineSettings::ScreenCaptureEnabled, false);
    settings->setAttribute(QWebEngineSettings::WebRTCPublicInterfacesOnly, true);
    settings->setAttribute(QWebEngineSettings::PluginsEnabled, false);

    m_recorder = new RequestRecorder(this);
    m_profile->setUrlRequestInterceptor(m_recorder);

    m_page = new ScanWebPage(m_profile, this);

    connect(m_page, &QWebEnginePage::loadStarted, this, [this]() {
        m_loadFinished = false;
        m_loadOk = false;
    });
    connect(m_page, &QWebEnginePage::loadFinished, this, [this](bool ok) {
        m_loadFinished = true;
        m_loadOk = ok;
    });
    connect(m_page, &ScanWebPage::consoleMessage, this,
            [this](int, const QString& message, int, const QString&) {
        if (m_sink) {
            m_sink(message.toStdString());
        }
    });

    // 화면에 표시하지 않는 뷰로 뷰포트 크기 고정
    m_view = new QWebEngineView();
    m_view->setAttribute(Qt::WA_DontShowOnScreen, true);
    m_view->setPage(m_page);
    m_view->resize(m_options.viewport);
    m_view->show();
}

WebEngineSession::~WebEngineSession()
{
    close();
}

void WebEngineSession::injectBeforeLoad(const std::string& name, const std::string& script)
{
    if (m_closed) return;

    QWebEngineScript injected;
    injected.setName(QString::fromStdString(name));
    injected.setSourceCode(QString::fromStdString(script));
    injected.setInjectionPoint(QWebEngineScript::DocumentCreation);
    injected.setWorldId(QWebEngineScript::MainWorld);
    injected.setRunsOnSubFrames(false);
    m_page->scripts().insert(injected);
}

void WebEngineSession::setConsoleSink(dappscan::probe::ConsoleSink sink)
{
    m_sink = std::move(sink);
}

NavigationResult WebEngineSession::navigate(const std::string& url, std::chrono::milliseconds timeout)
{
    NavigationResult result;
    if (m_closed) {
        result.error = "session closed";
        return result;
    }

    m_loadFinished = false;
    m_loadOk = false;
    m_recorder->touch();
    m_page->load(QUrl(QString::fromStdString(url)));

    QEventLoop loop;
    QElapsedTimer elapsed;
    elapsed.start();

    bool timedOut = false;
    QTimer tick;
    tick.setInterval(kPollIntervalMs);
    connect(&tick, &QTimer::timeout, &loop, [&]() {
        if (m_loadFinished && !m_loadOk) {
            loop.quit();
            return;
        }
        if (m_loadFinished && m_recorder->msSinceLastRequest() >= m_options.quietWindow.count()) {
            loop.quit();
            return;
        }
        if (elapsed.elapsed() >= timeout.count()) {
            timedOut = true;
            loop.quit();
        }
    });
    tick.start();
    loop.exec();
    tick.stop();

    if (m_loadFinished && !m_loadOk) {
        result.error = "page failed to load: " + url;
        std::cerr << "[WebEngineSession] " << result.error << std::endl;
        return result;
    }

    if (timedOut && !m_loadFinished) {
        m_page->triggerAction(QWebEnginePage::Stop);
        result.timed_out = true;
        result.error = "navigation timeout exceeded";
        std::cerr << "[WebEngineSession] 로드 타임아웃: " << url << std::endl;
        return result;
    }

    if (timedOut) {
        // 로드는 끝났지만 네트워크가 계속 활동 중 (폴링 등)
        std::cout << "[WebEngineSession] 네트워크가 조용해지지 않음, 계속 진행: " << url << std::endl;
    }

    result.ok = true;
    return result;
}

void WebEngineSession::wait(std::chrono::milliseconds duration)
{
    QEventLoop loop;
    QTimer::singleShot(static_cast<int>(duration.count()), &loop, &QEventLoop::quit);
    loop.exec();
}

std::optional<QVariant> WebEngineSession::runScript(const QString& source)
{
    if (m_closed) return std::nullopt;

    struct State {
        bool done = false;
        QVariant value;
    };
    auto state = std::make_shared<State>();

    QEventLoop loop;
    QPointer<QEventLoop> loopGuard(&loop);
    m_page->runJavaScript(source, QWebEngineScript::MainWorld,
                          [state, loopGuard](const QVariant& value) {
        state->done = true;
        state->value = value;
        if (loopGuard) loopGuard->quit();
    });

    QTimer::singleShot(static_cast<int>(m_options.scriptTimeout.count()), &loop, &QEventLoop::quit);
    if (!state->done) {
        loop.exec();
    }

    if (!state->done) {
        std::cerr << "[WebEngineSession] 스크립트 실행 타임아웃" << std::endl;
        return std::nullopt;
    }
    return state->value;
}

std::optional<std::string> WebEngineSession::evaluate(const std::string& expression)
{
    QString source = QStringLiteral(
        "(function() { try { var v = (%1); var s = JSON.stringify(v);"
        " return s === undefined ? 'null' : s; } catch (e) { return null; } })()")
        .arg(QString::fromStdString(expression));

    auto value = runScript(source);
    if (!value || !value->isValid() || value->isNull() || value->typeId() != QMetaType::QString) {
        return std::nullopt;
    }
    return value->toString().toStdString();
}

std::vector<ControlCandidate> WebEngineSession::queryControls()
{
    std::vector<ControlCandidate> controls;

    QString expr = QStringLiteral(
        "Array.from(document.querySelectorAll(%1)).map(function(el) {"
        " return { text: (el.textContent || '').trim(), tag: el.tagName.toLowerCase(),"
        " id: el.getAttribute('id') || '', classes: el.getAttribute('class') || '' }; })")
        .arg(jsStringLiteral(QString::fromUtf8(kControlQuery)));

    auto json = evaluate(expr.toStdString());
    if (!json) return controls;

    auto doc = QJsonDocument::fromJson(QByteArray::fromStdString(*json));
    if (!doc.isArray()) return controls;

    for (const auto& item : doc.array()) {
        auto obj = item.toObject();
        ControlCandidate candidate;
        candidate.text = obj.value("text").toString().toStdString();
        candidate.tag = obj.value("tag").toString().toStdString();
        candidate.id = obj.value("id").toString().toStdString();
        candidate.classes = obj.value("classes").toString().toStdString();
        controls.push_back(std::move(candidate));
    }
    return controls;
}

ClickResult WebEngineSession::click(const std::string& selector)
{
    // CSS 셀렉터 또는 tag:contains("text")
    QString source = QStringLiteral(R"(
(function(sel) {
    var el = null;
    var m = sel.match(/^([a-zA-Z0-9_-]+):contains\("((?:[^"\\]|\\.)*)"\)$/);
    if (m) {
        var text = m[2].replace(/\\(.)/g, '$1');
        el = Array.from(document.querySelectorAll(m[1])).find(function(e) {
            return (e.textContent || '').indexOf(text) !== -1;
        }) || null;
    } else {
        try { el = document.querySelector(sel); } catch (e) { return 'failed'; }
    }
    if (!el) return 'notfound';
    try {
        el.scrollIntoView({ block: 'center' });
        el.click();
    } catch (e) {
        return 'failed';
    }
    return 'clicked';
})(%1)
    )").arg(jsStringLiteral(QString::fromStdString(selector)));

    auto value = runScript(source);
    if (!value) return ClickResult::Failed;

    QString outcome = value->toString();
    if (outcome == "clicked") return ClickResult::Clicked;
    if (outcome == "notfound") return ClickResult::NotFound;
    return ClickResult::Failed;
}

std::string WebEngineSession::currentUrl()
{
    if (m_closed) return {};
    return m_page->url().toString().toStdString();
}

std::string WebEngineSession::pageText()
{
    auto value = runScript(QStringLiteral(
        "document.documentElement ? document.documentElement.textContent : ''"));
    if (!value) return {};
    return value->toString().toStdString();
}

std::vector<RequestRecord> WebEngineSession::observedRequests() const
{
    return m_recorder ? m_recorder->records() : std::vector<RequestRecord>{};
}

void WebEngineSession::close()
{
    if (m_closed) return;
    m_closed = true;

    m_page->triggerAction(QWebEnginePage::Stop);
    disconnect(m_page, nullptr, this, nullptr);
    m_sink = nullptr;

    // 뷰 → 페이지 → 프로필 순서로 해제
    delete m_view;
    m_view = nullptr;
    delete m_page;
    m_page = nullptr;
    m_profile->setUrlRequestInterceptor(nullptr);
    delete m_profile;
    m_profile = nullptr;

    std::cout << "[WebEngineSession] 세션 종료" << std::endl;
}

dappscan::probe::SessionFactory makeSessionFactory(const SessionOptions& options)
{
    return [options]() -> std::unique_ptr<dappscan::probe::BrowserSession> {
        if (!qobject_cast<QApplication*>(QCoreApplication::instance())) {
            throw std::runtime_error("QApplication is not running");
        }
        return std::make_unique<WebEngineSession>(options);
    };
}

} // namespace Engine
} // namespace DappScan
