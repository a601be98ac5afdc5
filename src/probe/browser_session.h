#pragma once

/**
 * @file browser_session.h
 * @brief 샌드박스 브라우저 세션 인터페이스 (브라우저 자동화 협력자)
 *
 * InteractionProber는 이 인터페이스만 사용합니다.
 * 실제 구현은 Qt WebEngine 기반 WebEngineSession이며,
 * 테스트에서는 가짜 세션으로 대체합니다.
 */

#include <chrono>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace dappscan::probe {

/**
 * @brief 관찰된 요청의 리소스 종류
 */
enum class ResourceKind {
    Document,
    Script,
    Stylesheet,
    Image,
    Xhr,        ///< XMLHttpRequest / fetch
    Other
};

/**
 * @brief 세션이 관찰한 네트워크 요청
 */
struct RequestRecord {
    std::string url;
    std::string method{"GET"};
    ResourceKind kind{ResourceKind::Other};
};

/**
 * @brief 페이지에서 찾은 클릭 가능 요소 후보
 */
struct ControlCandidate {
    std::string text;
    std::string tag;        ///< 소문자 태그 이름
    std::string id;
    std::string classes;    ///< class 속성 원문 (공백 구분)
};

/**
 * @brief 페이지 이동 결과
 */
struct NavigationResult {
    bool ok{false};
    bool timed_out{false};
    std::string error;
};

/**
 * @brief 클릭 시도 결과
 */
enum class ClickResult {
    Clicked,    ///< 요소를 찾아 클릭함
    NotFound,   ///< 셀렉터에 해당하는 요소 없음
    Failed      ///< 클릭 중 오류
};

/**
 * @brief 페이지 콘솔 메시지 수신 콜백
 */
using ConsoleSink = std::function<void(const std::string& message)>;

/**
 * @brief 샌드박스 브라우저 세션
 *
 * 세션은 격리된 프로필(쿠키/스토리지 비공유)을 사용하며,
 * close() 이후에는 어떤 메서드도 호출되지 않습니다.
 */
class BrowserSession {
public:
    virtual ~BrowserSession() = default;

    /**
     * @brief 모든 문서 생성 시 페이지 스크립트보다 먼저 실행할 스크립트 등록
     */
    virtual void injectBeforeLoad(const std::string& name, const std::string& script) = 0;

    /**
     * @brief 콘솔 메시지 수신자 등록 (모의 지갑 채널)
     */
    virtual void setConsoleSink(ConsoleSink sink) = 0;

    /**
     * @brief URL 로드 후 네트워크가 조용해질 때까지 대기
     */
    [[nodiscard]] virtual NavigationResult navigate(const std::string& url,
                                                    std::chrono::milliseconds timeout) = 0;

    /**
     * @brief 이벤트를 처리하며 지정 시간 대기
     */
    virtual void wait(std::chrono::milliseconds duration) = 0;

    /**
     * @brief 클릭 가능 요소 후보 조회 (DOM 순서)
     */
    [[nodiscard]] virtual std::vector<ControlCandidate> queryControls() = 0;

    /**
     * @brief 셀렉터에 해당하는 첫 요소를 한 번 클릭
     *
     * 셀렉터는 CSS 셀렉터 또는 `tag:contains("text")` 형식입니다.
     */
    [[nodiscard]] virtual ClickResult click(const std::string& selector) = 0;

    /**
     * @brief JavaScript 식 평가
     * @return 결과를 JSON 텍스트로, 실패 시 std::nullopt
     */
    [[nodiscard]] virtual std::optional<std::string> evaluate(const std::string& expression) = 0;

    [[nodiscard]] virtual std::string currentUrl() = 0;

    /**
     * @brief 렌더링된 페이지 텍스트
     */
    [[nodiscard]] virtual std::string pageText() = 0;

    /**
     * @brief 세션 시작 이후 관찰된 모든 요청
     */
    [[nodiscard]] virtual std::vector<RequestRecord> observedRequests() const = 0;

    /**
     * @brief 세션 종료 (여러 번 호출해도 안전)
     */
    virtual void close() = 0;
};

/**
 * @brief 세션 생성 함수 (실패 시 예외 또는 nullptr)
 */
using SessionFactory = std::function<std::unique_ptr<BrowserSession>()>;

} // namespace dappscan::probe
