#pragma once

/**
 * @file scan_error.h
 * @brief 스캔 치명적 오류와 스캔 데드라인
 *
 * 스캔 전체를 중단시키는 오류는 ProbeFailure 하나로 호출자에게 전달됩니다.
 * 그 외의 오류(주소별, 셀렉터별, 컨트롤별)는 각 단계에서 데이터로 흡수됩니다.
 */

#include <atomic>
#include <chrono>
#include <stdexcept>
#include <string>

namespace dappscan::core {

/**
 * @brief 실패한 스캔 단계
 */
enum class ScanPhase {
    SessionLaunch,  ///< 브라우저 세션 생성 실패
    PageLoad,       ///< 페이지 로드 실패 / 타임아웃
    Timeout         ///< 전체 스캔 데드라인 초과
};

inline const char* scanPhaseName(ScanPhase phase) {
    switch (phase) {
        case ScanPhase::SessionLaunch: return "session launch";
        case ScanPhase::PageLoad:      return "page load";
        case ScanPhase::Timeout:       return "scan timeout";
    }
    return "unknown";
}

/**
 * @brief 스캔 중단 오류
 */
class ProbeFailure : public std::runtime_error {
public:
    ProbeFailure(ScanPhase phase, const std::string& message)
        : std::runtime_error(std::string("Frontend analysis failed (")
                             + scanPhaseName(phase) + "): " + message)
        , phase_(phase) {}

    [[nodiscard]] ScanPhase phase() const noexcept { return phase_; }

private:
    ScanPhase phase_;
};

/**
 * @brief 스캔 전체 데드라인 + 명시적 취소
 *
 * 여러 스레드(주소별 분석 작업)에서 동시에 조회됩니다.
 */
class ScanDeadline {
public:
    using Clock = std::chrono::steady_clock;

    ScanDeadline() : deadline_(Clock::time_point::max()) {}
    explicit ScanDeadline(std::chrono::milliseconds budget,
                          const std::atomic<bool>* external_cancel = nullptr)
        : deadline_(Clock::now() + budget)
        , external_cancel_(external_cancel) {}

    [[nodiscard]] bool expired() const {
        if (cancelled_.load()) return true;
        if (external_cancel_ && external_cancel_->load()) return true;
        return Clock::now() >= deadline_;
    }

    void cancel() { cancelled_.store(true); }

    /**
     * @brief 남은 시간 (만료 시 0)
     */
    [[nodiscard]] std::chrono::milliseconds remaining() const {
        if (expired()) return std::chrono::milliseconds{0};
        if (deadline_ == Clock::time_point::max()) return std::chrono::milliseconds::max();
        return std::chrono::duration_cast<std::chrono::milliseconds>(deadline_ - Clock::now());
    }

private:
    Clock::time_point deadline_;
    const std::atomic<bool>* external_cancel_{nullptr};   ///< 시그널 핸들러 등 외부 취소 플래그
    std::atomic<bool> cancelled_{false};
};

} // namespace dappscan::core
