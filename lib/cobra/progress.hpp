#pragma once

#include <atomic>
#include <chrono>
#include <memory>
#include <mutex>
#include <string>
#include <string_view>

#include <fmt/color.h>

#include "cobra/common/types.hpp"
#include "cobra/engine/runner.hpp"

namespace cobra::progress {

struct BarTheme {
    fmt::text_style label;
    fmt::text_style spinner;
    fmt::text_style done_mark;
    fmt::text_style filled;
    fmt::text_style remaining;
    fmt::text_style percent;
    fmt::text_style points;
    fmt::text_style bifurcations;
    fmt::text_style clock;
};

BarTheme default_theme();

// One-line console bar for a running continuation:
//   <label> <spinner> <track> <pct> • Points: n • Bifurcations: m • [mm:ss<eta]
// A max_steps of 0 renders an indeterminate track with no percentage.
class ContinuationBar {
public:
    ContinuationBar(std::string_view label,
                    SizeType max_steps,
                    bool transient = true,
                    int width      = 32,
                    BarTheme theme = default_theme());
    ~ContinuationBar();

    ContinuationBar(const ContinuationBar&)            = delete;
    ContinuationBar& operator=(const ContinuationBar&) = delete;
    ContinuationBar(ContinuationBar&&)                 = delete;
    ContinuationBar& operator=(ContinuationBar&&)      = delete;

    void set_max_steps(SizeType max_steps);
    // Starts the clock on first call and redraws.
    void set_progress(SizeType step);
    void set_points(SizeType points);
    void set_bifurcations(SizeType bifurcations);
    void mark_as_completed();

    [[nodiscard]] bool is_completed() const;
    [[nodiscard]] SizeType get_progress() const;
    [[nodiscard]] SizeType get_max_steps() const;
    [[nodiscard]] std::chrono::nanoseconds elapsed() const;
    [[nodiscard]] std::string to_string() const;

private:
    std::string render_spinner() const;
    std::string render_track() const;
    std::string render_percent() const;
    std::string render_counters() const;
    std::string render_clock() const;
    void redraw();

    std::string m_label;
    BarTheme m_theme;
    int m_width;
    bool m_transient;
    std::atomic<SizeType> m_max_steps;
    std::atomic<SizeType> m_step{0};
    std::atomic<SizeType> m_points{0};
    std::atomic<SizeType> m_bifurcations{0};
    std::atomic<bool> m_completed{false};
    std::chrono::steady_clock::time_point m_started{
        std::chrono::steady_clock::now()};
    std::chrono::nanoseconds m_final_elapsed{};
    bool m_clock_running{false};
    mutable std::mutex m_mutex;
};

// Hides the terminal cursor for its lifetime.
class CursorGuard {
public:
    CursorGuard();
    ~CursorGuard();
    CursorGuard(const CursorGuard&)            = delete;
    CursorGuard& operator=(const CursorGuard&) = delete;
    CursorGuard(CursorGuard&&)                 = delete;
    CursorGuard& operator=(CursorGuard&&)      = delete;
};

std::unique_ptr<ContinuationBar>
make_continuation_bar(std::string_view label,
                      SizeType max_steps,
                      bool transient = true);

// Feeds engine progress snapshots into a bar. With show == false the
// snapshots are only remembered.
class ProgressReporter {
public:
    ProgressReporter(std::string_view label, bool show);
    ~ProgressReporter();
    ProgressReporter(const ProgressReporter&)            = delete;
    ProgressReporter& operator=(const ProgressReporter&) = delete;
    ProgressReporter(ProgressReporter&&)                 = delete;
    ProgressReporter& operator=(ProgressReporter&&)      = delete;

    void update(const engine::Progress& progress);
    void finish();
    [[nodiscard]] SizeType updates() const noexcept { return m_updates; }
    [[nodiscard]] const engine::Progress& last() const noexcept {
        return m_last;
    }

private:
    std::string m_label;
    bool m_show;
    std::unique_ptr<CursorGuard> m_cursor;
    std::unique_ptr<ContinuationBar> m_bar;
    engine::Progress m_last;
    SizeType m_updates{0};
};

} // namespace cobra::progress
