#include "cobra/progress.hpp"

#include <algorithm>
#include <array>
#include <cmath>
#include <cstdio>
#include <utility>

#include <fmt/color.h>
#include <fmt/format.h>

namespace cobra::progress {

namespace {

constexpr std::string_view kSeparator = " • ";
constexpr std::string_view kTrackChar = "━";
constexpr std::array<std::string_view, 4> kSpinner = {"|", "/", "-", "\\"};
constexpr double kSpinnerFrameMs = 120.0;

std::mutex& console_mutex() {
    static std::mutex mutex;
    return mutex;
}

std::string track(SizeType n) {
    std::string out;
    out.reserve(kTrackChar.size() * n);
    for (SizeType i = 0; i < n; ++i) {
        out += kTrackChar;
    }
    return out;
}

std::string clock_text(std::chrono::nanoseconds ns) {
    const auto total =
        std::chrono::floor<std::chrono::seconds>(ns).count();
    const auto hours   = total / 3600;
    const auto minutes = (total / 60) % 60;
    const auto seconds = total % 60;
    if (hours > 0) {
        return fmt::format("{:02d}:{:02d}:{:02d}s", hours, minutes, seconds);
    }
    return fmt::format("{:02d}:{:02d}s", minutes, seconds);
}

} // namespace

BarTheme default_theme() {
    return {
        .label        = fmt::fg(fmt::color{0x2EC4B6}) | fmt::emphasis::bold,
        .spinner      = fmt::fg(fmt::color{0x2EC4B6}),
        .done_mark    = fmt::fg(fmt::color{0x66BB6A}) | fmt::emphasis::bold,
        .filled       = fmt::fg(fmt::color{0xE9C46A}),
        .remaining    = fmt::fg(fmt::color{0x3A3A3A}),
        .percent      = fmt::fg(fmt::color{0x8ECAE6}),
        .points       = fmt::fg(fmt::color{0x66BB6A}),
        .bifurcations = fmt::fg(fmt::terminal_color::bright_red),
        .clock        = fmt::fg(fmt::color{0x1B998B}),
    };
}

ContinuationBar::ContinuationBar(std::string_view label,
                                 SizeType max_steps,
                                 bool transient,
                                 int width,
                                 BarTheme theme)
    : m_label(label),
      m_theme(theme),
      m_width(std::max(width, 4)),
      m_transient(transient),
      m_max_steps(max_steps) {}

ContinuationBar::~ContinuationBar() { mark_as_completed(); }

void ContinuationBar::set_max_steps(SizeType max_steps) {
    m_max_steps = max_steps;
}

void ContinuationBar::set_progress(SizeType step) {
    {
        std::lock_guard lock(m_mutex);
        if (!m_clock_running) {
            m_started       = std::chrono::steady_clock::now();
            m_clock_running = true;
        }
    }
    m_step = step;
    redraw();
}

void ContinuationBar::set_points(SizeType points) { m_points = points; }

void ContinuationBar::set_bifurcations(SizeType bifurcations) {
    m_bifurcations = bifurcations;
}

void ContinuationBar::mark_as_completed() {
    if (m_completed.load()) {
        return;
    }
    {
        std::lock_guard lock(m_mutex);
        m_final_elapsed = std::chrono::steady_clock::now() - m_started;
    }
    m_completed = true;
    redraw();
}

bool ContinuationBar::is_completed() const { return m_completed.load(); }
SizeType ContinuationBar::get_progress() const { return m_step.load(); }
SizeType ContinuationBar::get_max_steps() const { return m_max_steps.load(); }

std::chrono::nanoseconds ContinuationBar::elapsed() const {
    std::lock_guard lock(m_mutex);
    if (m_completed.load()) {
        return m_final_elapsed;
    }
    return std::chrono::steady_clock::now() - m_started;
}

std::string ContinuationBar::render_spinner() const {
    if (is_completed()) {
        return fmt::format("{}", fmt::styled("*", m_theme.done_mark));
    }
    const auto ms =
        std::chrono::duration<double, std::milli>(elapsed()).count();
    const auto frame = static_cast<SizeType>(ms / kSpinnerFrameMs);
    return fmt::format("{}",
                       fmt::styled(kSpinner[frame % kSpinner.size()],
                                   m_theme.spinner));
}

std::string ContinuationBar::render_track() const {
    const auto width = static_cast<SizeType>(m_width);
    const auto max   = get_max_steps();
    if (max == 0) {
        // Indeterminate: a quarter-width pulse sweeping once per second.
        const double secs = std::chrono::duration<double>(elapsed()).count();
        const auto pulse  = width / 4;
        const auto offset = std::min(
            width - pulse,
            static_cast<SizeType>(std::fmod(secs, 1.0) *
                                  static_cast<double>(width)));
        return fmt::format(
            "{}{}{}", fmt::styled(track(offset), m_theme.remaining),
            fmt::styled(track(pulse), m_theme.filled),
            fmt::styled(track(width - offset - pulse), m_theme.remaining));
    }
    const double fraction = std::clamp(
        static_cast<double>(get_progress()) / static_cast<double>(max), 0.0,
        1.0);
    const auto done = static_cast<SizeType>(static_cast<double>(width) * fraction);
    return fmt::format("{}{}", fmt::styled(track(done), m_theme.filled),
                       fmt::styled(track(width - done), m_theme.remaining));
}

std::string ContinuationBar::render_percent() const {
    const auto max = get_max_steps();
    if (max == 0) {
        return {};
    }
    const auto pct = static_cast<int>(
        std::min(1.0, static_cast<double>(get_progress()) /
                          static_cast<double>(max)) *
        100.0);
    return fmt::format(" {}", fmt::styled(fmt::format("{:3d}%", pct),
                                          m_theme.percent));
}

std::string ContinuationBar::render_counters() const {
    return fmt::format(
        "{}{}{}{}", kSeparator,
        fmt::styled(fmt::format("Points: {}", m_points.load()),
                    m_theme.points),
        kSeparator,
        fmt::styled(fmt::format("Bifurcations: {}", m_bifurcations.load()),
                    m_theme.bifurcations));
}

std::string ContinuationBar::render_clock() const {
    const auto spent = elapsed();
    const auto max   = get_max_steps();
    const auto step  = get_progress();
    std::string eta  = "--:--s";
    if (max != 0 && step != 0) {
        const auto total = std::chrono::duration_cast<std::chrono::nanoseconds>(
            spent * (static_cast<double>(max) / static_cast<double>(step)));
        eta = clock_text(std::max(total - spent, std::chrono::nanoseconds{0}));
    }
    return fmt::format(
        "{}{}", kSeparator,
        fmt::styled(fmt::format("[{}<{}]", clock_text(spent), eta),
                    m_theme.clock));
}

std::string ContinuationBar::to_string() const {
    return fmt::format("{} {} {}{}{}{}", fmt::styled(m_label, m_theme.label),
                       render_spinner(), render_track(), render_percent(),
                       render_counters(), render_clock());
}

void ContinuationBar::redraw() {
    const bool completed = is_completed();
    const auto line      = (completed && m_transient) ? std::string{}
                                                      : to_string();
    std::lock_guard lock(console_mutex());
    std::fputs("\r\033[K", stderr);
    if (!line.empty()) {
        std::fputs(line.c_str(), stderr);
        if (completed) {
            std::fputc('\n', stderr);
        }
    }
    std::fflush(stderr);
}

CursorGuard::CursorGuard() { std::fputs("\033[?25l", stderr); }

CursorGuard::~CursorGuard() { std::fputs("\033[?25h", stderr); }

std::unique_ptr<ContinuationBar>
make_continuation_bar(std::string_view label,
                      SizeType max_steps,
                      bool transient) {
    return std::make_unique<ContinuationBar>(label, max_steps, transient);
}

ProgressReporter::ProgressReporter(std::string_view label, bool show)
    : m_label(label),
      m_show(show) {
    if (m_show) {
        m_cursor = std::make_unique<CursorGuard>();
    }
}

ProgressReporter::~ProgressReporter() { finish(); }

void ProgressReporter::update(const engine::Progress& progress) {
    m_last = progress;
    ++m_updates;
    if (!m_show) {
        return;
    }
    if (!m_bar) {
        m_bar = make_continuation_bar(m_label, progress.max_steps);
    }
    m_bar->set_max_steps(progress.max_steps);
    m_bar->set_points(progress.points_computed);
    m_bar->set_bifurcations(progress.bifurcations_found);
    m_bar->set_progress(progress.current_step);
    if (progress.done) {
        m_bar->mark_as_completed();
    }
}

void ProgressReporter::finish() {
    if (m_bar) {
        m_bar->mark_as_completed();
    }
    m_cursor.reset();
}

} // namespace cobra::progress
