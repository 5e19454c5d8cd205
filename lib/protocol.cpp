#include "cobra/jobs/protocol.hpp"

#include <cmath>
#include <format>

#include "cobra/jobs/messages.hpp"
#include "cobra/jobs/registry.hpp"

namespace cobra::jobs {

namespace {
constexpr double kTargetBatches = 50.0;
} // namespace

SizeType compute_batch_size(double max_steps) noexcept {
    if (!std::isfinite(max_steps) || max_steps <= 0.0) {
        return 1;
    }
    const double batch = std::ceil(max_steps / kTargetBatches);
    return batch < 1.0 ? 1 : static_cast<SizeType>(batch);
}

std::string_view to_string(JobState state) noexcept {
    switch (state) {
    case JobState::kCreated:
        return "created";
    case JobState::kRunning:
        return "running";
    case JobState::kCompleted:
        return "completed";
    case JobState::kFailed:
        return "failed";
    case JobState::kCancelled:
        return "cancelled";
    }
    return "unknown";
}

bool is_terminal(JobState state) noexcept {
    return state == JobState::kCompleted || state == JobState::kFailed ||
           state == JobState::kCancelled;
}

bool JobStateMachine::can_transition(JobState next) const noexcept {
    switch (m_state) {
    case JobState::kCreated:
        return next == JobState::kRunning || next == JobState::kFailed ||
               next == JobState::kCancelled;
    case JobState::kRunning:
        return is_terminal(next);
    default:
        return false;
    }
}

void JobStateMachine::transition(JobState next) {
    error_check::check(can_transition(next),
                       std::format("Illegal job transition {} -> {}",
                                   to_string(m_state), to_string(next)));
    m_state = next;
}

std::string_view to_string(ErrorKind kind) noexcept {
    switch (kind) {
    case ErrorKind::kNone:
        return "none";
    case ErrorKind::kValidation:
        return "validation";
    case ErrorKind::kEngine:
        return "engine";
    case ErrorKind::kMissingCapability:
        return "missing_capability";
    }
    return "unknown";
}

std::optional<std::stop_token> CancellationRegistry::register_job(JobId id) {
    std::lock_guard<std::mutex> lock(m_mutex);
    const auto [it, inserted] = m_sources.try_emplace(id);
    if (!inserted) {
        return std::nullopt;
    }
    return it->second.get_token();
}

bool CancellationRegistry::cancel(JobId id) {
    std::lock_guard<std::mutex> lock(m_mutex);
    const auto it = m_sources.find(id);
    if (it == m_sources.end() || it->second.stop_requested()) {
        return false;
    }
    return it->second.request_stop();
}

void CancellationRegistry::release(JobId id, const std::stop_token& token) {
    std::lock_guard<std::mutex> lock(m_mutex);
    const auto it = m_sources.find(id);
    if (it != m_sources.end() && it->second.get_token() == token) {
        m_sources.erase(it);
    }
}

bool CancellationRegistry::contains(JobId id) const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_sources.contains(id);
}

bool CancellationRegistry::is_cancelled(JobId id) const {
    std::lock_guard<std::mutex> lock(m_mutex);
    const auto it = m_sources.find(id);
    return it != m_sources.end() && it->second.stop_requested();
}

SizeType CancellationRegistry::size() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_sources.size();
}

} // namespace cobra::jobs
