#pragma once

#include <cstdint>
#include <stop_token>
#include <string_view>
#include <utility>

#include "cobra/common/types.hpp"
#include "cobra/engine/runner.hpp"
#include "cobra/exceptions.hpp"

namespace cobra::jobs {

// Number of engine steps per batch, so a run reports about 50 increments.
// Non-finite or non-positive step counts run one step at a time.
[[nodiscard]] SizeType compute_batch_size(double max_steps) noexcept;

enum class JobState : std::uint8_t {
    kCreated,
    kRunning,
    kCompleted,
    kFailed,
    kCancelled,
};

[[nodiscard]] std::string_view to_string(JobState state) noexcept;
[[nodiscard]] bool is_terminal(JobState state) noexcept;

// Created -> Running -> {Completed | Failed | Cancelled}. A job may also be
// cancelled or fail before it starts running.
class JobStateMachine {
public:
    JobStateMachine() = default;

    [[nodiscard]] JobState state() const noexcept { return m_state; }
    [[nodiscard]] bool can_transition(JobState next) const noexcept;
    // Throws error_check::DetailedException on an illegal transition.
    void transition(JobState next);

private:
    JobState m_state{JobState::kCreated};
};

// Drives a runner to completion: emits the initial snapshot, then one
// snapshot per batch. Stop requests are honoured only between batches and
// raise AbortError.
template <typename Result, typename OnProgress>
Result run_stepped(engine::SteppedRunner<Result>& runner,
                   std::stop_token stop,
                   OnProgress&& on_progress) {
    auto progress = runner.get_progress();
    const auto batch_size =
        compute_batch_size(static_cast<double>(progress.max_steps));
    on_progress(std::as_const(progress));
    while (!progress.done) {
        if (stop.stop_requested()) {
            throw AbortError();
        }
        progress = runner.run_steps(batch_size);
        on_progress(std::as_const(progress));
    }
    return runner.get_result();
}

} // namespace cobra::jobs
