#pragma once

#include <optional>

#include "cobra/common/types.hpp"

namespace cobra::engine {

// Snapshot reported by a stepped runner after every batch.
struct Progress {
    bool done{false};
    SizeType current_step{};
    SizeType max_steps{};
    SizeType points_computed{};
    SizeType bifurcations_found{};
    double current_param{};
    std::optional<SizeType> rings_computed;

    bool operator==(const Progress&) const = default;
};

// Handle to a continuation run inside the engine. run_steps blocks for the
// whole batch; callers interleave batches with cancellation checks.
template <typename Result> class SteppedRunner {
public:
    SteppedRunner()                                = default;
    virtual ~SteppedRunner()                       = default;
    SteppedRunner(const SteppedRunner&)            = delete;
    SteppedRunner& operator=(const SteppedRunner&) = delete;
    SteppedRunner(SteppedRunner&&)                 = delete;
    SteppedRunner& operator=(SteppedRunner&&)      = delete;

    virtual Progress run_steps(SizeType batch_size) = 0;
    [[nodiscard]] virtual Progress get_progress() const = 0;
    virtual Result get_result()                         = 0;
};

} // namespace cobra::engine
