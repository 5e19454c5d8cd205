#pragma once

#include <optional>

#include "cobra/branch/branch_data.hpp"
#include "cobra/common/types.hpp"

namespace cobra::seeds {

struct TrimOptions {
    // kForward discards the first array point, kBackward the last one.
    Direction side{Direction::kForward};
    // Step size for a synthesized boundary seed.
    std::optional<double> step_hint;
};

// Drops the approximate starting point of a freshly initialised branch and
// re-derives a resume seed for the new boundary. Never throws; when no
// tangent can be obtained the boundary is left without a seed.
[[nodiscard]] branch::ContinuationBranchData
discard_initial_approximation_point(const branch::ContinuationBranchData& data,
                                    const TrimOptions& options = {});

} // namespace cobra::seeds
