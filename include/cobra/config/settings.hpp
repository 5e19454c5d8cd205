#pragma once

#include "cobra/branch/continuation_kind.hpp"
#include "cobra/common/types.hpp"

namespace cobra::config {

// Predictor/corrector configuration forwarded verbatim to the engine.
struct ContinuationSettings {
    double step_size{0.01};
    double min_step_size{1e-5};
    double max_step_size{0.1};
    SizeType max_steps{300};
    SizeType corrector_steps{32};
    double corrector_tolerance{1e-7};
    double step_tolerance{1e-7};

    // Copy with every field clamped to its admissible floor. Non-finite
    // values fall back to the field default.
    [[nodiscard]] ContinuationSettings sanitized() const;
    // Throws ValidationError on an inconsistent configuration.
    void validate() const;

    bool operator==(const ContinuationSettings&) const = default;
};

[[nodiscard]] ContinuationSettings default_settings(branch::BranchKind kind);

} // namespace cobra::config
