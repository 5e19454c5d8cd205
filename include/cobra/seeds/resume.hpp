#pragma once

#include <optional>
#include <span>
#include <string>
#include <vector>

#include "cobra/branch/branch_data.hpp"
#include "cobra/common/types.hpp"

namespace cobra::seeds {

// Parameter value followed by the state vector. Empty when the parameter or
// any state entry is non-finite, or the state is empty.
[[nodiscard]] std::vector<double>
augmented_state(const branch::ContinuationPoint& point);

// Unit vector along v, or nullopt when the norm is non-finite or at most
// kDegenerateNorm.
[[nodiscard]] std::optional<std::vector<double>>
normalized(std::span<const double> v);

// Reason the seed cannot resume continuation at the given endpoint, or
// nullopt when it is usable.
[[nodiscard]] std::optional<std::string>
validate_resume_seed(const branch::EndpointSeed& seed,
                     LogicalIndex endpoint,
                     SizeType expected_aug_len);

// Boundary seed for a continuation in the given direction (max seed going
// forward, min seed going backward), if it validates against the endpoint.
[[nodiscard]] std::optional<branch::EndpointSeed>
select_resume_seed(const branch::ContinuationBranchData& data,
                   Direction direction,
                   LogicalIndex endpoint,
                   SizeType expected_aug_len);

// Appends a restarted homoclinic run to its source branch. extension.points[0]
// duplicates the source endpoint and is skipped.
[[nodiscard]] branch::ContinuationBranchData
merge_homoclinic_extension(const branch::ContinuationBranchData& source,
                           const branch::ContinuationBranchData& extension,
                           LogicalIndex endpoint,
                           Direction direction);

} // namespace cobra::seeds
