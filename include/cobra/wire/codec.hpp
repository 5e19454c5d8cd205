#pragma once

#include <cstdint>
#include <optional>
#include <span>
#include <string>
#include <variant>
#include <vector>

#include "cobra/branch/branch_data.hpp"
#include "cobra/branch/continuation_object.hpp"
#include "cobra/branch/point.hpp"

namespace cobra::wire {

// A loosely typed numeric field: absent, a number, or text that may hold a
// number.
using Scalar = std::variant<std::monostate, double, std::string>;

struct StructuredEigenvalue {
    Scalar re;
    Scalar im;
};

// null, a [re, im] tuple, or a {re, im} record.
using RawEigenvalue =
    std::variant<std::monostate, std::vector<Scalar>, StructuredEigenvalue>;

struct RawPoint {
    std::vector<double> state;
    double param_value{};
    std::optional<double> param2_value;
    std::string stability{"None"};
    std::optional<std::vector<RawEigenvalue>> eigenvalues;
    std::optional<double> auxiliary;
};

// Branch shape exchanged with the engine.
struct BranchPayload {
    std::vector<RawPoint> points;
    std::vector<std::int64_t> bifurcations;
    std::optional<std::vector<std::int64_t>> indices;
    std::optional<branch::BranchType> branch_type;
    std::optional<branch::ResumeState> resume_state;
    std::optional<std::vector<std::vector<double>>> upoldp;
    std::optional<branch::HomoclinicContext> homoc_context;
};

struct CurvePoint {
    std::vector<double> state;
    double param1_value{};
    double param2_value{};
    std::string codim2_type{"None"};
    std::optional<std::vector<RawEigenvalue>> eigenvalues;
    std::optional<double> auxiliary;
};

// Result of a two-parameter bifurcation curve run.
struct CurvePayload {
    std::vector<CurvePoint> points;
    std::vector<std::int64_t> codim2_bifurcations;
    std::optional<std::vector<std::int64_t>> indices;
};

// Numbers pass through, numeric text is parsed in full, anything else is 0.
[[nodiscard]] double coerce_scalar(const Scalar& value);

// One {re, im} per entry, unusable entries become 0+0i. An absent array
// yields an empty list.
[[nodiscard]] std::vector<branch::Eigenvalue>
normalize_eigenvalue_array(const std::optional<std::vector<RawEigenvalue>>& raw);

[[nodiscard]] std::vector<RawEigenvalue>
to_wire_eigenvalues(std::span<const branch::Eigenvalue> eigenvalues);

[[nodiscard]] BranchPayload
serialize_branch_data(const branch::ContinuationBranchData& data);

// As above; limit-cycle branches always carry a LimitCycle descriptor
// (default mesh when the stored one is missing or of another kind).
[[nodiscard]] BranchPayload
serialize_branch_data(const branch::ContinuationObject& object);

// Inverse of serialize_branch_data. Regenerates indices that are absent or
// of the wrong length, discards out-of-range bifurcations and seeds that do
// not resolve.
[[nodiscard]] branch::ContinuationBranchData
normalize_branch_eigenvalues(const BranchPayload& payload);

// Two-parameter curve as branch data: p1 -> param_value, p2 -> param2_value,
// codim-2 label -> stability.
[[nodiscard]] branch::ContinuationBranchData
curve_to_branch_data(const CurvePayload& payload,
                     const branch::BranchType& branch_type);

} // namespace cobra::wire
