#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "cobra/common/types.hpp"

namespace cobra::config {

enum class SystemType : std::uint8_t { kFlow, kMap };

// Dynamical system definition handed to the engine with every request.
struct SystemConfig {
    std::string name;
    std::vector<std::string> equations;
    std::vector<double> params;
    std::vector<std::string> param_names;
    std::vector<std::string> var_names;
    std::string solver{"rk4"};
    SystemType type{SystemType::kFlow};

    [[nodiscard]] bool is_flow() const noexcept {
        return type == SystemType::kFlow;
    }
    [[nodiscard]] SizeType dimension() const noexcept {
        return var_names.size();
    }
    [[nodiscard]] std::optional<SizeType>
    param_index(std::string_view param_name) const;
    [[nodiscard]] bool has_param(std::string_view param_name) const {
        return param_index(param_name).has_value();
    }
};

struct SystemValidation {
    std::vector<std::string> errors;
    std::vector<std::string> warnings;

    [[nodiscard]] bool valid() const noexcept { return errors.empty(); }
    [[nodiscard]] std::string get_summary() const;
};

[[nodiscard]] SystemValidation validate_system(const SystemConfig& system);
// Throws ValidationError listing every problem found.
void require_valid_system(const SystemConfig& system);

} // namespace cobra::config
