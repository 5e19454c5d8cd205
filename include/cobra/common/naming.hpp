#pragma once

#include <optional>
#include <string>
#include <string_view>

namespace cobra {

// Persisted identifiers (systems, objects, branches): non-empty and
// [A-Za-z0-9_]+. Returns the user-facing message for an invalid name.
[[nodiscard]] std::optional<std::string> name_error(std::string_view name);
[[nodiscard]] bool is_valid_name(std::string_view name);
// Throws ValidationError carrying name_error's message.
void validate_name(std::string_view name);

// Variable and parameter identifiers: [A-Za-z_][A-Za-z0-9_]*
[[nodiscard]] bool is_identifier(std::string_view name);

} // namespace cobra
