#include "cobra/common/naming.hpp"

#include <regex>

#include "cobra/exceptions.hpp"

namespace cobra {

namespace {
const std::regex& name_regex() {
    static const std::regex kName(R"(^[A-Za-z0-9_]+$)");
    return kName;
}
const std::regex& identifier_regex() {
    static const std::regex kIdentifier(R"(^[A-Za-z_][A-Za-z0-9_]*$)");
    return kIdentifier;
}
} // namespace

std::optional<std::string> name_error(std::string_view name) {
    if (name.empty()) {
        return "Name cannot be empty.";
    }
    if (!std::regex_match(name.begin(), name.end(), name_regex())) {
        return "Name must contain only alphanumeric characters and "
               "underscores (no spaces).";
    }
    return std::nullopt;
}

bool is_valid_name(std::string_view name) { return !name_error(name); }

void validate_name(std::string_view name) {
    if (auto error = name_error(name)) {
        throw ValidationError(*error);
    }
}

bool is_identifier(std::string_view name) {
    return std::regex_match(name.begin(), name.end(), identifier_regex());
}

} // namespace cobra
