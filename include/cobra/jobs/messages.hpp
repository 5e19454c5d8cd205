#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <variant>

#include "cobra/common/types.hpp"
#include "cobra/engine/requests.hpp"
#include "cobra/engine/runner.hpp"

namespace cobra::jobs {

struct JobRequest {
    JobId id{};
    engine::JobPayload payload;
};

struct CancelRequest {
    JobId id{};
};

using InboundMessage = std::variant<JobRequest, CancelRequest>;

// Non-terminal notification.
struct ProgressMessage {
    JobId id{};
    engine::Progress progress;
};

enum class ErrorKind : std::uint8_t {
    kNone,
    kValidation,
    kEngine,
    kMissingCapability,
};

[[nodiscard]] std::string_view to_string(ErrorKind kind) noexcept;

// Terminal message; exactly one per job id.
struct JobResponse {
    JobId id{};
    bool ok{false};
    std::optional<engine::JobResult> result;
    std::string error;
    bool aborted{false};
    ErrorKind error_kind{ErrorKind::kNone};
    // Operation name for kMissingCapability.
    std::string capability;
};

using OutboundMessage = std::variant<ProgressMessage, JobResponse>;

} // namespace cobra::jobs
