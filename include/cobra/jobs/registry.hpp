#pragma once

#include <map>
#include <mutex>
#include <optional>
#include <stop_token>

#include "cobra/common/types.hpp"

namespace cobra::jobs {

// Job id -> cancellation handle. The only state shared between a requester
// and the job server; owned by the caller and injected into the server.
class CancellationRegistry {
public:
    CancellationRegistry()                                       = default;
    ~CancellationRegistry()                                      = default;
    CancellationRegistry(const CancellationRegistry&)            = delete;
    CancellationRegistry& operator=(const CancellationRegistry&) = delete;
    CancellationRegistry(CancellationRegistry&&)                 = delete;
    CancellationRegistry& operator=(CancellationRegistry&&)      = delete;

    // Token for a new job, or nullopt when the id is still pending. A
    // cancelled job stays pending until it is released.
    [[nodiscard]] std::optional<std::stop_token> register_job(JobId id);
    // Requests stop. False for unknown, finished or already cancelled ids.
    bool cancel(JobId id);
    // Forgets a job that reached a terminal state. Only the job holding
    // `token` can release its id.
    void release(JobId id, const std::stop_token& token);
    [[nodiscard]] bool contains(JobId id) const;
    [[nodiscard]] bool is_cancelled(JobId id) const;
    [[nodiscard]] SizeType size() const;

private:
    mutable std::mutex m_mutex;
    std::map<JobId, std::stop_source> m_sources;
};

} // namespace cobra::jobs
