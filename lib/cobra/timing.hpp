#pragma once

#include <atomic>
#include <chrono>
#include <string>
#include <string_view>

#include <spdlog/spdlog.h>

#include "cobra/common/types.hpp"

namespace cobra::timing {

// Wall time of one job, from dispatch to its terminal response. Reports
// once, through finish() or on destruction.
class JobTimer {
public:
    JobTimer(JobId id, std::string_view payload)
        : m_id(id),
          m_payload(payload),
          m_start(std::chrono::steady_clock::now()) {}

    ~JobTimer() { finish("abandoned"); }

    JobTimer(const JobTimer&)            = delete;
    JobTimer& operator=(const JobTimer&) = delete;
    JobTimer(JobTimer&&)                 = delete;
    JobTimer& operator=(JobTimer&&)      = delete;

    [[nodiscard]] double elapsed_seconds() const {
        return std::chrono::duration<double>(std::chrono::steady_clock::now() -
                                             m_start)
            .count();
    }

    void finish(std::string_view outcome) {
        if (m_reported) {
            return;
        }
        m_reported = true;
        if (s_enabled.load(std::memory_order_relaxed)) {
            spdlog::info("Job {} ({}) {} in {:.3f} s", m_id, m_payload,
                         outcome, elapsed_seconds());
        }
    }

    static void set_enabled(bool enabled) {
        s_enabled.store(enabled, std::memory_order_relaxed);
    }
    static bool is_enabled() { return s_enabled.load(std::memory_order_relaxed); }

private:
    JobId m_id;
    std::string m_payload;
    std::chrono::steady_clock::time_point m_start;
    bool m_reported{false};
    inline static std::atomic<bool> s_enabled{true};
};

} // namespace cobra::timing
