#pragma once

#include <atomic>
#include <stop_token>
#include <thread>

#include <BS_thread_pool.hpp>

#include "cobra/engine/engine.hpp"
#include "cobra/jobs/messages.hpp"
#include "cobra/jobs/queue.hpp"
#include "cobra/jobs/registry.hpp"

namespace cobra::jobs {

// Execution context for continuation jobs. A dispatcher thread reads
// requests from the inbox; jobs run on a worker pool and report through the
// outbox only.
class JobServer {
public:
    JobServer(engine::EngineLoader loader,
              CancellationRegistry& registry,
              MessageQueue<InboundMessage>& inbox,
              MessageQueue<OutboundMessage>& outbox,
              SizeType nthreads = std::thread::hardware_concurrency());
    ~JobServer();

    JobServer(const JobServer&)            = delete;
    JobServer& operator=(const JobServer&) = delete;
    JobServer(JobServer&&)                 = delete;
    JobServer& operator=(JobServer&&)      = delete;

    void start();
    // Closes the inbox and waits for every submitted job to report.
    void stop();
    [[nodiscard]] bool is_running() const noexcept { return m_running.load(); }

private:
    engine::EngineLoader m_loader;
    CancellationRegistry& m_registry;
    MessageQueue<InboundMessage>& m_inbox;
    MessageQueue<OutboundMessage>& m_outbox;
    std::atomic<bool> m_running{false};
    std::thread m_dispatcher;
    BS::thread_pool m_pool;

    void dispatch_loop();
    void handle(JobRequest request);
    void handle(const CancelRequest& request);
    void run_job(JobRequest request, std::stop_token stop);
    engine::JobResult execute(engine::Engine& engine,
                              const JobRequest& request,
                              std::stop_token stop);
};

} // namespace cobra::jobs
