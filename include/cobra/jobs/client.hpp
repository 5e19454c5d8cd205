#pragma once

#include <atomic>
#include <functional>
#include <future>
#include <map>
#include <mutex>
#include <thread>

#include "cobra/engine/engine.hpp"
#include "cobra/jobs/messages.hpp"
#include "cobra/jobs/queue.hpp"
#include "cobra/jobs/registry.hpp"
#include "cobra/jobs/server.hpp"

namespace cobra::jobs {

using ProgressCallback = std::function<void(const engine::Progress&)>;

// Requester side of the protocol. Progress callbacks run on the client's
// listener thread.
class JobClient {
public:
    struct Submission {
        JobId id{};
        std::future<engine::JobResult> result;
    };

    JobClient(MessageQueue<InboundMessage>& to_server,
              MessageQueue<OutboundMessage>& from_server);
    ~JobClient();

    JobClient(const JobClient&)            = delete;
    JobClient& operator=(const JobClient&) = delete;
    JobClient(JobClient&&)                 = delete;
    JobClient& operator=(JobClient&&)      = delete;

    // The future throws AbortError when the job was cancelled, and
    // EngineError / MissingCapabilityError / ValidationError on failure.
    [[nodiscard]] Submission submit(engine::JobPayload payload,
                                    ProgressCallback on_progress = {});
    void cancel(JobId id);
    // submit() and wait.
    engine::JobResult run(engine::JobPayload payload,
                          ProgressCallback on_progress = {});
    [[nodiscard]] SizeType pending() const;

private:
    struct Pending {
        std::promise<engine::JobResult> promise;
        ProgressCallback on_progress;
    };

    MessageQueue<InboundMessage>& m_to_server;
    MessageQueue<OutboundMessage>& m_from_server;
    std::atomic<JobId> m_next_id{1};
    mutable std::mutex m_mutex;
    std::map<JobId, Pending> m_pending;
    std::thread m_listener;

    void listen();
    void deliver(const ProgressMessage& message);
    void deliver(JobResponse response);
};

// Registry, queues, server and client wired together for one engine.
class JobSession {
public:
    explicit JobSession(engine::EngineLoader loader);
    ~JobSession();

    JobSession(const JobSession&)            = delete;
    JobSession& operator=(const JobSession&) = delete;
    JobSession(JobSession&&)                 = delete;
    JobSession& operator=(JobSession&&)      = delete;

    [[nodiscard]] JobClient& client() noexcept { return m_client; }
    [[nodiscard]] CancellationRegistry& registry() noexcept {
        return m_registry;
    }

private:
    CancellationRegistry m_registry;
    MessageQueue<InboundMessage> m_inbox;
    MessageQueue<OutboundMessage> m_outbox;
    JobServer m_server;
    JobClient m_client;
};

} // namespace cobra::jobs
