#include "cobra/jobs/client.hpp"

#include <exception>
#include <format>
#include <utility>

#include <spdlog/spdlog.h>

#include "cobra/exceptions.hpp"

namespace cobra::jobs {

namespace {

std::exception_ptr to_exception(const JobResponse& response) {
    if (response.aborted) {
        return std::make_exception_ptr(AbortError());
    }
    switch (response.error_kind) {
    case ErrorKind::kMissingCapability:
        return std::make_exception_ptr(
            MissingCapabilityError(response.capability));
    case ErrorKind::kValidation:
        return std::make_exception_ptr(ValidationError(response.error));
    default:
        return std::make_exception_ptr(EngineError(response.error));
    }
}

} // namespace

JobClient::JobClient(MessageQueue<InboundMessage>& to_server,
                     MessageQueue<OutboundMessage>& from_server)
    : m_to_server(to_server),
      m_from_server(from_server),
      m_listener(&JobClient::listen, this) {}

JobClient::~JobClient() {
    m_from_server.close();
    if (m_listener.joinable()) {
        m_listener.join();
    }
    std::lock_guard<std::mutex> lock(m_mutex);
    for (auto& [id, pending] : m_pending) {
        pending.promise.set_exception(std::make_exception_ptr(
            EngineError(std::format("Job {} abandoned: client shut down", id))));
    }
    m_pending.clear();
}

JobClient::Submission JobClient::submit(engine::JobPayload payload,
                                        ProgressCallback on_progress) {
    const JobId id = m_next_id.fetch_add(1);
    Submission submission{.id = id};
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        auto& pending       = m_pending[id];
        pending.on_progress = std::move(on_progress);
        submission.result   = pending.promise.get_future();
    }
    if (!m_to_server.push(JobRequest{.id = id, .payload = std::move(payload)})) {
        std::lock_guard<std::mutex> lock(m_mutex);
        auto node = m_pending.extract(id);
        node.mapped().promise.set_exception(std::make_exception_ptr(
            EngineError("Job server is not accepting requests")));
    }
    return submission;
}

void JobClient::cancel(JobId id) {
    if (!m_to_server.push(CancelRequest{.id = id})) {
        spdlog::debug("Cancel for job {} dropped: server closed", id);
    }
}

engine::JobResult JobClient::run(engine::JobPayload payload,
                                 ProgressCallback on_progress) {
    auto submission = submit(std::move(payload), std::move(on_progress));
    return submission.result.get();
}

SizeType JobClient::pending() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_pending.size();
}

void JobClient::listen() {
    while (auto message = m_from_server.pop()) {
        std::visit([this](auto&& msg) { deliver(std::forward<decltype(msg)>(msg)); },
                   std::move(*message));
    }
}

void JobClient::deliver(const ProgressMessage& message) {
    ProgressCallback callback;
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        const auto it = m_pending.find(message.id);
        if (it == m_pending.end()) {
            return;
        }
        callback = it->second.on_progress;
    }
    if (callback) {
        callback(message.progress);
    }
}

void JobClient::deliver(JobResponse response) {
    std::unique_lock<std::mutex> lock(m_mutex);
    auto node = m_pending.extract(response.id);
    lock.unlock();
    if (node.empty()) {
        spdlog::warn("Dropping response for unknown job {}", response.id);
        return;
    }
    auto& promise = node.mapped().promise;
    if (response.ok && response.result) {
        promise.set_value(std::move(*response.result));
    } else {
        promise.set_exception(to_exception(response));
    }
}

JobSession::JobSession(engine::EngineLoader loader)
    : m_server(std::move(loader), m_registry, m_inbox, m_outbox),
      m_client(m_inbox, m_outbox) {
    m_server.start();
}

JobSession::~JobSession() { m_server.stop(); }

} // namespace cobra::jobs
