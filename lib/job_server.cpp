#include "cobra/jobs/server.hpp"

#include <algorithm>
#include <exception>
#include <format>
#include <utility>

#include <spdlog/spdlog.h>

#include "cobra/exceptions.hpp"
#include "cobra/jobs/protocol.hpp"
#include "cobra/timing.hpp"

namespace cobra::jobs {

namespace {

JobResponse failure(JobId id, ErrorKind kind, std::string message) {
    return JobResponse{.id         = id,
                       .ok         = false,
                       .result     = std::nullopt,
                       .error      = std::move(message),
                       .aborted    = false,
                       .error_kind = kind};
}

} // namespace

JobServer::JobServer(engine::EngineLoader loader,
                     CancellationRegistry& registry,
                     MessageQueue<InboundMessage>& inbox,
                     MessageQueue<OutboundMessage>& outbox,
                     SizeType nthreads)
    : m_loader(std::move(loader)),
      m_registry(registry),
      m_inbox(inbox),
      m_outbox(outbox),
      m_pool(static_cast<BS::concurrency_t>(std::max<SizeType>(nthreads, 1))) {}

JobServer::~JobServer() { stop(); }

void JobServer::start() {
    if (m_running.exchange(true)) {
        return;
    }
    m_dispatcher = std::thread(&JobServer::dispatch_loop, this);
}

void JobServer::stop() {
    if (!m_running.exchange(false)) {
        return;
    }
    m_inbox.close();
    if (m_dispatcher.joinable()) {
        m_dispatcher.join();
    }
    m_pool.wait();
}

void JobServer::dispatch_loop() {
    while (auto message = m_inbox.pop()) {
        std::visit([this](auto&& msg) { handle(std::forward<decltype(msg)>(msg)); },
                   std::move(*message));
    }
    spdlog::debug("Job dispatcher stopped");
}

void JobServer::handle(JobRequest request) {
    const auto id    = request.id;
    const auto token = m_registry.register_job(id);
    if (!token) {
        spdlog::warn("Rejected job {}: id is still pending", id);
        m_outbox.push(failure(id, ErrorKind::kValidation,
                              std::format("Job id {} is still pending.", id)));
        return;
    }
    spdlog::debug("Dispatching job {} ({})", id,
                  engine::payload_name(request.payload));
    m_pool.detach_task(
        [this, stop = *token, req = std::move(request)]() mutable {
            run_job(std::move(req), stop);
        });
}

void JobServer::handle(const CancelRequest& request) {
    if (m_registry.cancel(request.id)) {
        spdlog::info("Cancellation requested for job {}", request.id);
    } else {
        spdlog::debug("Ignoring cancel for job {}: not pending", request.id);
    }
}

void JobServer::run_job(JobRequest request, std::stop_token stop) {
    const auto id = request.id;
    timing::JobTimer timer(id, engine::payload_name(request.payload));
    JobStateMachine state;
    JobResponse response{.id = id};
    try {
        if (stop.stop_requested()) {
            throw AbortError();
        }
        const auto engine = m_loader.get();
        error_check::check_not_null(engine.get(), "engine instance");
        if (stop.stop_requested()) {
            throw AbortError();
        }
        state.transition(JobState::kRunning);
        response.result = execute(*engine, request, stop);
        response.ok     = true;
        state.transition(JobState::kCompleted);
    } catch (const AbortError&) {
        response.aborted = true;
        response.error   = "cancelled";
        state.transition(JobState::kCancelled);
    } catch (const MissingCapabilityError& e) {
        response = failure(id, ErrorKind::kMissingCapability, e.what());
        response.capability = e.operation();
        state.transition(JobState::kFailed);
    } catch (const ValidationError& e) {
        response = failure(id, ErrorKind::kValidation, e.what());
        state.transition(JobState::kFailed);
    } catch (const std::exception& e) {
        response = failure(id, ErrorKind::kEngine, e.what());
        state.transition(JobState::kFailed);
    }

    timer.finish(to_string(state.state()));
    if (response.ok) {
        spdlog::debug("Job {} {}", id, to_string(state.state()));
    } else if (response.aborted) {
        spdlog::info("Job {} cancelled", id);
    } else {
        spdlog::error("Job {} failed ({}): {}", id,
                      to_string(response.error_kind), response.error);
    }
    m_registry.release(id, stop);
    m_outbox.push(std::move(response));
}

engine::JobResult JobServer::execute(engine::Engine& engine,
                                     const JobRequest& request,
                                     std::stop_token stop) {
    const auto id = request.id;
    auto emit     = [this, id](const engine::Progress& progress) {
        m_outbox.push(ProgressMessage{.id = id, .progress = progress});
    };
    auto drive = [&](auto runner) -> engine::JobResult {
        error_check::check_not_null(runner.get(), "engine runner");
        return run_stepped(*runner, stop, emit);
    };
    return std::visit(
        Overloaded{
            [&](const engine::EquilibriumRequest& r) {
                return drive(engine.create_equilibrium_runner(r));
            },
            [&](const engine::ExtensionRequest& r) {
                return drive(engine.create_extension_runner(r));
            },
            [&](const engine::LimitCycleFromHopfRequest& r) {
                return drive(engine.create_limit_cycle_from_hopf_runner(r));
            },
            [&](const engine::LimitCycleFromOrbitRequest& r) {
                return drive(engine.create_limit_cycle_from_orbit_runner(r));
            },
            [&](const engine::LimitCycleFromPDRequest& r) {
                return drive(engine.create_limit_cycle_from_pd_runner(r));
            },
            [&](const engine::MapCycleFromPDRequest& r) {
                return drive(engine.create_map_cycle_from_pd_runner(r));
            },
            [&](const engine::HomoclinicFromLargeCycleRequest& r) {
                return drive(engine.create_homoclinic_from_large_cycle_runner(r));
            },
            [&](const engine::HomoclinicFromHomoclinicRequest& r) {
                return drive(engine.create_homoclinic_from_homoclinic_runner(r));
            },
            [&](const engine::HomoclinicFromHomotopySaddleRequest& r) {
                return drive(
                    engine.create_homoclinic_from_homotopy_saddle_runner(r));
            },
            [&](const engine::HomotopySaddleRequest& r) {
                return drive(engine.create_homotopy_saddle_runner(r));
            },
            [&](const engine::FoldCurveRequest& r) {
                return drive(engine.create_fold_curve_runner(r));
            },
            [&](const engine::HopfCurveRequest& r) {
                return drive(engine.create_hopf_curve_runner(r));
            },
            [&](const engine::CycleCurveRequest& r) {
                return drive(engine.create_cycle_curve_runner(r));
            },
        },
        request.payload);
}

} // namespace cobra::jobs
