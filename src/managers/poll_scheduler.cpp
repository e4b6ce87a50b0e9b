#include "poll_scheduler.hpp"
#include "delivery_queue.hpp"
#include "session_log.hpp"
#include "worker_pool.hpp"
#include <core/constants.hpp>
#include <screen/chunker.hpp>
#include <screen/classifier.hpp>
#include <screen/extractor.hpp>
#include <terminal/agent_process.hpp>
#include <fmt/format.h>
#include <algorithm>

namespace {

// Releases the session's tick claim however the task ends.
struct TickClaim {
    SessionRegistry& registry;
    std::string id;
    uint64_t generation;
    ~TickClaim() { registry.end_tick(id, generation); }
};

} // namespace

// ── Construction / Destruction ──────────────────────────────

PollScheduler::PollScheduler(SessionRegistry& registry, AgentProcess& process,
                             DeliveryQueue& deliveries, WorkerPool& pool,
                             PollSettings settings)
    : registry_(registry), process_(process), deliveries_(deliveries),
      pool_(pool), settings_(std::move(settings)) {}

PollScheduler::~PollScheduler() {
    stop();
}

// ── Lifecycle ───────────────────────────────────────────────

void PollScheduler::start() {
    if (running_) return;
    running_ = true;
    thread_ = std::thread(&PollScheduler::scheduler_loop, this);
    agentmux_log(fmt::format("scheduler: started ({}ms tick)", settings_.poll_interval_ms));
}

void PollScheduler::stop() {
    if (!running_) return;
    running_ = false;
    if (thread_.joinable()) thread_.join();
    agentmux_log("scheduler: stopped");
}

void PollScheduler::scheduler_loop() {
    while (running_) {
        dispatch();

        // Sleep in short slices for responsive shutdown
        int slept = 0;
        while (running_ && slept < settings_.poll_interval_ms) {
            int slice = std::min(SHUTDOWN_CHECK_MS, settings_.poll_interval_ms - slept);
            std::this_thread::sleep_for(std::chrono::milliseconds(slice));
            slept += slice;
        }
    }
}

// ── Tick ────────────────────────────────────────────────────

size_t PollScheduler::dispatch() {
    size_t submitted = 0;
    for (const auto& candidate : registry_.with_requests()) {
        auto claimed = registry_.try_begin_tick(candidate.id);
        if (!claimed) continue;

        SessionRecord rec = *claimed;
        bool queued = pool_.try_submit([this, rec]() {
            TickClaim claim{registry_, rec.id, rec.generation};
            poll_session(rec);
        });
        if (queued) {
            ++submitted;
        } else {
            // Pool saturated; try again next tick.
            registry_.end_tick(rec.id, rec.generation);
        }
    }
    return submitted;
}

void PollScheduler::poll_session(const SessionRecord& rec) {
    if (!rec.request) return;
    std::lock_guard<std::mutex> io(*rec.io_mutex);

    if (!process_.exists(rec.handle)) {
        if (registry_.remove_if_generation(rec.id, rec.generation)) {
            agentmux_log(fmt::format("scheduler: {} ({}) is gone, session removed",
                                     rec.id, rec.handle.name));
        }
        return;
    }

    std::string snapshot = process_.capture(rec.handle);
    if (snapshot.empty()) return;   // transient capture failure
    registry_.note_snapshot(rec.id, rec.generation, snapshot);

    ScreenState state = classify(snapshot, rec.mode);
    if (state != ScreenState::AwaitingDecision && rec.decision_notified) {
        registry_.clear_decision_notified(rec.id);
    }

    switch (state) {
        case ScreenState::AwaitingDecision:
            if (rec.mode == SessionMode::Auto) {
                auto sent = process_.send_key(rec.handle, settings_.accept_key);
                if (sent.is_err()) {
                    agentmux_log(fmt::format("scheduler: auto-accept for {} failed: {}",
                                             rec.id, sent.error));
                } else {
                    agentmux_log(fmt::format("scheduler: auto-accepted prompt in {}", rec.id));
                    append_session_log(rec.handle.name, "Permission prompt auto-accepted");
                }
            } else if (registry_.mark_decision_notified(rec.id, rec.generation)) {
                Delivery d;
                d.conversation_id = rec.id;
                d.target = rec.request->target;
                d.request_id = rec.request->request_id;
                d.kind = DeliveryKind::DecisionPrompt;
                d.chunks = chunk_text(decision_excerpt(snapshot), settings_.chunk_bytes);
                deliveries_.push(std::move(d));
            }
            break;

        case ScreenState::Idle: {
            auto response = extract_response(snapshot, rec.last_emitted);
            if (!response) break;

            // The request may have been replaced or the session recreated
            // while this tick was capturing.
            if (!registry_.record_emission(rec.id, rec.generation,
                                           rec.request->request_id, *response, snapshot)) {
                agentmux_log(fmt::format("scheduler: stale response for {} dropped", rec.id));
                break;
            }

            Delivery d;
            d.conversation_id = rec.id;
            d.target = rec.request->target;
            d.request_id = rec.request->request_id;
            d.kind = DeliveryKind::Response;
            d.chunks = chunk_text(*response, settings_.chunk_bytes);
            deliveries_.push(std::move(d));
            append_session_log(rec.handle.name,
                               fmt::format("Response delivered ({} bytes)", response->size()));
            break;
        }

        case ScreenState::Busy:
        case ScreenState::Booting:
            break;
    }
}
