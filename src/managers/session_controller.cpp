#include "session_controller.hpp"
#include "session_log.hpp"
#include <core/constants.hpp>
#include <core/utils.hpp>
#include <screen/chunker.hpp>
#include <fmt/format.h>
#include <chrono>

SessionMode upgraded_mode(SessionMode current, SessionMode requested) {
    if (current == SessionMode::Dangerous) return current;
    if (requested == SessionMode::Normal) return current;
    // The running agent cannot drop its permission checks; auto-accepting
    // is the closest equivalent.
    return SessionMode::Auto;
}

// ── Construction / Destruction ──────────────────────────────

SessionController::SessionController(const Config& config, TerminalDriver& driver,
                                     ResponseSink& sink,
                                     std::map<std::string, std::string> agent_env)
    : config_(config),
      agent_env_(std::move(agent_env)),
      process_(driver, config.agent(), config.timing()),
      deliveries_(sink),
      pool_(config.workers(), WORK_QUEUE_CAPACITY),
      scheduler_(registry_, process_, deliveries_, pool_,
                 PollSettings{config.timing().poll_interval_ms,
                              static_cast<size_t>(config.delivery().chunk_bytes),
                              config.agent().accept_key}),
      reaper_(registry_, process_,
              std::chrono::seconds(config.timing().reap_interval_secs),
              std::chrono::minutes(config.timing().session_ttl_minutes)) {}

SessionController::~SessionController() {
    stop();
}

void SessionController::start() {
    deliveries_.start();
    scheduler_.start();
    reaper_.start();
}

void SessionController::stop() {
    scheduler_.stop();
    reaper_.stop();
    pool_.wait_idle();
    deliveries_.stop();
}

// ── Helpers ─────────────────────────────────────────────────

std::string SessionController::next_session_name(const std::string& prefix) {
    auto now = std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::system_clock::now().time_since_epoch()).count();
    std::lock_guard<std::mutex> lock(name_mutex_);
    uint64_t millis = static_cast<uint64_t>(now);
    if (millis <= last_name_millis_) millis = last_name_millis_ + 1;
    last_name_millis_ = millis;
    return fmt::format("{}-{}", prefix, to_base36(millis));
}

void SessionController::deliver_text(const std::string& conversation_id,
                                     const std::string& target,
                                     const std::string& request_id,
                                     DeliveryKind kind, const std::string& text) {
    Delivery d;
    d.conversation_id = conversation_id;
    d.target = target;
    d.request_id = request_id;
    d.kind = kind;
    d.chunks = chunk_text(text, static_cast<size_t>(config_.delivery().chunk_bytes));
    deliveries_.push(std::move(d));
}

// ── Inbound commands ────────────────────────────────────────

Result<void> SessionController::start_or_continue(const StartRequest& req) {
    bool created = false;
    std::string name;
    bool dangerous = req.mode == SessionMode::Dangerous;

    auto session = registry_.create_or_get(
        req.conversation_id, req.working_dir, req.mode,
        [&]() -> Result<TerminalHandle> {
            name = next_session_name(req.session_prefix);
            auto spawned = process_.spawn(name, req.working_dir, dangerous, agent_env_);
            if (!spawned.ok()) {
                return Result<TerminalHandle>::Err(fmt::format(
                    "{}: {}", spawn_error_name(spawned.error), spawned.message));
            }
            return Result<TerminalHandle>::Ok(spawned.handle);
        },
        &created);

    if (session.is_err()) {
        // Only the caller that attempted the spawn reports it.
        if (!name.empty()) {
            deliver_text(req.conversation_id, req.target, req.request_id,
                         DeliveryKind::Failure,
                         fmt::format("Could not start the agent: {}", session.error));
        }
        return Result<void>::Err(session.error);
    }

    SessionRecord rec = session.value;
    if (!created) {
        SessionMode mode = upgraded_mode(rec.mode, req.mode);
        if (mode != rec.mode) {
            registry_.set_mode(req.conversation_id, mode);
            agentmux_log(fmt::format("controller: {} mode {} -> {}", req.conversation_id,
                                     mode_name(rec.mode), mode_name(mode)));
        }
    }

    std::lock_guard<std::mutex> io(*rec.io_mutex);

    std::optional<OutstandingRequest> replaced;
    if (!registry_.set_request(req.conversation_id,
                               OutstandingRequest{req.target, req.request_id}, &replaced)) {
        return Result<void>::Err(fmt::format("session {} ended before the message was sent",
                                             req.conversation_id));
    }
    if (replaced) {
        agentmux_log(fmt::format("controller: {} request {} superseded by {}",
                                 req.conversation_id, replaced->request_id, req.request_id));
        if (config_.delivery().notify_superseded) {
            deliver_text(req.conversation_id, replaced->target, replaced->request_id,
                         DeliveryKind::Superseded,
                         "A newer message replaced this one before the agent answered.");
        }
    }

    auto sent = process_.send_text(rec.handle, req.text);
    if (sent.is_err()) {
        // The request stays outstanding; the agent may still have received it.
        agentmux_log(fmt::format("controller: send to {} failed: {}", rec.handle.name, sent.error));
    }
    registry_.touch(req.conversation_id);
    append_session_log(rec.handle.name, fmt::format("User: {}", req.text));
    return Result<void>::Ok();
}

bool SessionController::decide(const std::string& conversation_id, bool accept) {
    auto rec = registry_.find(conversation_id);
    if (!rec || !rec->request) return false;

    std::lock_guard<std::mutex> io(*rec->io_mutex);
    const std::string& key = accept ? config_.agent().accept_key : config_.agent().reject_key;
    auto sent = process_.send_key(rec->handle, key);
    if (sent.is_err()) {
        agentmux_log(fmt::format("controller: decision for {} failed: {}", conversation_id, sent.error));
    }
    registry_.clear_decision_notified(conversation_id);
    registry_.touch(conversation_id);
    append_session_log(rec->handle.name, accept ? "Permission granted" : "Permission denied");
    return true;
}

bool SessionController::terminate(const std::string& conversation_id) {
    auto rec = registry_.remove(conversation_id);
    if (!rec) return false;

    std::lock_guard<std::mutex> io(*rec->io_mutex);
    process_.kill(rec->handle);
    agentmux_log(fmt::format("controller: {} terminated ({})", conversation_id, rec->handle.name));
    return true;
}

bool SessionController::set_mode(const std::string& conversation_id, SessionMode mode) {
    auto rec = registry_.find(conversation_id);
    if (!rec) return false;
    SessionMode next = mode;
    if (rec->mode == SessionMode::Dangerous) next = SessionMode::Dangerous;
    else if (mode == SessionMode::Dangerous) next = SessionMode::Auto;
    return registry_.set_mode(conversation_id, next);
}

std::vector<SessionSummary> SessionController::sessions() const {
    std::vector<SessionSummary> out;
    auto now = SessionClock::now();
    for (const auto& rec : registry_.all()) {
        SessionSummary s;
        s.conversation_id = rec.id;
        s.terminal = rec.handle.name;
        s.working_dir = rec.working_dir;
        s.mode = rec.mode;
        s.awaiting_reply = rec.request.has_value();
        s.created_at = rec.created_at;
        s.idle = std::chrono::duration_cast<std::chrono::seconds>(now - rec.last_activity);
        out.push_back(s);
    }
    return out;
}
