#pragma once

#include <map>
#include <memory>
#include <string>
#include <vector>
#include <core/config.hpp>
#include "delivery_queue.hpp"
#include "poll_scheduler.hpp"
#include "reaper.hpp"
#include "session_registry.hpp"
#include "worker_pool.hpp"
#include <terminal/agent_process.hpp>

// An inbound chat message addressed to one conversation.
struct StartRequest {
    std::string conversation_id;
    std::string working_dir;
    std::string session_prefix = "agent";   // terminal name prefix
    std::string text;
    SessionMode mode = SessionMode::Normal;
    std::string target;                     // where the reply goes
    std::string request_id;
};

// For status displays.
struct SessionSummary {
    std::string conversation_id;
    std::string terminal;
    std::string working_dir;
    SessionMode mode;
    bool awaiting_reply;
    std::chrono::system_clock::time_point created_at;
    std::chrono::seconds idle;
};

// Everything between the chat side and the agents: one session per
// conversation, a scheduler watching for answers, a reaper for stale ones.
class SessionController {
public:
    SessionController(const Config& config, TerminalDriver& driver, ResponseSink& sink,
                      std::map<std::string, std::string> agent_env = {});
    ~SessionController();

    SessionController(const SessionController&) = delete;
    SessionController& operator=(const SessionController&) = delete;

    void start();
    void stop();

    // Reuse or spawn the conversation's agent, then submit the text.
    // A spawn failure is delivered to the sink and returned as an error.
    Result<void> start_or_continue(const StartRequest& req);

    // Answer a pending permission prompt. False if there is nothing to answer.
    bool decide(const std::string& conversation_id, bool accept);

    // Kill the agent and forget the conversation.
    bool terminate(const std::string& conversation_id);

    // Explicit mode change. A live session can never become Dangerous
    // (it degrades to Auto) and a Dangerous one stays Dangerous.
    bool set_mode(const std::string& conversation_id, SessionMode mode);

    std::vector<SessionSummary> sessions() const;

    SessionRegistry& registry() { return registry_; }
    PollScheduler& scheduler() { return scheduler_; }
    Reaper& reaper() { return reaper_; }
    DeliveryQueue& deliveries() { return deliveries_; }
    WorkerPool& pool() { return pool_; }
    AgentProcess& process() { return process_; }

private:
    std::string next_session_name(const std::string& prefix);
    void deliver_text(const std::string& conversation_id, const std::string& target,
                      const std::string& request_id, DeliveryKind kind,
                      const std::string& text);

    const Config& config_;
    std::map<std::string, std::string> agent_env_;

    AgentProcess process_;
    SessionRegistry registry_;
    DeliveryQueue deliveries_;
    WorkerPool pool_;
    PollScheduler scheduler_;
    Reaper reaper_;

    std::mutex name_mutex_;
    uint64_t last_name_millis_ = 0;
};

// Mode a live session ends up in when `requested` arrives.
// Modes only move up, and Dangerous cannot be reached after spawn.
SessionMode upgraded_mode(SessionMode current, SessionMode requested);
