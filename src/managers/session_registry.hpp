#pragma once

#include <chrono>
#include <cstdint>
#include <functional>
#include <future>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>
#include <core/types.hpp>
#include <terminal/terminal_driver.hpp>

using SessionClock = std::chrono::steady_clock;

// A reply owed to some caller once the session goes idle with new content.
struct OutstandingRequest {
    std::string target;       // where the sink posts (thread, channel, ...)
    std::string request_id;
};

// Everything known about one conversation's agent. Copies handed out by
// the registry are snapshots; io_mutex is shared between them so that all
// terminal I/O for one session stays ordered.
struct SessionRecord {
    std::string id;
    TerminalHandle handle;
    std::string working_dir;
    SessionMode mode = SessionMode::Normal;

    std::string last_snapshot;
    std::string last_emitted;
    std::optional<OutstandingRequest> request;
    bool decision_notified = false;

    SessionClock::time_point last_activity;
    std::chrono::system_clock::time_point created_at;

    uint64_t generation = 0;        // unique per created session
    bool tick_in_flight = false;
    std::shared_ptr<std::mutex> io_mutex;
};

// Conversation id → session. One slot per live session; all derived state
// lives in the slot, so removing a session is a single step.
class SessionRegistry {
public:
    using SpawnFn = std::function<Result<TerminalHandle>()>;

    // Return the existing session for id, or run spawn and register the
    // result. Concurrent callers for the same id share one spawn.
    Result<SessionRecord> create_or_get(const std::string& id,
                                        const std::string& working_dir,
                                        SessionMode mode,
                                        const SpawnFn& spawn,
                                        bool* created = nullptr);

    std::optional<SessionRecord> find(const std::string& id) const;

    // Install a new outstanding request; a replaced one is returned through
    // `replaced`. False if the session does not exist.
    bool set_request(const std::string& id, OutstandingRequest request,
                     std::optional<OutstandingRequest>* replaced = nullptr);

    // Store a delivered response and clear the request it answered.
    // Refused when the session was recreated or the request replaced
    // since the tick that produced it.
    bool record_emission(const std::string& id, uint64_t generation,
                         const std::string& request_id,
                         const std::string& response,
                         const std::string& snapshot);

    void note_snapshot(const std::string& id, uint64_t generation,
                       const std::string& snapshot);

    bool touch(const std::string& id, SessionClock::time_point now = SessionClock::now());
    bool set_mode(const std::string& id, SessionMode mode);

    // True the first time per prompt episode; false if already notified.
    bool mark_decision_notified(const std::string& id, uint64_t generation);
    void clear_decision_notified(const std::string& id);

    // Claim the session for one scheduler task. Nullopt if it is gone or
    // a task is already running for it.
    std::optional<SessionRecord> try_begin_tick(const std::string& id);
    void end_tick(const std::string& id, uint64_t generation);

    // Drop the session and everything derived from it.
    std::optional<SessionRecord> remove(const std::string& id);
    // Only removes if the slot still holds the given generation.
    std::optional<SessionRecord> remove_if_generation(const std::string& id, uint64_t generation);
    // Removes only if the slot still holds the given generation and has
    // seen no activity for longer than ttl as of now.
    std::optional<SessionRecord> remove_if_expired(const std::string& id, uint64_t generation,
                                                   SessionClock::time_point now,
                                                   SessionClock::duration ttl);

    std::vector<SessionRecord> with_requests() const;
    std::vector<SessionRecord> all() const;
    size_t size() const;

private:
    SessionRecord* slot_for(const std::string& id);
    const SessionRecord* slot_for(const std::string& id) const;
    std::optional<SessionRecord> remove_locked(const std::string& id);

    mutable std::mutex mutex_;
    std::vector<std::optional<SessionRecord>> slots_;
    std::vector<size_t> free_slots_;
    std::unordered_map<std::string, size_t> index_;
    std::unordered_map<std::string, std::shared_future<Result<SessionRecord>>> pending_;
    uint64_t next_generation_ = 1;
};
