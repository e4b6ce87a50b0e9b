#pragma once

#include <atomic>
#include <string>
#include <thread>
#include "session_registry.hpp"

class AgentProcess;
class DeliveryQueue;
class WorkerPool;

struct PollSettings {
    int poll_interval_ms = 800;
    size_t chunk_bytes = 3800;
    std::string accept_key = "y";
};

// Fixed-interval loop over every session that owes a reply. Each tick hands
// one task per session to the worker pool; a session whose previous task is
// still running is skipped for that tick.
class PollScheduler {
public:
    PollScheduler(SessionRegistry& registry, AgentProcess& process,
                  DeliveryQueue& deliveries, WorkerPool& pool, PollSettings settings);
    ~PollScheduler();

    void start();
    void stop();

    // One tick. Returns the number of sessions handed to the pool.
    size_t dispatch();

    // Capture, classify and react for one claimed session.
    void poll_session(const SessionRecord& rec);

private:
    void scheduler_loop();

    SessionRegistry& registry_;
    AgentProcess& process_;
    DeliveryQueue& deliveries_;
    WorkerPool& pool_;
    PollSettings settings_;

    std::atomic<bool> running_{false};
    std::thread thread_;
};
