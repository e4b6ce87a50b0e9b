#pragma once

#include <atomic>
#include <chrono>
#include <thread>
#include "session_registry.hpp"

class AgentProcess;

// Slow background sweep that evicts sessions whose agent died or that
// have been quiet for longer than the TTL. Eviction is silent.
class Reaper {
public:
    Reaper(SessionRegistry& registry, AgentProcess& process,
           std::chrono::seconds interval, std::chrono::minutes ttl);
    ~Reaper();

    void start();
    void stop();

    // One sweep as of `now`. Returns the number of sessions removed.
    size_t sweep(SessionClock::time_point now = SessionClock::now());

private:
    void reaper_loop();

    SessionRegistry& registry_;
    AgentProcess& process_;
    std::chrono::seconds interval_;
    std::chrono::minutes ttl_;

    std::atomic<bool> running_{false};
    std::thread thread_;
};
