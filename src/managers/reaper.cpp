#include "reaper.hpp"
#include "session_log.hpp"
#include <core/constants.hpp>
#include <terminal/agent_process.hpp>
#include <fmt/format.h>

Reaper::Reaper(SessionRegistry& registry, AgentProcess& process,
               std::chrono::seconds interval, std::chrono::minutes ttl)
    : registry_(registry), process_(process), interval_(interval), ttl_(ttl) {}

Reaper::~Reaper() {
    stop();
}

void Reaper::start() {
    if (running_) return;
    running_ = true;
    thread_ = std::thread(&Reaper::reaper_loop, this);
    agentmux_log(fmt::format("reaper: started (every {}s, ttl {}m)",
                             interval_.count(), ttl_.count()));
}

void Reaper::stop() {
    if (!running_) return;
    running_ = false;
    if (thread_.joinable()) thread_.join();
    agentmux_log("reaper: stopped");
}

void Reaper::reaper_loop() {
    auto next = SessionClock::now() + interval_;
    while (running_) {
        if (SessionClock::now() >= next) {
            sweep();
            next = SessionClock::now() + interval_;
        }
        std::this_thread::sleep_for(std::chrono::milliseconds(SHUTDOWN_CHECK_MS));
    }
}

size_t Reaper::sweep(SessionClock::time_point now) {
    size_t removed = 0;
    for (const auto& rec : registry_.all()) {
        if (!process_.exists(rec.handle)) {
            if (registry_.remove_if_generation(rec.id, rec.generation)) {
                agentmux_log(fmt::format("reaper: {} ({}) died, removed", rec.id, rec.handle.name));
                ++removed;
            }
            continue;
        }

        if (now - rec.last_activity <= ttl_) continue;

        // Take the session out first so no new work lands on it, then shut
        // the agent down. The ttl is checked again against the live slot;
        // a message may have arrived since the listing.
        auto gone = registry_.remove_if_expired(rec.id, rec.generation, now, ttl_);
        if (!gone) continue;
        {
            std::lock_guard<std::mutex> io(*gone->io_mutex);
            process_.kill(gone->handle);
        }
        append_session_log(gone->handle.name, "Session expired after inactivity");
        agentmux_log(fmt::format("reaper: {} idle past ttl, killed {}", rec.id, gone->handle.name));
        ++removed;
    }
    return removed;
}
