#include "session_registry.hpp"
#include "session_log.hpp"
#include <fmt/format.h>

// ── Slots ───────────────────────────────────────────────────

SessionRecord* SessionRegistry::slot_for(const std::string& id) {
    auto it = index_.find(id);
    if (it == index_.end()) return nullptr;
    auto& slot = slots_[it->second];
    return slot ? &*slot : nullptr;
}

const SessionRecord* SessionRegistry::slot_for(const std::string& id) const {
    auto it = index_.find(id);
    if (it == index_.end()) return nullptr;
    const auto& slot = slots_[it->second];
    return slot ? &*slot : nullptr;
}

// ── Creation ────────────────────────────────────────────────

Result<SessionRecord> SessionRegistry::create_or_get(const std::string& id,
                                                     const std::string& working_dir,
                                                     SessionMode mode,
                                                     const SpawnFn& spawn,
                                                     bool* created) {
    if (created) *created = false;

    std::promise<Result<SessionRecord>> promise;
    {
        std::unique_lock<std::mutex> lock(mutex_);
        if (const auto* existing = slot_for(id)) {
            return Result<SessionRecord>::Ok(*existing);
        }

        auto pending = pending_.find(id);
        if (pending != pending_.end()) {
            // Someone else is spawning this conversation; wait for theirs.
            auto future = pending->second;
            lock.unlock();
            return future.get();
        }

        pending_.emplace(id, promise.get_future().share());
    }

    Result<TerminalHandle> spawned = Result<TerminalHandle>::Err("spawn not attempted");
    try {
        spawned = spawn();
    } catch (const std::exception& e) {
        spawned = Result<TerminalHandle>::Err(fmt::format("spawn threw: {}", e.what()));
    }

    Result<SessionRecord> outcome = Result<SessionRecord>::Err(spawned.error);
    {
        std::lock_guard<std::mutex> lock(mutex_);
        pending_.erase(id);

        if (spawned.is_ok()) {
            SessionRecord rec;
            rec.id = id;
            rec.handle = spawned.value;
            rec.working_dir = working_dir;
            rec.mode = mode;
            rec.last_activity = SessionClock::now();
            rec.created_at = std::chrono::system_clock::now();
            rec.generation = next_generation_++;
            rec.io_mutex = std::make_shared<std::mutex>();

            size_t slot;
            if (!free_slots_.empty()) {
                slot = free_slots_.back();
                free_slots_.pop_back();
                slots_[slot] = rec;
            } else {
                slot = slots_.size();
                slots_.emplace_back(rec);
            }
            index_[id] = slot;
            outcome = Result<SessionRecord>::Ok(rec);
            if (created) *created = true;
        }
    }

    if (outcome.is_ok()) {
        agentmux_log(fmt::format("registry: created {} as {} (gen {})",
                                 id, outcome.value.handle.name, outcome.value.generation));
    } else {
        agentmux_log(fmt::format("registry: create {} failed: {}", id, outcome.error));
    }

    promise.set_value(outcome);
    return outcome;
}

// ── Queries ─────────────────────────────────────────────────

std::optional<SessionRecord> SessionRegistry::find(const std::string& id) const {
    std::lock_guard<std::mutex> lock(mutex_);
    const auto* rec = slot_for(id);
    if (!rec) return std::nullopt;
    return *rec;
}

std::vector<SessionRecord> SessionRegistry::with_requests() const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<SessionRecord> out;
    for (const auto& slot : slots_) {
        if (slot && slot->request) out.push_back(*slot);
    }
    return out;
}

std::vector<SessionRecord> SessionRegistry::all() const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<SessionRecord> out;
    for (const auto& slot : slots_) {
        if (slot) out.push_back(*slot);
    }
    return out;
}

size_t SessionRegistry::size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return index_.size();
}

// ── Mutations ───────────────────────────────────────────────

bool SessionRegistry::set_request(const std::string& id, OutstandingRequest request,
                                  std::optional<OutstandingRequest>* replaced) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto* rec = slot_for(id);
    if (!rec) return false;
    if (replaced) *replaced = rec->request;
    rec->request = std::move(request);
    rec->decision_notified = false;
    return true;
}

bool SessionRegistry::record_emission(const std::string& id, uint64_t generation,
                                      const std::string& request_id,
                                      const std::string& response,
                                      const std::string& snapshot) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto* rec = slot_for(id);
    if (!rec || rec->generation != generation) return false;
    if (!rec->request || rec->request->request_id != request_id) return false;

    rec->last_emitted = response;
    rec->last_snapshot = snapshot;
    rec->request.reset();
    rec->decision_notified = false;
    rec->last_activity = SessionClock::now();
    return true;
}

void SessionRegistry::note_snapshot(const std::string& id, uint64_t generation,
                                    const std::string& snapshot) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto* rec = slot_for(id);
    if (rec && rec->generation == generation) rec->last_snapshot = snapshot;
}

bool SessionRegistry::touch(const std::string& id, SessionClock::time_point now) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto* rec = slot_for(id);
    if (!rec) return false;
    rec->last_activity = now;
    return true;
}

bool SessionRegistry::set_mode(const std::string& id, SessionMode mode) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto* rec = slot_for(id);
    if (!rec) return false;
    rec->mode = mode;
    return true;
}

bool SessionRegistry::mark_decision_notified(const std::string& id, uint64_t generation) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto* rec = slot_for(id);
    if (!rec || rec->generation != generation || rec->decision_notified) return false;
    rec->decision_notified = true;
    return true;
}

void SessionRegistry::clear_decision_notified(const std::string& id) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (auto* rec = slot_for(id)) rec->decision_notified = false;
}

// ── Scheduler claims ────────────────────────────────────────

std::optional<SessionRecord> SessionRegistry::try_begin_tick(const std::string& id) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto* rec = slot_for(id);
    if (!rec || rec->tick_in_flight) return std::nullopt;
    rec->tick_in_flight = true;
    return *rec;
}

void SessionRegistry::end_tick(const std::string& id, uint64_t generation) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto* rec = slot_for(id);
    if (rec && rec->generation == generation) rec->tick_in_flight = false;
}

// ── Removal ─────────────────────────────────────────────────

std::optional<SessionRecord> SessionRegistry::remove_locked(const std::string& id) {
    auto it = index_.find(id);
    if (it == index_.end()) return std::nullopt;

    size_t slot = it->second;
    std::optional<SessionRecord> removed = std::move(slots_[slot]);
    slots_[slot].reset();
    free_slots_.push_back(slot);
    index_.erase(it);
    return removed;
}

std::optional<SessionRecord> SessionRegistry::remove(const std::string& id) {
    std::lock_guard<std::mutex> lock(mutex_);
    return remove_locked(id);
}

std::optional<SessionRecord> SessionRegistry::remove_if_generation(const std::string& id,
                                                                   uint64_t generation) {
    std::lock_guard<std::mutex> lock(mutex_);
    const auto* rec = slot_for(id);
    if (!rec || rec->generation != generation) return std::nullopt;
    return remove_locked(id);
}

std::optional<SessionRecord> SessionRegistry::remove_if_expired(const std::string& id,
                                                                uint64_t generation,
                                                                SessionClock::time_point now,
                                                                SessionClock::duration ttl) {
    std::lock_guard<std::mutex> lock(mutex_);
    const auto* rec = slot_for(id);
    if (!rec || rec->generation != generation) return std::nullopt;
    if (now - rec->last_activity <= ttl) return std::nullopt;
    return remove_locked(id);
}
