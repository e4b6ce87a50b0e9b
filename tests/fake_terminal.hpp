#pragma once

#include <atomic>
#include <deque>
#include <map>
#include <mutex>
#include <set>
#include <string>
#include <utility>
#include <vector>
#include <terminal/terminal_driver.hpp>
#include <managers/delivery_queue.hpp>

// In-memory terminal backend. Each terminal plays a queue of screens;
// the last one stays on screen until replaced.
class FakeTerminalDriver : public TerminalDriver {
public:
    Result<void> create(const TerminalSpec& spec) override {
        std::lock_guard<std::mutex> lock(mutex_);
        ++create_calls;
        if (fail_create) return Result<void>::Err("no pty available");
        live_.insert(spec.name);
        if (screens_.find(spec.name) == screens_.end()) {
            screens_[spec.name] = {initial_screen};
        }
        created.push_back(spec);
        return Result<void>::Ok();
    }

    Result<void> send_literal(const TerminalHandle& h, const std::string& text) override {
        std::lock_guard<std::mutex> lock(mutex_);
        if (!live_.count(h.name)) return Result<void>::Err("no such terminal");
        inputs.push_back({h.name, "text:" + text});
        return Result<void>::Ok();
    }

    Result<void> send_key(const TerminalHandle& h, const std::string& key) override {
        std::lock_guard<std::mutex> lock(mutex_);
        if (!live_.count(h.name)) return Result<void>::Err("no such terminal");
        inputs.push_back({h.name, "key:" + key});
        return Result<void>::Ok();
    }

    std::string capture(const TerminalHandle& h) override {
        std::lock_guard<std::mutex> lock(mutex_);
        ++capture_calls;
        if (!live_.count(h.name)) return "";
        auto& q = screens_[h.name];
        if (q.empty()) return "";
        std::string screen = q.front();
        if (q.size() > 1) q.pop_front();
        return screen;
    }

    void destroy(const TerminalHandle& h) override {
        std::lock_guard<std::mutex> lock(mutex_);
        live_.erase(h.name);
        destroyed.push_back(h.name);
    }

    bool exists(const TerminalHandle& h) override {
        std::lock_guard<std::mutex> lock(mutex_);
        return live_.count(h.name) > 0;
    }

    // ── Test controls ──────────────────────────────────────

    void set_screen(const std::string& name, const std::string& screen) {
        std::lock_guard<std::mutex> lock(mutex_);
        screens_[name] = {screen};
    }

    void play(const std::string& name, std::vector<std::string> screens) {
        std::lock_guard<std::mutex> lock(mutex_);
        screens_[name] = std::deque<std::string>(screens.begin(), screens.end());
    }

    // The agent exits on its own.
    void vanish(const std::string& name) {
        std::lock_guard<std::mutex> lock(mutex_);
        live_.erase(name);
    }

    std::vector<std::string> inputs_for(const std::string& name) {
        std::lock_guard<std::mutex> lock(mutex_);
        std::vector<std::string> out;
        for (const auto& [n, input] : inputs) {
            if (n == name) out.push_back(input);
        }
        return out;
    }

    std::string last_created() {
        std::lock_guard<std::mutex> lock(mutex_);
        return created.empty() ? "" : created.back().name;
    }

    std::string initial_screen = "\n> \n";
    bool fail_create = false;
    std::atomic<int> create_calls{0};
    std::atomic<int> capture_calls{0};
    std::vector<TerminalSpec> created;
    std::vector<std::pair<std::string, std::string>> inputs;
    std::vector<std::string> destroyed;

private:
    std::mutex mutex_;
    std::set<std::string> live_;
    std::map<std::string, std::deque<std::string>> screens_;
};

// Keeps every delivery for inspection.
class RecordingSink : public ResponseSink {
public:
    void deliver(const Delivery& delivery) override {
        std::lock_guard<std::mutex> lock(mutex_);
        deliveries_.push_back(delivery);
    }

    std::vector<Delivery> deliveries() {
        std::lock_guard<std::mutex> lock(mutex_);
        return deliveries_;
    }

    size_t count() {
        std::lock_guard<std::mutex> lock(mutex_);
        return deliveries_.size();
    }

private:
    std::mutex mutex_;
    std::vector<Delivery> deliveries_;
};
