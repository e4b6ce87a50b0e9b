#include "delivery_queue.hpp"
#include "session_log.hpp"
#include <fmt/format.h>
#include <exception>

const char* delivery_kind_name(DeliveryKind kind) {
    switch (kind) {
        case DeliveryKind::Response:       return "response";
        case DeliveryKind::DecisionPrompt: return "decision";
        case DeliveryKind::Failure:        return "failure";
        case DeliveryKind::Superseded:     return "superseded";
    }
    return "unknown";
}

DeliveryQueue::DeliveryQueue(ResponseSink& sink) : sink_(sink) {}

DeliveryQueue::~DeliveryQueue() {
    stop();
}

void DeliveryQueue::push(Delivery delivery) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        queue_.push_back(std::move(delivery));
    }
    cv_.notify_one();
}

void DeliveryQueue::start() {
    if (running_) return;
    running_ = true;
    thread_ = std::thread(&DeliveryQueue::run_loop, this);
}

void DeliveryQueue::stop() {
    if (!running_) return;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        running_ = false;
    }
    cv_.notify_all();
    if (thread_.joinable()) thread_.join();
    drain();
}

size_t DeliveryQueue::drain() {
    size_t count = 0;
    while (true) {
        Delivery next;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            if (queue_.empty()) return count;
            next = std::move(queue_.front());
            queue_.pop_front();
        }
        deliver_one(next);
        ++count;
    }
}

size_t DeliveryQueue::pending() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return queue_.size();
}

void DeliveryQueue::run_loop() {
    while (true) {
        Delivery next;
        {
            std::unique_lock<std::mutex> lock(mutex_);
            cv_.wait(lock, [this] { return !running_ || !queue_.empty(); });
            if (queue_.empty()) return;
            next = std::move(queue_.front());
            queue_.pop_front();
        }
        deliver_one(next);
    }
}

void DeliveryQueue::deliver_one(const Delivery& delivery) {
    try {
        sink_.deliver(delivery);
        agentmux_log(fmt::format("delivery: {} {} to {} ({} chunks)",
                                 delivery_kind_name(delivery.kind),
                                 delivery.conversation_id, delivery.target,
                                 delivery.chunks.size()));
    } catch (const std::exception& e) {
        agentmux_log(fmt::format("delivery: sink failed for {}: {}",
                                 delivery.conversation_id, e.what()));
    }
}
