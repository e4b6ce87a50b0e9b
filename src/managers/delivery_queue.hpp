#pragma once

#include <atomic>
#include <condition_variable>
#include <deque>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

enum class DeliveryKind {
    Response,         // the agent's answer
    DecisionPrompt,   // agent is asking for permission (Normal mode)
    Failure,          // the agent could not be started
    Superseded,       // a newer message replaced this request
};

const char* delivery_kind_name(DeliveryKind kind);

// One message for the chat side, already split into postable chunks.
struct Delivery {
    std::string conversation_id;
    std::string target;
    std::string request_id;
    DeliveryKind kind = DeliveryKind::Response;
    std::vector<std::string> chunks;
};

// Where deliveries end up (chat adapter, console, test recorder).
// Chunks must be posted in order.
class ResponseSink {
public:
    virtual ~ResponseSink() = default;
    virtual void deliver(const Delivery& delivery) = 0;
};

// FIFO between the session side and the sink. Producers never call the
// sink directly; a dedicated thread (or drain()) does.
class DeliveryQueue {
public:
    explicit DeliveryQueue(ResponseSink& sink);
    ~DeliveryQueue();

    void push(Delivery delivery);

    void start();
    // Deliver what is queued, then join.
    void stop();

    // Deliver everything queued on the calling thread. Returns the count.
    size_t drain();

    size_t pending() const;

private:
    void run_loop();
    void deliver_one(const Delivery& delivery);

    ResponseSink& sink_;
    mutable std::mutex mutex_;
    std::condition_variable cv_;
    std::deque<Delivery> queue_;
    std::atomic<bool> running_{false};
    std::thread thread_;
};
