#pragma once

#include <mutex>
#include <ostream>
#include <string>
#include <managers/delivery_queue.hpp>

// Prints deliveries to the terminal, for driving agents from the REPL
// without a chat platform. Deliveries arrive on the queue's thread; while
// output is held (readline owns the terminal) the formatted text is kept
// until the thread that owns the terminal calls flush_pending().
class ConsoleSink : public ResponseSink {
public:
    explicit ConsoleSink(std::ostream& out);

    void deliver(const Delivery& delivery) override;

    // Releasing the hold writes anything still pending.
    void hold_output(bool held);

    // Write pending output. True if anything was written.
    bool flush_pending();

private:
    std::ostream& out_;
    std::mutex mutex_;
    bool held_ = false;
    std::string pending_;
};

// Text block shown for one delivery (no colors), chunks separated by rules.
std::string render_delivery(const Delivery& delivery);
