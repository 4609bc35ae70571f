#pragma once
#include <chrono>
#include <cstdint>
#include <string>

// Kind of envelope travelling from a producer to a consumer
enum class MsgKind { Data, Stop };

// Unit of work handed through the dispatch queue.
struct Message {
    MsgKind   kind{MsgKind::Data};

    // For Data only
    int       producer_id{-1};
    int64_t   seq{0};               // per-producer, starts at 0
    std::string topic;
    std::string body;

    // Stamped by the producer right before it enqueues
    std::chrono::steady_clock::time_point enqueued_at{};
};

inline Message make_stop_message() {
    Message m;
    m.kind = MsgKind::Stop;
    return m;
}
