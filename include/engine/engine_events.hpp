#pragma once

#include "engine/event_queue.hpp"
#include "execution/order.hpp"
#include "market/market_view.hpp"

#include <chrono>
#include <string>
#include <variant>

namespace ramm {

struct SnapshotEvent {
    MarketSnapshot snapshot;
    std::chrono::steady_clock::time_point received = std::chrono::steady_clock::now();
};

struct FillEvent {
    Fill fill;
};

// ERROR message from the exchange; logged, never fatal.
struct ErrorEvent {
    std::string message;
};

struct AuthenticatedEvent {};

// A channel closed or failed, or the replay ran out. Ends the event loop.
struct DisconnectedEvent {
    std::string reason;
    bool        error = false;
};

using EngineEvent = std::variant<SnapshotEvent, FillEvent, ErrorEvent,
                                 AuthenticatedEvent, DisconnectedEvent>;

using EngineEventQueue = EventQueue<EngineEvent>;

} // namespace ramm
