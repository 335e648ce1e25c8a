/**
 * @file events.hpp
 * @brief Job lifecycle events
 *
 * NAMING CONVENTION:
 * Events are past tense: JobSubmittedEvent, ItemFinishedEvent
 */

#pragma once

#include "fetchd/jobs/types.hpp"

#include <chrono>
#include <cstdint>
#include <string>

namespace fetchd::events {

// ════════════════════════════════════════════════════════
// Server Events
// ════════════════════════════════════════════════════════

struct ServerStartedEvent {
    uint16_t port;
    std::chrono::system_clock::time_point timestamp{std::chrono::system_clock::now()};
};

struct ServerShuttingDownEvent {
    std::string reason;
    std::chrono::system_clock::time_point timestamp{std::chrono::system_clock::now()};
};

// ════════════════════════════════════════════════════════
// Job Events
// ════════════════════════════════════════════════════════

/**
 * @brief Emitted once a submit passed validation and a worker was dispatched
 */
struct JobSubmittedEvent {
    std::string session_id;
    std::uint64_t generation;
    std::string source_ref;
    jobs::MediaKind kind;
    bool fast_path;
    std::chrono::system_clock::time_point timestamp{std::chrono::system_clock::now()};
};

struct JobPhaseChangedEvent {
    std::string session_id;
    std::uint64_t generation;
    jobs::JobPhase from;
    jobs::JobPhase to;
    std::chrono::system_clock::time_point timestamp{std::chrono::system_clock::now()};
};

struct ItemFinishedEvent {
    std::string session_id;
    std::string label;
    std::size_t items_completed;
    std::size_t items_total;
    std::chrono::system_clock::time_point timestamp{std::chrono::system_clock::now()};
};

struct JobFinishedEvent {
    std::string session_id;
    std::string source_ref;
    std::string title;
    std::size_t item_count;
    std::chrono::milliseconds duration{0};
    std::chrono::system_clock::time_point timestamp{std::chrono::system_clock::now()};
};

struct JobCanceledEvent {
    std::string session_id;
    std::string source_ref;
    std::size_t items_completed;
    std::chrono::system_clock::time_point timestamp{std::chrono::system_clock::now()};
};

struct JobFailedEvent {
    std::string session_id;
    std::string source_ref;
    std::string error_message;
    std::chrono::system_clock::time_point timestamp{std::chrono::system_clock::now()};
};

/**
 * @brief A superseded worker tried to write after its session was reset
 */
struct StaleUpdateDroppedEvent {
    std::string session_id;
    std::uint64_t stale_generation;
    std::chrono::system_clock::time_point timestamp{std::chrono::system_clock::now()};
};

} // namespace fetchd::events
