#pragma once

#include <chrono>
#include <cstdint>
#include <deque>
#include <optional>
#include <string>
#include <unordered_set>
#include <vector>

namespace fetchd::jobs {

enum class JobPhase {
    Ready,
    Processing,
    Starting,
    Downloading,
    Finished,
    Canceled,
    Error
};

const char* to_string(JobPhase phase) noexcept;

[[nodiscard]] inline bool is_terminal(JobPhase phase) noexcept {
    return phase == JobPhase::Finished || phase == JobPhase::Canceled || phase == JobPhase::Error;
}

enum class MediaKind {
    Video,
    Audio
};

const char* to_string(MediaKind kind) noexcept;

/**
 * @brief True for an empty or whitespace-only source reference
 */
bool is_blank(const std::string& text);

std::optional<MediaKind> media_kind_from_string(const std::string& text);

/**
 * @brief One discovered item of a job, in discovery order
 */
struct ManifestEntry {
    std::string label;
    std::optional<double> duration_seconds;
    bool completed = false;
};

/**
 * @brief Live status of the in-flight or most recently finished job
 */
struct JobState {
    JobPhase phase = JobPhase::Ready;
    std::string source_ref;
    MediaKind kind = MediaKind::Video;
    std::string quality;
    std::string title;

    std::size_t items_total = 0;
    bool items_total_revised = false;    ///< Upward revision is allowed once
    std::size_t items_completed = 0;

    std::string current_item_label;
    std::string current_item_raw_progress;
    double overall_percent = 0.0;

    std::vector<ManifestEntry> manifest;
    std::vector<std::string> completed_items;
    std::optional<std::string> error_message; ///< Populated when phase == Error
};

/**
 * @brief Immutable history entry, written once per successful job
 */
struct JobRecord {
    std::chrono::system_clock::time_point timestamp{};
    std::string source_ref;
    MediaKind kind = MediaKind::Video;
    std::string quality;
    std::string title;
    std::size_t item_count = 0;
};

/**
 * @brief What a client asks for when submitting a job
 */
struct JobRequest {
    std::string source_ref;
    MediaKind kind = MediaKind::Video;
    std::string quality;
};

/**
 * @brief Result of a lightweight listing pass
 */
struct PreviewResult {
    std::string source_ref;
    std::string title;
    std::size_t total = 0;
    std::vector<ManifestEntry> manifest;
};

struct Session {
    std::string id;
    std::uint64_t generation = 0;
    std::optional<JobState> job;
    bool cancel_requested = false;
    std::deque<JobRecord> history;
    std::unordered_set<std::string> known_items;
    std::optional<PreviewResult> preview;
};

/**
 * @brief Snapshot handed to pollers; always well-formed, even for unknown sessions
 */
struct JobStatus {
    std::string session_id;
    std::uint64_t generation = 0;
    JobState job;
    bool cancel_requested = false;
    std::size_t history_size = 0;
};

struct SubmitReceipt {
    std::string session_id;
    std::uint64_t generation = 0;
    bool fast_path = false;
};

} // namespace fetchd::jobs
