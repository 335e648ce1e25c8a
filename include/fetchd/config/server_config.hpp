#pragma once

#include "fetchd/core/result.hpp"

#include <cstddef>
#include <cstdint>
#include <string>

#include <nlohmann/json_fwd.hpp>

namespace fetchd::config {

/**
 * @brief Runtime settings of the fetchd server
 *
 * Precedence: built-in defaults, then the JSON file named by --config, then
 * the remaining command-line flags.
 */
struct ServerConfig {
    uint16_t port = 5000;
    std::string video_dir = "~/Music";
    std::string audio_dir = "~/Music/YT-Downloader";
    std::string ytdlp_binary = "yt-dlp";
    std::size_t history_limit = 20;
    std::size_t io_threads = 1;
    std::string log_level = "info";
    bool show_help = false;
};

/**
 * @brief Build the configuration from argv
 *
 * Recognised flags: --config FILE, -p/--port N, --video-dir DIR,
 * --audio-dir DIR, --yt-dlp PATH, --history-limit N, --threads N,
 * --log-level LEVEL, -h/--help.
 *
 * @return ErrorKind::Config on unknown flags, missing values, unreadable
 *         files or out-of-range numbers
 */
Result<ServerConfig> load_config(int argc, const char* const* argv);

/**
 * @brief Overlay the keys present in `doc` onto `config`
 *
 * Keys: port, video_dir, audio_dir, yt_dlp, history_limit, threads, log_level.
 */
Result<void> apply_json(const nlohmann::json& doc, ServerConfig& config);

Result<void> apply_json_file(const std::string& path, ServerConfig& config);

Result<void> validate(const ServerConfig& config);

/**
 * @brief Replace a leading "~" with $HOME; other paths are returned unchanged
 */
std::string expand_home(const std::string& path);

std::string usage(const std::string& program_name);

} // namespace fetchd::config
