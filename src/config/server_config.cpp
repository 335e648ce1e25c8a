#include "fetchd/config/server_config.hpp"

#include <cstdlib>
#include <fstream>
#include <limits>
#include <sstream>
#include <stdexcept>

#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>

namespace fetchd::config {
namespace {

Result<std::size_t> parse_count(const std::string& flag, const std::string& text) {
    if (text.empty() || text.find_first_not_of("0123456789") != std::string::npos) {
        return Err<std::size_t>(Error::config("Invalid value for " + flag + ": '" + text + "'"));
    }
    try {
        return Ok(static_cast<std::size_t>(std::stoull(text)));
    } catch (const std::out_of_range&) {
        return Err<std::size_t>(Error::config("Value for " + flag + " is too large: " + text));
    }
}

Result<uint16_t> parse_port(const std::string& flag, const std::string& text) {
    auto value = parse_count(flag, text);
    if (value.is_error()) {
        return propagate<uint16_t>(value);
    }
    if (value.value() == 0 || value.value() > std::numeric_limits<uint16_t>::max()) {
        return Err<uint16_t>(Error::config("Port out of range: " + text));
    }
    return Ok(static_cast<uint16_t>(value.value()));
}

template<typename T>
Result<T> read_key(const nlohmann::json& doc, const char* key) {
    try {
        return Ok(doc.at(key).get<T>());
    } catch (const nlohmann::json::exception& e) {
        return Err<T>(Error::config(std::string("Bad config key '") + key + "': " + e.what()));
    }
}

bool is_known_level(const std::string& level) {
    return spdlog::level::from_str(level) != spdlog::level::off || level == "off";
}

} // namespace

std::string expand_home(const std::string& path) {
    if (path.empty() || path[0] != '~') {
        return path;
    }
    if (path.size() > 1 && path[1] != '/') {
        return path;   // ~user is left alone
    }
    const char* home = std::getenv("HOME");
    if (home == nullptr || *home == '\0') {
        return path;
    }
    return std::string(home) + path.substr(1);
}

Result<void> apply_json(const nlohmann::json& doc, ServerConfig& config) {
    if (!doc.is_object()) {
        return Err<void>(Error::config("Config file must contain a JSON object"));
    }

    if (doc.contains("port")) {
        auto port = read_key<unsigned>(doc, "port");
        if (port.is_error()) {
            return propagate<void>(port);
        }
        if (port.value() == 0 || port.value() > std::numeric_limits<uint16_t>::max()) {
            return Err<void>(Error::config("Port out of range: " + std::to_string(port.value())));
        }
        config.port = static_cast<uint16_t>(port.value());
    }

    struct StringKey {
        const char* key;
        std::string* target;
    };
    for (const auto& [key, target] : {StringKey{"video_dir", &config.video_dir},
                                      StringKey{"audio_dir", &config.audio_dir},
                                      StringKey{"yt_dlp", &config.ytdlp_binary},
                                      StringKey{"log_level", &config.log_level}}) {
        if (!doc.contains(key)) {
            continue;
        }
        auto value = read_key<std::string>(doc, key);
        if (value.is_error()) {
            return propagate<void>(value);
        }
        *target = value.value();
    }

    if (doc.contains("history_limit")) {
        auto limit = read_key<std::size_t>(doc, "history_limit");
        if (limit.is_error()) {
            return propagate<void>(limit);
        }
        config.history_limit = limit.value();
    }
    if (doc.contains("threads")) {
        auto threads = read_key<std::size_t>(doc, "threads");
        if (threads.is_error()) {
            return propagate<void>(threads);
        }
        config.io_threads = threads.value();
    }
    return Ok();
}

Result<void> apply_json_file(const std::string& path, ServerConfig& config) {
    std::ifstream in(expand_home(path));
    if (!in) {
        return Err<void>(Error::config("Cannot open config file: " + path));
    }

    auto doc = nlohmann::json::parse(in, nullptr, false);
    if (doc.is_discarded()) {
        return Err<void>(Error::config("Config file is not valid JSON: " + path));
    }
    spdlog::debug("Loaded config file {}", path);
    return apply_json(doc, config);
}

Result<void> validate(const ServerConfig& config) {
    if (config.history_limit == 0) {
        return Err<void>(Error::config("history_limit must be at least 1"));
    }
    if (config.io_threads == 0) {
        return Err<void>(Error::config("threads must be at least 1"));
    }
    if (config.ytdlp_binary.empty()) {
        return Err<void>(Error::config("yt-dlp path must not be empty"));
    }
    if (config.video_dir.empty() || config.audio_dir.empty()) {
        return Err<void>(Error::config("Output directories must not be empty"));
    }
    if (!is_known_level(config.log_level)) {
        return Err<void>(Error::config("Unknown log level: " + config.log_level));
    }
    return Ok();
}

Result<ServerConfig> load_config(int argc, const char* const* argv) {
    ServerConfig config;

    // The file is applied first so flags win regardless of their position
    for (int i = 1; i < argc; ++i) {
        if (std::string(argv[i]) == "--config") {
            if (i + 1 >= argc) {
                return Err<ServerConfig>(Error::config("--config requires a value"));
            }
            auto loaded = apply_json_file(argv[i + 1], config);
            if (loaded.is_error()) {
                return propagate<ServerConfig>(loaded);
            }
        }
    }

    for (int i = 1; i < argc; ++i) {
        const std::string arg = argv[i];

        if (arg == "-h" || arg == "--help") {
            config.show_help = true;
            continue;
        }

        if (i + 1 >= argc) {
            return Err<ServerConfig>(Error::config(arg.rfind('-', 0) == 0 ? arg + " requires a value"
                                                                           : "Unknown option: " + arg));
        }
        const std::string value = argv[++i];

        if (arg == "--config") {
            continue;
        } else if (arg == "-p" || arg == "--port") {
            auto port = parse_port(arg, value);
            if (port.is_error()) {
                return propagate<ServerConfig>(port);
            }
            config.port = port.value();
        } else if (arg == "--video-dir") {
            config.video_dir = value;
        } else if (arg == "--audio-dir") {
            config.audio_dir = value;
        } else if (arg == "--yt-dlp") {
            config.ytdlp_binary = value;
        } else if (arg == "--history-limit") {
            auto limit = parse_count(arg, value);
            if (limit.is_error()) {
                return propagate<ServerConfig>(limit);
            }
            config.history_limit = limit.value();
        } else if (arg == "--threads") {
            auto threads = parse_count(arg, value);
            if (threads.is_error()) {
                return propagate<ServerConfig>(threads);
            }
            config.io_threads = threads.value();
        } else if (arg == "--log-level") {
            config.log_level = value;
        } else {
            return Err<ServerConfig>(Error::config("Unknown option: " + arg));
        }
    }

    config.video_dir = expand_home(config.video_dir);
    config.audio_dir = expand_home(config.audio_dir);

    auto valid = validate(config);
    if (valid.is_error()) {
        return propagate<ServerConfig>(valid);
    }
    return Ok(std::move(config));
}

std::string usage(const std::string& program_name) {
    std::ostringstream out;
    out << "Usage: " << program_name << " [options]\n"
        << "\n"
        << "Options:\n"
        << "  --config FILE         JSON file with default settings\n"
        << "  -p, --port N          Listen port (default 5000)\n"
        << "  --video-dir DIR       Output directory for video jobs (default ~/Music)\n"
        << "  --audio-dir DIR       Output directory for audio jobs (default ~/Music/YT-Downloader)\n"
        << "  --yt-dlp PATH         yt-dlp executable (default yt-dlp)\n"
        << "  --history-limit N     Completed jobs kept per session (default 20)\n"
        << "  --threads N           I/O threads for the HTTP server (default 1)\n"
        << "  --log-level LEVEL     trace, debug, info, warn, err, critical, off\n"
        << "  -h, --help            Show this help\n";
    return out.str();
}

} // namespace fetchd::config
