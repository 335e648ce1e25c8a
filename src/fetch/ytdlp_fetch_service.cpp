#include "fetchd/fetch/ytdlp_fetch_service.hpp"
#include "fetchd/jobs/progress.hpp"

#include <cctype>
#include <cerrno>
#include <cstring>

#include <fcntl.h>
#include <poll.h>
#include <signal.h>
#include <sys/wait.h>
#include <unistd.h>

#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>

namespace fetchd::fetch {
namespace {

bool starts_with(const std::string& text, const char* prefix) {
    return text.rfind(prefix, 0) == 0;
}

std::string trim(const std::string& text) {
    auto begin = text.find_first_not_of(" \t\r\n");
    if (begin == std::string::npos) {
        return {};
    }
    auto end = text.find_last_not_of(" \t\r\n");
    return text.substr(begin, end - begin + 1);
}

bool is_number(const std::string& text) {
    if (text.empty()) {
        return false;
    }
    for (unsigned char c : text) {
        if (!std::isdigit(c)) {
            return false;
        }
    }
    return true;
}

std::string output_template(const std::string& dir) {
    if (dir.empty()) {
        return "%(title)s.%(ext)s";
    }
    if (dir.back() == '/') {
        return dir + "%(title)s.%(ext)s";
    }
    return dir + "/%(title)s.%(ext)s";
}

ResolvedEntry entry_from_json(const nlohmann::json& node) {
    ResolvedEntry entry;
    if (!node.is_object()) {
        entry.resolved = false;
        return entry;
    }
    if (node.contains("title") && node["title"].is_string()) {
        entry.label = node["title"].get<std::string>();
    }
    if (node.contains("duration") && node["duration"].is_number()) {
        entry.duration_seconds = node["duration"].get<double>();
    }
    entry.resolved = !entry.label.empty();
    return entry;
}

// Appends raw bytes and hands out complete lines
class LineBuffer {
public:
    template<typename Fn>
    void feed(const char* data, std::size_t size, Fn&& on_line) {
        pending_.append(data, size);
        std::size_t start = 0;
        for (auto pos = pending_.find('\n'); pos != std::string::npos; pos = pending_.find('\n', start)) {
            on_line(pending_.substr(start, pos - start));
            start = pos + 1;
        }
        pending_.erase(0, start);
    }

    template<typename Fn>
    void flush(Fn&& on_line) {
        if (!pending_.empty()) {
            on_line(pending_);
            pending_.clear();
        }
    }

private:
    std::string pending_;
};

void close_fd(int& fd) {
    if (fd >= 0) {
        ::close(fd);
        fd = -1;
    }
}

} // namespace

// =============================================================================
// YtDlpOutputParser
// =============================================================================

std::optional<ProgressEvent> YtDlpOutputParser::parse_line(const std::string& raw_line) {
    const std::string line = trim(jobs::ProgressAggregator::strip_ansi(raw_line));

    if (starts_with(line, kDoneMarker)) {
        ProgressEvent event;
        event.kind = ProgressKind::ItemFinished;
        event.raw_percent = "100%";
        event.percent = 100.0;
        event.label = line.substr(std::strlen(kDoneMarker));
        return event;
    }

    if (!starts_with(line, kProgressMarker)) {
        return std::nullopt;
    }

    const std::string body = line.substr(std::strlen(kProgressMarker));
    const auto first = body.find('|');
    if (first == std::string::npos) {
        return std::nullopt;
    }
    const auto second = body.find('|', first + 1);
    if (second == std::string::npos) {
        return std::nullopt;
    }

    ProgressEvent event;
    event.kind = ProgressKind::Downloading;
    event.raw_percent = trim(body.substr(0, first));
    event.percent = jobs::ProgressAggregator::parse_percent(event.raw_percent).value_or(0.0);

    const std::string size = trim(body.substr(first + 1, second - first - 1));
    if (is_number(size)) {
        event.collection_size = static_cast<std::size_t>(std::stoull(size));
    }

    event.label = body.substr(second + 1);
    if (event.label == "NA") {
        event.label.clear();
    }
    return event;
}

Result<std::optional<ResolvedMetadata>> YtDlpOutputParser::parse_metadata(const std::string& json_text) {
    if (trim(json_text).empty()) {
        return Ok(std::optional<ResolvedMetadata>{});
    }

    auto doc = nlohmann::json::parse(json_text, nullptr, false);
    if (doc.is_discarded()) {
        return Err<std::optional<ResolvedMetadata>>(Error::resolution("yt-dlp printed malformed metadata"));
    }
    if (doc.is_null()) {
        return Ok(std::optional<ResolvedMetadata>{});
    }
    if (!doc.is_object()) {
        return Err<std::optional<ResolvedMetadata>>(Error::resolution("yt-dlp metadata is not an object"));
    }

    ResolvedMetadata metadata;
    if (doc.contains("title") && doc["title"].is_string()) {
        metadata.title = doc["title"].get<std::string>();
    }

    if (doc.contains("entries") && doc["entries"].is_array()) {
        metadata.is_collection = true;
        for (const auto& node : doc["entries"]) {
            metadata.entries.push_back(entry_from_json(node));
        }
    } else {
        metadata.entries.push_back(entry_from_json(doc));
    }

    return Ok(std::optional<ResolvedMetadata>(std::move(metadata)));
}

// =============================================================================
// YtDlpFetchService
// =============================================================================

YtDlpFetchService::YtDlpFetchService(YtDlpOptions options)
    : options_(std::move(options)) {
}

std::vector<std::string> YtDlpFetchService::build_resolve_args(const std::string& source_ref,
                                                               ResolveMode mode) const {
    std::vector<std::string> args{options_.binary, "-J", "--no-warnings"};
    if (mode == ResolveMode::FlatListing) {
        args.emplace_back("--flat-playlist");
        args.emplace_back("--ignore-errors");
    }
    args.emplace_back("--");
    args.push_back(source_ref);
    return args;
}

std::vector<std::string> YtDlpFetchService::build_fetch_args(const FetchRequest& request) const {
    std::vector<std::string> args{
        options_.binary,
        "--no-simulate",
        "--newline",
        "--progress",
        "--no-warnings",
        "--progress-template",
        std::string("download:") + YtDlpOutputParser::kProgressMarker +
            "%(progress._percent_str)s|%(info.playlist_count)s|%(info.title)s",
        "--print",
        std::string("after_move:") + YtDlpOutputParser::kDoneMarker + "%(title)s",
    };

    if (request.kind == jobs::MediaKind::Audio) {
        args.insert(args.end(), {"-f", "bestaudio", "-x", "--audio-format", "mp3"});
        if (!request.quality.empty()) {
            args.insert(args.end(), {"--audio-quality", request.quality});
        }
        args.insert(args.end(), {"-o", output_template(options_.audio_dir)});
    } else {
        if (is_number(request.quality)) {
            args.insert(args.end(), {"-f", "bestvideo[height<=" + request.quality + "]+bestaudio/best[height<=" +
                                               request.quality + "]"});
        } else {
            args.insert(args.end(), {"-f", "bestvideo+bestaudio/best"});
        }
        args.insert(args.end(), {"--merge-output-format", "mp4", "-o", output_template(options_.video_dir)});
    }

    args.emplace_back("--");
    args.push_back(request.source_ref);
    return args;
}

Result<std::optional<ResolvedMetadata>> YtDlpFetchService::resolve_metadata(const std::string& source_ref,
                                                                            ResolveMode mode) {
    std::string document;
    auto outcome = run_process(build_resolve_args(source_ref, mode), [&document](const std::string& line) {
        document += line;
        document += '\n';
        return Ok();
    });
    if (outcome.is_error()) {
        return propagate<std::optional<ResolvedMetadata>>(outcome);
    }

    const auto& process = outcome.value();
    if (process.exit_code != 0 && trim(document).empty()) {
        std::string reason = process.last_stderr_line.empty()
            ? "yt-dlp exited with status " + std::to_string(process.exit_code)
            : process.last_stderr_line;
        return Err<std::optional<ResolvedMetadata>>(Error::resolution(reason));
    }
    if (process.exit_code != 0) {
        // --ignore-errors still prints the listing but exits non-zero
        spdlog::debug("yt-dlp listing of {} exited with {}: {}", source_ref, process.exit_code,
                      process.last_stderr_line);
    }
    return YtDlpOutputParser::parse_metadata(document);
}

Result<void> YtDlpFetchService::fetch(const FetchRequest& request, const ProgressCallback& on_progress) {
    auto outcome = run_process(build_fetch_args(request), [&on_progress](const std::string& line) {
        auto event = YtDlpOutputParser::parse_line(line);
        if (!event) {
            return Ok();
        }
        return on_progress(*event);
    });
    if (outcome.is_error()) {
        return Err<void>(outcome.error());
    }

    const auto& process = outcome.value();
    if (process.aborted_by) {
        return Err<void>(*process.aborted_by);
    }
    if (process.exit_code == 127) {
        return Err<void>(Error::transfer("Could not run " + options_.binary));
    }
    if (process.exit_code != 0) {
        std::string reason = process.last_stderr_line.empty()
            ? "yt-dlp exited with status " + std::to_string(process.exit_code)
            : process.last_stderr_line;
        return Err<void>(Error::transfer(reason));
    }
    return Ok();
}

Result<YtDlpFetchService::ProcessOutcome> YtDlpFetchService::run_process(const std::vector<std::string>& args,
                                                                         const LineHandler& on_line) {
    // Close-on-exec: a concurrently spawned sibling must not inherit our write ends
    int stdout_pipe[2];
    int stderr_pipe[2];
    if (::pipe2(stdout_pipe, O_CLOEXEC) < 0) {
        return Err<ProcessOutcome>(Error::internal(std::string("pipe failed: ") + std::strerror(errno)));
    }
    if (::pipe2(stderr_pipe, O_CLOEXEC) < 0) {
        const int err = errno;
        ::close(stdout_pipe[0]);
        ::close(stdout_pipe[1]);
        return Err<ProcessOutcome>(Error::internal(std::string("pipe failed: ") + std::strerror(err)));
    }

    std::vector<char*> argv;
    argv.reserve(args.size() + 1);
    for (const auto& arg : args) {
        argv.push_back(const_cast<char*>(arg.c_str()));
    }
    argv.push_back(nullptr);

    spdlog::debug("Spawning {} with {} argument(s)", args.front(), args.size() - 1);

    const pid_t pid = ::fork();
    if (pid < 0) {
        const int err = errno;
        ::close(stdout_pipe[0]);
        ::close(stdout_pipe[1]);
        ::close(stderr_pipe[0]);
        ::close(stderr_pipe[1]);
        return Err<ProcessOutcome>(Error::internal(std::string("fork failed: ") + std::strerror(err)));
    }

    if (pid == 0) {
        // Own process group so SIGTERM also reaches ffmpeg
        ::setpgid(0, 0);
        int dev_null = ::open("/dev/null", O_RDONLY);
        if (dev_null >= 0) {
            ::dup2(dev_null, STDIN_FILENO);
            ::close(dev_null);
        }
        ::dup2(stdout_pipe[1], STDOUT_FILENO);
        ::dup2(stderr_pipe[1], STDERR_FILENO);
        ::close(stdout_pipe[0]);
        ::close(stdout_pipe[1]);
        ::close(stderr_pipe[0]);
        ::close(stderr_pipe[1]);
        ::execvp(argv[0], argv.data());
        ::_exit(127);
    }

    ::setpgid(pid, pid);
    ::close(stdout_pipe[1]);
    ::close(stderr_pipe[1]);
    int out_fd = stdout_pipe[0];
    int err_fd = stderr_pipe[0];

    ProcessOutcome outcome;
    LineBuffer out_lines;
    LineBuffer err_lines;

    auto handle_stdout = [&](const std::string& line) {
        if (outcome.aborted_by) {
            return;
        }
        auto handled = on_line(line);
        if (handled.is_error()) {
            outcome.aborted_by = handled.error();
        }
    };
    auto handle_stderr = [&](const std::string& line) {
        auto text = trim(jobs::ProgressAggregator::strip_ansi(line));
        if (!text.empty()) {
            outcome.last_stderr_line = std::move(text);
        }
    };

    char buffer[4096];
    while ((out_fd >= 0 || err_fd >= 0) && !outcome.aborted_by) {
        pollfd fds[2];
        fds[0] = {out_fd, POLLIN, 0};
        fds[1] = {err_fd, POLLIN, 0};

        const int ready = ::poll(fds, 2, -1);
        if (ready < 0) {
            if (errno == EINTR) {
                continue;
            }
            spdlog::error("poll on {} output failed: {}", args.front(), std::strerror(errno));
            break;
        }

        if (out_fd >= 0 && (fds[0].revents & (POLLIN | POLLHUP | POLLERR))) {
            const ssize_t n = ::read(out_fd, buffer, sizeof(buffer));
            if (n > 0) {
                out_lines.feed(buffer, static_cast<std::size_t>(n), handle_stdout);
            } else if (n == 0 || errno != EINTR) {
                out_lines.flush(handle_stdout);
                close_fd(out_fd);
            }
        }
        if (err_fd >= 0 && (fds[1].revents & (POLLIN | POLLHUP | POLLERR))) {
            const ssize_t n = ::read(err_fd, buffer, sizeof(buffer));
            if (n > 0) {
                err_lines.feed(buffer, static_cast<std::size_t>(n), handle_stderr);
            } else if (n == 0 || errno != EINTR) {
                err_lines.flush(handle_stderr);
                close_fd(err_fd);
            }
        }
    }

    if (outcome.aborted_by) {
        spdlog::info("Stopping {} (pid {}): {}", args.front(), pid, outcome.aborted_by->message);
        ::kill(-pid, SIGTERM);
    }
    close_fd(out_fd);
    close_fd(err_fd);

    int status = 0;
    while (::waitpid(pid, &status, 0) < 0) {
        if (errno != EINTR) {
            return Err<ProcessOutcome>(Error::internal(std::string("waitpid failed: ") + std::strerror(errno)));
        }
    }

    if (WIFEXITED(status)) {
        outcome.exit_code = WEXITSTATUS(status);
    } else if (WIFSIGNALED(status)) {
        outcome.exit_code = 128 + WTERMSIG(status);
    }
    spdlog::debug("{} (pid {}) exited with {}", args.front(), pid, outcome.exit_code);
    return Ok(std::move(outcome));
}

} // namespace fetchd::fetch
