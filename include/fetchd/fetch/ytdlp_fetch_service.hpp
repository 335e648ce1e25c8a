#pragma once

#include "fetchd/core/result.hpp"
#include "fetchd/fetch/fetch_service.hpp"

#include <functional>
#include <optional>
#include <string>
#include <vector>

namespace fetchd::fetch {

struct YtDlpOptions {
    std::string binary = "yt-dlp";
    std::string video_dir;
    std::string audio_dir;
};

/**
 * @brief Turns yt-dlp's stdout into engine events
 *
 * The adapter asks yt-dlp for two kinds of machine-readable lines:
 *   FETCHD_PROGRESS|<percent>|<playlist size or NA>|<title>
 *   FETCHD_DONE|<title>
 * The title comes last so a '|' inside it survives.
 */
class YtDlpOutputParser {
public:
    static constexpr const char* kProgressMarker = "FETCHD_PROGRESS|";
    static constexpr const char* kDoneMarker = "FETCHD_DONE|";

    /**
     * @return nullopt for lines that are neither progress nor completion
     */
    static std::optional<ProgressEvent> parse_line(const std::string& line);

    /**
     * @brief Parse the document printed by `yt-dlp -J`
     *
     * Null entries and entries without a title are kept with resolved = false.
     * @return nullopt when the document is empty or `null`
     */
    static Result<std::optional<ResolvedMetadata>> parse_metadata(const std::string& json_text);
};

/**
 * @brief FetchService backed by the yt-dlp executable
 *
 * Every call spawns one child process (fork/execvp, no shell) and reads its
 * stdout line by line on the calling thread. When the progress callback
 * returns an error the whole process group receives SIGTERM.
 */
class YtDlpFetchService : public FetchService {
public:
    explicit YtDlpFetchService(YtDlpOptions options);

    Result<std::optional<ResolvedMetadata>> resolve_metadata(const std::string& source_ref,
                                                             ResolveMode mode) override;

    Result<void> fetch(const FetchRequest& request, const ProgressCallback& on_progress) override;

    [[nodiscard]] std::vector<std::string> build_resolve_args(const std::string& source_ref,
                                                              ResolveMode mode) const;
    [[nodiscard]] std::vector<std::string> build_fetch_args(const FetchRequest& request) const;

private:
    struct ProcessOutcome {
        int exit_code = -1;
        std::string last_stderr_line;
        std::optional<Error> aborted_by;   ///< Set when the line handler stopped the child
    };

    using LineHandler = std::function<Result<void>(const std::string&)>;

    Result<ProcessOutcome> run_process(const std::vector<std::string>& args, const LineHandler& on_line);

    YtDlpOptions options_;
};

} // namespace fetchd::fetch
