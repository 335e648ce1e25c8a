#pragma once

#include "fetchd/core/result.hpp"
#include "fetchd/jobs/types.hpp"

#include <functional>
#include <optional>
#include <string>
#include <vector>

namespace fetchd::fetch {

enum class ProgressKind {
    Downloading,
    ItemFinished
};

/**
 * @brief One low-level progress notification from the collaborator
 *
 * `percent` is already parsed from `raw_percent`; `collection_size` is
 * non-zero only when the collaborator happens to know the playlist length.
 */
struct ProgressEvent {
    ProgressKind kind = ProgressKind::Downloading;
    std::string raw_percent;
    double percent = 0.0;
    std::string label;
    std::size_t collection_size = 0;
};

/**
 * @brief Return an error (normally ErrorKind::Canceled) to make the fetch stop
 */
using ProgressCallback = std::function<Result<void>(const ProgressEvent&)>;

enum class ResolveMode {
    Full,        ///< Prepare everything a transfer needs
    FlatListing  ///< List collection entries only
};

struct ResolvedEntry {
    std::string label;
    std::optional<double> duration_seconds;
    bool resolved = true;   ///< False when the entry could not be listed
};

struct ResolvedMetadata {
    std::string title;
    bool is_collection = false;
    std::vector<ResolvedEntry> entries;
};

struct FetchRequest {
    std::string source_ref;
    jobs::MediaKind kind = jobs::MediaKind::Video;
    std::string quality;
};

/**
 * @brief Contract of the external media-extraction collaborator
 *
 * Both calls are synchronous and may block for a long time. `fetch` must
 * invoke the callback on the calling thread and stop as soon as the callback
 * returns an error, handing that same error back.
 */
class FetchService {
public:
    virtual ~FetchService() = default;

    /**
     * @return nullopt when the reference resolves to nothing usable
     */
    virtual Result<std::optional<ResolvedMetadata>> resolve_metadata(const std::string& source_ref,
                                                                     ResolveMode mode) = 0;

    virtual Result<void> fetch(const FetchRequest& request, const ProgressCallback& on_progress) = 0;
};

} // namespace fetchd::fetch
