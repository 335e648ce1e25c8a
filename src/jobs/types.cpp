#include "fetchd/jobs/types.hpp"

#include <algorithm>
#include <cctype>

namespace fetchd::jobs {

const char* to_string(JobPhase phase) noexcept {
    switch (phase) {
        case JobPhase::Ready: return "ready";
        case JobPhase::Processing: return "processing";
        case JobPhase::Starting: return "starting";
        case JobPhase::Downloading: return "downloading";
        case JobPhase::Finished: return "finished";
        case JobPhase::Canceled: return "canceled";
        case JobPhase::Error: return "error";
    }
    return "unknown";
}

const char* to_string(MediaKind kind) noexcept {
    switch (kind) {
        case MediaKind::Video: return "video";
        case MediaKind::Audio: return "audio";
    }
    return "unknown";
}

bool is_blank(const std::string& text) {
    return std::all_of(text.begin(), text.end(), [](unsigned char c) { return std::isspace(c) != 0; });
}

std::optional<MediaKind> media_kind_from_string(const std::string& text) {
    std::string lowered = text;
    std::transform(lowered.begin(), lowered.end(), lowered.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    if (lowered.empty() || lowered == "video") {
        return MediaKind::Video;
    }
    if (lowered == "audio") {
        return MediaKind::Audio;
    }
    return std::nullopt;
}

} // namespace fetchd::jobs
