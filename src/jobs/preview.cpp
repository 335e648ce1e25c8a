#include "fetchd/jobs/preview.hpp"

#include <spdlog/spdlog.h>

namespace fetchd::jobs {

Result<PreviewResult> PreviewResolver::preview(const std::string& source_ref) {
    if (is_blank(source_ref)) {
        return Err<PreviewResult>(Error::input("Missing URL"));
    }

    auto listing = fetch_service_.resolve_metadata(source_ref, fetch::ResolveMode::FlatListing);
    if (listing.is_error()) {
        return Err<PreviewResult>(Error::resolution("Could not fetch info: " + listing.error().message));
    }
    if (!listing.value()) {
        return Err<PreviewResult>(Error::resolution("Could not fetch info: nothing found at " + source_ref));
    }

    auto result = from_metadata(source_ref, *listing.value());
    if (result.total == 0) {
        return Err<PreviewResult>(Error::resolution("Could not fetch info: no resolvable items at " + source_ref));
    }

    spdlog::info("Preview of {} lists {} item(s)", source_ref, result.total);
    return Ok(std::move(result));
}

PreviewResult PreviewResolver::from_metadata(const std::string& source_ref,
                                             const fetch::ResolvedMetadata& metadata) {
    PreviewResult result;
    result.source_ref = source_ref;
    result.title = metadata.title;

    if (!metadata.is_collection) {
        result.total = 1;
        result.manifest.push_back(ManifestEntry{metadata.title, std::nullopt, false});
        if (!metadata.entries.empty()) {
            result.manifest.front().duration_seconds = metadata.entries.front().duration_seconds;
        }
        return result;
    }

    std::size_t skipped = 0;
    for (const auto& entry : metadata.entries) {
        if (!entry.resolved) {
            ++skipped;
            continue;
        }
        result.manifest.push_back(ManifestEntry{entry.label, entry.duration_seconds, false});
    }
    result.total = result.manifest.size();

    if (skipped > 0) {
        spdlog::debug("Skipped {} unresolvable entr{} of {}", skipped, skipped == 1 ? "y" : "ies", source_ref);
    }
    return result;
}

} // namespace fetchd::jobs
