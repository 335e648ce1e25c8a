#pragma once

#include "fetchd/core/result.hpp"
#include "fetchd/fetch/fetch_service.hpp"
#include "fetchd/jobs/types.hpp"

#include <string>

namespace fetchd::jobs {

/**
 * @brief Best-effort listing of a source's items without transferring content
 *
 * Entries the collaborator could not resolve are skipped and left out of the
 * total; only a listing that yields nothing at all is an error.
 */
class PreviewResolver {
public:
    explicit PreviewResolver(fetch::FetchService& fetch_service) : fetch_service_(fetch_service) {}

    Result<PreviewResult> preview(const std::string& source_ref);

    /**
     * @brief Build a preview from resolved metadata
     *
     * Shared with the runner's slow path so both paths count items the same way.
     */
    static PreviewResult from_metadata(const std::string& source_ref,
                                       const fetch::ResolvedMetadata& metadata);

private:
    fetch::FetchService& fetch_service_;
};

} // namespace fetchd::jobs
