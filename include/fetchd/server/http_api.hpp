#pragma once

#include "fetchd/events/components.hpp"
#include "fetchd/jobs/service.hpp"
#include "fetchd/network/http_router.hpp"

#include <string>
#include <unordered_map>

#include <nlohmann/json.hpp>

namespace fetchd::server {

constexpr const char* kSessionCookie = "fetchd_session";

/**
 * @brief Register the polling API on `router`
 *
 * POST /download  url, download_type, quality     202 | 400
 * GET  /progress                                  200
 * POST /cancel                                    200
 * POST /reset                                     200
 * POST /preview   url                             200 | 400
 * GET  /history                                   200
 * GET  /health                                    200
 *
 * Every route resolves the caller's session from the fetchd_session cookie
 * and sets the cookie when a new session had to be created. `service` and
 * `metrics` must outlive the router.
 */
void register_routes(network::HttpRouter& router,
                     jobs::JobService& service,
                     const events::MetricsComponent* metrics = nullptr);

nlohmann::json status_to_json(const jobs::JobStatus& status);
nlohmann::json preview_to_json(const jobs::PreviewResult& preview);
nlohmann::json record_to_json(const jobs::JobRecord& record);

/**
 * @brief Request fields from a JSON body, a form body or the query string
 *
 * The body wins over the query string. Non-string JSON values are rendered
 * with dump() so `"quality": 720` reads as "720".
 */
std::unordered_map<std::string, std::string> request_fields(const network::HttpContext& ctx);

} // namespace fetchd::server
