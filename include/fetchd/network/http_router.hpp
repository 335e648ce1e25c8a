#pragma once

#include "fetchd/network/http_types.hpp"

#include <functional>
#include <regex>
#include <string>
#include <unordered_map>
#include <vector>

namespace fetchd {
namespace network {

/**
 * @brief Request context with route and query parameters
 */
struct HttpContext {
    const HttpRequest& request;
    std::unordered_map<std::string, std::string> params;  // URL parameters like :id
    std::unordered_map<std::string, std::string> query;   // Decoded query string

    explicit HttpContext(const HttpRequest& req) : request(req) {}

    std::string get_param(const std::string& name, const std::string& default_value = "") const {
        auto it = params.find(name);
        return (it != params.end()) ? it->second : default_value;
    }

    bool has_param(const std::string& name) const {
        return params.find(name) != params.end();
    }

    std::string get_query(const std::string& name, const std::string& default_value = "") const {
        auto it = query.find(name);
        return (it != query.end()) ? it->second : default_value;
    }

    std::string get_cookie(const std::string& name) const {
        auto cookies = HttpFieldUtils::parse_cookies(request.get_header("Cookie"));
        auto it = cookies.find(name);
        return (it != cookies.end()) ? it->second : std::string();
    }
};

using RouteHandler = std::function<HttpResponse(const HttpContext&)>;

/**
 * @brief Runs before route handlers; return false to short-circuit with `res`
 */
using Middleware = std::function<bool(const HttpContext&, HttpResponse&)>;

struct Route {
    HttpMethod method;
    std::string pattern;
    std::regex regex;
    std::vector<std::string> param_names;
    RouteHandler handler;

    Route(HttpMethod m, const std::string& pat, RouteHandler h);

    bool matches(HttpMethod method, const std::string& path) const;
    bool matches_path(const std::string& path) const;
    std::unordered_map<std::string, std::string> extract_params(const std::string& path) const;
};

/**
 * @brief Method and path based request dispatch
 *
 * Routes match on the path only; the query string is decoded into
 * HttpContext::query. A path that matches under another method yields 405.
 *
 * @code
 * HttpRouter router;
 * router.get("/progress", [](const HttpContext& ctx) {
 *     HttpResponse res(HttpStatus::OK);
 *     res.set_body("...");
 *     return res;
 * });
 * @endcode
 */
class HttpRouter {
public:
    HttpRouter();

    void get(const std::string& pattern, RouteHandler handler);
    void post(const std::string& pattern, RouteHandler handler);
    void add_route(HttpMethod method, const std::string& pattern, RouteHandler handler);

    void use(Middleware middleware);
    void set_not_found_handler(RouteHandler handler);

    /**
     * @brief Dispatch one request; handler exceptions become a 500
     */
    HttpResponse handle_request(const HttpRequest& request);

    std::vector<std::string> list_routes() const;
    size_t route_count() const { return routes_.size(); }

private:
    std::vector<Route> routes_;
    std::vector<Middleware> middlewares_;
    RouteHandler not_found_handler_;

    static HttpResponse default_not_found_handler(const HttpContext& ctx);

    const Route* find_route(HttpMethod method, const std::string& path) const;
    bool path_is_routed(const std::string& path) const;
};

/**
 * @brief Convert "/users/:id" into "^/users/([^/]+)$", collecting param names
 */
std::string pattern_to_regex(const std::string& pattern, std::vector<std::string>& param_names);

} // namespace network
} // namespace fetchd
