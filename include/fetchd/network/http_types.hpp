#pragma once

#include <cctype>
#include <cstdint>
#include <sstream>
#include <string>
#include <unordered_map>
#include <vector>

#include <strings.h>

namespace fetchd {
namespace network {

enum class HttpMethod {
    GET,
    POST,
    PUT,
    DELETE_METHOD,  // DELETE collides with a Windows macro
    HEAD,
    OPTIONS,
    UNKNOWN
};

enum class HttpVersion {
    HTTP_1_0,
    HTTP_1_1,
    UNKNOWN
};

enum class HttpStatus {
    OK = 200,
    ACCEPTED = 202,
    NO_CONTENT = 204,
    BAD_REQUEST = 400,
    NOT_FOUND = 404,
    METHOD_NOT_ALLOWED = 405,
    PAYLOAD_TOO_LARGE = 413,
    INTERNAL_SERVER_ERROR = 500,
    SERVICE_UNAVAILABLE = 503
};

/**
 * @brief Parsed HTTP/1.x request
 *
 * `url` is the raw request target including any query string; use path()
 * and query_string() to split it.
 */
struct HttpRequest {
    HttpMethod method = HttpMethod::UNKNOWN;
    std::string url;
    HttpVersion version = HttpVersion::HTTP_1_1;
    std::unordered_map<std::string, std::string> headers;
    std::vector<uint8_t> body;

    /**
     * @brief Case-insensitive header lookup
     * @return Header value if found, empty string otherwise
     */
    std::string get_header(const std::string& name) const {
        for (const auto& [key, value] : headers) {
            if (strcasecmp(key.c_str(), name.c_str()) == 0) {
                return value;
            }
        }
        return "";
    }

    bool has_header(const std::string& name) const {
        return !get_header(name).empty();
    }

    std::string body_as_string() const {
        return std::string(body.begin(), body.end());
    }

    std::string path() const {
        auto pos = url.find('?');
        return pos == std::string::npos ? url : url.substr(0, pos);
    }

    std::string query_string() const {
        auto pos = url.find('?');
        return pos == std::string::npos ? std::string() : url.substr(pos + 1);
    }
};

struct HttpResponse {
    HttpVersion version = HttpVersion::HTTP_1_1;
    int status_code = 200;
    std::string reason_phrase;
    std::unordered_map<std::string, std::string> headers;
    std::vector<uint8_t> body;

    HttpResponse() = default;

    explicit HttpResponse(HttpStatus status)
        : status_code(static_cast<int>(status))
        , reason_phrase(get_reason_phrase(status)) {
    }

    /**
     * @brief Set a text body and its Content-Length
     */
    void set_body(const std::string& content) {
        body.assign(content.begin(), content.end());
        headers["Content-Length"] = std::to_string(body.size());
    }

    void set_header(const std::string& name, const std::string& value) {
        headers[name] = value;
    }

    std::string body_as_string() const {
        return std::string(body.begin(), body.end());
    }

    /**
     * @brief Serialize to the HTTP/1.x wire format
     */
    std::vector<uint8_t> serialize() const {
        std::ostringstream oss;
        oss << version_to_string(version) << " " << status_code << " " << reason_phrase << "\r\n";
        for (const auto& [name, value] : headers) {
            oss << name << ": " << value << "\r\n";
        }
        oss << "\r\n";

        std::string header_str = oss.str();
        std::vector<uint8_t> result(header_str.begin(), header_str.end());
        result.insert(result.end(), body.begin(), body.end());
        return result;
    }

    static std::string get_reason_phrase(HttpStatus status) {
        switch (status) {
            case HttpStatus::OK: return "OK";
            case HttpStatus::ACCEPTED: return "Accepted";
            case HttpStatus::NO_CONTENT: return "No Content";
            case HttpStatus::BAD_REQUEST: return "Bad Request";
            case HttpStatus::NOT_FOUND: return "Not Found";
            case HttpStatus::METHOD_NOT_ALLOWED: return "Method Not Allowed";
            case HttpStatus::PAYLOAD_TOO_LARGE: return "Payload Too Large";
            case HttpStatus::INTERNAL_SERVER_ERROR: return "Internal Server Error";
            case HttpStatus::SERVICE_UNAVAILABLE: return "Service Unavailable";
        }
        return "Unknown";
    }

    static std::string version_to_string(HttpVersion version) {
        switch (version) {
            case HttpVersion::HTTP_1_0: return "HTTP/1.0";
            default: return "HTTP/1.1";
        }
    }
};

class HttpMethodUtils {
public:
    static HttpMethod from_string(const std::string& method_str) {
        if (method_str == "GET") return HttpMethod::GET;
        if (method_str == "POST") return HttpMethod::POST;
        if (method_str == "PUT") return HttpMethod::PUT;
        if (method_str == "DELETE") return HttpMethod::DELETE_METHOD;
        if (method_str == "HEAD") return HttpMethod::HEAD;
        if (method_str == "OPTIONS") return HttpMethod::OPTIONS;
        return HttpMethod::UNKNOWN;
    }

    static std::string to_string(HttpMethod method) {
        switch (method) {
            case HttpMethod::GET: return "GET";
            case HttpMethod::POST: return "POST";
            case HttpMethod::PUT: return "PUT";
            case HttpMethod::DELETE_METHOD: return "DELETE";
            case HttpMethod::HEAD: return "HEAD";
            case HttpMethod::OPTIONS: return "OPTIONS";
            default: return "UNKNOWN";
        }
    }
};

/**
 * @brief Decoding helpers for query strings, form bodies and cookies
 */
class HttpFieldUtils {
public:
    /**
     * @brief Percent-decode a component; '+' becomes a space
     *
     * Malformed escapes are kept verbatim.
     */
    static std::string url_decode(const std::string& text) {
        std::string out;
        out.reserve(text.size());
        for (size_t i = 0; i < text.size(); ++i) {
            char c = text[i];
            if (c == '+') {
                out += ' ';
            } else if (c == '%' && i + 2 < text.size() &&
                       std::isxdigit(static_cast<unsigned char>(text[i + 1])) &&
                       std::isxdigit(static_cast<unsigned char>(text[i + 2]))) {
                out += static_cast<char>(std::stoi(text.substr(i + 1, 2), nullptr, 16));
                i += 2;
            } else {
                out += c;
            }
        }
        return out;
    }

    /**
     * @brief Parse "a=1&b=2" (query strings and x-www-form-urlencoded bodies)
     *
     * The first occurrence of a key wins.
     */
    static std::unordered_map<std::string, std::string> parse_urlencoded(const std::string& text) {
        std::unordered_map<std::string, std::string> fields;
        size_t start = 0;
        while (start <= text.size()) {
            size_t end = text.find('&', start);
            if (end == std::string::npos) {
                end = text.size();
            }
            std::string pair = text.substr(start, end - start);
            if (!pair.empty()) {
                size_t eq = pair.find('=');
                std::string key = url_decode(pair.substr(0, eq));
                std::string value = eq == std::string::npos ? std::string() : url_decode(pair.substr(eq + 1));
                fields.emplace(std::move(key), std::move(value));
            }
            start = end + 1;
        }
        return fields;
    }

    /**
     * @brief Parse a Cookie header ("a=1; b=2")
     */
    static std::unordered_map<std::string, std::string> parse_cookies(const std::string& header) {
        std::unordered_map<std::string, std::string> cookies;
        std::istringstream in(header);
        std::string part;
        while (std::getline(in, part, ';')) {
            size_t eq = part.find('=');
            if (eq == std::string::npos) {
                continue;
            }
            std::string name = trim(part.substr(0, eq));
            std::string value = trim(part.substr(eq + 1));
            if (value.size() >= 2 && value.front() == '"' && value.back() == '"') {
                value = value.substr(1, value.size() - 2);
            }
            if (!name.empty()) {
                cookies.emplace(std::move(name), std::move(value));
            }
        }
        return cookies;
    }

private:
    static std::string trim(const std::string& text) {
        auto begin = text.find_first_not_of(" \t");
        if (begin == std::string::npos) {
            return "";
        }
        auto end = text.find_last_not_of(" \t");
        return text.substr(begin, end - begin + 1);
    }
};

} // namespace network
} // namespace fetchd
