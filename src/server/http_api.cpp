#include "fetchd/server/http_api.hpp"

#include <chrono>

#include <spdlog/spdlog.h>

namespace fetchd::server {

using network::HttpContext;
using network::HttpResponse;
using network::HttpStatus;

namespace {

HttpResponse json_response(HttpStatus status, const nlohmann::json& body) {
    HttpResponse response(status);
    response.set_body(body.dump(-1, ' ', false, nlohmann::json::error_handler_t::replace));
    response.set_header("Content-Type", "application/json");
    response.set_header("Cache-Control", "no-store");
    return response;
}

HttpResponse error_response(const Error& error) {
    HttpStatus status = HttpStatus::INTERNAL_SERVER_ERROR;
    if (error.is(ErrorKind::Input) || error.is(ErrorKind::Resolution) || error.is(ErrorKind::PartialEntry)) {
        status = HttpStatus::BAD_REQUEST;
    } else if (error.is(ErrorKind::NotFound)) {
        status = HttpStatus::NOT_FOUND;
    }
    return json_response(status, {{"error", error.message}, {"kind", to_string(error.kind)}});
}

std::string lookup(const std::unordered_map<std::string, std::string>& fields, const char* key) {
    auto it = fields.find(key);
    return it == fields.end() ? std::string() : it->second;
}

// Resolves the caller's session and remembers whether the cookie must be (re)issued
class SessionScope {
public:
    SessionScope(const HttpContext& ctx, jobs::JobService& service)
        : presented_(ctx.get_cookie(kSessionCookie)),
          id_(service.open_session(presented_)) {
    }

    const std::string& id() const { return id_; }

    HttpResponse finish(HttpResponse response) const {
        if (id_ != presented_) {
            response.set_header("Set-Cookie",
                                std::string(kSessionCookie) + "=" + id_ + "; Path=/; HttpOnly; SameSite=Lax");
        }
        return response;
    }

private:
    std::string presented_;
    std::string id_;
};

nlohmann::json manifest_to_json(const std::vector<jobs::ManifestEntry>& manifest) {
    auto entries = nlohmann::json::array();
    for (const auto& entry : manifest) {
        nlohmann::json item{{"label", entry.label}, {"completed", entry.completed}};
        if (entry.duration_seconds) {
            item["duration"] = *entry.duration_seconds;
        } else {
            item["duration"] = nullptr;
        }
        entries.push_back(std::move(item));
    }
    return entries;
}

} // namespace

nlohmann::json status_to_json(const jobs::JobStatus& status) {
    const auto& job = status.job;
    nlohmann::json body{
        {"session", status.session_id},
        {"generation", status.generation},
        {"status", jobs::to_string(job.phase)},
        {"progress", job.current_item_raw_progress},
        {"title", job.current_item_label},
        {"current", job.items_completed},
        {"total", job.items_total},
        {"overall_percent", job.overall_percent},
        {"job_title", job.title},
        {"source", job.source_ref},
        {"download_type", jobs::to_string(job.kind)},
        {"quality", job.quality},
        {"completed_items", job.completed_items},
        {"manifest", manifest_to_json(job.manifest)},
        {"cancel_requested", status.cancel_requested},
        {"history_size", status.history_size},
    };
    if (job.error_message) {
        body["error"] = *job.error_message;
    } else {
        body["error"] = nullptr;
    }
    return body;
}

nlohmann::json preview_to_json(const jobs::PreviewResult& preview) {
    return {
        {"source", preview.source_ref},
        {"title", preview.title},
        {"total", preview.total},
        {"manifest", manifest_to_json(preview.manifest)},
    };
}

nlohmann::json record_to_json(const jobs::JobRecord& record) {
    const auto seconds = std::chrono::duration_cast<std::chrono::seconds>(
        record.timestamp.time_since_epoch()).count();
    return {
        {"timestamp", seconds},
        {"source", record.source_ref},
        {"download_type", jobs::to_string(record.kind)},
        {"quality", record.quality},
        {"title", record.title},
        {"item_count", record.item_count},
    };
}

std::unordered_map<std::string, std::string> request_fields(const HttpContext& ctx) {
    std::unordered_map<std::string, std::string> fields;
    const std::string content_type = ctx.request.get_header("Content-Type");

    if (content_type.find("application/json") != std::string::npos) {
        auto doc = nlohmann::json::parse(ctx.request.body_as_string(), nullptr, false);
        if (!doc.is_discarded() && doc.is_object()) {
            for (const auto& [key, value] : doc.items()) {
                if (value.is_string()) {
                    fields.emplace(key, value.get<std::string>());
                } else if (!value.is_null()) {
                    fields.emplace(key, value.dump());
                }
            }
        }
    } else if (!ctx.request.body.empty()) {
        fields = network::HttpFieldUtils::parse_urlencoded(ctx.request.body_as_string());
    }

    for (const auto& [key, value] : ctx.query) {
        fields.emplace(key, value);
    }
    return fields;
}

void register_routes(network::HttpRouter& router,
                     jobs::JobService& service,
                     const events::MetricsComponent* metrics) {
    router.post("/download", [&service](const HttpContext& ctx) {
        SessionScope session(ctx, service);
        const auto fields = request_fields(ctx);

        auto kind = jobs::media_kind_from_string(lookup(fields, "download_type"));
        if (!kind) {
            return session.finish(error_response(
                Error::input("Unknown download_type: " + lookup(fields, "download_type"))));
        }

        jobs::JobRequest request;
        request.source_ref = lookup(fields, "url");
        request.kind = *kind;
        request.quality = lookup(fields, "quality");

        auto receipt = service.submit_job(session.id(), request);
        if (receipt.is_error()) {
            return session.finish(error_response(receipt.error()));
        }
        return session.finish(json_response(HttpStatus::ACCEPTED, {
            {"status", "accepted"},
            {"session", receipt.value().session_id},
            {"generation", receipt.value().generation},
            {"fast_path", receipt.value().fast_path},
        }));
    });

    router.get("/progress", [&service](const HttpContext& ctx) {
        SessionScope session(ctx, service);
        return session.finish(json_response(HttpStatus::OK, status_to_json(service.get_status(session.id()))));
    });

    router.post("/cancel", [&service](const HttpContext& ctx) {
        SessionScope session(ctx, service);
        if (!service.request_cancel(session.id())) {
            return session.finish(error_response(Error::not_found("Session " + session.id() + " was closed")));
        }
        return session.finish(json_response(HttpStatus::OK, {{"status", "cancel_requested"}}));
    });

    router.post("/reset", [&service](const HttpContext& ctx) {
        SessionScope session(ctx, service);
        auto reset = service.reset_session(session.id());
        if (reset.is_error()) {
            return session.finish(error_response(reset.error()));
        }
        return session.finish(json_response(HttpStatus::OK, {{"status", "reset"}}));
    });

    router.post("/preview", [&service](const HttpContext& ctx) {
        SessionScope session(ctx, service);
        const auto fields = request_fields(ctx);

        auto preview = service.preview(lookup(fields, "url"), session.id());
        if (preview.is_error()) {
            return session.finish(error_response(preview.error()));
        }
        return session.finish(json_response(HttpStatus::OK, preview_to_json(preview.value())));
    });

    router.get("/history", [&service](const HttpContext& ctx) {
        SessionScope session(ctx, service);
        auto records = nlohmann::json::array();
        for (const auto& record : service.history(session.id())) {
            records.push_back(record_to_json(record));
        }
        return session.finish(json_response(HttpStatus::OK, {{"history", records}}));
    });

    router.get("/health", [&service, metrics](const HttpContext&) {
        nlohmann::json body{{"status", "ok"}, {"active_workers", service.active_workers()}};
        if (metrics != nullptr) {
            const auto& stats = metrics->get_stats();
            body["jobs"] = {
                {"submitted", stats.jobs_submitted.load()},
                {"fast_path", stats.fast_path_jobs.load()},
                {"finished", stats.jobs_finished.load()},
                {"canceled", stats.jobs_canceled.load()},
                {"failed", stats.jobs_failed.load()},
                {"items_finished", stats.items_finished.load()},
            };
        }
        return json_response(HttpStatus::OK, body);
    });

    spdlog::debug("Registered {} API routes", router.route_count());
}

} // namespace fetchd::server
