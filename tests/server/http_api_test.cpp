#include "fetchd/server/http_api.hpp"
#include "support/fake_fetch_service.hpp"

#include <gtest/gtest.h>

using fetchd::events::EventBus;
using fetchd::events::MetricsComponent;
using fetchd::jobs::JobService;
using fetchd::jobs::SessionStore;
using fetchd::network::HttpMethod;
using fetchd::network::HttpRequest;
using fetchd::network::HttpResponse;
using fetchd::network::HttpRouter;
using fetchd::test_support::FakeFetchService;
using fetchd::test_support::collection;
using fetchd::test_support::finished;
using fetchd::test_support::progress;
using fetchd::test_support::single;

namespace {

const std::string kClip = "https://example.test/watch?v=clip";
const std::string kAlbum = "https://example.test/playlist?list=album";

std::string session_from(const HttpResponse& res) {
    auto it = res.headers.find("Set-Cookie");
    if (it == res.headers.end()) {
        return {};
    }
    const std::string prefix = std::string(fetchd::server::kSessionCookie) + "=";
    auto start = it->second.find(prefix);
    if (start == std::string::npos) {
        return {};
    }
    start += prefix.size();
    return it->second.substr(start, it->second.find(';', start) - start);
}

nlohmann::json body_of(const HttpResponse& res) {
    return nlohmann::json::parse(res.body_as_string());
}

} // namespace

class HttpApiTest : public ::testing::Test {
protected:
    void SetUp() override {
        fetcher.set_metadata(kClip, single("Clip", 120.0));
        fetcher.set_script(kClip, {progress("60%", "Clip"), finished("Clip")});
        fetcher.set_metadata(kAlbum, collection("Album", {"One", "Two"}));
        fetcher.set_script(kAlbum, {finished("One"), finished("Two")});

        fetchd::server::register_routes(router, service, &metrics);
    }

    HttpResponse send(HttpMethod method, const std::string& url,
                      const std::string& body = {}, const std::string& content_type = {}) {
        HttpRequest request;
        request.method = method;
        request.url = url;
        if (!session.empty()) {
            request.headers["Cookie"] = std::string(fetchd::server::kSessionCookie) + "=" + session;
        }
        if (!content_type.empty()) {
            request.headers["Content-Type"] = content_type;
        }
        request.body.assign(body.begin(), body.end());

        auto response = router.handle_request(request);
        auto issued = session_from(response);
        if (!issued.empty()) {
            session = issued;
        }
        return response;
    }

    HttpResponse post_json(const std::string& url, const nlohmann::json& body) {
        return send(HttpMethod::POST, url, body.dump(), "application/json");
    }

    EventBus bus;
    MetricsComponent metrics{bus};
    SessionStore store;
    FakeFetchService fetcher;
    JobService service{store, fetcher, bus};
    HttpRouter router;
    std::string session;
};

TEST_F(HttpApiTest, FirstRequestIssuesSessionCookie) {
    auto res = send(HttpMethod::GET, "/progress");

    EXPECT_EQ(res.status_code, 200);
    EXPECT_EQ(session.size(), 32u);
    EXPECT_NE(res.headers["Set-Cookie"].find("HttpOnly"), std::string::npos);

    auto again = send(HttpMethod::GET, "/progress");
    EXPECT_EQ(again.headers.count("Set-Cookie"), 0u);
    EXPECT_EQ(body_of(again)["session"], session);
}

TEST_F(HttpApiTest, IdleProgressIsReady) {
    auto body = body_of(send(HttpMethod::GET, "/progress"));

    EXPECT_EQ(body["status"], "ready");
    EXPECT_EQ(body["current"], 0);
    EXPECT_EQ(body["total"], 0);
    EXPECT_TRUE(body["error"].is_null());
}

TEST_F(HttpApiTest, DownloadIsAcceptedAndCompletes) {
    auto res = post_json("/download", {{"url", kClip}, {"download_type", "video"}, {"quality", 720}});

    EXPECT_EQ(res.status_code, 202);
    auto accepted = body_of(res);
    EXPECT_EQ(accepted["status"], "accepted");
    EXPECT_EQ(accepted["fast_path"], false);

    service.wait_idle();

    auto status = body_of(send(HttpMethod::GET, "/progress"));
    EXPECT_EQ(status["status"], "finished");
    EXPECT_EQ(status["overall_percent"], 100.0);
    EXPECT_EQ(status["job_title"], "Clip");
    EXPECT_EQ(status["quality"], "720");
    EXPECT_EQ(status["completed_items"], nlohmann::json::array({"Clip"}));
}

TEST_F(HttpApiTest, FormEncodedDownloadIsAccepted) {
    auto res = send(HttpMethod::POST, "/download",
                    "url=https%3A%2F%2Fexample.test%2Fwatch%3Fv%3Dclip&download_type=audio&quality=192",
                    "application/x-www-form-urlencoded");

    EXPECT_EQ(res.status_code, 202);
    service.wait_idle();
    EXPECT_EQ(body_of(send(HttpMethod::GET, "/progress"))["download_type"], "audio");
}

TEST_F(HttpApiTest, InvalidUtf8InUrlStillRendersProgress) {
    auto res = send(HttpMethod::POST, "/download", "url=http%3A%2F%2Fx%2F%FF", "application/x-www-form-urlencoded");

    ASSERT_EQ(res.status_code, 202);
    service.wait_idle();

    auto progress = send(HttpMethod::GET, "/progress");
    ASSERT_EQ(progress.status_code, 200);
    EXPECT_EQ(body_of(progress)["source"], "http://x/\xEF\xBF\xBD");
}

TEST_F(HttpApiTest, DownloadWithoutUrlIs400) {
    auto res = post_json("/download", {{"download_type", "video"}});

    EXPECT_EQ(res.status_code, 400);
    EXPECT_EQ(body_of(res)["kind"], "input");
    EXPECT_EQ(fetcher.fetch_calls(), 0u);
}

TEST_F(HttpApiTest, UnknownDownloadTypeIs400) {
    auto res = post_json("/download", {{"url", kClip}, {"download_type", "hologram"}});

    EXPECT_EQ(res.status_code, 400);
}

TEST_F(HttpApiTest, PreviewListsItemsThenDownloadTakesFastPath) {
    auto preview = post_json("/preview", {{"url", kAlbum}});

    ASSERT_EQ(preview.status_code, 200);
    auto listing = body_of(preview);
    EXPECT_EQ(listing["total"], 2);
    EXPECT_EQ(listing["title"], "Album");
    ASSERT_EQ(listing["manifest"].size(), 2u);
    EXPECT_EQ(listing["manifest"][0]["label"], "One");

    auto res = post_json("/download", {{"url", kAlbum}, {"download_type", "audio"}});
    ASSERT_EQ(res.status_code, 202);
    EXPECT_EQ(body_of(res)["fast_path"], true);
}

TEST_F(HttpApiTest, PreviewOfNothingIs400) {
    auto res = post_json("/preview", {{"url", "https://example.test/empty"}});

    EXPECT_EQ(res.status_code, 400);
    EXPECT_EQ(body_of(res)["kind"], "resolution");
}

TEST_F(HttpApiTest, CancelAndResetAnswerImmediately) {
    auto cancel = send(HttpMethod::POST, "/cancel");
    EXPECT_EQ(cancel.status_code, 200);
    EXPECT_EQ(body_of(cancel)["status"], "cancel_requested");
    EXPECT_EQ(body_of(send(HttpMethod::GET, "/progress"))["cancel_requested"], true);

    auto reset = send(HttpMethod::POST, "/reset");
    EXPECT_EQ(body_of(reset)["status"], "reset");
    EXPECT_EQ(body_of(send(HttpMethod::GET, "/progress"))["cancel_requested"], false);
}

TEST_F(HttpApiTest, ClosedSessionCookieIsReplacedNotRevived) {
    send(HttpMethod::GET, "/progress");
    const std::string closed = session;
    service.close_session(closed);

    auto reset = send(HttpMethod::POST, "/reset");

    EXPECT_EQ(reset.status_code, 200);
    EXPECT_NE(session, closed);
    EXPECT_FALSE(store.get(closed).has_value());
}

TEST_F(HttpApiTest, HistoryListsFinishedJobs) {
    ASSERT_EQ(post_json("/download", {{"url", kClip}}).status_code, 202);
    service.wait_idle();

    auto history = body_of(send(HttpMethod::GET, "/history"))["history"];

    ASSERT_EQ(history.size(), 1u);
    EXPECT_EQ(history[0]["title"], "Clip");
    EXPECT_EQ(history[0]["item_count"], 1);
    EXPECT_EQ(history[0]["download_type"], "video");
    EXPECT_GT(history[0]["timestamp"].get<long long>(), 0);
}

TEST_F(HttpApiTest, SessionsAreIsolated) {
    ASSERT_EQ(post_json("/download", {{"url", kClip}}).status_code, 202);
    service.wait_idle();
    const std::string first = session;

    session.clear();
    auto other = body_of(send(HttpMethod::GET, "/progress"));

    EXPECT_NE(session, first);
    EXPECT_EQ(other["status"], "ready");
    EXPECT_EQ(other["history_size"], 0);
}

TEST_F(HttpApiTest, HealthReportsCounters) {
    ASSERT_EQ(post_json("/download", {{"url", kClip}}).status_code, 202);
    service.wait_idle();

    auto res = send(HttpMethod::GET, "/health");

    EXPECT_EQ(res.status_code, 200);
    auto body = body_of(res);
    EXPECT_EQ(body["status"], "ok");
    EXPECT_EQ(body["jobs"]["submitted"], 1);
    EXPECT_EQ(body["jobs"]["finished"], 1);
}

TEST_F(HttpApiTest, QueryFieldsDoNotOverrideBody) {
    HttpRequest request;
    request.method = HttpMethod::POST;
    request.url = "/download?url=from-query&quality=1080";
    request.headers["Content-Type"] = "application/json";
    const std::string body = R"({"url": "from-body"})";
    request.body.assign(body.begin(), body.end());

    fetchd::network::HttpContext ctx(request);
    ctx.query = fetchd::network::HttpFieldUtils::parse_urlencoded(request.query_string());

    auto fields = fetchd::server::request_fields(ctx);
    EXPECT_EQ(fields["url"], "from-body");
    EXPECT_EQ(fields["quality"], "1080");
}
