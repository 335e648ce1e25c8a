#include "fetchd/config/server_config.hpp"
#include "fetchd/events/components.hpp"
#include "fetchd/events/event_bus.hpp"
#include "fetchd/events/events.hpp"
#include "fetchd/fetch/ytdlp_fetch_service.hpp"
#include "fetchd/jobs/service.hpp"
#include "fetchd/jobs/session_store.hpp"
#include "fetchd/network/http_router.hpp"
#include "fetchd/network/http_server_asio.hpp"
#include "fetchd/server/http_api.hpp"

#include <csignal>
#include <iostream>
#include <memory>
#include <thread>
#include <vector>

#include <boost/asio/signal_set.hpp>
#include <spdlog/spdlog.h>

using namespace fetchd;

int main(int argc, char* argv[]) {
    spdlog::set_pattern("[%H:%M:%S] [%^%l%$] [%t] %v");

    auto loaded = config::load_config(argc, argv);
    if (loaded.is_error()) {
        spdlog::error("{}", loaded.error().message);
        std::cerr << config::usage(argv[0]);
        return 1;
    }
    const config::ServerConfig cfg = loaded.value();
    if (cfg.show_help) {
        std::cout << config::usage(argv[0]);
        return 0;
    }

    spdlog::set_level(spdlog::level::from_str(cfg.log_level));
    spdlog::info("Configuration:");
    spdlog::info("  Port:           {}", cfg.port);
    spdlog::info("  Video output:   {}", cfg.video_dir);
    spdlog::info("  Audio output:   {}", cfg.audio_dir);
    spdlog::info("  yt-dlp:         {}", cfg.ytdlp_binary);
    spdlog::info("  History limit:  {}", cfg.history_limit);
    spdlog::info("  I/O threads:    {}", cfg.io_threads);

    events::EventBus event_bus;
    events::LoggerComponent logger(event_bus);
    events::MetricsComponent metrics(event_bus);

    jobs::SessionStore store(cfg.history_limit);
    fetch::YtDlpFetchService fetcher(fetch::YtDlpOptions{cfg.ytdlp_binary, cfg.video_dir, cfg.audio_dir});
    jobs::JobService service(store, fetcher, event_bus);

    network::HttpRouter router;
    server::register_routes(router, service, &metrics);

    network::asio::io_context io_context;
    std::unique_ptr<network::HttpServerAsio> http_server;
    try {
        http_server = std::make_unique<network::HttpServerAsio>(io_context, cfg.port);
    } catch (const boost::system::system_error& e) {
        spdlog::error("Cannot listen on port {}: {}", cfg.port, e.what());
        return 1;
    }
    http_server->set_handler([&router](const network::HttpRequest& request) {
        return router.handle_request(request);
    });

    boost::asio::signal_set signals(io_context, SIGINT, SIGTERM);
    signals.async_wait([&](const boost::system::error_code& ec, int signal_number) {
        if (ec) {
            return;
        }
        event_bus.emit(events::ServerShuttingDownEvent{signal_number == SIGINT ? "SIGINT" : "SIGTERM"});
        http_server->stop();
        service.cancel_all();
        io_context.stop();
    });

    event_bus.emit(events::ServerStartedEvent{cfg.port});

    std::vector<std::thread> io_threads;
    for (size_t i = 1; i < cfg.io_threads; ++i) {
        io_threads.emplace_back([&io_context]() { io_context.run(); });
    }
    io_context.run();
    for (auto& thread : io_threads) {
        thread.join();
    }

    spdlog::info("Waiting for {} running job(s)", service.active_workers());
    service.wait_idle();
    metrics.print_stats();
    return 0;
}
