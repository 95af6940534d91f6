#include "config.hpp"
#include "asset_loader.hpp"
#include "asset_registry.hpp"
#include "backing.hpp"
#include "collateral.hpp"
#include "errors.hpp"
#include "event_publisher.hpp"
#include "health.hpp"
#include "http_feeds.hpp"
#include "postgres_store.hpp"
#include "redis_bus.hpp"
#include "views.hpp"
#include "util.hpp"
#include <httplib.h>
#include <spdlog/spdlog.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <curl/curl.h>
#include <signal.h>
#include <atomic>
#include <chrono>
#include <thread>

std::atomic<bool> shutdown_requested{false};

void signal_handler(int signal) {
    spdlog::info("Received signal {}, initiating shutdown", signal);
    shutdown_requested = true;
}

void setup_logging(const std::string& log_level) {
    auto console_sink = std::make_shared<spdlog::sinks::stdout_color_sink_mt>();
    auto logger = std::make_shared<spdlog::logger>("pegwatch", console_sink);

    if (log_level == "debug") {
        logger->set_level(spdlog::level::debug);
    } else if (log_level == "warn") {
        logger->set_level(spdlog::level::warn);
    } else if (log_level == "error") {
        logger->set_level(spdlog::level::err);
    } else {
        logger->set_level(spdlog::level::info);
    }

    spdlog::set_default_logger(logger);
    spdlog::set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%^%l%$] %v");
}

void json_reply(httplib::Response& res, const nlohmann::json& body, int status = 200) {
    res.status = status;
    res.set_content(body.dump(), "application/json");
}

// Builds every collateral of the assets file and resumes its persisted state
std::vector<Position> register_assets(const AssetsFile& assets,
                                      const Config& config,
                                      std::shared_ptr<Clock> clock,
                                      std::shared_ptr<EventSink> events,
                                      PostgresStore& pg,
                                      AssetRegistry& registry) {
    std::vector<Position> positions;

    for (const auto& spec : assets.assets) {
        auto rate = std::make_shared<HttpRateSource>(spec.rate_url, config.request_timeout_ms);
        std::shared_ptr<RewardSource> rewards;
        if (!spec.reward_url.empty()) {
            rewards = std::make_shared<HttpRewardSource>(spec.reward_url, config.request_timeout_ms);
        }

        auto collateral = std::make_shared<Collateral>(spec.config, spec.revenue_hiding,
                                                       rate, clock, events, rewards);

        if (auto snapshot = pg.load_latest_snapshot(spec.config.erc20)) {
            collateral->restore(*snapshot);
        }

        registry.register_asset(collateral);
        positions.push_back(Position{spec.config.erc20, spec.balance});
    }

    return positions;
}

void refresh_loop(std::shared_ptr<Config> config,
                  std::shared_ptr<AssetRegistry> registry,
                  std::shared_ptr<PostgresStore> pg,
                  std::atomic<bool>& running) {

    spdlog::info("Starting refresh loop, every {}s", config->refresh_interval_s);

    while (running) {
        try {
            auto report = registry->refresh_all();
            for (const auto& collateral : registry->all()) {
                pg->save_snapshot(collateral->snapshot());
            }
            spdlog::info("Refresh: {} sound, {} iffy, {} default, {} failed",
                         report.sound, report.iffy, report.defaulted, report.failed);

        } catch (const std::exception& e) {
            spdlog::error("Refresh loop error: {}", e.what());
        }

        for (int i = 0; i < config->refresh_interval_s && running; ++i) {
            std::this_thread::sleep_for(std::chrono::seconds(1));
        }
    }

    spdlog::info("Refresh loop stopped");
}

int main(int argc, char* argv[]) {
    try {
        auto config = std::make_shared<Config>(Config::from_env());
        setup_logging(config->log_level);

        spdlog::info("==============================================");
        spdlog::info("PegWatch Collateral Monitor v1.0");
        spdlog::info("==============================================");

        config->validate();

        signal(SIGINT, signal_handler);
        signal(SIGTERM, signal_handler);

        curl_global_init(CURL_GLOBAL_DEFAULT);

        // Initialize components
        auto redis = std::make_shared<RedisBus>(config->redis_url);
        auto pg = std::make_shared<PostgresStore>(config->pg_dsn);
        auto events = std::make_shared<EventPublisher>(redis, pg, config->stream_events);
        auto clock = std::make_shared<SystemClock>();
        auto registry = std::make_shared<AssetRegistry>();
        auto health = std::make_shared<HealthCheck>(redis, pg, registry);

        pg->init_schema();

        int timeout_ms = config->request_timeout_ms;
        auto assets = load_assets_file(config->assets_file,
            [timeout_ms](const std::string& erc20, const std::string& slot, const FeedSpec& spec) {
                return std::make_shared<HttpOracleFeed>(erc20 + "/" + slot, spec.url, timeout_ms);
            });

        auto positions = register_assets(assets, *config, clock, events, *pg, *registry);
        Fix liabilities = assets.liabilities;

        // Start refresh loop
        std::atomic<bool> refresh_running{true};
        std::thread refresh_thread(refresh_loop, config, registry, pg, std::ref(refresh_running));

        // Start HTTP server
        httplib::Server server;

        server.Get("/health", [health](const httplib::Request&, httplib::Response& res) {
            json_reply(res, health->get_status(), health->is_healthy() ? 200 : 503);
        });

        server.Get("/assets", [registry](const httplib::Request&, httplib::Response& res) {
            nlohmann::json body = nlohmann::json::array();
            for (const auto& collateral : registry->all()) {
                body.push_back(asset_json(*collateral));
            }
            json_reply(res, body);
        });

        server.Get(R"(/assets/([^/]+))", [registry](const httplib::Request& req, httplib::Response& res) {
            auto collateral = registry->get(req.matches[1]);
            if (!collateral) {
                json_reply(res, {{"error", "unknown asset"}}, 404);
                return;
            }
            json_reply(res, asset_json(*collateral));
        });

        server.Get("/backing", [registry, positions, liabilities](const httplib::Request&, httplib::Response& res) {
            BackingAggregator aggregator;
            json_reply(res, backing_json(aggregator.value_backing(*registry, positions, liabilities)));
        });

        server.Post(R"(/assets/([^/]+)/claim)", [registry](const httplib::Request& req, httplib::Response& res) {
            auto collateral = registry->get(req.matches[1]);
            if (!collateral) {
                json_reply(res, {{"error", "unknown asset"}}, 404);
                return;
            }
            try {
                Fix amount = collateral->claim_rewards();
                json_reply(res, {
                    {"erc20", collateral->erc20()},
                    {"amount", fixmath::to_string(amount)},
                    {"ts", util::current_iso8601()}
                });
            } catch (const FeedError& e) {
                spdlog::error("Reward claim for {} failed: {}", collateral->erc20(), e.what());
                json_reply(res, {{"error", e.what()}}, 502);
            }
        });

        std::thread http_thread([&server, config]() {
            spdlog::info("Starting HTTP server on {}:{}", config->listen_addr, config->listen_port);
            server.listen(config->listen_addr.c_str(), config->listen_port);
        });

        spdlog::info("Monitor service started with {} assets", registry->size());

        // Main loop
        while (!shutdown_requested) {
            std::this_thread::sleep_for(std::chrono::seconds(1));
        }

        // Shutdown
        spdlog::info("Stopping services...");
        refresh_running = false;
        server.stop();

        if (refresh_thread.joinable()) refresh_thread.join();
        if (http_thread.joinable()) http_thread.join();

        curl_global_cleanup();
        spdlog::info("Shutdown complete");
        return 0;

    } catch (const std::exception& e) {
        spdlog::error("Fatal error: {}", e.what());
        return 1;
    }
}
