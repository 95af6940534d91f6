#include "config.hpp"
#include "util.hpp"
#include <spdlog/spdlog.h>
#include <stdexcept>

std::string Config::get_env(const char* name, const std::string& default_val) {
    const char* val = std::getenv(name);
    return val ? std::string(val) : default_val;
}

int Config::get_env_int(const char* name, int default_val) {
    const char* val = std::getenv(name);
    if (!val) return default_val;
    try {
        return std::stoi(val);
    } catch (const std::exception&) {
        spdlog::warn("Invalid integer for {}, using default {}", name, default_val);
        return default_val;
    }
}

Config Config::from_env() {
    Config cfg;

    cfg.redis_url = get_env("REDIS_URL", "redis://localhost:6379");
    cfg.stream_events = get_env("STREAM_EVENTS", "pegwatch.collateral.events");

    cfg.pg_dsn = get_env("PG_DSN");

    cfg.assets_file = get_env("ASSETS_FILE", "assets.json");
    cfg.refresh_interval_s = get_env_int("REFRESH_INTERVAL_S", 60);
    cfg.request_timeout_ms = get_env_int("REQUEST_TIMEOUT_MS", 8000);

    cfg.listen_addr = get_env("LISTEN_ADDR", "0.0.0.0");
    cfg.listen_port = get_env_int("LISTEN_PORT", 8085);

    cfg.service_name = get_env("SERVICE_NAME", "pegwatch-monitor");
    cfg.log_level = get_env("LOG_LEVEL", "info");

    return cfg;
}

void Config::validate() const {
    if (pg_dsn.empty()) {
        throw std::runtime_error("PG_DSN is required");
    }
    if (assets_file.empty()) {
        throw std::runtime_error("ASSETS_FILE must not be empty");
    }
    if (refresh_interval_s <= 0) {
        throw std::runtime_error("REFRESH_INTERVAL_S must be positive");
    }
    if (request_timeout_ms <= 0) {
        throw std::runtime_error("REQUEST_TIMEOUT_MS must be positive");
    }

    spdlog::info("Configuration validated successfully");
    spdlog::info("  Postgres: {}", util::redact_dsn(pg_dsn));
    spdlog::info("  Assets file: {}", assets_file);
    spdlog::info("  Refresh every {}s, request timeout {}ms", refresh_interval_s, request_timeout_ms);
}
