#pragma once

#include <string>
#include <cstdlib>

struct Config {
    // Redis
    std::string redis_url;
    std::string stream_events;

    // Postgres
    std::string pg_dsn;

    // Assets
    std::string assets_file;
    int refresh_interval_s;
    int request_timeout_ms;

    // HTTP
    std::string listen_addr;
    int listen_port;

    // Service
    std::string service_name;
    std::string log_level;

    static Config from_env();
    void validate() const;

private:
    static std::string get_env(const char* name, const std::string& default_val = "");
    static int get_env_int(const char* name, int default_val);
};
