#pragma once

#include "feeds.hpp"
#include <memory>
#include <mutex>
#include <string>
#include <nlohmann/json.hpp>
#include <curl/curl.h>

// One curl easy handle, serialised. Transport failures, HTTP errors and
// unparseable bodies throw FeedError.
class HttpJsonClient {
public:
    explicit HttpJsonClient(int timeout_ms = 8000);
    ~HttpJsonClient();

    HttpJsonClient(const HttpJsonClient&) = delete;
    HttpJsonClient& operator=(const HttpJsonClient&) = delete;

    nlohmann::json get(const std::string& url);
    nlohmann::json post(const std::string& url, const nlohmann::json& body);

private:
    int timeout_ms_;
    CURL* curl_;
    std::mutex mutex_;

    nlohmann::json make_request(const std::string& url, const std::string* body);

    static size_t write_callback(void* contents, size_t size, size_t nmemb, void* userp);
};

// Accepts a JSON number or a decimal string. Throws FeedError.
Fix parse_decimal(const nlohmann::json& value, const std::string& field);

// {"price": ..., "updated_at": <unix s>}
FeedReading parse_feed_reading(const nlohmann::json& body);
// {"rate": ...}
Fix parse_rate(const nlohmann::json& body);
// {"amount": ...}
Fix parse_claim(const nlohmann::json& body);

class HttpOracleFeed : public OracleFeed {
public:
    HttpOracleFeed(std::string name, std::string url, int timeout_ms);

    FeedReading latest() override;
    std::string describe() const override { return name_; }

private:
    std::string name_;
    std::string url_;
    HttpJsonClient client_;
};

class HttpRateSource : public ExchangeRateSource {
public:
    HttpRateSource(std::string url, int timeout_ms);

    Fix current_rate() override;

private:
    std::string url_;
    HttpJsonClient client_;
};

class HttpRewardSource : public RewardSource {
public:
    HttpRewardSource(std::string url, int timeout_ms);

    Fix claim(const std::string& recipient) override;

private:
    std::string url_;
    HttpJsonClient client_;
};
