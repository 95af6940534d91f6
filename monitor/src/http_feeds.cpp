#include "http_feeds.hpp"
#include "errors.hpp"
#include <spdlog/spdlog.h>
#include <stdexcept>

HttpJsonClient::HttpJsonClient(int timeout_ms)
    : timeout_ms_(timeout_ms)
    , curl_(curl_easy_init())
{
    if (!curl_) {
        throw std::runtime_error("Failed to initialize CURL");
    }

    curl_easy_setopt(curl_, CURLOPT_WRITEFUNCTION, write_callback);
    curl_easy_setopt(curl_, CURLOPT_TIMEOUT_MS, static_cast<long>(timeout_ms_));
    curl_easy_setopt(curl_, CURLOPT_NOSIGNAL, 1L);
}

HttpJsonClient::~HttpJsonClient() {
    if (curl_) {
        curl_easy_cleanup(curl_);
    }
}

size_t HttpJsonClient::write_callback(void* contents, size_t size, size_t nmemb, void* userp) {
    ((std::string*)userp)->append((char*)contents, size * nmemb);
    return size * nmemb;
}

nlohmann::json HttpJsonClient::get(const std::string& url) {
    return make_request(url, nullptr);
}

nlohmann::json HttpJsonClient::post(const std::string& url, const nlohmann::json& body) {
    std::string payload = body.dump();
    return make_request(url, &payload);
}

nlohmann::json HttpJsonClient::make_request(const std::string& url, const std::string* body) {
    std::lock_guard<std::mutex> lock(mutex_);

    std::string response_string;
    struct curl_slist* headers = nullptr;

    curl_easy_setopt(curl_, CURLOPT_URL, url.c_str());
    curl_easy_setopt(curl_, CURLOPT_WRITEDATA, &response_string);

    if (body) {
        headers = curl_slist_append(headers, "Content-Type: application/json");
        curl_easy_setopt(curl_, CURLOPT_HTTPHEADER, headers);
        curl_easy_setopt(curl_, CURLOPT_POSTFIELDS, body->c_str());
    } else {
        curl_easy_setopt(curl_, CURLOPT_HTTPGET, 1L);
        curl_easy_setopt(curl_, CURLOPT_HTTPHEADER, nullptr);
    }

    CURLcode res = curl_easy_perform(curl_);
    long http_code = 0;
    curl_easy_getinfo(curl_, CURLINFO_RESPONSE_CODE, &http_code);

    if (headers) {
        curl_easy_setopt(curl_, CURLOPT_HTTPHEADER, nullptr);
        curl_slist_free_all(headers);
    }

    if (res != CURLE_OK) {
        throw FeedError(url + ": " + curl_easy_strerror(res));
    }
    if (http_code >= 400) {
        throw FeedError(url + ": HTTP " + std::to_string(http_code));
    }

    try {
        return nlohmann::json::parse(response_string);
    } catch (const std::exception& e) {
        throw FeedError(url + ": bad JSON: " + e.what());
    }
}

Fix parse_decimal(const nlohmann::json& value, const std::string& field) {
    try {
        if (value.is_string()) {
            return fixmath::from_string(value.get<std::string>());
        }
        if (value.is_number_integer()) {
            return fixmath::from_int(value.get<int64_t>());
        }
        if (value.is_number()) {
            return fixmath::from_double(value.get<double>());
        }
    } catch (const std::exception& e) {
        throw FeedError("invalid " + field + ": " + e.what());
    }
    throw FeedError("invalid " + field + ": expected a number or decimal string");
}

FeedReading parse_feed_reading(const nlohmann::json& body) {
    if (!body.is_object() || !body.contains("price") || !body.contains("updated_at")) {
        throw FeedError("feed response needs price and updated_at");
    }
    if (!body["updated_at"].is_number_integer()) {
        throw FeedError("invalid updated_at");
    }
    return FeedReading{parse_decimal(body["price"], "price"), body["updated_at"].get<int64_t>()};
}

Fix parse_rate(const nlohmann::json& body) {
    if (!body.is_object() || !body.contains("rate")) {
        throw FeedError("rate response needs rate");
    }
    return parse_decimal(body["rate"], "rate");
}

Fix parse_claim(const nlohmann::json& body) {
    if (!body.is_object() || !body.contains("amount")) {
        throw FeedError("claim response needs amount");
    }
    Fix amount = parse_decimal(body["amount"], "amount");
    if (amount < 0) {
        throw FeedError("negative claim amount");
    }
    return amount;
}

HttpOracleFeed::HttpOracleFeed(std::string name, std::string url, int timeout_ms)
    : name_(std::move(name)), url_(std::move(url)), client_(timeout_ms) {}

FeedReading HttpOracleFeed::latest() {
    FeedReading reading = parse_feed_reading(client_.get(url_));
    spdlog::debug("{}: price {} updated at {}", name_, fixmath::to_string(reading.price),
                  reading.updated_at);
    return reading;
}

HttpRateSource::HttpRateSource(std::string url, int timeout_ms)
    : url_(std::move(url)), client_(timeout_ms) {}

Fix HttpRateSource::current_rate() {
    return parse_rate(client_.get(url_));
}

HttpRewardSource::HttpRewardSource(std::string url, int timeout_ms)
    : url_(std::move(url)), client_(timeout_ms) {}

Fix HttpRewardSource::claim(const std::string& recipient) {
    return parse_claim(client_.post(url_, nlohmann::json{{"recipient", recipient}}));
}
