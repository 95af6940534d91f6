#include "event_publisher.hpp"
#include "util.hpp"
#include <spdlog/spdlog.h>

nlohmann::json status_changed_json(const StatusChanged& event) {
    return {
        {"event", "status_changed"},
        {"erc20", event.erc20},
        {"from", status_name(event.from)},
        {"to", status_name(event.to)},
        {"at", event.at},
        {"ts", util::to_iso8601(event.at)}
    };
}

nlohmann::json rewards_claimed_json(const RewardsClaimed& event) {
    return {
        {"event", "rewards_claimed"},
        {"erc20", event.erc20},
        {"reward_token", event.reward_token},
        {"recipient", event.recipient},
        {"amount", fixmath::to_string(event.amount)},
        {"at", event.at},
        {"ts", util::to_iso8601(event.at)}
    };
}

EventPublisher::EventPublisher(std::shared_ptr<RedisBus> redis,
                               std::shared_ptr<PostgresStore> pg,
                               std::string stream)
    : redis_(std::move(redis)), pg_(std::move(pg)), stream_(std::move(stream)) {}

void EventPublisher::on_status_changed(const StatusChanged& event) {
    pg_->record_status_change(event);
    redis_->publish_event(stream_, status_changed_json(event));
    spdlog::info("Published status change {} {} -> {}", event.erc20,
                 status_name(event.from), status_name(event.to));
}

void EventPublisher::on_rewards_claimed(const RewardsClaimed& event) {
    redis_->publish_event(stream_, rewards_claimed_json(event));
}
