#pragma once

#include "events.hpp"
#include "postgres_store.hpp"
#include "redis_bus.hpp"
#include <memory>
#include <string>
#include <nlohmann/json.hpp>

nlohmann::json status_changed_json(const StatusChanged& event);
nlohmann::json rewards_claimed_json(const RewardsClaimed& event);

// Publishes collateral notifications to the events stream and keeps the
// status-change history in Postgres
class EventPublisher : public EventSink {
public:
    EventPublisher(std::shared_ptr<RedisBus> redis,
                   std::shared_ptr<PostgresStore> pg,
                   std::string stream);

    void on_status_changed(const StatusChanged& event) override;
    void on_rewards_claimed(const RewardsClaimed& event) override;

private:
    std::shared_ptr<RedisBus> redis_;
    std::shared_ptr<PostgresStore> pg_;
    std::string stream_;
};
