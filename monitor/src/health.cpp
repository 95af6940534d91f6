#include "health.hpp"

HealthCheck::HealthCheck(std::shared_ptr<RedisBus> redis,
                         std::shared_ptr<PostgresStore> pg,
                         std::shared_ptr<AssetRegistry> registry)
    : redis_(redis), pg_(pg), registry_(registry) {}

nlohmann::json HealthCheck::get_status() const {
    bool redis_ok = redis_->ping();
    bool pg_ok = pg_->ping();

    int sound = 0, iffy = 0, defaulted = 0;
    for (const auto& collateral : registry_->all()) {
        switch (collateral->status()) {
            case CollateralStatus::SOUND: sound++; break;
            case CollateralStatus::IFFY: iffy++; break;
            case CollateralStatus::DEFAULT: defaulted++; break;
        }
    }

    nlohmann::json status = {
        {"ok", redis_ok && pg_ok},
        {"redis", redis_ok},
        {"postgres", pg_ok},
        {"assets", {
            {"sound", sound},
            {"iffy", iffy},
            {"default", defaulted}
        }}
    };

    return status;
}

bool HealthCheck::is_healthy() const {
    return redis_->ping() && pg_->ping();
}
