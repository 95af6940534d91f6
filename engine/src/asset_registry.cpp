#include "asset_registry.hpp"
#include "errors.hpp"
#include <spdlog/spdlog.h>

void AssetRegistry::register_asset(std::shared_ptr<Collateral> collateral) {
    if (!collateral) {
        throw ConfigInvalid("cannot register a null collateral");
    }

    std::lock_guard<std::mutex> lock(mutex_);
    const std::string& erc20 = collateral->erc20();
    if (assets_.count(erc20)) {
        throw ConfigInvalid("duplicate collateral " + erc20);
    }
    assets_.emplace(erc20, std::move(collateral));
    spdlog::info("Registered collateral {} ({} total)", erc20, assets_.size());
}

bool AssetRegistry::unregister_asset(const std::string& erc20) {
    std::lock_guard<std::mutex> lock(mutex_);
    bool removed = assets_.erase(erc20) > 0;
    if (removed) {
        spdlog::info("Unregistered collateral {}", erc20);
    }
    return removed;
}

std::shared_ptr<Collateral> AssetRegistry::get(const std::string& erc20) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = assets_.find(erc20);
    return it == assets_.end() ? nullptr : it->second;
}

std::vector<std::string> AssetRegistry::erc20s() const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<std::string> keys;
    for (const auto& [erc20, collateral] : assets_) {
        keys.push_back(erc20);
    }
    return keys;
}

std::vector<std::shared_ptr<Collateral>> AssetRegistry::all() const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<std::shared_ptr<Collateral>> out;
    for (const auto& [erc20, collateral] : assets_) {
        out.push_back(collateral);
    }
    return out;
}

size_t AssetRegistry::size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return assets_.size();
}

RefreshReport AssetRegistry::refresh_all() {
    RefreshReport report;

    // Refresh outside the registry lock so readers are not blocked on feeds
    for (const auto& collateral : all()) {
        try {
            switch (collateral->refresh()) {
                case CollateralStatus::SOUND: report.sound++; break;
                case CollateralStatus::IFFY: report.iffy++; break;
                case CollateralStatus::DEFAULT: report.defaulted++; break;
            }
            report.refreshed++;
        } catch (const std::exception& e) {
            report.failed++;
            spdlog::error("Refresh of {} failed: {}", collateral->erc20(), e.what());
        }
    }

    spdlog::debug("Refreshed {} assets: {} sound, {} iffy, {} defaulted, {} failed",
                  report.refreshed, report.sound, report.iffy, report.defaulted, report.failed);
    return report;
}
