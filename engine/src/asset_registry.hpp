#pragma once

#include "collateral.hpp"
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

struct RefreshReport {
    int refreshed = 0;
    int failed = 0;
    int sound = 0;
    int iffy = 0;
    int defaulted = 0;
};

class AssetRegistry {
public:
    // Throws ConfigInvalid on a null collateral or a duplicate erc20
    void register_asset(std::shared_ptr<Collateral> collateral);
    bool unregister_asset(const std::string& erc20);

    std::shared_ptr<Collateral> get(const std::string& erc20) const;
    std::vector<std::string> erc20s() const;
    std::vector<std::shared_ptr<Collateral>> all() const;
    size_t size() const;

    // Refresh every asset. A failing asset is logged and counted, the sweep
    // always continues.
    RefreshReport refresh_all();

private:
    mutable std::mutex mutex_;
    std::map<std::string, std::shared_ptr<Collateral>> assets_;
};
