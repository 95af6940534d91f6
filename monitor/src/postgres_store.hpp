#pragma once

#include "collateral.hpp"
#include "events.hpp"
#include <optional>
#include <string>
#include <pqxx/pqxx>

class PostgresStore {
public:
    explicit PostgresStore(const std::string& dsn);

    void init_schema();

    void save_snapshot(const CollateralSnapshot& snapshot);
    std::optional<CollateralSnapshot> load_latest_snapshot(const std::string& erc20);

    void record_status_change(const StatusChanged& event);

    bool ping();

private:
    std::string dsn_;

    pqxx::connection make_connection();
};
