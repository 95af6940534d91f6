#include "postgres_store.hpp"
#include "util.hpp"
#include <spdlog/spdlog.h>

PostgresStore::PostgresStore(const std::string& dsn) : dsn_(dsn) {
    spdlog::info("PostgresStore initialized: {}", util::redact_dsn(dsn));
}

pqxx::connection PostgresStore::make_connection() {
    return pqxx::connection(dsn_);
}

void PostgresStore::init_schema() {
    try {
        auto conn = make_connection();
        pqxx::work txn(conn);

        txn.exec(R"(
            CREATE TABLE IF NOT EXISTS collateral_snapshots (
                id BIGSERIAL PRIMARY KEY,
                erc20 TEXT NOT NULL,
                status TEXT NOT NULL CHECK (status IN ('SOUND','IFFY','DEFAULT')),
                peak_rate NUMERIC NOT NULL,
                exposed_rate NUMERIC NOT NULL,
                state JSONB NOT NULL,
                ts TIMESTAMPTZ NOT NULL DEFAULT NOW()
            )
        )");

        txn.exec(R"(
            CREATE INDEX IF NOT EXISTS collateral_snapshots_erc20_ts
                ON collateral_snapshots (erc20, ts DESC)
        )");

        txn.exec(R"(
            CREATE TABLE IF NOT EXISTS collateral_status_changes (
                id BIGSERIAL PRIMARY KEY,
                erc20 TEXT NOT NULL,
                from_status TEXT NOT NULL,
                to_status TEXT NOT NULL,
                ts TIMESTAMPTZ NOT NULL
            )
        )");

        txn.commit();
        spdlog::info("Database schema initialized");

    } catch (const std::exception& e) {
        spdlog::error("Failed to initialize schema: {}", e.what());
        throw;
    }
}

void PostgresStore::save_snapshot(const CollateralSnapshot& snapshot) {
    try {
        auto conn = make_connection();
        pqxx::work txn(conn);

        txn.exec_params(
            "INSERT INTO collateral_snapshots (erc20, status, peak_rate, exposed_rate, state, ts) "
            "VALUES ($1, $2, $3::NUMERIC, $4::NUMERIC, $5::JSONB, to_timestamp($6))",
            snapshot.erc20,
            status_name(snapshot.status),
            fixmath::to_string(snapshot.peak_rate),
            fixmath::to_string(snapshot.exposed_rate),
            snapshot_to_json(snapshot).dump(),
            snapshot.taken_at
        );

        txn.commit();

    } catch (const std::exception& e) {
        spdlog::error("Failed to save snapshot for {}: {}", snapshot.erc20, e.what());
    }
}

std::optional<CollateralSnapshot> PostgresStore::load_latest_snapshot(const std::string& erc20) {
    try {
        auto conn = make_connection();
        pqxx::work txn(conn);

        auto result = txn.exec_params(
            "SELECT state::TEXT FROM collateral_snapshots "
            "WHERE erc20 = $1 ORDER BY ts DESC, id DESC LIMIT 1",
            erc20
        );

        if (result.empty()) {
            return std::nullopt;
        }
        return snapshot_from_json(nlohmann::json::parse(result[0][0].as<std::string>()));

    } catch (const std::exception& e) {
        spdlog::error("Failed to load snapshot for {}: {}", erc20, e.what());
        throw;
    }
}

void PostgresStore::record_status_change(const StatusChanged& event) {
    try {
        auto conn = make_connection();
        pqxx::work txn(conn);

        txn.exec_params(
            "INSERT INTO collateral_status_changes (erc20, from_status, to_status, ts) "
            "VALUES ($1, $2, $3, to_timestamp($4))",
            event.erc20, status_name(event.from), status_name(event.to), event.at
        );

        txn.commit();

    } catch (const std::exception& e) {
        spdlog::error("Failed to record status change for {}: {}", event.erc20, e.what());
    }
}

bool PostgresStore::ping() {
    try {
        auto conn = make_connection();
        pqxx::nontransaction txn(conn);
        txn.exec("SELECT 1");
        return true;
    } catch (const std::exception& e) {
        spdlog::debug("Postgres ping failed: {}", e.what());
        return false;
    }
}
