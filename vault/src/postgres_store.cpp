#include "postgres_store.hpp"
#include "util.hpp"
#include <spdlog/spdlog.h>

PostgresStore::PostgresStore(const std::string& dsn)
    : dsn_(dsn), run_id_(util::current_timestamp_ms()) {
    spdlog::info("PostgresStore initialized: {} (run {})", util::redact_dsn(dsn), run_id_);
}

pqxx::connection PostgresStore::make_connection() {
    return pqxx::connection(dsn_);
}

void PostgresStore::init_schema() {
    try {
        auto conn = make_connection();
        pqxx::work txn(conn);
        
        // Append-only; removal flips is_active
        txn.exec(R"(
            CREATE TABLE IF NOT EXISTS strategies (
                run_id BIGINT NOT NULL,
                idx INT NOT NULL,
                address TEXT NOT NULL,
                name TEXT NOT NULL,
                kind TEXT NOT NULL CHECK (kind IN ('convertible','direct')),
                allocation_bps INT NOT NULL CHECK (allocation_bps BETWEEN 0 AND 10000),
                has_lockup BOOLEAN NOT NULL,
                is_active BOOLEAN NOT NULL,
                added_at TIMESTAMPTZ NOT NULL,
                updated_at TIMESTAMPTZ NOT NULL DEFAULT NOW(),
                PRIMARY KEY (run_id, idx)
            )
        )");
        
        txn.exec(R"(
            CREATE TABLE IF NOT EXISTS withdrawal_requests (
                run_id BIGINT NOT NULL,
                holder TEXT NOT NULL,
                request_id BIGINT NOT NULL,
                receiver TEXT NOT NULL,
                shares_burned NUMERIC(20,0) NOT NULL,
                assets_owed NUMERIC(20,0) NOT NULL,
                created_at TIMESTAMPTZ NOT NULL,
                completed BOOLEAN NOT NULL DEFAULT FALSE,
                completed_at TIMESTAMPTZ,
                superseded BOOLEAN NOT NULL DEFAULT FALSE,
                PRIMARY KEY (run_id, holder, request_id)
            )
        )");
        
        txn.exec(R"(
            CREATE TABLE IF NOT EXISTS vault_snapshots (
                id BIGSERIAL PRIMARY KEY,
                run_id BIGINT NOT NULL,
                ts TIMESTAMPTZ NOT NULL DEFAULT NOW(),
                total_value NUMERIC(20,0) NOT NULL,
                total_shares NUMERIC(20,0) NOT NULL,
                price_per_share NUMERIC(20,0) NOT NULL,
                total_queued NUMERIC(20,0) NOT NULL,
                idle_balance NUMERIC(20,0) NOT NULL,
                shortfall NUMERIC(20,0) NOT NULL DEFAULT 0,
                active_strategies INT NOT NULL,
                paused BOOLEAN NOT NULL
            )
        )");
        
        txn.exec(R"(
            CREATE TABLE IF NOT EXISTS vault_events (
                id BIGSERIAL PRIMARY KEY,
                run_id BIGINT NOT NULL,
                event TEXT NOT NULL,
                data JSONB NOT NULL,
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

int PostgresStore::close_previous_runs() {
    try {
        auto conn = make_connection();
        pqxx::work txn(conn);
        
        auto requests = txn.exec_params(
            "UPDATE withdrawal_requests SET superseded = TRUE "
            "WHERE run_id <> $1 AND NOT completed AND NOT superseded",
            run_id_
        );
        auto strategies = txn.exec_params(
            "UPDATE strategies SET is_active = FALSE, updated_at = NOW() "
            "WHERE run_id <> $1 AND is_active",
            run_id_
        );
        
        txn.commit();
        int closed = static_cast<int>(requests.affected_rows());
        if (closed > 0 || strategies.affected_rows() > 0) {
            spdlog::warn("Superseded {} pending withdrawal requests and {} strategies from earlier runs",
                         closed, strategies.affected_rows());
        }
        return closed;
        
    } catch (const std::exception& e) {
        spdlog::error("Failed to close previous runs: {}", e.what());
        throw;
    }
}

void PostgresStore::save_strategies(const std::vector<Strategy>& strategies) {
    try {
        auto conn = make_connection();
        pqxx::work txn(conn);
        
        for (size_t i = 0; i < strategies.size(); i++) {
            const auto& s = strategies[i];
            txn.exec_params(
                "INSERT INTO strategies "
                "(run_id, idx, address, name, kind, allocation_bps, has_lockup, is_active, added_at) "
                "VALUES ($9, $1, $2, $3, $4, $5, $6, $7, to_timestamp($8::double precision / 1000)) "
                "ON CONFLICT (run_id, idx) DO UPDATE SET "
                "allocation_bps = $5, is_active = $7, updated_at = NOW()",
                static_cast<int>(i),
                s.address(),
                s.name,
                strategy_kind_string(s.kind()),
                static_cast<int>(s.target_allocation_bps),
                s.has_lockup,
                s.active,
                s.added_at_ms,
                run_id_
            );
        }
        
        txn.commit();
        spdlog::debug("Saved {} strategies", strategies.size());
        
    } catch (const std::exception& e) {
        spdlog::error("Failed to save strategies: {}", e.what());
        throw;
    }
}

void PostgresStore::save_requests(const std::vector<WithdrawalRequest>& requests) {
    try {
        auto conn = make_connection();
        pqxx::work txn(conn);
        
        for (const auto& r : requests) {
            txn.exec_params(
                "INSERT INTO withdrawal_requests "
                "(run_id, holder, request_id, receiver, shares_burned, assets_owed, created_at, "
                "completed, completed_at) "
                "VALUES ($9, $1, $2, $3, $4::numeric, $5::numeric, "
                "to_timestamp($6::double precision / 1000), $7, "
                "CASE WHEN $7 THEN to_timestamp($8::double precision / 1000) END) "
                "ON CONFLICT (run_id, holder, request_id) DO UPDATE SET "
                "completed = $7, completed_at = EXCLUDED.completed_at",
                r.holder,
                static_cast<int64_t>(r.id),
                r.receiver,
                std::to_string(r.shares_burned),
                std::to_string(r.assets_owed),
                r.created_at_ms,
                r.completed,
                r.completed_at_ms,
                run_id_
            );
        }
        
        txn.commit();
        
    } catch (const std::exception& e) {
        spdlog::error("Failed to save withdrawal requests: {}", e.what());
        throw;
    }
}

int64_t PostgresStore::save_snapshot(const VaultMetrics& metrics, bool paused) {
    try {
        auto conn = make_connection();
        pqxx::work txn(conn);
        
        auto result = txn.exec_params(
            "INSERT INTO vault_snapshots "
            "(run_id, total_value, total_shares, price_per_share, total_queued, idle_balance, "
            "shortfall, active_strategies, paused) "
            "VALUES ($9, $1::numeric, $2::numeric, $3::numeric, $4::numeric, $5::numeric, "
            "$8::numeric, $6, $7) "
            "RETURNING id",
            std::to_string(metrics.total_value),
            std::to_string(metrics.total_shares),
            std::to_string(metrics.price_per_share),
            std::to_string(metrics.total_queued),
            std::to_string(metrics.idle_balance),
            static_cast<int>(metrics.active_strategies),
            paused,
            std::to_string(metrics.shortfall),
            run_id_
        );
        
        txn.commit();
        return result[0][0].as<int64_t>();
        
    } catch (const std::exception& e) {
        spdlog::error("Failed to save snapshot: {}", e.what());
        throw;
    }
}

void PostgresStore::save_event(const VaultEvent& event) {
    try {
        auto conn = make_connection();
        pqxx::work txn(conn);
        
        txn.exec_params(
            "INSERT INTO vault_events (run_id, event, data, ts) "
            "VALUES ($4, $1, $2::jsonb, to_timestamp($3::double precision / 1000))",
            event.name,
            event.data.dump(),
            event.ts_ms,
            run_id_
        );
        
        txn.commit();
        
    } catch (const std::exception& e) {
        spdlog::error("Failed to save {} event: {}", event.name, e.what());
    }
}

bool PostgresStore::ping() {
    try {
        auto conn = make_connection();
        pqxx::work txn(conn);
        txn.exec("SELECT 1");
        txn.commit();
        return true;
    } catch (const std::exception& e) {
        spdlog::error("Postgres ping failed: {}", e.what());
        return false;
    }
}
