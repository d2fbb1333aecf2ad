#include "adapters/duckdb/DuckStore.hpp"

#include <filesystem>
#include <stdexcept>
#include <string>
#include <system_error>
#include <utility>

#include <duckdb.hpp>

#include "logging/Log.h"

namespace fs = std::filesystem;

namespace adapters::duckdb {
namespace {
constexpr logging::LogCategory kLogCategory = logging::LogCategory::DB;

bool isInMemory(const std::string& path) {
    return path.empty() || path == ":memory:";
}

constexpr const char* kMigrations[] = {
    R"SQL(
        CREATE TABLE IF NOT EXISTS event_log (
            tenant_id TEXT NOT NULL,
            sequence_number BIGINT NOT NULL,
            event_id TEXT NOT NULL UNIQUE,
            event_type TEXT NOT NULL,
            payload TEXT NOT NULL,
            user_id TEXT,
            timestamp_ms BIGINT NOT NULL,
            expires_at_ms BIGINT NOT NULL,
            PRIMARY KEY(tenant_id, sequence_number)
        )
    )SQL",
    R"SQL(
        CREATE TABLE IF NOT EXISTS event_watermarks (
            tenant_id TEXT PRIMARY KEY,
            max_sequence BIGINT NOT NULL
        )
    )SQL",
    R"SQL(
        CREATE TABLE IF NOT EXISTS event_sequences (
            tenant_id TEXT PRIMARY KEY,
            last_value BIGINT NOT NULL
        )
    )SQL",
    "CREATE INDEX IF NOT EXISTS event_log_expires_idx ON event_log(expires_at_ms)",
};

}  // namespace

DuckStore::DuckStore(std::string dbPath) : dbPath_(std::move(dbPath)) {
    if (isInMemory(dbPath_)) {
        db_ = std::make_unique<::duckdb::DuckDB>(nullptr);
        return;
    }

    const fs::path path{dbPath_};
    if (path.has_parent_path()) {
        std::error_code ec;
        fs::create_directories(path.parent_path(), ec);
        if (ec) {
            throw std::runtime_error("DuckStore: unable to create directory '" +
                                     path.parent_path().string() + "': " + ec.message());
        }
    }
    db_ = std::make_unique<::duckdb::DuckDB>(path.string());
}

DuckStore::~DuckStore() = default;

void DuckStore::migrate() {
    ::duckdb::Connection connection(*db_);

    for (const char* statement : kMigrations) {
        auto result = connection.Query(statement);
        if (!result || result->HasError()) {
            const std::string errorMessage =
                result ? result->GetError() : std::string("unknown error running migration");
            throw std::runtime_error("DuckStore: migration failed: " + errorMessage);
        }
    }

    LOG_INFO(kLogCategory,
             "DuckStore migration finished path=%s",
             isInMemory(dbPath_) ? ":memory:" : dbPath_.c_str());
}

}  // namespace adapters::duckdb
