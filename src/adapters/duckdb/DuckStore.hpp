#pragma once

#include <memory>
#include <string>

namespace duckdb {
class DuckDB;
}  // namespace duckdb

namespace adapters::duckdb {

// Owns the DuckDB database shared by the event log and the sequence counter.
// An empty path or ":memory:" opens an in-memory database.
class DuckStore {
public:
    explicit DuckStore(std::string dbPath = "data/tenantsync.duckdb");
    ~DuckStore();

    DuckStore(const DuckStore&) = delete;
    DuckStore& operator=(const DuckStore&) = delete;

    void migrate();

    ::duckdb::DuckDB& database() { return *db_; }
    const std::string& path() const { return dbPath_; }

private:
    std::string dbPath_;
    std::unique_ptr<::duckdb::DuckDB> db_;
};

}  // namespace adapters::duckdb
