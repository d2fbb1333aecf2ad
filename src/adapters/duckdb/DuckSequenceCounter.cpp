#include "adapters/duckdb/DuckSequenceCounter.hpp"

#include <algorithm>
#include <chrono>
#include <cstdint>
#include <random>
#include <string>
#include <thread>

#include <duckdb.hpp>

#include "adapters/duckdb/DuckStore.hpp"
#include "logging/Log.h"

namespace adapters::duckdb {
namespace {
constexpr logging::LogCategory kLogCategory = logging::LogCategory::SEQ;
constexpr int kMaxConflictRetries = 64;
constexpr int kMaxRetryPauseMs = 32;

using DuckdbValueVector = ::duckdb::vector<::duckdb::Value>;

bool isConflict(const std::string& message) {
    return message.find("onflict") != std::string::npos;
}

// Randomized pause between conflicting attempts, up to kMaxRetryPauseMs.
void pauseBeforeRetry(int attempt) {
    thread_local std::mt19937 rng{std::random_device{}()};
    const int ceiling = std::min(kMaxRetryPauseMs, 1 << std::min(attempt, 5));
    std::uniform_int_distribution<int> pause(1, std::max(1, ceiling));
    std::this_thread::sleep_for(std::chrono::milliseconds(pause(rng)));
}

}  // namespace

DuckSequenceCounter::DuckSequenceCounter(DuckStore& store) : store_(store) {}

std::optional<domain::SequenceNumber> DuckSequenceCounter::next(const domain::TenantId& tenantId) {
    std::lock_guard<std::mutex> lock(mutex_);
    for (int attempt = 0; attempt < kMaxConflictRetries; ++attempt) {
        bool conflict = false;
        auto value = tryNext_(tenantId, conflict);
        if (value || !conflict) {
            return value;
        }
        LOG_DEBUG(kLogCategory,
                  "DuckSequenceCounter transaction conflict tenant=%s attempt=%d",
                  tenantId.c_str(),
                  attempt + 1);
        pauseBeforeRetry(attempt + 1);
    }
    LOG_ERROR(kLogCategory, "DuckSequenceCounter gave up after repeated conflicts tenant=%s", tenantId.c_str());
    return std::nullopt;
}

std::optional<domain::SequenceNumber> DuckSequenceCounter::tryNext_(const domain::TenantId& tenantId,
                                                                    bool& conflict) {
    ::duckdb::Connection connection(store_.database());

    bool inTransaction = false;
    auto rollback = [&]() {
        if (!inTransaction) {
            return;
        }
        try {
            connection.Rollback();
        }
        catch (const std::exception& ex) {
            LOG_WARN(kLogCategory, "DuckSequenceCounter rollback failed: %s", ex.what());
        }
        inTransaction = false;
    };
    auto fail = [&](const char* step, const std::string& message) -> std::optional<domain::SequenceNumber> {
        conflict = isConflict(message);
        if (!conflict) {
            LOG_WARN(kLogCategory,
                     "DuckSequenceCounter %s failed tenant=%s error=%s",
                     step,
                     tenantId.c_str(),
                     message.c_str());
        }
        rollback();
        return std::nullopt;
    };

    try {
        connection.BeginTransaction();
        inTransaction = true;

        DuckdbValueVector tenantParam;
        tenantParam.emplace_back(tenantId);

        auto seed = connection.Prepare(
            "INSERT INTO event_sequences (tenant_id, last_value) "
            "SELECT $1, COALESCE((SELECT max_sequence FROM event_watermarks WHERE tenant_id = $1), 0) "
            "ON CONFLICT (tenant_id) DO NOTHING");
        if (!seed || seed->HasError()) {
            return fail("prepare seed", seed ? seed->GetError() : std::string{"null statement"});
        }
        auto seeded = seed->Execute(tenantParam);
        if (!seeded || seeded->HasError()) {
            return fail("seed", seeded ? seeded->GetError() : std::string{"unknown error"});
        }

        auto bump = connection.Prepare("UPDATE event_sequences SET last_value = last_value + 1 WHERE tenant_id = ?");
        if (!bump || bump->HasError()) {
            return fail("prepare increment", bump ? bump->GetError() : std::string{"null statement"});
        }
        auto bumped = bump->Execute(tenantParam);
        if (!bumped || bumped->HasError()) {
            return fail("increment", bumped ? bumped->GetError() : std::string{"unknown error"});
        }

        auto read = connection.Prepare("SELECT last_value FROM event_sequences WHERE tenant_id = ?");
        if (!read || read->HasError()) {
            return fail("prepare read", read ? read->GetError() : std::string{"null statement"});
        }
        auto current = read->Execute(tenantParam);
        if (!current || current->HasError()) {
            return fail("read", current ? current->GetError() : std::string{"unknown error"});
        }

        std::optional<domain::SequenceNumber> value;
        if (auto chunk = current->Fetch()) {
            if (chunk->size() > 0 && !chunk->GetValue(0, 0).IsNull()) {
                value = chunk->GetValue(0, 0).GetValue<std::int64_t>();
            }
        }
        if (!value) {
            return fail("read", "counter row missing after increment");
        }

        // A failed commit is already rolled back by DuckDB.
        inTransaction = false;
        connection.Commit();
        return value;
    }
    catch (const std::exception& ex) {
        return fail("transaction", ex.what());
    }
}

}  // namespace adapters::duckdb
