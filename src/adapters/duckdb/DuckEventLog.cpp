#include "adapters/duckdb/DuckEventLog.hpp"

#include <algorithm>
#include <cstdint>
#include <limits>
#include <stdexcept>
#include <string>
#include <utility>

#include <boost/json.hpp>
#include <duckdb.hpp>

#include "adapters/duckdb/DuckStore.hpp"
#include "logging/Log.h"

namespace adapters::duckdb {
namespace {
constexpr logging::LogCategory kLogCategory = logging::LogCategory::DB;

using DuckdbValueVector = ::duckdb::vector<::duckdb::Value>;

std::string resultError(const ::duckdb::QueryResult* result, const char* fallback) {
    return result ? result->GetError() : std::string{fallback};
}

void logRollbackFailure(const std::exception& ex) {
    LOG_WARN(kLogCategory, "DuckEventLog rollback failed: %s", ex.what());
}

std::optional<domain::Event> rowToEvent(::duckdb::DataChunk& chunk, ::duckdb::idx_t row) {
    const auto typeText = chunk.GetValue(3, row).GetValue<std::string>();
    const auto type = domain::eventTypeFromString(typeText);
    if (!type) {
        LOG_WARN(kLogCategory, "DuckEventLog skipping row with unknown event_type=%s", typeText.c_str());
        return std::nullopt;
    }

    domain::Event event;
    event.tenantId = chunk.GetValue(0, row).GetValue<std::string>();
    event.sequenceNumber = chunk.GetValue(1, row).GetValue<std::int64_t>();
    event.id = chunk.GetValue(2, row).GetValue<std::string>();
    event.eventType = *type;

    const auto payloadText = chunk.GetValue(4, row).GetValue<std::string>();
    boost::json::error_code ec;
    event.payload = boost::json::parse(payloadText, ec);
    if (ec) {
        LOG_WARN(kLogCategory,
                 "DuckEventLog payload parse failed tenant=%s seq=%lld error=%s",
                 event.tenantId.c_str(),
                 static_cast<long long>(event.sequenceNumber),
                 ec.message().c_str());
        event.payload = nullptr;
    }

    const auto userValue = chunk.GetValue(5, row);
    if (!userValue.IsNull()) {
        event.userId = userValue.GetValue<std::string>();
    }
    event.timestamp = chunk.GetValue(6, row).GetValue<std::int64_t>();
    event.expiresAt = chunk.GetValue(7, row).GetValue<std::int64_t>();
    return event;
}

}  // namespace

DuckEventLog::DuckEventLog(DuckStore& store) : store_(store) {}

bool DuckEventLog::append(const domain::Event& event) {
    std::lock_guard<std::mutex> writeLock(writeMutex_);

    try {
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
                logRollbackFailure(ex);
            }
            inTransaction = false;
        };

        try {
            connection.BeginTransaction();
            inTransaction = true;

            auto insert = connection.Prepare(
                "INSERT INTO event_log (tenant_id, sequence_number, event_id, event_type, payload, user_id, "
                "timestamp_ms, expires_at_ms) VALUES (?, ?, ?, ?, ?, ?, ?, ?)");
            if (!insert || insert->HasError()) {
                LOG_WARN(kLogCategory,
                         "DuckEventLog prepare insert failed: %s",
                         insert ? insert->GetError().c_str() : "null statement");
                rollback();
                return false;
            }

            DuckdbValueVector parameters;
            parameters.reserve(8);
            parameters.emplace_back(event.tenantId);
            parameters.emplace_back(::duckdb::Value::BIGINT(event.sequenceNumber));
            parameters.emplace_back(event.id);
            parameters.emplace_back(std::string(domain::eventTypeToString(event.eventType)));
            parameters.emplace_back(boost::json::serialize(event.payload));
            if (event.userId) {
                parameters.emplace_back(*event.userId);
            }
            else {
                parameters.emplace_back(::duckdb::Value(::duckdb::LogicalType::VARCHAR));
            }
            parameters.emplace_back(::duckdb::Value::BIGINT(event.timestamp));
            parameters.emplace_back(::duckdb::Value::BIGINT(event.expiresAt));

            auto inserted = insert->Execute(parameters);
            if (!inserted || inserted->HasError()) {
                LOG_WARN(kLogCategory,
                         "DuckEventLog insert failed tenant=%s seq=%lld error=%s",
                         event.tenantId.c_str(),
                         static_cast<long long>(event.sequenceNumber),
                         resultError(inserted.get(), "failed to execute insert").c_str());
                rollback();
                return false;
            }

            auto watermark = connection.Prepare(
                "INSERT INTO event_watermarks (tenant_id, max_sequence) VALUES (?, ?) "
                "ON CONFLICT (tenant_id) DO UPDATE SET max_sequence = greatest(max_sequence, excluded.max_sequence)");
            if (!watermark || watermark->HasError()) {
                LOG_WARN(kLogCategory,
                         "DuckEventLog prepare watermark failed: %s",
                         watermark ? watermark->GetError().c_str() : "null statement");
                rollback();
                return false;
            }

            DuckdbValueVector watermarkParams;
            watermarkParams.emplace_back(event.tenantId);
            watermarkParams.emplace_back(::duckdb::Value::BIGINT(event.sequenceNumber));
            auto updated = watermark->Execute(watermarkParams);
            if (!updated || updated->HasError()) {
                LOG_WARN(kLogCategory,
                         "DuckEventLog watermark update failed tenant=%s error=%s",
                         event.tenantId.c_str(),
                         resultError(updated.get(), "failed to update watermark").c_str());
                rollback();
                return false;
            }

            connection.Commit();
            inTransaction = false;
            return true;
        }
        catch (...) {
            rollback();
            throw;
        }
    }
    catch (const std::exception& ex) {
        LOG_WARN(kLogCategory,
                 "DuckEventLog append exception tenant=%s seq=%lld error=%s",
                 event.tenantId.c_str(),
                 static_cast<long long>(event.sequenceNumber),
                 ex.what());
    }
    return false;
}

std::optional<std::vector<domain::Event>> DuckEventLog::readSince(const domain::TenantId& tenantId,
                                                                  domain::SequenceNumber since,
                                                                  std::size_t limit,
                                                                  domain::TimestampMs nowMs) const {
    try {
        ::duckdb::Connection connection(store_.database());
        auto statement = connection.Prepare(
            "SELECT tenant_id, sequence_number, event_id, event_type, payload, user_id, timestamp_ms, expires_at_ms "
            "FROM event_log WHERE tenant_id = ? AND sequence_number > ? AND expires_at_ms > ? "
            "ORDER BY sequence_number ASC LIMIT ?");
        if (!statement || statement->HasError()) {
            LOG_WARN(kLogCategory,
                     "DuckEventLog prepare readSince failed: %s",
                     statement ? statement->GetError().c_str() : "null statement");
            return std::nullopt;
        }

        const auto limitValue = static_cast<std::int64_t>(
            std::min<std::size_t>(limit, static_cast<std::size_t>(std::numeric_limits<std::int64_t>::max())));
        DuckdbValueVector parameters;
        parameters.reserve(4);
        parameters.emplace_back(tenantId);
        parameters.emplace_back(::duckdb::Value::BIGINT(since));
        parameters.emplace_back(::duckdb::Value::BIGINT(nowMs));
        parameters.emplace_back(::duckdb::Value::BIGINT(limitValue));

        auto result = statement->Execute(parameters);
        if (!result || result->HasError()) {
            LOG_WARN(kLogCategory,
                     "DuckEventLog readSince failed tenant=%s since=%lld error=%s",
                     tenantId.c_str(),
                     static_cast<long long>(since),
                     resultError(result.get(), "unknown query error").c_str());
            return std::nullopt;
        }

        std::vector<domain::Event> events;
        events.reserve(std::min<std::size_t>(limit, 256));
        while (auto chunk = result->Fetch()) {
            const auto count = chunk->size();
            for (::duckdb::idx_t row = 0; row < count; ++row) {
                if (auto event = rowToEvent(*chunk, row)) {
                    events.push_back(std::move(*event));
                }
            }
        }
        return events;
    }
    catch (const std::exception& ex) {
        LOG_WARN(kLogCategory, "DuckEventLog readSince exception tenant=%s error=%s", tenantId.c_str(), ex.what());
    }
    return std::nullopt;
}

std::optional<domain::SequenceNumber> DuckEventLog::scalarSequence_(const char* sql,
                                                                    const domain::TenantId& tenantId,
                                                                    std::optional<domain::TimestampMs> nowMs) const {
    try {
        ::duckdb::Connection connection(store_.database());
        auto statement = connection.Prepare(sql);
        if (!statement || statement->HasError()) {
            LOG_WARN(kLogCategory,
                     "DuckEventLog prepare failed: %s",
                     statement ? statement->GetError().c_str() : "null statement");
            return std::nullopt;
        }

        DuckdbValueVector parameters;
        parameters.emplace_back(tenantId);
        if (nowMs) {
            parameters.emplace_back(::duckdb::Value::BIGINT(*nowMs));
        }

        auto result = statement->Execute(parameters);
        if (!result || result->HasError()) {
            LOG_WARN(kLogCategory,
                     "DuckEventLog scalar query failed tenant=%s error=%s",
                     tenantId.c_str(),
                     resultError(result.get(), "unknown query error").c_str());
            return std::nullopt;
        }

        if (auto chunk = result->Fetch()) {
            if (chunk->size() > 0) {
                const auto value = chunk->GetValue(0, 0);
                if (!value.IsNull()) {
                    return value.GetValue<std::int64_t>();
                }
            }
        }
    }
    catch (const std::exception& ex) {
        LOG_WARN(kLogCategory, "DuckEventLog scalar query exception tenant=%s error=%s", tenantId.c_str(), ex.what());
    }
    return std::nullopt;
}

std::optional<domain::SequenceNumber> DuckEventLog::oldestRetained(const domain::TenantId& tenantId,
                                                                   domain::TimestampMs nowMs) const {
    return scalarSequence_("SELECT MIN(sequence_number) FROM event_log WHERE tenant_id = ? AND expires_at_ms > ?",
                           tenantId,
                           nowMs);
}

std::optional<domain::SequenceNumber> DuckEventLog::highWatermark(const domain::TenantId& tenantId) const {
    return scalarSequence_("SELECT max_sequence FROM event_watermarks WHERE tenant_id = ?", tenantId, std::nullopt);
}

std::optional<std::size_t> DuckEventLog::rowCount(const domain::TenantId& tenantId) const {
    auto count = scalarSequence_("SELECT COUNT(*) FROM event_log WHERE tenant_id = ?", tenantId, std::nullopt);
    if (!count) {
        return std::nullopt;
    }
    return static_cast<std::size_t>(*count);
}

std::size_t DuckEventLog::purgeExpired(domain::TimestampMs nowMs) {
    std::lock_guard<std::mutex> writeLock(writeMutex_);
    try {
        ::duckdb::Connection connection(store_.database());
        auto statement = connection.Prepare("DELETE FROM event_log WHERE expires_at_ms <= ?");
        if (!statement || statement->HasError()) {
            LOG_WARN(kLogCategory,
                     "DuckEventLog prepare purge failed: %s",
                     statement ? statement->GetError().c_str() : "null statement");
            return 0;
        }

        DuckdbValueVector parameters;
        parameters.emplace_back(::duckdb::Value::BIGINT(nowMs));
        auto result = statement->Execute(parameters);
        if (!result || result->HasError()) {
            LOG_WARN(kLogCategory,
                     "DuckEventLog purge failed: %s",
                     resultError(result.get(), "unknown query error").c_str());
            return 0;
        }

        std::int64_t deleted = 0;
        if (auto chunk = result->Fetch()) {
            if (chunk->size() > 0) {
                const auto value = chunk->GetValue(0, 0);
                if (!value.IsNull()) {
                    deleted = value.GetValue<std::int64_t>();
                }
            }
        }
        if (deleted > 0) {
            LOG_INFO(kLogCategory, "DuckEventLog purged expired rows=%lld", static_cast<long long>(deleted));
        }
        return static_cast<std::size_t>(std::max<std::int64_t>(deleted, 0));
    }
    catch (const std::exception& ex) {
        LOG_WARN(kLogCategory, "DuckEventLog purge exception: %s", ex.what());
    }
    return 0;
}

}  // namespace adapters::duckdb
