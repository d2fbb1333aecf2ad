#pragma once

#include <mutex>
#include <optional>
#include <string>
#include <vector>

#include "domain/Ports.hpp"

namespace adapters::duckdb {

class DuckStore;

class DuckEventLog : public domain::contracts::IEventLog {
public:
    explicit DuckEventLog(DuckStore& store);

    bool append(const domain::Event& event) override;

    std::optional<std::vector<domain::Event>> readSince(const domain::TenantId& tenantId,
                                                        domain::SequenceNumber since,
                                                        std::size_t limit,
                                                        domain::TimestampMs nowMs) const override;

    std::optional<domain::SequenceNumber> oldestRetained(const domain::TenantId& tenantId,
                                                         domain::TimestampMs nowMs) const override;

    std::optional<domain::SequenceNumber> highWatermark(const domain::TenantId& tenantId) const override;

    std::size_t purgeExpired(domain::TimestampMs nowMs) override;

    // Number of rows currently in the log for a tenant, expired or not.
    std::optional<std::size_t> rowCount(const domain::TenantId& tenantId) const;

private:
    std::optional<domain::SequenceNumber> scalarSequence_(const char* sql,
                                                          const domain::TenantId& tenantId,
                                                          std::optional<domain::TimestampMs> nowMs) const;

    DuckStore& store_;
    std::mutex writeMutex_;
};

}  // namespace adapters::duckdb
