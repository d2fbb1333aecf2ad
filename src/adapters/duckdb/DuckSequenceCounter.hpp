#pragma once

#include <mutex>
#include <optional>

#include "domain/Ports.hpp"

namespace adapters::duckdb {

class DuckStore;

// Durable per-tenant counter. Each call runs an increment-and-read inside one
// transaction against event_sequences, seeded from the event log watermark the
// first time a tenant is seen.
class DuckSequenceCounter : public domain::contracts::ISequenceCounter {
public:
    explicit DuckSequenceCounter(DuckStore& store);

    std::optional<domain::SequenceNumber> next(const domain::TenantId& tenantId) override;

private:
    std::optional<domain::SequenceNumber> tryNext_(const domain::TenantId& tenantId, bool& conflict);

    DuckStore& store_;
    std::mutex mutex_;
};

}  // namespace adapters::duckdb
