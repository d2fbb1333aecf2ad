#pragma once

#include <memory>
#include <mutex>
#include <optional>
#include <unordered_map>

#include "domain/Ports.hpp"

namespace core {

// Hands out per-tenant sequence numbers from an injected counter. The counter is
// the single authority; this class only validates and observes what it returns.
class SequenceService {
public:
    explicit SequenceService(std::shared_ptr<domain::contracts::ISequenceCounter> counter);

    std::optional<domain::SequenceNumber> next(const domain::TenantId& tenantId);

    std::optional<domain::SequenceNumber> lastIssued(const domain::TenantId& tenantId) const;

private:
    std::shared_ptr<domain::contracts::ISequenceCounter> counter_;
    mutable std::mutex mutex_;
    std::unordered_map<domain::TenantId, domain::SequenceNumber> lastIssued_;
};

// In-process counter seeded from the event log. Only safe with a single writer
// process; deployments with more than one instance use the durable counter.
class LocalSequenceCounter : public domain::contracts::ISequenceCounter {
public:
    explicit LocalSequenceCounter(const domain::contracts::IEventLog& log);

    std::optional<domain::SequenceNumber> next(const domain::TenantId& tenantId) override;

private:
    const domain::contracts::IEventLog& log_;
    std::mutex mutex_;
    std::unordered_map<domain::TenantId, domain::SequenceNumber> counters_;
};

}  // namespace core
