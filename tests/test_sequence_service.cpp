#include <algorithm>
#include <iostream>
#include <memory>
#include <mutex>
#include <set>
#include <thread>
#include <vector>

#include <boost/json/object.hpp>

#include "adapters/duckdb/DuckEventLog.hpp"
#include "adapters/duckdb/DuckSequenceCounter.hpp"
#include "adapters/duckdb/DuckStore.hpp"
#include "core/SequenceService.hpp"

namespace {

domain::Event makeEvent(const std::string& tenant, domain::SequenceNumber seq) {
    domain::Event event;
    event.id = tenant + "-" + std::to_string(seq);
    event.sequenceNumber = seq;
    event.tenantId = tenant;
    event.eventType = domain::EventType::LeadCreated;
    event.payload = boost::json::object{{"id", seq}};
    event.timestamp = 1000;
    event.expiresAt = 1000 + 60'000;
    return event;
}

}  // namespace

int main() {
    adapters::duckdb::DuckStore store(":memory:");
    store.migrate();

    {
        // Many writers on one durable counter: unique and contiguous per tenant.
        auto counter = std::make_shared<adapters::duckdb::DuckSequenceCounter>(store);
        auto service = std::make_shared<core::SequenceService>(counter);

        constexpr int kThreads = 4;
        constexpr int kPerThread = 50;
        std::mutex mutex;
        std::vector<domain::SequenceNumber> issuedA;
        std::vector<domain::SequenceNumber> issuedB;
        bool failed = false;

        std::vector<std::thread> workers;
        for (int t = 0; t < kThreads; ++t) {
            workers.emplace_back([&, t]() {
                const std::string tenant = (t % 2 == 0) ? "tenant-a" : "tenant-b";
                for (int i = 0; i < kPerThread; ++i) {
                    auto value = service->next(tenant);
                    std::lock_guard<std::mutex> lock(mutex);
                    if (!value) {
                        failed = true;
                        continue;
                    }
                    (tenant == "tenant-a" ? issuedA : issuedB).push_back(*value);
                }
            });
        }
        for (auto& worker : workers) {
            worker.join();
        }

        if (failed) {
            std::cerr << "Sequence allocation failed under concurrency\n";
            return 1;
        }
        for (auto* issued : {&issuedA, &issuedB}) {
            std::sort(issued->begin(), issued->end());
            const auto expected = static_cast<std::size_t>(kThreads / 2 * kPerThread);
            if (issued->size() != expected) {
                std::cerr << "Expected " << expected << " values, got " << issued->size() << "\n";
                return 1;
            }
            for (std::size_t i = 0; i < issued->size(); ++i) {
                if ((*issued)[i] != static_cast<domain::SequenceNumber>(i + 1)) {
                    std::cerr << "Sequence not contiguous at index " << i << ": " << (*issued)[i] << "\n";
                    return 1;
                }
            }
        }
        if (service->lastIssued("tenant-a").value_or(0) != kThreads / 2 * kPerThread) {
            std::cerr << "lastIssued must report the highest value handed out\n";
            return 1;
        }
        if (service->next("")) {
            std::cerr << "Empty tenant must be rejected\n";
            return 1;
        }

        // A second counter on the same store continues where the first left off.
        core::SequenceService second(std::make_shared<adapters::duckdb::DuckSequenceCounter>(store));
        if (second.next("tenant-a").value_or(0) != kThreads / 2 * kPerThread + 1) {
            std::cerr << "Durable counter must survive a new instance\n";
            return 1;
        }
    }

    {
        // Independent allocators sharing the durable counter race on the same
        // row; conflicts are retried, never dropped or duplicated.
        constexpr int kAllocators = 3;
        constexpr int kPerAllocator = 40;
        std::vector<std::shared_ptr<core::SequenceService>> allocators;
        for (int i = 0; i < kAllocators; ++i) {
            allocators.push_back(std::make_shared<core::SequenceService>(
                std::make_shared<adapters::duckdb::DuckSequenceCounter>(store)));
        }

        std::mutex mutex;
        std::vector<domain::SequenceNumber> issued;
        int dropped = 0;
        std::vector<std::thread> workers;
        for (int a = 0; a < kAllocators; ++a) {
            workers.emplace_back([&, a]() {
                for (int i = 0; i < kPerAllocator; ++i) {
                    auto value = allocators[a]->next("tenant-shared");
                    std::lock_guard<std::mutex> lock(mutex);
                    if (!value) {
                        ++dropped;
                        continue;
                    }
                    issued.push_back(*value);
                }
            });
        }
        for (auto& worker : workers) {
            worker.join();
        }

        if (dropped != 0) {
            std::cerr << "Concurrent allocators dropped " << dropped << " allocations\n";
            return 1;
        }
        std::sort(issued.begin(), issued.end());
        if (std::adjacent_find(issued.begin(), issued.end()) != issued.end()) {
            std::cerr << "Concurrent allocators issued a duplicate sequence number\n";
            return 1;
        }
        const auto expected = static_cast<std::size_t>(kAllocators * kPerAllocator);
        if (issued.size() != expected || issued.front() != 1 ||
            issued.back() != static_cast<domain::SequenceNumber>(expected)) {
            std::cerr << "Concurrent allocators must cover 1.." << expected << " without holes\n";
            return 1;
        }
    }

    {
        // Durable counter seeds from the log watermark for a tenant it has never seen.
        adapters::duckdb::DuckEventLog log(store);
        if (!log.append(makeEvent("tenant-c", 41))) {
            std::cerr << "Failed to append seed event\n";
            return 1;
        }
        adapters::duckdb::DuckSequenceCounter counter(store);
        if (counter.next("tenant-c").value_or(0) != 42) {
            std::cerr << "Durable counter must start after the watermark\n";
            return 1;
        }
    }

    {
        // The in-process counter seeds from the watermark the same way.
        adapters::duckdb::DuckEventLog log(store);
        log.append(makeEvent("tenant-d", 7));
        core::SequenceService service(std::make_shared<core::LocalSequenceCounter>(log));
        const auto first = service.next("tenant-d");
        const auto second = service.next("tenant-d");
        const auto fresh = service.next("tenant-e");
        if (first.value_or(0) != 8 || second.value_or(0) != 9 || fresh.value_or(0) != 1) {
            std::cerr << "LocalSequenceCounter seeded incorrectly\n";
            return 1;
        }
    }

    {
        // A counter that goes backwards is refused rather than reissuing numbers.
        class RewindingCounter : public domain::contracts::ISequenceCounter {
        public:
            std::optional<domain::SequenceNumber> next(const domain::TenantId&) override {
                return values_[index_++ % 2];
            }

        private:
            domain::SequenceNumber values_[2] = {5, 3};
            std::size_t index_ = 0;
        };

        core::SequenceService service(std::make_shared<RewindingCounter>());
        if (service.next("t").value_or(0) != 5 || service.next("t")) {
            std::cerr << "Backwards counter value must be rejected\n";
            return 1;
        }
        if (service.lastIssued("t").value_or(0) != 5) {
            std::cerr << "Rejected value must not replace lastIssued\n";
            return 1;
        }
    }

    return 0;
}
