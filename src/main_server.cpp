#include <chrono>
#include <csignal>
#include <cstdio>
#include <cstdlib>
#include <exception>
#include <memory>
#include <thread>

#include "adapters/api/http/Router.hpp"
#include "adapters/api/ws/WsServer.hpp"
#include "adapters/duckdb/DuckEventLog.hpp"
#include "adapters/duckdb/DuckSequenceCounter.hpp"
#include "adapters/duckdb/DuckStore.hpp"
#include "app/EventEmitter.hpp"
#include "app/RetentionSweeper.hpp"
#include "app/SyncProtocolHandler.hpp"
#include "common/Config.hpp"
#include "core/ConnectionRegistry.hpp"
#include "core/EventStore.hpp"
#include "core/PresenceTracker.hpp"
#include "core/SequenceService.hpp"
#include "logging/Log.h"

namespace {

constexpr logging::LogCategory kLogCategory = logging::LogCategory::NET;

volatile std::sig_atomic_t gSignalStatus = 0;

void handleSignal(int signal) {
    gSignalStatus = signal;
}

void logConfig(const tsync::common::Config& config) {
    LOG_INFO(kLogCategory, "Configuration loaded");
    LOG_INFO(kLogCategory, "  Listen: %s:%u", config.bindAddress.c_str(), static_cast<unsigned>(config.port));
    LOG_INFO(kLogCategory, "  Log level: %s", logging::Log::level_to_string(config.logLevel));
    LOG_INFO(kLogCategory, "  Worker threads: %zu", config.threads);
    LOG_INFO(kLogCategory, "  DuckDB: %s", config.duckdbPath.c_str());
    LOG_INFO(kLogCategory, "  Sequence backend: %s", tsync::common::sequenceBackendToString(config.sequenceBackend));
    LOG_INFO(kLogCategory,
             "  Retention: %u h, cache=%zu, sync batch=%zu",
             config.retentionHours,
             config.cacheCapacity,
             config.syncBatchLimit);
    LOG_INFO(kLogCategory,
             "  Purge interval: %u ms, presence TTL: %u ms",
             config.purgeIntervalMs,
             config.presenceTtlMs);
    LOG_INFO(kLogCategory,
             "  WS ping=%u ms pong timeout=%u ms",
             config.wsPingPeriodMs,
             config.wsPongTimeoutMs);
    LOG_INFO(kLogCategory,
             "  WS send queue max msgs=%zu max bytes=%zu stall=%u ms",
             config.wsSendQueueMaxMsgs,
             config.wsSendQueueMaxBytes,
             config.wsStallTimeoutMs);
    if (!config.configFile.empty()) {
        LOG_INFO(kLogCategory, "  Config file: %s", config.configFile.c_str());
    }
}

}  // namespace

int main(int argc, char** argv) {
    std::set_terminate([] {
        auto eptr = std::current_exception();
        if (eptr) {
            try {
                std::rethrow_exception(eptr);
            } catch (const std::exception& ex) {
                std::fprintf(stderr, "std::terminate: %s\n", ex.what());
            } catch (...) {
                std::fprintf(stderr, "std::terminate: unknown exception\n");
            }
        } else {
            std::fprintf(stderr, "std::terminate without current_exception\n");
        }
        std::_Exit(1);
    });

    try {
        const auto config = tsync::common::Config::fromArgs(argc, argv);
        logging::Log::set_log_level(config.logLevel);
        logConfig(config);

        adapters::duckdb::DuckStore duckStore(config.duckdbPath);
        duckStore.migrate();

        auto eventLog = std::make_shared<adapters::duckdb::DuckEventLog>(duckStore);

        std::shared_ptr<domain::contracts::ISequenceCounter> counter;
        if (config.sequenceBackend == tsync::common::SequenceBackend::Duck) {
            counter = std::make_shared<adapters::duckdb::DuckSequenceCounter>(duckStore);
        } else {
            LOG_WARN(kLogCategory, "Local sequence counter selected; run a single instance against this database");
            counter = std::make_shared<core::LocalSequenceCounter>(*eventLog);
        }

        auto sequences = std::make_shared<core::SequenceService>(counter);

        core::EventStore::Options storeOptions;
        storeOptions.cacheCapacity = config.cacheCapacity;
        storeOptions.defaultLimit = config.syncBatchLimit;
        auto eventStore = std::make_shared<core::EventStore>(eventLog, storeOptions);

        auto registry = std::make_shared<core::ConnectionRegistry>();
        auto presence = std::make_shared<core::PresenceTracker>(std::chrono::milliseconds(config.presenceTtlMs));

        app::EventEmitter::Options emitterOptions;
        emitterOptions.retention = std::chrono::hours(config.retentionHours);
        auto emitter = std::make_shared<app::EventEmitter>(sequences, eventStore, registry, emitterOptions);

        app::SyncProtocolHandler::Options handlerOptions;
        handlerOptions.syncBatchLimit = config.syncBatchLimit;
        handlerOptions.maxProtocolErrors = config.wsMaxProtocolErrors;
        auto handler = std::make_shared<app::SyncProtocolHandler>(eventStore, registry, presence, handlerOptions);

        auto router = std::make_shared<const adapters::api::http::Router>(emitter, presence);

        adapters::api::ws::WsServer::Options serverOptions;
        serverOptions.bindAddress = config.bindAddress;
        serverOptions.port = config.port;
        serverOptions.threads = config.threads;
        serverOptions.keepAlive.pingPeriod = std::chrono::milliseconds(config.wsPingPeriodMs);
        serverOptions.keepAlive.pongTimeout = std::chrono::milliseconds(config.wsPongTimeoutMs);
        serverOptions.sendQueue.maxMessages = config.wsSendQueueMaxMsgs;
        serverOptions.sendQueue.maxBytes = config.wsSendQueueMaxBytes;
        serverOptions.sendQueue.stallTimeout = std::chrono::milliseconds(config.wsStallTimeoutMs);
        adapters::api::ws::WsServer server(serverOptions, handler, router);

        app::RetentionSweeper sweeper(eventStore, presence, registry, std::chrono::milliseconds(config.purgeIntervalMs));

        std::signal(SIGINT, handleSignal);
        std::signal(SIGTERM, handleSignal);

        server.start();
        sweeper.start();
        LOG_INFO(kLogCategory, "Server running on port %u", static_cast<unsigned>(server.boundPort()));

        while (gSignalStatus == 0) {
            std::this_thread::sleep_for(std::chrono::milliseconds(200));
        }

        LOG_INFO(kLogCategory, "Signal %d received, shutting down", static_cast<int>(gSignalStatus));
        sweeper.stop();
        server.stop();
        LOG_INFO(kLogCategory, "Shutdown complete");
    } catch (const std::exception& ex) {
        LOG_ERROR(kLogCategory, "Fatal error: %s", ex.what());
        logging::Log::flush();
        return EXIT_FAILURE;
    }

    logging::Log::flush();
    return EXIT_SUCCESS;
}
