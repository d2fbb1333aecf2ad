#pragma once

#include <cstddef>
#include <cstdint>
#include <string>

#include "config/Config.h"

namespace tsync::common {

enum class SequenceBackend { Duck, Local };

const char* sequenceBackendToString(SequenceBackend backend);

struct Config {
    std::uint16_t port = 8080;
    std::string bindAddress = "0.0.0.0";
    std::size_t threads = 2;
    config::LogLevel logLevel = config::LogLevel::Info;
    std::string duckdbPath = "./data/tenantsync.duckdb";
    SequenceBackend sequenceBackend = SequenceBackend::Duck;

    std::uint32_t retentionHours = 24;
    std::size_t cacheCapacity = 1000;
    std::size_t syncBatchLimit = 100;
    std::uint32_t purgeIntervalMs = 60000;
    std::uint32_t presenceTtlMs = 300000;

    std::uint32_t wsPingPeriodMs = 30000;
    std::uint32_t wsPongTimeoutMs = 75000;
    std::size_t wsSendQueueMaxMsgs = 500;
    std::size_t wsSendQueueMaxBytes = 15728640;  // 15 MiB
    std::uint32_t wsStallTimeoutMs = 20000;
    std::size_t wsMaxProtocolErrors = 5;

    // Optional key=value file; keys are the CLI names without the leading dashes.
    std::string configFile;

    static Config fromArgs(int argc, char** argv);
};

}  // namespace tsync::common
