#include "common/Config.hpp"

#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <functional>
#include <limits>
#include <stdexcept>
#include <string>
#include <system_error>
#include <unordered_map>
#include <vector>

#include "logging/Log.h"

namespace tsync::common {
namespace {

std::string toLower(std::string value) {
    std::transform(value.begin(), value.end(), value.begin(), [](unsigned char c) {
        return static_cast<char>(std::tolower(c));
    });
    return value;
}

std::string trim(std::string value) {
    auto isSpace = [](unsigned char ch) { return std::isspace(ch) != 0; };
    value.erase(value.begin(), std::find_if(value.begin(), value.end(), [&](unsigned char ch) {
                   return !isSpace(ch);
               }));
    value.erase(std::find_if(value.rbegin(), value.rend(), [&](unsigned char ch) {
                    return !isSpace(ch);
                }).base(),
                value.end());
    return value;
}

std::uint16_t parsePort(const std::string& value) {
    try {
        const auto portValue = std::stoul(value);
        if (portValue == 0U || portValue > 65535U) {
            throw std::out_of_range("port out of range");
        }
        return static_cast<std::uint16_t>(portValue);
    } catch (const std::exception&) {
        throw std::runtime_error("Invalid port: " + value);
    }
}

std::size_t parsePositive(const std::string& value, const std::string& label) {
    try {
        if (!value.empty() && value.front() == '-') {
            throw std::out_of_range("negative");
        }
        const auto parsed = std::stoull(value);
        if (parsed == 0U) {
            throw std::out_of_range("must be >= 1");
        }
        return static_cast<std::size_t>(parsed);
    } catch (const std::exception&) {
        throw std::runtime_error("Invalid value for " + label + ": " + value);
    }
}

std::size_t parseSize(const std::string& value, const std::string& label) {
    try {
        if (!value.empty() && value.front() == '-') {
            throw std::out_of_range("negative");
        }
        return static_cast<std::size_t>(std::stoull(value));
    } catch (const std::exception&) {
        throw std::runtime_error("Invalid value for " + label + ": " + value);
    }
}

std::uint32_t parseDurationMs(const std::string& value, const std::string& label) {
    try {
        if (!value.empty() && value.front() == '-') {
            throw std::out_of_range("negative");
        }
        const auto parsed = std::stoul(value);
        if (parsed == 0U || parsed > std::numeric_limits<std::uint32_t>::max()) {
            throw std::out_of_range("duration out of range");
        }
        return static_cast<std::uint32_t>(parsed);
    } catch (const std::exception&) {
        throw std::runtime_error("Invalid value for " + label + ": " + value);
    }
}

config::LogLevel parseLogLevel(const std::string& value) {
    config::LogLevel level{};
    if (!logging::Log::try_parse_log_level(trim(value), level)) {
        throw std::runtime_error("Invalid log level: " + value);
    }
    return level;
}

SequenceBackend parseSequenceBackend(const std::string& value) {
    const auto normalized = toLower(trim(value));
    if (normalized == "duck") {
        return SequenceBackend::Duck;
    }
    if (normalized == "local") {
        return SequenceBackend::Local;
    }
    throw std::runtime_error("Invalid sequence backend: " + value);
}

std::string valueFromArgs(int argc, char** argv, const std::string& key) {
    const std::string withEquals = key + '=';
    for (int i = 1; i < argc; ++i) {
        std::string arg{argv[i]};
        if (arg == key && i + 1 < argc) {
            return argv[i + 1];
        }
        if (arg.rfind(withEquals, 0) == 0) {
            return arg.substr(withEquals.size());
        }
    }
    return {};
}

std::unordered_map<std::string, std::string> readConfigFile(const std::string& path) {
    std::ifstream in(path);
    if (!in) {
        throw std::runtime_error("Cannot open config file: " + path);
    }

    std::unordered_map<std::string, std::string> values;
    std::string line;
    std::size_t lineNumber = 0;
    while (std::getline(in, line)) {
        ++lineNumber;
        if (const auto hash = line.find('#'); hash != std::string::npos) {
            line.erase(hash);
        }
        line = trim(line);
        if (line.empty()) {
            continue;
        }
        const auto eq = line.find('=');
        if (eq == std::string::npos) {
            throw std::runtime_error("Malformed config line " + std::to_string(lineNumber) + " in " + path);
        }
        auto key = toLower(trim(line.substr(0, eq)));
        if (key.rfind("--", 0) == 0) {
            key.erase(0, 2);
        }
        values[key] = trim(line.substr(eq + 1));
    }
    return values;
}

struct Setting {
    const char* key;  // CLI name without dashes; also the config file key
    const char* env;
    std::function<void(Config&, const std::string&)> apply;
};

const std::vector<Setting>& settings() {
    static const std::vector<Setting> kSettings{
        {"port", "PORT", [](Config& c, const std::string& v) { c.port = parsePort(v); }},
        {"bind", "BIND_ADDRESS", [](Config& c, const std::string& v) {
             auto address = trim(v);
             if (address.empty()) {
                 throw std::runtime_error("Bind address cannot be empty");
             }
             c.bindAddress = std::move(address);
         }},
        {"threads", "THREADS", [](Config& c, const std::string& v) { c.threads = parsePositive(v, "threads"); }},
        {"log-level", "LOG_LEVEL", [](Config& c, const std::string& v) { c.logLevel = parseLogLevel(v); }},
        {"duckdb", "DUCKDB_PATH", [](Config& c, const std::string& v) {
             auto pathValue = trim(v);
             if (!pathValue.empty()) {
                 c.duckdbPath = std::move(pathValue);
             }
         }},
        {"sequence-backend", "SEQUENCE_BACKEND",
         [](Config& c, const std::string& v) { c.sequenceBackend = parseSequenceBackend(v); }},
        {"retention-hours", "RETENTION_HOURS",
         [](Config& c, const std::string& v) {
             c.retentionHours = static_cast<std::uint32_t>(
                 std::min<std::size_t>(parsePositive(v, "retention-hours"), std::numeric_limits<std::uint32_t>::max()));
         }},
        {"cache-capacity", "CACHE_CAPACITY",
         [](Config& c, const std::string& v) { c.cacheCapacity = parsePositive(v, "cache-capacity"); }},
        {"sync-batch-limit", "SYNC_BATCH_LIMIT",
         [](Config& c, const std::string& v) { c.syncBatchLimit = parsePositive(v, "sync-batch-limit"); }},
        {"purge-interval-ms", "PURGE_INTERVAL_MS",
         [](Config& c, const std::string& v) { c.purgeIntervalMs = parseDurationMs(v, "purge-interval-ms"); }},
        {"presence-ttl-ms", "PRESENCE_TTL_MS",
         [](Config& c, const std::string& v) { c.presenceTtlMs = parseDurationMs(v, "presence-ttl-ms"); }},
        {"ws-ping-period-ms", "WS_PING_PERIOD_MS",
         [](Config& c, const std::string& v) { c.wsPingPeriodMs = parseDurationMs(v, "ws-ping-period-ms"); }},
        {"ws-pong-timeout-ms", "WS_PONG_TIMEOUT_MS",
         [](Config& c, const std::string& v) { c.wsPongTimeoutMs = parseDurationMs(v, "ws-pong-timeout-ms"); }},
        {"ws-send-queue-max-msgs", "WS_SEND_QUEUE_MAX_MSGS",
         [](Config& c, const std::string& v) { c.wsSendQueueMaxMsgs = parseSize(v, "ws-send-queue-max-msgs"); }},
        {"ws-send-queue-max-bytes", "WS_SEND_QUEUE_MAX_BYTES",
         [](Config& c, const std::string& v) { c.wsSendQueueMaxBytes = parseSize(v, "ws-send-queue-max-bytes"); }},
        {"ws-stall-timeout-ms", "WS_STALL_TIMEOUT_MS",
         [](Config& c, const std::string& v) { c.wsStallTimeoutMs = parseDurationMs(v, "ws-stall-timeout-ms"); }},
        {"ws-max-protocol-errors", "WS_MAX_PROTOCOL_ERRORS",
         [](Config& c, const std::string& v) { c.wsMaxProtocolErrors = parseSize(v, "ws-max-protocol-errors"); }},
    };
    return kSettings;
}

}  // namespace

const char* sequenceBackendToString(SequenceBackend backend) {
    switch (backend) {
    case SequenceBackend::Duck:
        return "duck";
    case SequenceBackend::Local:
        return "local";
    }
    return "duck";
}

Config Config::fromArgs(int argc, char** argv) {
    Config config{};

    if (auto fileArg = valueFromArgs(argc, argv, "--config"); !fileArg.empty()) {
        config.configFile = trim(fileArg);
    } else if (const char* envFile = std::getenv("TSYNC_CONFIG")) {
        config.configFile = trim(envFile);
    }

    // Lowest precedence first: file, then environment, then flags.
    if (!config.configFile.empty()) {
        const auto fileValues = readConfigFile(config.configFile);
        for (const auto& [key, value] : fileValues) {
            const auto& all = settings();
            const auto it = std::find_if(all.begin(), all.end(), [&key](const Setting& s) { return key == s.key; });
            if (it == all.end()) {
                throw std::runtime_error("Unknown key in config file " + config.configFile + ": " + key);
            }
            it->apply(config, value);
        }
    }

    for (const auto& setting : settings()) {
        if (const char* envValue = std::getenv(setting.env)) {
            setting.apply(config, envValue);
        }
    }

    for (const auto& setting : settings()) {
        if (auto arg = valueFromArgs(argc, argv, std::string("--") + setting.key); !arg.empty()) {
            setting.apply(config, arg);
        }
    }

    if (config.wsPongTimeoutMs <= config.wsPingPeriodMs) {
        throw std::runtime_error("ws-pong-timeout-ms must be greater than ws-ping-period-ms");
    }

    if (config.duckdbPath != ":memory:") {
        const std::filesystem::path duckPath{config.duckdbPath};
        const auto parentDir = duckPath.parent_path();
        if (!parentDir.empty()) {
            std::error_code ec;
            std::filesystem::create_directories(parentDir, ec);
            if (ec) {
                throw std::runtime_error("Cannot create directory for DuckDB (" + parentDir.string() + "): " +
                                         ec.message());
            }
        }
    }

    return config;
}

}  // namespace tsync::common
