#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

#include "common/Config.hpp"

namespace {

struct EnvGuard {
    explicit EnvGuard(std::vector<std::string> names) : names_(std::move(names)) {
        for (const auto& name : names_) {
            const char* current = std::getenv(name.c_str());
            saved_.push_back(current ? std::optional<std::string>(current) : std::nullopt);
            ::unsetenv(name.c_str());
        }
    }

    ~EnvGuard() {
        for (std::size_t i = 0; i < names_.size(); ++i) {
            if (saved_[i]) {
                ::setenv(names_[i].c_str(), saved_[i]->c_str(), 1);
            } else {
                ::unsetenv(names_[i].c_str());
            }
        }
    }

    void set(const std::string& name, const std::string& value) { ::setenv(name.c_str(), value.c_str(), 1); }
    void clear(const std::string& name) { ::unsetenv(name.c_str()); }

    std::vector<std::string> names_;
    std::vector<std::optional<std::string>> saved_;
};

::tsync::common::Config runConfig(const std::vector<std::string>& args) {
    std::vector<char*> argv;
    argv.reserve(args.size());
    for (const auto& arg : args) {
        argv.push_back(const_cast<char*>(arg.c_str()));
    }
    return ::tsync::common::Config::fromArgs(static_cast<int>(argv.size()), argv.data());
}

bool throws(const std::vector<std::string>& args) {
    try {
        runConfig(args);
    } catch (const std::runtime_error&) {
        return true;
    }
    return false;
}

}  // namespace

int main() {
    EnvGuard env({"DUCKDB_PATH", "PORT", "LOG_LEVEL", "SEQUENCE_BACKEND", "RETENTION_HOURS", "TSYNC_CONFIG",
                  "WS_PONG_TIMEOUT_MS", "WS_PING_PERIOD_MS"});

    const auto root = std::filesystem::temp_directory_path() / "tenantsync_test_config";
    std::filesystem::remove_all(root);
    const std::string flagPath = (root / "flag" / "events.duckdb").string();
    const std::string envPath = (root / "env" / "events.duckdb").string();
    const std::string filePath = (root / "file" / "events.duckdb").string();

    // Defaults with nothing set; in-memory path keeps the filesystem untouched.
    auto defaults = runConfig({"app", "--duckdb", ":memory:"});
    if (defaults.port != 8080 || defaults.retentionHours != 24 || defaults.cacheCapacity != 1000 ||
        defaults.syncBatchLimit != 100 || defaults.wsPingPeriodMs != 30000 || defaults.wsPongTimeoutMs != 75000 ||
        defaults.sequenceBackend != tsync::common::SequenceBackend::Duck ||
        defaults.logLevel != config::LogLevel::Info) {
        std::cerr << "Unexpected default configuration\n";
        return 1;
    }

    // Environment variable overrides default and creates the parent directory.
    env.set("DUCKDB_PATH", envPath);
    env.set("PORT", "9090");
    auto fromEnv = runConfig({"app"});
    if (fromEnv.duckdbPath != envPath || fromEnv.port != 9090) {
        std::cerr << "Expected env values, got path=" << fromEnv.duckdbPath << " port=" << fromEnv.port << "\n";
        return 1;
    }
    if (!std::filesystem::exists(std::filesystem::path(envPath).parent_path())) {
        std::cerr << "Expected parent directory for env path to be created\n";
        return 1;
    }

    // CLI flag overrides environment variable.
    auto fromFlag = runConfig({"app", "--duckdb", flagPath, "--port=7070", "--log-level", "debug"});
    if (fromFlag.duckdbPath != flagPath || fromFlag.port != 7070 || fromFlag.logLevel != config::LogLevel::Debug) {
        std::cerr << "Expected flag values to win over env\n";
        return 1;
    }
    env.clear("DUCKDB_PATH");
    env.clear("PORT");

    // Config file is the lowest layer: env and flags still win.
    std::filesystem::create_directories(root);
    const auto confFile = (root / "tenantsync.conf").string();
    {
        std::ofstream out(confFile);
        out << "# tenantsync test config\n"
            << "port = 6060\n"
            << "duckdb = " << filePath << "\n"
            << "sequence-backend = local\n"
            << "retention-hours = 48   # two days\n"
            << "cache-capacity = 50\n";
    }
    env.set("RETENTION_HOURS", "12");
    auto fromFile = runConfig({"app", "--config", confFile, "--cache-capacity", "75"});
    if (fromFile.port != 6060 || fromFile.duckdbPath != filePath ||
        fromFile.sequenceBackend != tsync::common::SequenceBackend::Local || fromFile.retentionHours != 12 ||
        fromFile.cacheCapacity != 75 || fromFile.configFile != confFile) {
        std::cerr << "Unexpected layering of file, env and flags\n";
        return 1;
    }
    env.clear("RETENTION_HOURS");

    env.set("TSYNC_CONFIG", confFile);
    auto fromEnvFile = runConfig({"app"});
    if (fromEnvFile.port != 6060 || fromEnvFile.retentionHours != 48) {
        std::cerr << "Expected TSYNC_CONFIG to select the config file\n";
        return 1;
    }
    env.clear("TSYNC_CONFIG");

    // Invalid values are rejected.
    if (!throws({"app", "--duckdb", ":memory:", "--port", "0"}) ||
        !throws({"app", "--duckdb", ":memory:", "--port", "abc"}) ||
        !throws({"app", "--duckdb", ":memory:", "--sequence-backend", "redis"}) ||
        !throws({"app", "--duckdb", ":memory:", "--log-level", "loud"}) ||
        !throws({"app", "--duckdb", ":memory:", "--retention-hours", "-1"}) ||
        !throws({"app", "--duckdb", ":memory:", "--ws-ping-period-ms", "80000"}) ||
        !throws({"app", "--config", (root / "missing.conf").string()})) {
        std::cerr << "Expected invalid configuration to throw\n";
        return 1;
    }

    {
        std::ofstream out(confFile);
        out << "no-such-key = 1\n";
    }
    if (!throws({"app", "--config", confFile})) {
        std::cerr << "Expected unknown config file key to throw\n";
        return 1;
    }

    std::filesystem::remove_all(root);
    return 0;
}
