#include <chrono>
#include <csignal>
#include <cstdio>
#include <cstdlib>
#include <exception>
#include <iostream>
#include <sstream>
#include <string>
#include <thread>
#include <vector>

#include <boost/json.hpp>

#include "client/InvalidationTable.hpp"
#include "client/PresenceBeacon.hpp"
#include "client/SyncClient.hpp"
#include "core/WireProtocol.hpp"
#include "logging/Log.h"

namespace {

volatile std::sig_atomic_t gSignalStatus = 0;

void handleSignal(int signal) {
    gSignalStatus = signal;
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

bool hasFlag(int argc, char** argv, const std::string& flag) {
    for (int i = 1; i < argc; ++i) {
        if (flag == argv[i]) {
            return true;
        }
    }
    return false;
}

std::vector<domain::EventType> parseEventTypes(const std::string& csv) {
    std::vector<domain::EventType> types;
    std::stringstream ss(csv);
    std::string item;
    while (std::getline(ss, item, ',')) {
        if (item.empty()) {
            continue;
        }
        const auto type = domain::eventTypeFromString(item);
        if (!type) {
            throw std::runtime_error("Unknown event type: " + item);
        }
        types.push_back(*type);
    }
    return types;
}

void printUsage() {
    std::cerr << "usage: sync_tail --tenant <id> [--user <id>] [--user-name <name>] [--host 127.0.0.1]\n"
                 "                 [--port 8080] [--path /] [--tls] [--cursor N] [--events a,b]\n"
                 "                 [--view <entityType>/<entityId>] [--max-attempts N] [--log-level info]\n";
}

}  // namespace

int main(int argc, char** argv) {
    if (hasFlag(argc, argv, "--help") || hasFlag(argc, argv, "-h")) {
        printUsage();
        return EXIT_SUCCESS;
    }

    try {
        client::SyncClient::Options options;
        options.tenantId = valueFromArgs(argc, argv, "--tenant");
        if (options.tenantId.empty()) {
            printUsage();
            return EXIT_FAILURE;
        }
        if (auto user = valueFromArgs(argc, argv, "--user"); !user.empty()) {
            options.userId = user;
        }
        options.userName = valueFromArgs(argc, argv, "--user-name");
        if (auto host = valueFromArgs(argc, argv, "--host"); !host.empty()) {
            options.host = host;
        }
        if (auto port = valueFromArgs(argc, argv, "--port"); !port.empty()) {
            options.port = port;
        }
        if (auto path = valueFromArgs(argc, argv, "--path"); !path.empty()) {
            options.path = path;
        }
        options.tls = hasFlag(argc, argv, "--tls");
        if (auto cursor = valueFromArgs(argc, argv, "--cursor"); !cursor.empty()) {
            options.initialCursor = std::stoll(cursor);
        }
        if (auto attempts = valueFromArgs(argc, argv, "--max-attempts"); !attempts.empty()) {
            options.sync.backoff.maxAttempts = static_cast<std::size_t>(std::stoul(attempts));
        }
        options.subscriptions = parseEventTypes(valueFromArgs(argc, argv, "--events"));

        config::LogLevel level = config::LogLevel::Info;
        if (auto levelArg = valueFromArgs(argc, argv, "--log-level"); !levelArg.empty()) {
            if (!logging::Log::try_parse_log_level(levelArg, level)) {
                throw std::runtime_error("Invalid log level: " + levelArg);
            }
        }
        logging::Log::set_log_level(level);

        client::SyncStateMachine::Callbacks callbacks;
        callbacks.onEvent = [](const domain::Event& event) {
            std::string keys;
            for (const auto& key : client::InvalidationTable::keysFor(event)) {
                keys += keys.empty() ? key : "," + key;
            }
            std::cout << boost::json::serialize(core::wire::eventToJson(event)) << "  invalidates=" << keys
                      << std::endl;
        };
        callbacks.onFullRefresh = [](domain::SequenceNumber latest) {
            std::cout << "# full refresh required, resuming from " << latest << std::endl;
        };
        callbacks.onStateChange = [](client::SyncState from, client::SyncState to) {
            std::cerr << "# state " << client::syncStateToString(from) << " -> " << client::syncStateToString(to)
                      << std::endl;
        };
        callbacks.onGaveUp = []() { std::cerr << "# gave up reconnecting" << std::endl; };
        callbacks.onPresence = [](const core::wire::PresenceChange& change) {
            std::cout << "# presence " << domain::presenceSignalToString(change.signal) << ' ' << change.entityType
                      << '/' << change.entityId << " user=" << change.state.userId << std::endl;
        };
        callbacks.onInitialPresence = [](const core::wire::InitialPresence& snapshot) {
            std::cout << "# presence snapshot " << snapshot.entityType << '/' << snapshot.entityId
                      << " users=" << snapshot.users.size() << std::endl;
        };

        client::SyncClient syncClient(options, callbacks);

        std::shared_ptr<client::PresenceBeacon> beacon;
        const auto view = valueFromArgs(argc, argv, "--view");
        if (!view.empty()) {
            const auto slash = view.find('/');
            if (slash == std::string::npos || slash == 0 || slash + 1 == view.size()) {
                throw std::runtime_error("--view expects <entityType>/<entityId>");
            }
            if (!options.userId) {
                throw std::runtime_error("--view requires --user");
            }
            beacon = std::make_shared<client::PresenceBeacon>(
                [&syncClient](const std::string& text) { return syncClient.send(text); }, options.userName);
            syncClient.attachBeacon(beacon);
            beacon->attach(view.substr(0, slash), view.substr(slash + 1));
        }

        std::signal(SIGINT, handleSignal);
        std::signal(SIGTERM, handleSignal);

        syncClient.start();
        while (gSignalStatus == 0 && syncClient.state() != client::SyncState::GaveUp) {
            std::this_thread::sleep_for(std::chrono::milliseconds(200));
        }

        if (beacon) {
            beacon->detach();
            std::this_thread::sleep_for(std::chrono::milliseconds(100));
        }
        syncClient.stop();
        logging::Log::flush();
        std::cerr << "# last cursor " << syncClient.cursor() << std::endl;
        return syncClient.state() == client::SyncState::GaveUp ? EXIT_FAILURE : EXIT_SUCCESS;
    } catch (const std::exception& ex) {
        std::cerr << "sync_tail: " << ex.what() << std::endl;
        return EXIT_FAILURE;
    }
}
