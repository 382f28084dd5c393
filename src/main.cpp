#include "app/Application.hpp"

#include <spdlog/spdlog.h>

#include <cstdlib>
#include <filesystem>
#include <iostream>
#include <optional>
#include <string>
#include <vector>

namespace {

void printUsage(const char* program) {
    std::cerr << "Usage: " << program << " [options] <command> [args]\n"
              << "\nOptions:\n"
              << "  --data-dir DIR     Data directory (default: $XDG_DATA_HOME/hostwatch)\n"
              << "  -v, --verbose      Log debug messages to the console\n"
              << "  -h, --help         Show this help message\n"
              << "\nCommands:\n"
              << "  run                        Check hosts periodically until interrupted\n"
              << "  check [none|wifi|mobile]   Check all hosts once\n"
              << "  add <host> <port>          Start monitoring a host\n"
              << "  remove <host> <port>       Stop monitoring a host\n"
              << "  list                       Show monitored hosts and their status\n"
              << "  reset                      Remove all hosts\n"
              << "  set <key> <value>          Change a setting (socket-timeout, max-attempts,\n"
              << "                             channel, interval, log-level)\n"
              << "  status                     Show the active connection type\n";
}

std::filesystem::path defaultDataDir() {
    if (const char* xdg = std::getenv("XDG_DATA_HOME"); xdg && *xdg) {
        return std::filesystem::path(xdg) / "hostwatch";
    }
    if (const char* home = std::getenv("HOME"); home && *home) {
        return std::filesystem::path(home) / ".local" / "share" / "hostwatch";
    }
    return std::filesystem::current_path() / ".hostwatch";
}

std::optional<hostwatch::core::Host> parseHost(const std::vector<std::string>& args) {
    if (args.size() != 2) {
        return std::nullopt;
    }

    try {
        size_t consumed = 0;
        int port = std::stoi(args[1], &consumed);
        if (consumed != args[1].size()) {
            return std::nullopt;
        }
        return hostwatch::core::Host{args[0], port};
    } catch (const std::exception&) {
        return std::nullopt;
    }
}

int dispatch(hostwatch::app::Application& app, const std::string& command,
             const std::vector<std::string>& args) {
    using hostwatch::core::connectionTypeFromString;

    if (command == "run" && args.empty()) {
        return app.run();
    }

    if (command == "check" && args.size() <= 1) {
        std::optional<hostwatch::core::ConnectionType> type;
        if (!args.empty()) {
            type = connectionTypeFromString(args[0]);
            if (!type) {
                spdlog::error("Unknown connection type '{}'", args[0]);
                return 1;
            }
        }
        return app.check(type);
    }

    if (command == "add" || command == "remove") {
        auto host = parseHost(args);
        if (!host) {
            spdlog::error("Usage: {} <host> <port>", command);
            return 1;
        }
        return command == "add" ? app.addHost(*host) : app.removeHost(*host);
    }

    if (command == "list" && args.empty()) {
        return app.listHosts();
    }

    if (command == "reset" && args.empty()) {
        return app.resetHosts();
    }

    if (command == "set" && args.size() == 2) {
        return app.setOption(args[0], args[1]);
    }

    if (command == "status" && args.empty()) {
        return app.showStatus();
    }

    spdlog::error("Unknown command or wrong arguments: {}", command);
    return 1;
}

} // namespace

int main(int argc, char* argv[]) {
    std::filesystem::path dataDir;
    bool verbose = false;
    std::string command;
    std::vector<std::string> args;

    for (int i = 1; i < argc; i++) {
        std::string arg = argv[i];
        if (!command.empty()) {
            args.push_back(arg);
        } else if (arg == "-h" || arg == "--help") {
            printUsage(argv[0]);
            return 0;
        } else if (arg == "--data-dir" && i + 1 < argc) {
            dataDir = argv[++i];
        } else if (arg == "-v" || arg == "--verbose") {
            verbose = true;
        } else if (!arg.empty() && arg[0] == '-') {
            std::cerr << "Unknown option: " << arg << "\n";
            printUsage(argv[0]);
            return 1;
        } else {
            command = arg;
        }
    }

    if (command.empty()) {
        printUsage(argv[0]);
        return 1;
    }

    if (dataDir.empty()) {
        dataDir = defaultDataDir();
    }

    try {
        hostwatch::app::Application app(dataDir, verbose);
        return dispatch(app, command, args);
    } catch (const std::exception& e) {
        spdlog::critical("Fatal error: {}", e.what());
        return 1;
    }
}
