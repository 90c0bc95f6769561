#include "node_config.hpp"
#include <cstdlib>
#include <stdexcept>
#include "biteledger/errors.hpp"

namespace node {

int parse_port(const std::string& value) {
    size_t consumed = 0;
    int port = 0;
    try {
        port = std::stoi(value, &consumed);
    } catch (const std::logic_error&) {
        throw biteledger::InvalidArgumentError("Invalid port: " + value);
    }
    if (consumed != value.size() || port < 1 || port > 65535) {
        throw biteledger::InvalidArgumentError("Invalid port: " + value);
    }
    return port;
}

NodeConfig NodeConfig::load(const Environment& env, const std::vector<std::string>& args) {
    NodeConfig config;
    if (auto port = env("BITELEDGER_PORT")) {
        config.port = parse_port(*port);
    }
    if (auto path = env("BITELEDGER_SNAPSHOT_PATH")) {
        config.snapshot_path = *path;
    }
    if (auto level = env("BITELEDGER_LOG_LEVEL")) {
        config.log_level = *level;
    }
    if (!args.empty()) {
        config.port = parse_port(args.front());
    }
    return config;
}

NodeConfig NodeConfig::from_env(int argc, char** argv) {
    auto process_env = [](const std::string& name) -> std::optional<std::string> {
        const char* value = std::getenv(name.c_str());
        if (!value) return std::nullopt;
        return std::string(value);
    };
    std::vector<std::string> args;
    for (int i = 1; i < argc; ++i) {
        args.emplace_back(argv[i]);
    }
    return load(process_env, args);
}

} // namespace node
