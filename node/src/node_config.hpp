#pragma once

#include <functional>
#include <optional>
#include <string>
#include <vector>

namespace node {

/**
 * Ledger node settings.
 *
 * Read from BITELEDGER_PORT, BITELEDGER_SNAPSHOT_PATH and
 * BITELEDGER_LOG_LEVEL; a first command-line argument overrides the
 * port.
 */
struct NodeConfig {
    static constexpr int DEFAULT_PORT = 50061;

    int port = DEFAULT_PORT;
    /// Empty disables persistence.
    std::string snapshot_path;
    std::string log_level = "info";

    std::string listen_address() const { return "0.0.0.0:" + std::to_string(port); }

    using Environment = std::function<std::optional<std::string>(const std::string&)>;

    /**
     * @param env Variable lookup
     * @param args Command-line arguments after the program name
     * @throws biteledger::InvalidArgumentError for a malformed port
     */
    static NodeConfig load(const Environment& env, const std::vector<std::string>& args);

    /// load() over the process environment and argv.
    static NodeConfig from_env(int argc, char** argv);
};

/// Parse a TCP port in [1, 65535].
int parse_port(const std::string& value);

} // namespace node
