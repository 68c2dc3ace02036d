#ifndef REDISKIT_UTIL_CONFIG_HPP
#define REDISKIT_UTIL_CONFIG_HPP

#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>
#include <vector>

#include "rediskit/core/config.hpp"
#include "rediskit/core/node_address.hpp"
#include "rediskit/util/logger.hpp"

namespace rediskit::util {

enum class ClientMode { Connection, Node, Cluster };

// throws std::invalid_argument
ClientMode parse_client_mode(const std::string& s);
const char* client_mode_name(ClientMode mode);

// "host:port,host:port"; throws std::invalid_argument
std::vector<core::NodeAddress> parse_seeds(const std::string& s);

struct Config {
    // client
    ClientMode mode = ClientMode::Connection;
    std::vector<core::NodeAddress> seeds = {core::NodeAddress{}};
    std::size_t pool_size = 1;
    int64_t connect_timeout_ms = 5000;
    int64_t command_timeout_ms = 5000;

    // reconnection
    int64_t reconnect_initial_ms = 100;
    int64_t reconnect_max_ms = 10000;
    int reconnect_max_retries = -1;  // unlimited

    // cluster
    int64_t auto_refresh_ms = 5000;
    int64_t min_refresh_ms = 1000;
    std::size_t nodes_to_query = 3;
    int64_t node_client_close_delay_ms = 1000;
    int max_redirections = 3;

    // logging
    LogLevel log_level = LogLevel::Info;

    // flat "key = value" file, '#' starts a comment. nullopt when the file cannot be opened,
    // malformed values throw std::invalid_argument
    static std::optional<Config> load_file(const std::filesystem::path& path);

    // parse CLI args, returns nullopt on --help
    static std::optional<Config> parse_args(int argc, char* argv[]);

    // value of -c/--config, if given
    static std::optional<std::filesystem::path> config_path(int argc, char* argv[]);

    // merge: CLI overrides file, file overrides defaults
    static Config merge(const Config& file_config, const Config& cli_config,
                        const Config& defaults);

    [[nodiscard]] core::ConnectionConfig to_connection_config() const;
    [[nodiscard]] core::NodeConfig to_node_config() const;
    [[nodiscard]] core::ClusterConfig to_cluster_config() const;
    [[nodiscard]] Duration command_timeout() const { return Duration(command_timeout_ms); }
};

}  // namespace rediskit::util

#endif
