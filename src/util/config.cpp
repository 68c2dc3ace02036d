#include "rediskit/util/config.hpp"

#include <algorithm>
#include <fstream>
#include <iostream>
#include <memory>
#include <sstream>
#include <stdexcept>

namespace rediskit::util {

namespace {

std::string trim(const std::string& s) {
    size_t start = s.find_first_not_of(" \t\r\n");
    if (start == std::string::npos) return "";
    size_t end = s.find_last_not_of(" \t\r\n");
    return s.substr(start, end - start + 1);
}

int64_t parse_number(const std::string& key, const std::string& value) {
    try {
        size_t used = 0;
        int64_t parsed = std::stoll(value, &used);
        if (used != value.size()) {
            throw std::invalid_argument(value);
        }
        return parsed;
    } catch (const std::logic_error&) {
        throw std::invalid_argument("invalid value for " + key + ": '" + value + "'");
    }
}

std::size_t parse_count(const std::string& key, const std::string& value) {
    int64_t parsed = parse_number(key, value);
    if (parsed < 0) {
        throw std::invalid_argument("invalid value for " + key + ": '" + value + "'");
    }
    return static_cast<std::size_t>(parsed);
}

// returns false for unknown keys
bool apply(Config& config, const std::string& key, const std::string& value) {
    if (key == "mode") {
        config.mode = parse_client_mode(value);
    } else if (key == "seeds") {
        config.seeds = parse_seeds(value);
    } else if (key == "pool_size") {
        config.pool_size = parse_count(key, value);
    } else if (key == "connect_timeout_ms") {
        config.connect_timeout_ms = parse_number(key, value);
    } else if (key == "command_timeout_ms") {
        config.command_timeout_ms = parse_number(key, value);
    } else if (key == "reconnect_initial_ms") {
        config.reconnect_initial_ms = parse_number(key, value);
    } else if (key == "reconnect_max_ms") {
        config.reconnect_max_ms = parse_number(key, value);
    } else if (key == "reconnect_max_retries") {
        config.reconnect_max_retries = static_cast<int>(parse_number(key, value));
    } else if (key == "auto_refresh_ms") {
        config.auto_refresh_ms = parse_number(key, value);
    } else if (key == "min_refresh_ms") {
        config.min_refresh_ms = parse_number(key, value);
    } else if (key == "nodes_to_query") {
        config.nodes_to_query = parse_count(key, value);
    } else if (key == "node_client_close_delay_ms") {
        config.node_client_close_delay_ms = parse_number(key, value);
    } else if (key == "max_redirections") {
        config.max_redirections = static_cast<int>(parse_number(key, value));
    } else if (key == "log_level") {
        config.log_level = parse_log_level(value);
    } else {
        return false;
    }
    return true;
}

}  // namespace

ClientMode parse_client_mode(const std::string& s) {
    if (s == "connection") return ClientMode::Connection;
    if (s == "node") return ClientMode::Node;
    if (s == "cluster") return ClientMode::Cluster;
    throw std::invalid_argument("unknown client mode: '" + s + "'");
}

const char* client_mode_name(ClientMode mode) {
    switch (mode) {
        case ClientMode::Connection: return "connection";
        case ClientMode::Node: return "node";
        case ClientMode::Cluster: return "cluster";
    }
    return "unknown";
}

std::vector<core::NodeAddress> parse_seeds(const std::string& s) {
    std::vector<core::NodeAddress> seeds;
    std::istringstream in(s);
    std::string item;
    while (std::getline(in, item, ',')) {
        item = trim(item);
        if (!item.empty()) {
            seeds.push_back(core::NodeAddress::parse(item));
        }
    }
    if (seeds.empty()) {
        throw std::invalid_argument("no seed address given");
    }
    return seeds;
}

std::optional<Config> Config::load_file(const std::filesystem::path& path) {
    std::ifstream file(path);
    if (!file.is_open()) {
        return std::nullopt;
    }

    Config config;
    std::string line;

    while (std::getline(file, line)) {
        line = trim(line);

        if (line.empty() || line[0] == '#') {
            continue;
        }

        size_t eq = line.find('=');
        if (eq == std::string::npos) {
            continue;
        }

        std::string key = trim(line.substr(0, eq));
        std::string value = trim(line.substr(eq + 1));

        // remove quotes if present
        if (value.size() >= 2 && value.front() == '"' && value.back() == '"') {
            value = value.substr(1, value.size() - 2);
        }

        if (!apply(config, key, value)) {
            LOG_WARN("ignoring unknown config key '" + key + "' in " + path.string());
        }
    }

    return config;
}

std::optional<Config> Config::parse_args(int argc, char* argv[]) {
    Config config;

    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        if (arg == "-h" || arg == "--help") {
            std::cout << "Usage: " << argv[0] << " [options]\n"
                      << "Reads one command per line from stdin and prints the replies.\n"
                      << "Options:\n"
                      << "  -c, --config FILE          Config file path\n"
                      << "  -m, --mode MODE            connection, node or cluster (default: connection)\n"
                      << "  -s, --seeds LIST           host:port[,host:port...] (default: 127.0.0.1:6379)\n"
                      << "  -t, --timeout MS           Command timeout in ms (default: 5000)\n"
                      << "  -l, --log-level LEVEL      Log level: debug, info, warn, error, none\n"
                      << "  --pool-size N              Connections per node (default: 1)\n"
                      << "  --connect-timeout MS       Connect timeout in ms (default: 5000)\n"
                      << "  --max-redirections N       Cluster redirections per command (default: 3)\n"
                      << "  -h, --help                 Show this help\n";
            return std::nullopt;
        }
        if ((arg == "-m" || arg == "--mode") && i + 1 < argc) {
            config.mode = parse_client_mode(argv[++i]);
        } else if ((arg == "-s" || arg == "--seeds") && i + 1 < argc) {
            config.seeds = parse_seeds(argv[++i]);
        } else if ((arg == "-t" || arg == "--timeout") && i + 1 < argc) {
            config.command_timeout_ms = parse_number("timeout", argv[++i]);
        } else if ((arg == "-l" || arg == "--log-level") && i + 1 < argc) {
            config.log_level = parse_log_level(argv[++i]);
        } else if (arg == "--pool-size" && i + 1 < argc) {
            config.pool_size = parse_count("pool-size", argv[++i]);
        } else if (arg == "--connect-timeout" && i + 1 < argc) {
            config.connect_timeout_ms = parse_number("connect-timeout", argv[++i]);
        } else if (arg == "--max-redirections" && i + 1 < argc) {
            config.max_redirections = static_cast<int>(parse_number("max-redirections", argv[++i]));
        } else if ((arg == "-c" || arg == "--config") && i + 1 < argc) {
            // Config file handled separately in main
            ++i;
        } else {
            throw std::invalid_argument("unknown option: " + arg);
        }
    }

    return config;
}

std::optional<std::filesystem::path> Config::config_path(int argc, char* argv[]) {
    for (int i = 1; i + 1 < argc; ++i) {
        std::string arg = argv[i];
        if (arg == "-c" || arg == "--config") {
            return std::filesystem::path(argv[i + 1]);
        }
    }
    return std::nullopt;
}

Config Config::merge(const Config& file_config, const Config& cli_config, const Config& defaults) {
    Config result = defaults;
    for (const Config* layer : {&file_config, &cli_config}) {
        const Config& c = *layer;
        if (c.mode != defaults.mode) result.mode = c.mode;
        if (c.seeds != defaults.seeds) result.seeds = c.seeds;
        if (c.pool_size != defaults.pool_size) result.pool_size = c.pool_size;
        if (c.connect_timeout_ms != defaults.connect_timeout_ms) result.connect_timeout_ms = c.connect_timeout_ms;
        if (c.command_timeout_ms != defaults.command_timeout_ms) result.command_timeout_ms = c.command_timeout_ms;
        if (c.reconnect_initial_ms != defaults.reconnect_initial_ms) result.reconnect_initial_ms = c.reconnect_initial_ms;
        if (c.reconnect_max_ms != defaults.reconnect_max_ms) result.reconnect_max_ms = c.reconnect_max_ms;
        if (c.reconnect_max_retries != defaults.reconnect_max_retries) result.reconnect_max_retries = c.reconnect_max_retries;
        if (c.auto_refresh_ms != defaults.auto_refresh_ms) result.auto_refresh_ms = c.auto_refresh_ms;
        if (c.min_refresh_ms != defaults.min_refresh_ms) result.min_refresh_ms = c.min_refresh_ms;
        if (c.nodes_to_query != defaults.nodes_to_query) result.nodes_to_query = c.nodes_to_query;
        if (c.node_client_close_delay_ms != defaults.node_client_close_delay_ms) result.node_client_close_delay_ms = c.node_client_close_delay_ms;
        if (c.max_redirections != defaults.max_redirections) result.max_redirections = c.max_redirections;
        if (c.log_level != defaults.log_level) result.log_level = c.log_level;
    }
    return result;
}

core::ConnectionConfig Config::to_connection_config() const {
    core::ConnectionConfig config;
    config.reconnection_strategy = std::make_shared<core::ExponentialBackoff>(
        Duration(reconnect_initial_ms), Duration(reconnect_max_ms), reconnect_max_retries);
    config.connect_timeout = Duration(connect_timeout_ms);
    return config;
}

core::NodeConfig Config::to_node_config() const {
    core::NodeConfig config;
    config.pool_size = pool_size;
    auto connection = to_connection_config();
    config.connection_configs = [connection](std::size_t) { return connection; };
    return config;
}

core::ClusterConfig Config::to_cluster_config() const {
    core::ClusterConfig config;
    auto node = to_node_config();
    auto connection = to_connection_config();
    config.node_configs = [node](const core::NodeAddress&) { return node; };
    config.monitoring_connection_configs = [connection](const core::NodeAddress&) {
        return connection;
    };
    config.auto_refresh_interval = Duration(auto_refresh_ms);
    config.min_refresh_interval = Duration(min_refresh_ms);
    auto limit = nodes_to_query;
    config.nodes_to_query_for_state = [limit](std::size_t known) {
        return std::min(known, limit);
    };
    config.node_client_close_delay = Duration(node_client_close_delay_ms);
    config.max_redirections = max_redirections;
    return config;
}

}  // namespace rediskit::util
