#include "rediskit/actor/actor_system.hpp"
#include "rediskit/client/cluster_client.hpp"
#include "rediskit/client/connection_client.hpp"
#include "rediskit/client/node_client.hpp"
#include "rediskit/core/commands.hpp"
#include "rediskit/util/config.hpp"
#include "rediskit/util/logger.hpp"
#include "rediskit/util/signal_handler.hpp"

#include <future>
#include <iostream>
#include <memory>
#include <string>
#include <vector>

using namespace rediskit;

namespace {

// whitespace separated, "double quoted" arguments may contain spaces
std::vector<std::string> split_args(const std::string& line) {
    std::vector<std::string> args;
    std::string current;
    bool quoted = false;
    bool pending = false;
    for (char c : line) {
        if (c == '"') {
            quoted = !quoted;
            pending = true;
        } else if (!quoted && (c == ' ' || c == '\t')) {
            if (pending) {
                args.push_back(current);
                current.clear();
                pending = false;
            }
        } else {
            current += c;
            pending = true;
        }
    }
    if (pending) {
        args.push_back(current);
    }
    return args;
}

}  // namespace

int main(int argc, char* argv[]) {
    util::Config config;
    try {
        util::Config defaults;
        util::Config file_config;
        if (auto path = util::Config::config_path(argc, argv)) {
            auto loaded = util::Config::load_file(*path);
            if (!loaded) {
                std::cerr << "Cannot read config file " << path->string() << std::endl;
                return 1;
            }
            file_config = *loaded;
        }
        auto cli_config = util::Config::parse_args(argc, argv);
        if (!cli_config) {
            return 0;
        }
        config = util::Config::merge(file_config, *cli_config, defaults);
    } catch (const std::exception& e) {
        std::cerr << "Invalid configuration: " << e.what() << std::endl;
        return 1;
    }

    util::Logger::instance().set_level(config.log_level);
    util::SignalHandler::install();

    actor::ActorSystem system;
    std::unique_ptr<client::RedisExecutor> executor;
    std::shared_future<void> initialized;
    const auto& seed = config.seeds.front();

    switch (config.mode) {
        case util::ClientMode::Connection: {
            auto c = std::make_unique<client::ConnectionClient>(system, seed,
                                                                config.to_connection_config());
            initialized = c->initialized();
            executor = std::move(c);
            break;
        }
        case util::ClientMode::Node: {
            auto c = std::make_unique<client::NodeClient>(system, seed, config.to_node_config());
            initialized = c->initialized();
            executor = std::move(c);
            break;
        }
        case util::ClientMode::Cluster: {
            auto c = std::make_unique<client::ClusterClient>(system, config.seeds,
                                                             config.to_cluster_config());
            initialized = c->initialized();
            executor = std::move(c);
            break;
        }
    }

    try {
        if (initialized.wait_for(config.command_timeout()) != std::future_status::ready) {
            std::cerr << "Connection failed: timed out" << std::endl;
            return 1;
        }
        initialized.get();
        std::cout << "Connected to " << seed.to_string() << " ("
                  << util::client_mode_name(config.mode) << ")" << std::endl;
    } catch (const std::exception& e) {
        std::cerr << "Connection failed: " << e.what() << std::endl;
        return 1;
    }

    std::string line;
    std::cout << "> " << std::flush;

    while (!util::SignalHandler::should_shutdown() && std::getline(std::cin, line)) {
        auto args = split_args(line);
        if (args.empty()) {
            std::cout << "> " << std::flush;
            continue;
        }
        if (args.size() == 1 && (args[0] == "quit" || args[0] == "QUIT" || args[0] == "exit")) {
            std::cout << "BYE" << std::endl;
            break;
        }

        try {
            // a cluster routes by key: the first argument after the command name is taken as one
            auto batch = config.mode == util::ClientMode::Cluster && args.size() > 1
                             ? core::commands::raw_keyed(args, {1})
                             : core::commands::raw(args);
            auto reply = executor->execute_batch(batch, config.command_timeout()).get();
            std::cout << reply.to_string() << std::endl;
        } catch (const std::exception& e) {
            std::cout << "(error) " << e.what() << std::endl;
        }

        std::cout << "> " << std::flush;
    }

    executor.reset();
    system.shutdown();
    return 0;
}
