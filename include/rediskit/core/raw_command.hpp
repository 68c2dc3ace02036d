#ifndef REDISKIT_CORE_RAW_COMMAND_HPP
#define REDISKIT_CORE_RAW_COMMAND_HPP

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace rediskit::core {

/*
    minimum client capability a command needs. ordered: a command at level L may be executed by a
    client whose minimum allowed level is <= L.
        Connection    - changes connection state (CLIENT SETNAME, AUTH, SELECT): connection client only
        OperationOnly - only meaningful inside an operation holding a reservation (WATCH, MULTI, EXEC)
        Node          - any single node client (CLUSTER SLOTS, keyless server commands)
        Cluster       - key-routed commands, valid everywhere
*/
enum class Level : uint8_t {
    Unsafe = 0,
    Connection = 1,
    OperationOnly = 2,
    Node = 3,
    Cluster = 4,
};

const char* level_name(Level level);

struct RawCommand {
    std::vector<std::string> args;
    Level level = Level::Cluster;
    std::vector<std::size_t> key_positions;  // indexes into args

    [[nodiscard]] const std::string& name() const { return args.front(); }
    [[nodiscard]] std::vector<std::string> keys() const;

    // slot shared by all keys; nullopt when keyless; throws CrossSlotException
    [[nodiscard]] std::optional<int> slot() const;
};

// unit of routing: a single command or a MULTI ... EXEC group
struct RawCommandPack {
    std::vector<RawCommand> commands;

    [[nodiscard]] std::size_t reply_count() const noexcept { return commands.size(); }
    [[nodiscard]] std::optional<int> slot() const;
};

// what a connection executes in one contiguous write
struct RawCommandPacks {
    std::vector<RawCommandPack> packs;

    [[nodiscard]] std::size_t reply_count() const noexcept;
    [[nodiscard]] bool empty() const noexcept { return packs.empty(); }
    [[nodiscard]] std::string encode() const;

    // throws ForbiddenCommandException for the first command below min_allowed
    void require_level(Level min_allowed, const std::string& client_type) const;

    RawCommandPacks& append(const RawCommandPacks& other);
};

}  // namespace rediskit::core

#endif
