#include "rediskit/core/raw_command.hpp"

#include "rediskit/core/errors.hpp"
#include "rediskit/core/slots.hpp"
#include "rediskit/protocol/resp.hpp"

namespace rediskit::core {

const char* level_name(Level level) {
    switch (level) {
        case Level::Unsafe:
            return "unsafe";
        case Level::Connection:
            return "connection";
        case Level::OperationOnly:
            return "operation";
        case Level::Node:
            return "node";
        case Level::Cluster:
            return "cluster";
    }
    return "unknown";
}

std::vector<std::string> RawCommand::keys() const {
    std::vector<std::string> result;
    result.reserve(key_positions.size());
    for (auto pos : key_positions) {
        result.push_back(args.at(pos));
    }
    return result;
}

std::optional<int> RawCommand::slot() const {
    std::optional<int> result;
    for (auto pos : key_positions) {
        int s = key_slot(args.at(pos));
        if (result && *result != s) {
            throw CrossSlotException();
        }
        result = s;
    }
    return result;
}

std::optional<int> RawCommandPack::slot() const {
    std::optional<int> result;
    for (const auto& command : commands) {
        auto s = command.slot();
        if (!s) {
            continue;
        }
        if (result && *result != *s) {
            throw CrossSlotException();
        }
        result = s;
    }
    return result;
}

std::size_t RawCommandPacks::reply_count() const noexcept {
    std::size_t count = 0;
    for (const auto& pack : packs) {
        count += pack.reply_count();
    }
    return count;
}

std::string RawCommandPacks::encode() const {
    std::string buf;
    for (const auto& pack : packs) {
        for (const auto& command : pack.commands) {
            protocol::RespEncoder::encode_command_into(buf, command.args);
        }
    }
    return buf;
}

void RawCommandPacks::require_level(Level min_allowed, const std::string& client_type) const {
    for (const auto& pack : packs) {
        for (const auto& command : pack.commands) {
            if (command.level < min_allowed) {
                throw ForbiddenCommandException(command.name(), client_type);
            }
        }
    }
}

RawCommandPacks& RawCommandPacks::append(const RawCommandPacks& other) {
    packs.insert(packs.end(), other.packs.begin(), other.packs.end());
    return *this;
}

}  // namespace rediskit::core
