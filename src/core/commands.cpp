#include "rediskit/core/commands.hpp"

#include <string>

#include "rediskit/core/errors.hpp"

namespace rediskit::core::commands {

namespace {

RawCommandPacks single(std::vector<std::string> args, Level level,
                       std::vector<std::size_t> key_positions = {}) {
    RawCommandPacks packs;
    RawCommandPack pack;
    pack.commands.push_back(RawCommand{std::move(args), level, std::move(key_positions)});
    packs.packs.push_back(std::move(pack));
    return packs;
}

const RespValue& checked(const RespValue& reply) {
    if (reply.is_error()) {
        throw ErrorReplyException(reply.str);
    }
    return reply;
}

std::vector<std::size_t> positions(std::size_t first, std::size_t count) {
    std::vector<std::size_t> result;
    for (std::size_t i = 0; i < count; ++i) {
        result.push_back(first + i);
    }
    return result;
}

}  // namespace

namespace decode {

bool ok(const RespValue& reply) {
    const auto& r = checked(reply);
    if (r.is_nil()) {
        return false;
    }
    if (r.type == protocol::RespType::SimpleString && r.str == "OK") {
        return true;
    }
    throw UnexpectedReplyException("expected OK, got " + r.to_string());
}

std::string simple_or_bulk(const RespValue& reply) {
    const auto& r = checked(reply);
    if (r.type == protocol::RespType::SimpleString || r.type == protocol::RespType::BulkString) {
        return r.str;
    }
    throw UnexpectedReplyException("expected string, got " + r.to_string());
}

std::optional<std::string> nullable_bulk(const RespValue& reply) {
    const auto& r = checked(reply);
    if (r.is_nil()) {
        return std::nullopt;
    }
    if (r.type == protocol::RespType::BulkString) {
        return r.str;
    }
    throw UnexpectedReplyException("expected bulk string, got " + r.to_string());
}

int64_t integer(const RespValue& reply) {
    const auto& r = checked(reply);
    if (r.type == protocol::RespType::Integer) {
        return r.integer;
    }
    throw UnexpectedReplyException("expected integer, got " + r.to_string());
}

/*
    CLUSTER SLOTS reply, one entry per range:
        1) start slot
        2) end slot
        3) master: host, port[, node id, ...]
        4...) replicas, ignored
*/
std::vector<SlotRangeMapping> slot_mappings(const RespValue& reply) {
    const auto& r = checked(reply);
    if (!r.is_array()) {
        throw UnexpectedReplyException("expected CLUSTER SLOTS array, got " + r.to_string());
    }

    std::vector<SlotRangeMapping> result;
    result.reserve(r.elements.size());
    for (const auto& entry : r.elements) {
        if (!entry.is_array() || entry.elements.size() < 3) {
            throw UnexpectedReplyException("malformed slot range entry: " + entry.to_string());
        }
        const auto& master = entry.elements[2];
        if (!master.is_array() || master.elements.size() < 2) {
            throw UnexpectedReplyException("malformed master entry: " + master.to_string());
        }

        int64_t start = integer(entry.elements[0]);
        int64_t end = integer(entry.elements[1]);
        if (start < 0 || end >= kSlotCount || start > end) {
            throw UnexpectedReplyException("invalid slot range " + std::to_string(start) + "-" +
                                           std::to_string(end));
        }
        int64_t port = integer(master.elements[1]);
        if (port <= 0 || port > 65535) {
            throw UnexpectedReplyException("invalid port " + std::to_string(port));
        }

        SlotRangeMapping mapping;
        mapping.range.start = static_cast<int>(start);
        mapping.range.end = static_cast<int>(end);
        mapping.master.host = simple_or_bulk(master.elements[0]);
        mapping.master.port = static_cast<uint16_t>(port);
        result.push_back(std::move(mapping));
    }
    return result;
}

}  // namespace decode

Batch<std::string> ping() {
    return Batch<std::string>(single({"PING"}, Level::Node), [](ReplyCursor& cursor) {
        return decode::simple_or_bulk(cursor.next());
    });
}

Batch<std::string> echo(const std::string& message) {
    return Batch<std::string>(single({"ECHO", message}, Level::Node), [](ReplyCursor& cursor) {
        return decode::simple_or_bulk(cursor.next());
    });
}

Batch<std::optional<std::string>> get(const std::string& key) {
    return Batch<std::optional<std::string>>(
        single({"GET", key}, Level::Cluster, {1}),
        [](ReplyCursor& cursor) { return decode::nullable_bulk(cursor.next()); });
}

Batch<bool> set(const std::string& key, const std::string& value) {
    return Batch<bool>(single({"SET", key, value}, Level::Cluster, {1}),
                       [](ReplyCursor& cursor) { return decode::ok(cursor.next()); });
}

Batch<int64_t> del(const std::vector<std::string>& keys) {
    std::vector<std::string> args{"DEL"};
    args.insert(args.end(), keys.begin(), keys.end());
    return Batch<int64_t>(single(std::move(args), Level::Cluster, positions(1, keys.size())),
                          [](ReplyCursor& cursor) { return decode::integer(cursor.next()); });
}

Batch<int64_t> incr(const std::string& key) {
    return Batch<int64_t>(single({"INCR", key}, Level::Cluster, {1}),
                          [](ReplyCursor& cursor) { return decode::integer(cursor.next()); });
}

Batch<bool> exists(const std::string& key) {
    return Batch<bool>(single({"EXISTS", key}, Level::Cluster, {1}),
                       [](ReplyCursor& cursor) { return decode::integer(cursor.next()) > 0; });
}

Batch<bool> watch(const std::vector<std::string>& keys) {
    std::vector<std::string> args{"WATCH"};
    args.insert(args.end(), keys.begin(), keys.end());
    return Batch<bool>(single(std::move(args), Level::OperationOnly, positions(1, keys.size())),
                       [](ReplyCursor& cursor) { return decode::ok(cursor.next()); });
}

Batch<bool> unwatch() {
    return Batch<bool>(single({"UNWATCH"}, Level::OperationOnly),
                       [](ReplyCursor& cursor) { return decode::ok(cursor.next()); });
}

Batch<bool> client_setname(const std::string& name) {
    return Batch<bool>(single({"CLIENT", "SETNAME", name}, Level::Connection),
                       [](ReplyCursor& cursor) { return decode::ok(cursor.next()); });
}

Batch<std::vector<SlotRangeMapping>> cluster_slots() {
    return Batch<std::vector<SlotRangeMapping>>(
        single({"CLUSTER", "SLOTS"}, Level::Node),
        [](ReplyCursor& cursor) { return decode::slot_mappings(cursor.next()); });
}

Batch<RespValue> raw(const std::vector<std::string>& args) {
    return Batch<RespValue>(single(args, Level::Node),
                            [](ReplyCursor& cursor) { return cursor.next(); });
}

Batch<RespValue> raw_keyed(const std::vector<std::string>& args,
                           const std::vector<std::size_t>& key_positions) {
    return Batch<RespValue>(single(args, Level::Cluster, key_positions),
                            [](ReplyCursor& cursor) { return cursor.next(); });
}

}  // namespace rediskit::core::commands
