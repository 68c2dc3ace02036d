#ifndef REDISKIT_CORE_COMMANDS_HPP
#define REDISKIT_CORE_COMMANDS_HPP

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

#include "rediskit/core/batch.hpp"
#include "rediskit/core/slots.hpp"

/*
    small set of typed command builders. each returns a single-command batch with its level and key
    positions filled in, ready to be combined with sequence(), transaction() or flat_map().
*/

namespace rediskit::core::commands {

Batch<std::string> ping();
Batch<std::string> echo(const std::string& message);

Batch<std::optional<std::string>> get(const std::string& key);
// true on OK, false when a condition (NX/XX) prevented the write
Batch<bool> set(const std::string& key, const std::string& value);
Batch<int64_t> del(const std::vector<std::string>& keys);
Batch<int64_t> incr(const std::string& key);
Batch<bool> exists(const std::string& key);

// only usable inside operations, which hold their connection for the whole chain
Batch<bool> watch(const std::vector<std::string>& keys);
Batch<bool> unwatch();

// changes connection state, connection client only
Batch<bool> client_setname(const std::string& name);

Batch<std::vector<SlotRangeMapping>> cluster_slots();

// arbitrary command, reply returned undecoded. keyless commands are node level
Batch<RespValue> raw(const std::vector<std::string>& args);
Batch<RespValue> raw_keyed(const std::vector<std::string>& args,
                           const std::vector<std::size_t>& key_positions);

// decoders, exposed for reuse in custom batches
namespace decode {
bool ok(const RespValue& reply);
std::string simple_or_bulk(const RespValue& reply);
std::optional<std::string> nullable_bulk(const RespValue& reply);
int64_t integer(const RespValue& reply);
std::vector<SlotRangeMapping> slot_mappings(const RespValue& reply);
}  // namespace decode

}  // namespace rediskit::core::commands

#endif
