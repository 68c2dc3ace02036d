#ifndef REDISKIT_CORE_SLOTS_HPP
#define REDISKIT_CORE_SLOTS_HPP

#include <cstdint>
#include <string>
#include <string_view>

#include "rediskit/core/node_address.hpp"

namespace rediskit::core {

constexpr int kSlotCount = 16384;

uint16_t crc16(std::string_view data);

// hash slot of a key, honoring {hash tags}
int key_slot(std::string_view key);

struct SlotRange {
    int start = 0;
    int end = 0;  // inclusive

    [[nodiscard]] bool contains(int slot) const noexcept { return slot >= start && slot <= end; }
    [[nodiscard]] std::string to_string() const {
        return "[" + std::to_string(start) + ", " + std::to_string(end) + "]";
    }

    bool operator==(const SlotRange& other) const { return start == other.start && end == other.end; }
    bool operator!=(const SlotRange& other) const { return !(*this == other); }
};

struct SlotRangeMapping {
    SlotRange range;
    NodeAddress master;

    bool operator==(const SlotRangeMapping& other) const {
        return range == other.range && master == other.master;
    }
};

}  // namespace rediskit::core

#endif
