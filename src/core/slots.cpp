#include "rediskit/core/slots.hpp"

namespace rediskit::core {

/*
    CRC16-CCITT (XMODEM): polynomial 0x1021, initial value 0, no reflection. this is the variant
    redis cluster uses for key hashing (slot = crc16(key) mod 16384).
*/
uint16_t crc16(std::string_view data) {
    uint16_t crc = 0;
    for (unsigned char byte : data) {
        crc ^= static_cast<uint16_t>(byte) << 8;
        for (int bit = 0; bit < 8; ++bit) {
            if (crc & 0x8000) {
                crc = static_cast<uint16_t>((crc << 1) ^ 0x1021);
            } else {
                crc = static_cast<uint16_t>(crc << 1);
            }
        }
    }
    return crc;
}

int key_slot(std::string_view key) {
    // only the part between the first '{' and the following '}' is hashed, if non-empty
    auto open = key.find('{');
    if (open != std::string_view::npos) {
        auto close = key.find('}', open + 1);
        if (close != std::string_view::npos && close != open + 1) {
            key = key.substr(open + 1, close - open - 1);
        }
    }
    return crc16(key) & (kSlotCount - 1);
}

}  // namespace rediskit::core
