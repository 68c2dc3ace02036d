#ifndef REDISKIT_PROTOCOL_RESP_HPP
#define REDISKIT_PROTOCOL_RESP_HPP

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace rediskit::protocol {

enum class RespType : uint8_t {
    SimpleString = 0,
    Error = 1,
    Integer = 2,
    BulkString = 3,
    Nil = 4,
    Array = 5,
};

struct RespValue {
    RespType type = RespType::Nil;
    std::string str;  // simple string, error message or bulk payload
    int64_t integer = 0;
    std::vector<RespValue> elements;

    static RespValue simple(std::string s) { return {RespType::SimpleString, std::move(s), 0, {}}; }
    static RespValue error(std::string s) { return {RespType::Error, std::move(s), 0, {}}; }
    static RespValue number(int64_t n) { return {RespType::Integer, "", n, {}}; }
    static RespValue bulk(std::string s) { return {RespType::BulkString, std::move(s), 0, {}}; }
    static RespValue nil() { return {RespType::Nil, "", 0, {}}; }
    static RespValue array(std::vector<RespValue> e) { return {RespType::Array, "", 0, std::move(e)}; }

    [[nodiscard]] bool is_error() const noexcept { return type == RespType::Error; }
    [[nodiscard]] bool is_nil() const noexcept { return type == RespType::Nil; }
    [[nodiscard]] bool is_array() const noexcept { return type == RespType::Array; }

    // human readable form, redis-cli style
    [[nodiscard]] std::string to_string() const;

    bool operator==(const RespValue& other) const;
    bool operator!=(const RespValue& other) const { return !(*this == other); }
};

using Replies = std::vector<RespValue>;

class RespEncoder {
   public:
    // multibulk request form: *N\r\n$len\r\narg\r\n...
    static void encode_command_into(std::string& buf, const std::vector<std::string>& args);
    static std::string encode_command(const std::vector<std::string>& args);

    static void encode_into(std::string& buf, const RespValue& value);
    static std::string encode(const RespValue& value);
};

/*
    incremental reply decoder. bytes arrive in arbitrary chunks from the socket, complete values
    are handed out strictly in the order they were received. an incomplete value stays buffered
    until the rest arrives.
*/
class RespParser {
   public:
    static constexpr int64_t kMaxBulkLength = 512LL * 1024 * 1024;
    static constexpr int kMaxDepth = 64;

    void feed(std::string_view data);

    // throws ProtocolException on malformed input
    [[nodiscard]] std::optional<RespValue> next();

    [[nodiscard]] std::size_t buffered() const noexcept { return buffer_.size() - offset_; }
    void reset();

   private:
    // returns false when the input ends before the value does
    bool parse_value(std::size_t& pos, RespValue& out, int depth);
    bool read_line(std::size_t& pos, std::string_view& line);
    int64_t parse_integer(std::string_view line);

    std::string buffer_;
    std::size_t offset_ = 0;
};

}  // namespace rediskit::protocol

#endif
