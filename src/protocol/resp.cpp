#include "rediskit/protocol/resp.hpp"

#include <algorithm>
#include <charconv>

#include "rediskit/core/errors.hpp"

/*
    RESP2 wire format:
    - simple string: +OK\r\n
    - error:         -ERR message\r\n
    - integer:       :42\r\n
    - bulk string:   $5\r\nhello\r\n   ($-1\r\n is nil)
    - array:         *2\r\n<value><value>   (*-1\r\n is nil)
*/

namespace rediskit::protocol {

namespace {

void append_header(std::string& buf, char prefix, int64_t n) {
    char tmp[24];
    auto [end, ec] = std::to_chars(tmp, tmp + sizeof(tmp), n);
    (void)ec;
    buf += prefix;
    buf.append(tmp, static_cast<std::size_t>(end - tmp));
    buf.append("\r\n", 2);
}

}  // namespace

std::string RespValue::to_string() const {
    switch (type) {
        case RespType::SimpleString:
            return str;
        case RespType::Error:
            return "(error) " + str;
        case RespType::Integer:
            return "(integer) " + std::to_string(integer);
        case RespType::BulkString:
            return "\"" + str + "\"";
        case RespType::Nil:
            return "(nil)";
        case RespType::Array: {
            if (elements.empty()) {
                return "(empty array)";
            }
            std::string out;
            for (std::size_t i = 0; i < elements.size(); ++i) {
                if (i > 0) out += "\n";
                out += std::to_string(i + 1) + ") " + elements[i].to_string();
            }
            return out;
        }
    }
    return "";
}

bool RespValue::operator==(const RespValue& other) const {
    if (type != other.type) {
        return false;
    }
    switch (type) {
        case RespType::Integer:
            return integer == other.integer;
        case RespType::Nil:
            return true;
        case RespType::Array:
            return elements == other.elements;
        default:
            return str == other.str;
    }
}

void RespEncoder::encode_command_into(std::string& buf, const std::vector<std::string>& args) {
    append_header(buf, '*', static_cast<int64_t>(args.size()));
    for (const auto& arg : args) {
        append_header(buf, '$', static_cast<int64_t>(arg.size()));
        buf.append(arg);
        buf.append("\r\n", 2);
    }
}

std::string RespEncoder::encode_command(const std::vector<std::string>& args) {
    std::string buf;
    encode_command_into(buf, args);
    return buf;
}

void RespEncoder::encode_into(std::string& buf, const RespValue& value) {
    switch (value.type) {
        case RespType::SimpleString:
            buf += '+';
            buf.append(value.str);
            buf.append("\r\n", 2);
            break;
        case RespType::Error:
            buf += '-';
            buf.append(value.str);
            buf.append("\r\n", 2);
            break;
        case RespType::Integer:
            append_header(buf, ':', value.integer);
            break;
        case RespType::BulkString:
            append_header(buf, '$', static_cast<int64_t>(value.str.size()));
            buf.append(value.str);
            buf.append("\r\n", 2);
            break;
        case RespType::Nil:
            buf.append("$-1\r\n", 5);
            break;
        case RespType::Array:
            append_header(buf, '*', static_cast<int64_t>(value.elements.size()));
            for (const auto& element : value.elements) {
                encode_into(buf, element);
            }
            break;
    }
}

std::string RespEncoder::encode(const RespValue& value) {
    std::string buf;
    encode_into(buf, value);
    return buf;
}

void RespParser::feed(std::string_view data) {
    // compact consumed prefix before growing the buffer
    if (offset_ > 0 && offset_ >= buffer_.size() / 2) {
        buffer_.erase(0, offset_);
        offset_ = 0;
    }
    buffer_.append(data.data(), data.size());
}

std::optional<RespValue> RespParser::next() {
    std::size_t pos = offset_;
    RespValue value;
    if (!parse_value(pos, value, 0)) {
        return std::nullopt;
    }
    offset_ = pos;
    if (offset_ == buffer_.size()) {
        buffer_.clear();
        offset_ = 0;
    }
    return value;
}

void RespParser::reset() {
    buffer_.clear();
    offset_ = 0;
}

bool RespParser::read_line(std::size_t& pos, std::string_view& line) {
    std::size_t crlf = buffer_.find("\r\n", pos);
    if (crlf == std::string::npos) {
        return false;
    }
    line = std::string_view(buffer_).substr(pos, crlf - pos);
    pos = crlf + 2;
    return true;
}

int64_t RespParser::parse_integer(std::string_view line) {
    int64_t value = 0;
    auto [end, ec] = std::from_chars(line.data(), line.data() + line.size(), value);
    if (ec != std::errc() || end != line.data() + line.size() || line.empty()) {
        throw core::ProtocolException("invalid integer: " + std::string(line));
    }
    return value;
}

bool RespParser::parse_value(std::size_t& pos, RespValue& out, int depth) {
    if (depth > kMaxDepth) {
        throw core::ProtocolException("reply nested too deeply");
    }
    if (pos >= buffer_.size()) {
        return false;
    }

    char prefix = buffer_[pos];
    std::size_t cursor = pos + 1;
    std::string_view line;
    if (!read_line(cursor, line)) {
        return false;
    }

    switch (prefix) {
        case '+':
            out = RespValue::simple(std::string(line));
            break;

        case '-':
            out = RespValue::error(std::string(line));
            break;

        case ':':
            out = RespValue::number(parse_integer(line));
            break;

        case '$': {
            int64_t len = parse_integer(line);
            if (len == -1) {
                out = RespValue::nil();
                break;
            }
            if (len < 0 || len > kMaxBulkLength) {
                throw core::ProtocolException("invalid bulk length " + std::to_string(len));
            }
            auto size = static_cast<std::size_t>(len);
            if (buffer_.size() < cursor + size + 2) {
                return false;
            }
            if (buffer_.compare(cursor + size, 2, "\r\n") != 0) {
                throw core::ProtocolException("bulk string not terminated by CRLF");
            }
            out = RespValue::bulk(buffer_.substr(cursor, size));
            cursor += size + 2;
            break;
        }

        case '*': {
            int64_t count = parse_integer(line);
            if (count == -1) {
                out = RespValue::nil();
                break;
            }
            if (count < 0) {
                throw core::ProtocolException("invalid array length " + std::to_string(count));
            }
            std::vector<RespValue> elements;
            elements.reserve(static_cast<std::size_t>(std::min<int64_t>(count, 1024)));
            for (int64_t i = 0; i < count; ++i) {
                RespValue element;
                if (!parse_value(cursor, element, depth + 1)) {
                    return false;
                }
                elements.push_back(std::move(element));
            }
            out = RespValue::array(std::move(elements));
            break;
        }

        default:
            throw core::ProtocolException(std::string("unexpected reply prefix '") + prefix + "'");
    }

    pos = cursor;
    return true;
}

}  // namespace rediskit::protocol
