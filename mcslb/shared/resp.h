#pragma once
#include <string>
#include <string_view>
#include <vector>
#include <cstdint>
#include <cstring>
#include <charconv>
#include <initializer_list>

// RESP2 encoder for outgoing commands and decoder for server replies

namespace resp {

// Safety limits against a misbehaving registry
constexpr int RESP_MAX_ARRAY_SIZE = 1 << 16;
constexpr int RESP_MAX_BULK_LEN = 512 * 1024;
constexpr int RESP_MAX_DEPTH = 4;

// ─── \r\n scanner ───
inline const char* find_crlf(const char* data, size_t len) noexcept
{
    const char* end = data + len;
    while (true)
    {
        const char* p = static_cast<const char*>(std::memchr(data, '\r', static_cast<size_t>(end - data)));
        if (__builtin_expect(!p || p + 1 >= end, 0))
            return nullptr;
        if (__builtin_expect(p[1] == '\n', 1))
            return p;
        data = p + 1;
    }
}

// ─── Encoding ───

inline void encode_bulk_into(std::string& buf, std::string_view str)
{
    char tmp[24];
    auto [end, ec] = std::to_chars(tmp, tmp + sizeof(tmp), str.size());
    buf += '$';
    buf.append(tmp, static_cast<size_t>(end - tmp));
    buf.append("\r\n", 2);
    buf.append(str.data(), str.size());
    buf.append("\r\n", 2);
}

inline void encode_array_header_into(std::string& buf, size_t n)
{
    char tmp[24];
    auto [end, ec] = std::to_chars(tmp, tmp + sizeof(tmp), n);
    buf += '*';
    buf.append(tmp, static_cast<size_t>(end - tmp));
    buf.append("\r\n", 2);
}

// Commands are always sent as arrays of bulk strings
inline std::string encode_command(const std::vector<std::string>& args)
{
    std::string out;
    out.reserve(16 + args.size() * 16);
    encode_array_header_into(out, args.size());
    for (const auto& a : args)
        encode_bulk_into(out, a);
    return out;
}

inline std::string encode_command(std::initializer_list<std::string_view> args)
{
    std::string out;
    encode_array_header_into(out, args.size());
    for (auto a : args)
        encode_bulk_into(out, a);
    return out;
}

// ─── Decoding ───

enum class parse_result { ok, incomplete, error };

struct reply
{
    enum kind_t : uint8_t { simple, error, integer, bulk, nil, array } kind = nil;
    std::string str;             // simple, error, bulk
    int64_t integer_value = 0;
    std::vector<reply> elements; // array

    bool is_error() const { return kind == error; }
    bool is_array() const { return kind == array; }
};

namespace detail {

inline parse_result read_line_int(std::string_view buf, size_t& offset, int64_t& out)
{
    const char* crlf = find_crlf(buf.data() + offset, buf.size() - offset);
    if (!crlf)
        return parse_result::incomplete;

    const char* begin = buf.data() + offset;
    auto [ptr, ec] = std::from_chars(begin, crlf, out);
    if (ec != std::errc{} || ptr != crlf)
        return parse_result::error;

    offset = static_cast<size_t>(crlf - buf.data()) + 2;
    return parse_result::ok;
}

inline parse_result parse_at(std::string_view buf, size_t& offset, reply& out, int depth)
{
    if (depth > RESP_MAX_DEPTH)
        return parse_result::error;
    if (offset >= buf.size())
        return parse_result::incomplete;

    char type = buf[offset++];
    switch (type)
    {
        case '+':
        case '-':
        {
            const char* crlf = find_crlf(buf.data() + offset, buf.size() - offset);
            if (!crlf)
                return parse_result::incomplete;
            out.kind = (type == '+') ? reply::simple : reply::error;
            out.str.assign(buf.data() + offset, static_cast<size_t>(crlf - (buf.data() + offset)));
            offset = static_cast<size_t>(crlf - buf.data()) + 2;
            return parse_result::ok;
        }
        case ':':
        {
            out.kind = reply::integer;
            return read_line_int(buf, offset, out.integer_value);
        }
        case '$':
        {
            int64_t len = 0;
            auto r = read_line_int(buf, offset, len);
            if (r != parse_result::ok)
                return r;
            if (len == -1)
            {
                out.kind = reply::nil;
                return parse_result::ok;
            }
            if (len < 0 || len > RESP_MAX_BULK_LEN)
                return parse_result::error;
            if (offset + static_cast<size_t>(len) + 2 > buf.size())
                return parse_result::incomplete;
            if (buf[offset + len] != '\r' || buf[offset + len + 1] != '\n')
                return parse_result::error;
            out.kind = reply::bulk;
            out.str.assign(buf.data() + offset, static_cast<size_t>(len));
            offset += static_cast<size_t>(len) + 2;
            return parse_result::ok;
        }
        case '*':
        {
            int64_t count = 0;
            auto r = read_line_int(buf, offset, count);
            if (r != parse_result::ok)
                return r;
            if (count == -1)
            {
                out.kind = reply::nil;
                return parse_result::ok;
            }
            if (count < 0 || count > RESP_MAX_ARRAY_SIZE)
                return parse_result::error;
            out.kind = reply::array;
            out.elements.clear();
            out.elements.resize(static_cast<size_t>(count));
            for (auto& e : out.elements)
            {
                r = parse_at(buf, offset, e, depth + 1);
                if (r != parse_result::ok)
                    return r;
            }
            return parse_result::ok;
        }
        default:
            return parse_result::error;
    }
}

} // namespace detail

// Parse one complete reply from buf. `consumed` is only meaningful on ok.
inline parse_result parse_reply(std::string_view buf, reply& out, size_t& consumed)
{
    consumed = 0;
    size_t offset = 0;
    auto r = detail::parse_at(buf, offset, out, 0);
    if (r == parse_result::ok)
        consumed = offset;
    return r;
}

} // namespace resp
