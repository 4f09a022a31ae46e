#include "Resp.h"
#include <stdexcept>

namespace redis {

std::string resp_encode(const std::vector<std::string>& args) {
    std::string out;
    out += "*" + std::to_string(args.size()) + "\r\n";
    for (const auto& a : args) {
        out += "$" + std::to_string(a.size()) + "\r\n";
        out += a + "\r\n";
    }
    return out;
}

static std::optional<int64_t> parse_len(const std::string& s) {
    try {
        size_t used = 0;
        int64_t v = std::stoll(s, &used);
        if (used != s.size()) return std::nullopt;
        return v;
    } catch (const std::exception&) {
        return std::nullopt;
    }
}

static std::optional<RespValue> parse_single(const std::string& buf, size_t& pos) {
    if (pos >= buf.size()) return std::nullopt;
    char t = buf[pos++];
    size_t e = buf.find("\r\n", pos);
    if (e == std::string::npos) return std::nullopt;
    std::string line = buf.substr(pos, e - pos);
    pos = e + 2;
    if (t == '+' || t == '-') {
        RespValue v; v.type = (t == '+') ? RespType::SimpleString : RespType::Error; v.str = line; return v;
    }
    auto n = parse_len(line);
    if (!n.has_value()) return std::nullopt;
    if (t == ':') {
        RespValue v; v.type = RespType::Integer; v.integer = *n; return v;
    }
    if (t == '$') {
        if (*n == -1) { RespValue v; v.type = RespType::Null; return v; }
        if (*n < 0 || pos + static_cast<size_t>(*n) + 2 > buf.size()) return std::nullopt;
        RespValue v; v.type = RespType::BulkString; v.str = buf.substr(pos, (size_t)*n); pos += (size_t)*n + 2; return v;
    }
    if (t == '*') {
        if (*n == -1) { RespValue v; v.type = RespType::Null; return v; }
        if (*n < 0) return std::nullopt;
        RespValue v; v.type = RespType::Array;
        for (int64_t i = 0; i < *n; ++i) {
            auto elem = parse_single(buf, pos);
            if (!elem.has_value()) return std::nullopt;
            v.arr.push_back(std::move(*elem));
        }
        return v;
    }
    return std::nullopt;
}

std::optional<RespValue> resp_parse(const std::string& buf) {
    size_t pos = 0;
    return parse_single(buf, pos);
}

} 
