#pragma once

#include <string>
#include <optional>
#include <cstdint>
#include <string_view>
#include <limits>
#include <utility>
#include <vector>


struct JsonValue {
    enum class Type { Null, Bool, Number, String, Array, Object };
    Type type = Type::Null;
    bool boolean = false;
    std::string str;                 // decoded string, or the number exactly as written
    std::vector<JsonValue> arr;
    std::vector<std::pair<std::string, JsonValue>> obj;   // document order

    bool is_object() const { return type == Type::Object; }
    const JsonValue* find(const std::string& key) const;
    JsonValue* find(const std::string& key);
};

// Strict RFC 8259 document parser. Throws std::runtime_error on malformed input.
JsonValue json_parse(const std::string& js);

std::string json_serialize(const JsonValue& v);

// Deep merge of two JSON object documents: nested objects merge key by key,
// everything else in patch replaces what base holds. Throws if either is not an object.
std::string json_merge_objects(const std::string& base, const std::string& patch);

std::string json_escape_resp(const std::string& s);

// Accepts only an integral JSON number that fits in int.
std::optional<int> json_number_as_int(const JsonValue& v);



inline std::optional<int64_t> parse_int64_strict_sv(std::string_view s) {
    if (s.empty()) return std::nullopt;
    size_t i = 0;
    bool neg = false;
    if (s[i] == '-') { neg = true; ++i; }
    if (i >= s.size()) return std::nullopt;

    const uint64_t maxAbs = neg ? (uint64_t(std::numeric_limits<int64_t>::max()) + 1ULL) : uint64_t(std::numeric_limits<int64_t>::max());
    uint64_t v = 0;
    for (; i < s.size(); ++i) {
        unsigned char c = static_cast<unsigned char>(s[i]);
        if (c < '0' || c > '9') return std::nullopt;
        uint64_t d = uint64_t(c - '0');
        if (v > (maxAbs - d) / 10) return std::nullopt;
        v = v * 10 + d;
    }

    if (!neg) {
        if (v > uint64_t(std::numeric_limits<int64_t>::max())) return std::nullopt;
        return static_cast<int64_t>(v);
    }

    if (v == (uint64_t(std::numeric_limits<int64_t>::max()) + 1ULL)) return std::numeric_limits<int64_t>::min();
    return -static_cast<int64_t>(v);
}


inline std::optional<int> parse_int_strict_sv(std::string_view s) {
    auto v = parse_int64_strict_sv(s);
    if (!v.has_value()) return std::nullopt;
    if (*v < std::numeric_limits<int>::min() || *v > std::numeric_limits<int>::max()) return std::nullopt;
    return static_cast<int>(*v);
}
