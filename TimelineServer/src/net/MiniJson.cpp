#include "MiniJson.h"
#include <stdexcept>
#include <cctype>
#include <vector>


const JsonValue* JsonValue::find(const std::string& key) const {
    for (const auto& p : obj) if (p.first == key) return &p.second;
    return nullptr;
}

JsonValue* JsonValue::find(const std::string& key) {
    for (auto& p : obj) if (p.first == key) return &p.second;
    return nullptr;
}

namespace {

class Parser {
public:
    explicit Parser(const std::string& js) : js_(js), n_(js.size()) {}

    JsonValue document() {
        JsonValue v = value(0);
        skip_ws();
        if (i_ != n_) throw std::runtime_error("trailing characters after json value");
        return v;
    }

private:
    static constexpr int MAX_DEPTH = 64;

    void skip_ws() { while (i_ < n_ && (js_[i_] == ' ' || js_[i_] == '\t' || js_[i_] == '\n' || js_[i_] == '\r')) ++i_; }

    void expect_literal(const char* lit) {
        std::string_view l(lit);
        if (js_.compare(i_, l.size(), l) != 0) throw std::runtime_error("invalid json literal");
        i_ += l.size();
    }

    JsonValue value(int depth) {
        if (depth > MAX_DEPTH) throw std::runtime_error("json nesting too deep");
        skip_ws();
        if (i_ >= n_) throw std::runtime_error("unexpected end of json");
        JsonValue v;
        char c = js_[i_];
        if (c == '{') { v.type = JsonValue::Type::Object; object(v, depth); }
        else if (c == '[') { v.type = JsonValue::Type::Array; array(v, depth); }
        else if (c == '"') { v.type = JsonValue::Type::String; v.str = string(); }
        else if (c == 't') { expect_literal("true"); v.type = JsonValue::Type::Bool; v.boolean = true; }
        else if (c == 'f') { expect_literal("false"); v.type = JsonValue::Type::Bool; v.boolean = false; }
        else if (c == 'n') { expect_literal("null"); v.type = JsonValue::Type::Null; }
        else if (c == '-' || (c >= '0' && c <= '9')) { v.type = JsonValue::Type::Number; v.str = number(); }
        else throw std::runtime_error("unexpected character in json");
        return v;
    }

    void object(JsonValue& v, int depth) {
        ++i_;
        skip_ws();
        if (i_ < n_ && js_[i_] == '}') { ++i_; return; }
        while (true) {
            skip_ws();
            if (i_ >= n_ || js_[i_] != '"') throw std::runtime_error("expected string key in json object");
            std::string key = string();
            skip_ws();
            if (i_ >= n_ || js_[i_] != ':') throw std::runtime_error("missing ':' after string field");
            ++i_;
            JsonValue member = value(depth + 1);
            // last duplicate wins
            if (JsonValue* existing = v.find(key)) *existing = std::move(member);
            else v.obj.emplace_back(std::move(key), std::move(member));
            skip_ws();
            if (i_ < n_ && js_[i_] == ',') { ++i_; continue; }
            if (i_ < n_ && js_[i_] == '}') { ++i_; return; }
            throw std::runtime_error("unterminated json object");
        }
    }

    void array(JsonValue& v, int depth) {
        ++i_;
        skip_ws();
        if (i_ < n_ && js_[i_] == ']') { ++i_; return; }
        while (true) {
            v.arr.push_back(value(depth + 1));
            skip_ws();
            if (i_ < n_ && js_[i_] == ',') { ++i_; continue; }
            if (i_ < n_ && js_[i_] == ']') { ++i_; return; }
            throw std::runtime_error("unterminated json array");
        }
    }

    std::string number() {
        size_t start = i_;
        if (js_[i_] == '-') ++i_;
        if (i_ >= n_ || !isdigit((unsigned char)js_[i_])) throw std::runtime_error("invalid json number");
        if (js_[i_] == '0') ++i_;
        else while (i_ < n_ && isdigit((unsigned char)js_[i_])) ++i_;
        if (i_ < n_ && js_[i_] == '.') {
            ++i_;
            if (i_ >= n_ || !isdigit((unsigned char)js_[i_])) throw std::runtime_error("invalid json number");
            while (i_ < n_ && isdigit((unsigned char)js_[i_])) ++i_;
        }
        if (i_ < n_ && (js_[i_] == 'e' || js_[i_] == 'E')) {
            ++i_;
            if (i_ < n_ && (js_[i_] == '+' || js_[i_] == '-')) ++i_;
            if (i_ >= n_ || !isdigit((unsigned char)js_[i_])) throw std::runtime_error("invalid json number");
            while (i_ < n_ && isdigit((unsigned char)js_[i_])) ++i_;
        }
        return js_.substr(start, i_ - start);
    }

    static void append_utf8(std::string& out, unsigned code) {
        if (code <= 0x7f) out.push_back((char)code);
        else if (code <= 0x7ff) {
            out.push_back((char)(0xc0 | ((code >> 6) & 0x1f)));
            out.push_back((char)(0x80 | (code & 0x3f)));
        } else if (code <= 0xffff) {
            out.push_back((char)(0xe0 | ((code >> 12) & 0x0f)));
            out.push_back((char)(0x80 | ((code >> 6) & 0x3f)));
            out.push_back((char)(0x80 | (code & 0x3f)));
        } else {
            out.push_back((char)(0xf0 | ((code >> 18) & 0x07)));
            out.push_back((char)(0x80 | ((code >> 12) & 0x3f)));
            out.push_back((char)(0x80 | ((code >> 6) & 0x3f)));
            out.push_back((char)(0x80 | (code & 0x3f)));
        }
    }

    unsigned hex4() {
        if (i_ + 4 > n_) throw std::runtime_error("invalid unicode escape in json string");
        unsigned code = 0;
        for (size_t k = 0; k < 4; ++k) {
            char ch = js_[i_ + k];
            code <<= 4;
            if (ch >= '0' && ch <= '9') code += ch - '0';
            else if (ch >= 'a' && ch <= 'f') code += 10 + (ch - 'a');
            else if (ch >= 'A' && ch <= 'F') code += 10 + (ch - 'A');
            else throw std::runtime_error("invalid hex in unicode escape");
        }
        i_ += 4;
        return code;
    }

    // i_ points at the opening quote
    std::string string() {
        ++i_;
        std::string out;
        while (true) {
            if (i_ >= n_) throw std::runtime_error("unterminated json string");
            char c = js_[i_++];
            if (c == '"') return out;
            if ((unsigned char)c < 0x20) throw std::runtime_error("control character in json string");
            if (c != '\\') { out.push_back(c); continue; }
            if (i_ >= n_) throw std::runtime_error("unterminated escape in json string");
            char e = js_[i_++];
            switch (e) {
                case '"': out.push_back('"'); break;
                case '\\': out.push_back('\\'); break;
                case '/': out.push_back('/'); break;
                case 'b': out.push_back('\b'); break;
                case 'f': out.push_back('\f'); break;
                case 'n': out.push_back('\n'); break;
                case 'r': out.push_back('\r'); break;
                case 't': out.push_back('\t'); break;
                case 'u': {
                    unsigned code = hex4();
                    if (code >= 0xd800 && code <= 0xdbff) {
                        if (i_ + 2 > n_ || js_[i_] != '\\' || js_[i_ + 1] != 'u') throw std::runtime_error("unpaired surrogate in json string");
                        i_ += 2;
                        unsigned low = hex4();
                        if (low < 0xdc00 || low > 0xdfff) throw std::runtime_error("unpaired surrogate in json string");
                        code = 0x10000 + ((code - 0xd800) << 10) + (low - 0xdc00);
                    }
                    append_utf8(out, code);
                    break;
                }
                default: throw std::runtime_error("unsupported escape in json string");
            }
        }
    }

    const std::string& js_;
    size_t n_;
    size_t i_ = 0;
};

void serialize_into(std::string& out, const JsonValue& v) {
    switch (v.type) {
        case JsonValue::Type::Null: out += "null"; break;
        case JsonValue::Type::Bool: out += v.boolean ? "true" : "false"; break;
        case JsonValue::Type::Number: out += v.str; break;
        case JsonValue::Type::String: out += '"'; out += json_escape_resp(v.str); out += '"'; break;
        case JsonValue::Type::Array:
            out += '[';
            for (size_t i = 0; i < v.arr.size(); ++i) { if (i) out += ','; serialize_into(out, v.arr[i]); }
            out += ']';
            break;
        case JsonValue::Type::Object:
            out += '{';
            for (size_t i = 0; i < v.obj.size(); ++i) {
                if (i) out += ',';
                out += '"'; out += json_escape_resp(v.obj[i].first); out += "\":";
                serialize_into(out, v.obj[i].second);
            }
            out += '}';
            break;
    }
}

void merge_into(JsonValue& base, const JsonValue& patch) {
    for (const auto& p : patch.obj) {
        JsonValue* existing = base.find(p.first);
        if (existing && existing->is_object() && p.second.is_object()) merge_into(*existing, p.second);
        else if (existing) *existing = p.second;
        else base.obj.emplace_back(p.first, p.second);
    }
}

}

JsonValue json_parse(const std::string& js) {
    Parser p(js);
    return p.document();
}

std::string json_serialize(const JsonValue& v) {
    std::string out;
    serialize_into(out, v);
    return out;
}

std::string json_merge_objects(const std::string& base, const std::string& patch) {
    JsonValue b = base.empty() ? JsonValue{JsonValue::Type::Object} : json_parse(base);
    JsonValue p = json_parse(patch);
    if (!b.is_object() || !p.is_object()) throw std::runtime_error("json merge requires objects");
    merge_into(b, p);
    return json_serialize(b);
}

std::optional<int> json_number_as_int(const JsonValue& v) {
    if (v.type != JsonValue::Type::Number) return std::nullopt;
    return parse_int_strict_sv(v.str);
}

// escape chars for JSON response strings; escapes control chars < 0x20 with \u00XX
std::string json_escape_resp(const std::string& s) {
    static const char* hex = "0123456789ABCDEF";
    std::string out; out.reserve(s.size()+8);
    for (unsigned char uc : s) {
        if (uc == '"') { out += "\\\""; }
        else if (uc == '\\') { out += "\\\\"; }
        else if (uc == '\n') { out += "\\n"; }
        else if (uc == '\r') { out += "\\r"; }
        else if (uc == '\t') { out += "\\t"; }
        else if (uc < 0x20) {
            out.push_back('\\'); out.push_back('u'); out.push_back('0'); out.push_back('0');
            out.push_back(hex[(uc >> 4) & 0xF]); out.push_back(hex[uc & 0xF]);
        } else out.push_back((char)uc);
    }
    return out;
}
