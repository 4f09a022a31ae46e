#include "Jwt.h"
#include <openssl/hmac.h>
#include <openssl/evp.h>
#include <string>
#include <cstring>
#include <vector>
#include <ctime>
#include <sstream>
#include <iomanip>
#include <stdexcept>
#include <openssl/bio.h>
#include <openssl/buffer.h>
#include <openssl/crypto.h>
#include "../net/MiniJson.h"

namespace {

static std::string json_build_header() {
    return std::string("{\"alg\":\"HS256\",\"typ\":\"JWT\"}");
}

static std::optional<std::string> claim_string(const JsonValue& obj, const char* key) {
    const JsonValue* v = obj.find(key);
    if (!v) return std::string();
    if (v->type == JsonValue::Type::String) return v->str;
    // numeric subjects are common for integer user ids
    if (v->type == JsonValue::Type::Number && parse_int64_strict_sv(v->str).has_value()) return v->str;
    return std::nullopt;
}

static std::optional<int64_t> claim_int(const JsonValue& obj, const char* key) {
    const JsonValue* v = obj.find(key);
    if (!v) return int64_t(0);
    if (v->type != JsonValue::Type::Number) return std::nullopt;
    return parse_int64_strict_sv(v->str);
}

static std::optional<JsonValue> decode_object(const std::string& js) {
    try {
        JsonValue v = json_parse(js);
        if (!v.is_object()) return std::nullopt;
        return v;
    } catch (const std::runtime_error&) {
        return std::nullopt;
    }
}


std::string base64url_encode(const std::string& in) {
    BIO* b64 = BIO_new(BIO_f_base64());
    BIO* bmem = BIO_new(BIO_s_mem());
    BIO_set_flags(b64, BIO_FLAGS_BASE64_NO_NL);
    b64 = BIO_push(b64, bmem);
    BIO_write(b64, in.data(), in.size());
    BIO_flush(b64);
    BUF_MEM* bptr;
    BIO_get_mem_ptr(b64, &bptr);
    std::string out(bptr->data, bptr->length);
    BIO_free_all(b64);
    // url-safe
    for (auto& c : out) {
        if (c == '+') c = '-';
        else if (c == '/') c = '_';
    }
    while (!out.empty() && out.back() == '=') out.pop_back();
    return out;
}

std::string base64url_decode(const std::string& in) {
    std::string s = in;
    for (auto& c : s) {
        if (c == '-') c = '+';
        else if (c == '_') c = '/';
    }
    while (s.size() % 4) s.push_back('=');
    BIO* b64 = BIO_new(BIO_f_base64());
    BIO* bmem = BIO_new_mem_buf(s.data(), s.size());
    BIO_set_flags(b64, BIO_FLAGS_BASE64_NO_NL);
    bmem = BIO_push(b64, bmem);
    std::vector<char> out(s.size());
    int outlen = BIO_read(bmem, out.data(), out.size());
    BIO_free_all(bmem);
    if (outlen <= 0) return std::string();
    return std::string(out.data(), outlen);
}

std::string hmac_sha256(const std::string& key, const std::string& data) {
    unsigned int len = EVP_MAX_MD_SIZE;
    unsigned char md[EVP_MAX_MD_SIZE];
    HMAC(EVP_sha256(), key.data(), key.size(), (unsigned char*)data.data(), data.size(), md, &len);
    return std::string(reinterpret_cast<char*>(md), len);
}

}

namespace auth {

std::string create_jwt(const Claims& c, const std::string& secret) {
    std::string header_s = json_build_header();
    std::ostringstream oss;
    oss << "{";
    oss << "\"sub\":\"" << json_escape_resp(c.sub) << "\",";
    oss << "\"email\":\"" << json_escape_resp(c.email) << "\",";
    oss << "\"iat\":" << c.iat << ",";
    oss << "\"exp\":" << c.exp;
    oss << "}";
    std::string payload_s = oss.str();
    std::string to_sign = base64url_encode(header_s) + "." + base64url_encode(payload_s);
    std::string sig = hmac_sha256(secret, to_sign);
    std::string token = to_sign + "." + base64url_encode(sig);
    return token;
}

std::optional<Claims> verify_jwt(const std::string& token, const std::string& secret) {
    // reject absurdly large tokens
    const size_t MAX_TOKEN = 8 * 1024; // 8KB
    if (token.size() == 0 || token.size() > MAX_TOKEN) return {};
    size_t p1 = token.find('.');
    if (p1 == std::string::npos) return {};
    size_t p2 = token.find('.', p1 + 1);
    if (p2 == std::string::npos) return {};
    std::string h_enc = token.substr(0, p1);
    std::string p_enc = token.substr(p1 + 1, p2 - p1 -1);
    std::string s_enc = token.substr(p2 + 1);
    std::string header_s = base64url_decode(h_enc);
    std::string payload_s = base64url_decode(p_enc);
    std::string sig = base64url_decode(s_enc);
    std::string to_sign = h_enc + "." + p_enc;
    std::string expected_sig = hmac_sha256(secret, to_sign);
    // constant time compare
    if (sig.size() != expected_sig.size()) return {};
    if (CRYPTO_memcmp(sig.data(), expected_sig.data(), sig.size()) != 0) return {};
    auto header = decode_object(header_s);
    auto payload = decode_object(payload_s);
    if (!header || !payload) return {};
    auto alg = claim_string(*header, "alg");
    if (!alg || *alg != "HS256") return {};
    auto typ = claim_string(*header, "typ");
    if (!typ || (!typ->empty() && *typ != "JWT")) return {};
    auto sub = claim_string(*payload, "sub");
    auto email = claim_string(*payload, "email");
    auto iat = claim_int(*payload, "iat");
    auto exp = claim_int(*payload, "exp");
    if (!sub || !email || !iat || !exp) return {};
    Claims cl;
    cl.sub = *sub;
    cl.email = *email;
    cl.iat = *iat;
    cl.exp = *exp;
    auto now = std::time(nullptr);
    if (cl.exp != 0 && now > cl.exp) return {};
    // optional: reject tokens issued far in the future
    if (cl.iat != 0 && cl.iat > now + 60) return {};
    return cl;
}

std::optional<std::string> bearer_token(const std::string& authorization) {
    static const std::string prefix = "Bearer ";
    if (authorization.size() <= prefix.size()) return std::nullopt;
    if (authorization.compare(0, prefix.size(), prefix) != 0) return std::nullopt;
    std::string token = authorization.substr(prefix.size());
    while (!token.empty() && token.back() == ' ') token.pop_back();
    if (token.empty()) return std::nullopt;
    return token;
}

std::optional<int64_t> subject_user_id(const Claims& c) {
    auto id = parse_int64_strict_sv(c.sub);
    if (!id.has_value() || *id <= 0) return std::nullopt;
    return id;
}

}
