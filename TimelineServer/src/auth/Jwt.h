#pragma once

#include <cstdint>
#include <string>
#include <optional>

namespace auth {

struct Claims {
    std::string sub;
    std::string email;
    int64_t iat = 0;
    int64_t exp = 0;
};

std::string create_jwt(const Claims& c, const std::string& secret);

// HS256 only. Rejects bad signatures, expired tokens and tokens issued in the future.
std::optional<Claims> verify_jwt(const std::string& token, const std::string& secret);

// "Bearer <token>" -> "<token>"
std::optional<std::string> bearer_token(const std::string& authorization);

// sub must hold a positive integer user id
std::optional<int64_t> subject_user_id(const Claims& c);

}
