#include <algorithm>
#include <ctime>
#include <iostream>
#include <optional>
#include <string>
#include "auth/Jwt.h"

static std::string flip_first_sig_char(std::string token) {
    size_t i = token.rfind('.') + 1;
    token[i] = token[i] == 'A' ? 'B' : 'A';
    return token;
}

int main() {
    const std::string secret = "secret";
    const int64_t now = std::time(nullptr);

    auth::Claims c;
    c.sub = "42";
    c.email = "planner@example.com";
    c.iat = now - 10;
    c.exp = now + 3600;

    std::string token = auth::create_jwt(c, secret);
    if (std::count(token.begin(), token.end(), '.') != 2) { std::cerr << "token must have three segments\n"; return 1; }
    if (token.find('=') != std::string::npos || token.find('+') != std::string::npos || token.find('/') != std::string::npos) {
        std::cerr << "token is not base64url\n"; return 1;
    }

    auto ok = auth::verify_jwt(token, secret);
    if (!ok) { std::cerr << "verify_jwt(valid) failed\n"; return 1; }
    if (ok->sub != "42" || ok->email != c.email || ok->exp != c.exp) { std::cerr << "claims mismatch\n"; return 1; }
    if (auth::subject_user_id(*ok) != int64_t(42)) { std::cerr << "subject_user_id\n"; return 1; }

    if (auth::verify_jwt(token, "wrongsecret")) { std::cerr << "wrong secret accepted\n"; return 1; }
    if (auth::verify_jwt(flip_first_sig_char(token), secret)) { std::cerr << "corrupted signature accepted\n"; return 1; }

    auth::Claims expired = c;
    expired.exp = now - 1;
    if (auth::verify_jwt(auth::create_jwt(expired, secret), secret)) { std::cerr << "expired token accepted\n"; return 1; }

    auth::Claims future = c;
    future.iat = now + 3600;
    if (auth::verify_jwt(auth::create_jwt(future, secret), secret)) { std::cerr << "token from the future accepted\n"; return 1; }

    for (const char* bad : {"", "abc", "abc.def", "a.b.c", "..."}) {
        if (auth::verify_jwt(bad, secret)) { std::cerr << "malformed token accepted: " << bad << "\n"; return 1; }
    }

    // subjects that are not positive integer ids do not authenticate a user
    for (const char* sub : {"u1", "0", "-5", "", "12x", "99999999999999999999"}) {
        auth::Claims s = c;
        s.sub = sub;
        if (auth::subject_user_id(s)) { std::cerr << "sub accepted as user id: " << sub << "\n"; return 1; }
    }

    // a token without exp never expires
    auth::Claims forever = c;
    forever.exp = 0;
    if (!auth::verify_jwt(auth::create_jwt(forever, secret), secret)) { std::cerr << "exp=0 rejected\n"; return 1; }

    auto bt = auth::bearer_token("Bearer abc.def.ghi");
    if (!bt || *bt != "abc.def.ghi") { std::cerr << "bearer_token\n"; return 1; }
    if (auth::bearer_token("Bearer ") || auth::bearer_token("Basic dXNlcjpwYXNz") || auth::bearer_token("") || auth::bearer_token("bearer abc")) {
        std::cerr << "bad Authorization header accepted\n"; return 1;
    }
    if (*auth::bearer_token("Bearer tok  ") != "tok") { std::cerr << "trailing spaces kept\n"; return 1; }

    std::cout << "auth_unit ok\n";
    return 0;
}
