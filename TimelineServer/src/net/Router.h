#pragma once

#include "Request.h"
#include "Response.h"
#include <string>
#include <functional>
#include <map>
#include <unordered_map>

// Exact-path routes for the small synchronous endpoints (health, metrics).
class Router {
public:
    using Handler = std::function<Response(const Request&)>;
    void add_route(std::string method, std::string path, Handler h);
    // 404 for unknown paths, 405 with an Allow header for known paths under another method.
    Response route(const Request& req) const;
private:
    // path -> method -> handler; ordered so Allow lists are stable
    std::unordered_map<std::string, std::map<std::string, Handler>> routes_;
};

Response json_reply(const Request& req, boost::beast::http::status st, std::string body);
Response text_reply(const Request& req, boost::beast::http::status st, std::string content_type, std::string body);
