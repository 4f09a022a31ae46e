#include "Router.h"
#include <boost/beast/http.hpp>

void Router::add_route(std::string method, std::string path, Handler h) {
    routes_[std::move(path)][std::move(method)] = std::move(h);
}

Response Router::route(const Request& req) const {
    std::string path(req.target());
    auto q = path.find('?');
    if (q != std::string::npos) path.erase(q);

    auto it = routes_.find(path);
    if (it == routes_.end()) {
        return json_reply(req, boost::beast::http::status::not_found, "{\"error\":\"not found\"}");
    }
    auto h = it->second.find(std::string(req.method_string()));
    if (h == it->second.end()) {
        std::string allow;
        for (const auto& m : it->second) {
            if (!allow.empty()) allow += ", ";
            allow += m.first;
        }
        Response res = json_reply(req, boost::beast::http::status::method_not_allowed, "{\"error\":\"method not allowed\"}");
        res.set(boost::beast::http::field::allow, allow);
        return res;
    }
    return h->second(req);
}

Response json_reply(const Request& req, boost::beast::http::status st, std::string body) {
    return text_reply(req, st, "application/json; charset=utf-8", std::move(body));
}

Response text_reply(const Request& req, boost::beast::http::status st, std::string content_type, std::string body) {
    Response res{st, req.version()};
    res.set(boost::beast::http::field::content_type, content_type);
    res.keep_alive(req.keep_alive());
    res.body() = std::move(body);
    res.prepare_payload();
    return res;
}
