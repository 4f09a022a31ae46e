#pragma once

#include <boost/beast/http.hpp>

using Response = boost::beast::http::response<boost::beast::http::string_body>;
