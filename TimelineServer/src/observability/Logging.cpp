#include "Logging.h"
#include <atomic>
#include <iostream>
#include <chrono>
#include <mutex>
#include <sstream>
#include <iomanip>

namespace observability {

static std::atomic<int> g_level{2};
static std::mutex g_out_mu;

void set_log_level(int level) { g_level = level; }

int log_level() { return g_level; }

static int64_t now_ms() {
    using namespace std::chrono;
    return static_cast<int64_t>(duration_cast<milliseconds>(system_clock::now().time_since_epoch()).count());
}

static std::string escape_json(const std::string& s) {
    static const char* hex = "0123456789abcdef";
    std::string out;
    out.reserve(s.size());
    for (unsigned char c : s) {
        switch (c) {
            case '"': out += "\\\""; break;
            case '\\': out += "\\\\"; break;
            case '\n': out += "\\n"; break;
            case '\r': out += "\\r"; break;
            case '\t': out += "\\t"; break;
            default:
                if (c < 0x20) { out += "\\u00"; out += hex[c >> 4]; out += hex[c & 0xf]; }
                else out += static_cast<char>(c);
                break;
        }
    }
    return out;
}

static void log_generic(int level, const char* lvl_name, const std::string& msg, const Fields& fields) {
    if (level < g_level) return;
    std::ostringstream ss;
    ss << '{';
    ss << "\"ts\":" << now_ms() << ',';
    ss << "\"level\":\"" << lvl_name << "\",";
    ss << "\"msg\":\"" << escape_json(msg) << "\"";
    for (const auto& p : fields) {
        ss << ",\"" << escape_json(p.first) << "\":";
        if (std::holds_alternative<std::string>(p.second)) {
            ss << '\"' << escape_json(std::get<std::string>(p.second)) << '\"';
        } else if (std::holds_alternative<int64_t>(p.second)) {
            ss << std::get<int64_t>(p.second);
        } else if (std::holds_alternative<double>(p.second)) {
            std::ostringstream tmp; tmp << std::fixed << std::setprecision(3) << std::get<double>(p.second);
            ss << tmp.str();
        }
    }
    ss << '}';
    std::lock_guard<std::mutex> lk(g_out_mu);
    std::cout << ss.str() << std::endl;
}

void log_debug(const std::string& msg, const Fields& fields) { log_generic(1, "DEBUG", msg, fields); }
void log_info(const std::string& msg, const Fields& fields) { log_generic(2, "INFO", msg, fields); }
void log_warn(const std::string& msg, const Fields& fields) { log_generic(3, "WARN", msg, fields); }
void log_error(const std::string& msg, const Fields& fields) { log_generic(4, "ERROR", msg, fields); }

} // namespace observability
