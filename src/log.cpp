#include "hideez/log.hpp"

#include <iostream>

namespace hideez {
namespace log {

namespace {

Level g_level = Level::Warn;
std::ostream* g_sink = nullptr;

const char* name(Level l) {
    switch (l) {
        case Level::Debug: return "debug";
        case Level::Info:  return "info";
        case Level::Warn:  return "warn";
        case Level::Error: return "error";
    }
    return "info";
}

std::string quote(const std::string& v) {
    if (!v.empty() && v.find_first_of(" \t\"=") == std::string::npos) return v;
    std::string out = "\"";
    for (char c : v) {
        if (c == '"' || c == '\\') out.push_back('\\');
        out.push_back(c);
    }
    out.push_back('"');
    return out;
}

} // namespace

void set_level(Level l) { g_level = l; }
Level level() { return g_level; }
bool enabled(Level l) { return static_cast<int>(l) >= static_cast<int>(g_level); }

void set_sink(std::ostream* out) { g_sink = out; }

void write(Level l, const std::string& msg, std::initializer_list<Field> fields) {
    if (!enabled(l)) return;
    std::ostream& os = g_sink ? *g_sink : std::cerr;
    os << "level=" << name(l) << " msg=" << quote(msg);
    for (const auto& f : fields) os << ' ' << f.key << '=' << quote(f.value);
    os << '\n';
}

} // namespace log
} // namespace hideez
