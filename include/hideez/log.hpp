#pragma once
/**
 * @file log.hpp
 * @brief Leveled key=value diagnostics on stderr.
 *
 * Lines look like:
 *   level=debug msg=send type=GetAddress bytes=58
 *
 * Values containing spaces, quotes or '=' are double-quoted. The default
 * threshold is Warn; --verbose lowers it to Debug, which turns on the
 * communication trace written by LinkClient.
 */

#include <initializer_list>
#include <iosfwd>
#include <string>

namespace hideez {
namespace log {

enum class Level { Debug = 0, Info = 1, Warn = 2, Error = 3 };

struct Field {
    const char* key;
    std::string value;
};

void set_level(Level level);
Level level();
bool enabled(Level level);

/// Redirect output (tests). Passing nullptr restores std::cerr.
void set_sink(std::ostream* out);

void write(Level level, const std::string& msg, std::initializer_list<Field> fields = {});

inline void debug(const std::string& msg, std::initializer_list<Field> f = {}) { write(Level::Debug, msg, f); }
inline void info (const std::string& msg, std::initializer_list<Field> f = {}) { write(Level::Info, msg, f); }
inline void warn (const std::string& msg, std::initializer_list<Field> f = {}) { write(Level::Warn, msg, f); }
inline void error(const std::string& msg, std::initializer_list<Field> f = {}) { write(Level::Error, msg, f); }

} // namespace log
} // namespace hideez
