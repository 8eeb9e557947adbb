// log.hpp

#ifndef LOG_H_
#define LOG_H_

#include <cstdint>
#include <ostream>
#include <string>

namespace fatxrec::log {

enum class Level { debug, info, error };

//! Messages below this level are dropped.  Defaults to Level::info.
void set_level(Level level);
Level level();

//! Redirects log output (defaults to std::clog).
void set_sink(std::ostream &sink);

void debug(const std::string &message);
void info(const std::string &message);
void error(const std::string &message);

//! Formats a value as 0x-prefixed lowercase hex.
std::string hex(uint64_t value);

} // namespace fatxrec::log

#endif // LOG_H_
