// log.cpp

#include <iostream>
#include <sstream>

#include "log.hpp"

namespace fatxrec::log {

namespace {

Level g_level = Level::info;
std::ostream *g_sink = &std::clog;

void write(Level msg_level, const char *tag, const std::string &message) {
    if (msg_level < g_level) {
        return;
    }
    *g_sink << "[" << tag << "] " << message << "\n";
}

} // namespace

void set_level(Level level) { g_level = level; }

Level level() { return g_level; }

void set_sink(std::ostream &sink) { g_sink = &sink; }

void debug(const std::string &message) { write(Level::debug, "debug", message); }

void info(const std::string &message) { write(Level::info, "info", message); }

void error(const std::string &message) { write(Level::error, "error", message); }

std::string hex(uint64_t value) {
    std::ostringstream os;
    os << "0x" << std::hex << value;
    return os.str();
}

} // namespace fatxrec::log
