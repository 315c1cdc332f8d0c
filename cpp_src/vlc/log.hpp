#ifndef VLC_LOG_HPP
#define VLC_LOG_HPP

#include <iostream>
#include <string>

#define LOG_HEADER "[" << ::vlc::log::gettid() << "] " << __FILE__ << ":" << __LINE__ << " {" << __PRETTY_FUNCTION__ << "}: "

#define LOG_AT(level, tag, what) \
    (::vlc::log::enabled(level) ? \
        (std::cerr << tag " " << LOG_HEADER << what << std::endl, 0) : 0)

#define LOG_DBG(what)  LOG_AT(::vlc::log::DEBUG, "DBG", what)
#define LOG_INFO(what) LOG_AT(::vlc::log::INFO, "INF", what)
#define LOG_WARN(what) LOG_AT(::vlc::log::WARN, "WRN", what)
#define LOG_ERR(what)  LOG_AT(::vlc::log::ERROR, "ERR", what)

namespace vlc {
namespace log {

enum level
{
    DEBUG = 0,
    INFO = 1,
    WARN = 2,
    ERROR = 3
};

unsigned gettid();

/// Messages below the threshold are discarded (default: INFO)
void set_level(level);

/// Parses "debug", "info", "warn" or "error"; throws on anything else
void set_level(const std::string &);

bool enabled(level);

std::string ascii_escape(const std::string &);

/// Lower-case hexadecimal rendering of a byte string
std::string hex(const std::string &);

}
}

#endif

