#include "vlc/log.hpp"
#include "vlc/error.hpp"

#include <unistd.h>
#include <sys/syscall.h>
#include <sys/types.h>
#include <atomic>
#include <cstdio>
#include <sstream>

namespace vlc {
namespace log {

namespace {

std::atomic<int> threshold(INFO);

}

unsigned gettid()
{
    return syscall(SYS_gettid);
}

void set_level(level lvl)
{
    threshold = lvl;
}

void set_level(const std::string & name)
{
    if(name == "debug")
        set_level(DEBUG);
    else if(name == "info")
        set_level(INFO);
    else if(name == "warn")
        set_level(WARN);
    else if(name == "error")
        set_level(ERROR);
    else
    {
        throw error::vlc_exception("config_error",
            "unknown log level " + ascii_escape(name));
    }
}

bool enabled(level lvl)
{
    return lvl >= threshold.load(std::memory_order_relaxed);
}

std::string ascii_escape(const std::string & in)
{
    std::stringstream out;
    char buf[10];

    out << '"';
    for(unsigned char c : in)
    {
        if(c == '\r')
            out << "\\r";
        else if(c == '\n')
            out << "\\n";
        else if(c == '\t')
            out << "\\t";
        else if(c == '\\')
            out << "\\\\";
        else if(c == '"')
            out << "\\\"";
        else if(c < 0x20 || c >= 0x7f)
        {
            std::sprintf(buf, "\\x%02x", c);
            out << buf;
        }
        else
            out << c;
    }
    out << '"';
    return out.str();
}

std::string hex(const std::string & in)
{
    static const char digits[] = "0123456789abcdef";

    std::string out;
    out.reserve(in.size() * 2);

    for(unsigned char c : in)
    {
        out.push_back(digits[c >> 4]);
        out.push_back(digits[c & 0x0f]);
    }
    return out;
}

}
}

