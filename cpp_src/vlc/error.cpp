#include "vlc/error.hpp"
#include <openssl/err.h>
#include <sstream>

namespace vlc {
namespace error {

vlc_exception::vlc_exception(
    const std::string & _type,
    const std::string & _msg,
    const std::string & _file,
    const std::string & _func,
    unsigned _line_no)
 :  type(_type),
    msg(_msg),
    file(_file),
    func(_func),
    line_no(_line_no)
{
    std::stringstream s;

    s << "vlc_exception<" << type << ">: " << msg;

    if(!file.empty())
    {
        s << "\n\t" << file << ":" << line_no << " {" << func << "}";
    }

    _what = s.str();
}

not_genesis::not_genesis(const std::string & clock_repr)
 :  vlc_exception("not_genesis",
        "clock is not in genesis state: " + clock_repr)
{ }

namespace {

const char * verify_errc_name(verify_errc code)
{
    switch(code)
    {
    case STALE_OR_INVALID_DOCUMENT:
        return "stale_or_invalid_document";
    case PCR_MISMATCH:
        return "pcr_mismatch";
    case FINGERPRINT_MISMATCH:
        return "fingerprint_mismatch";
    }
    return "verify_error";
}

class protocol_category_impl : public boost::system::error_category
{
public:

    const char * name() const BOOST_SYSTEM_NOEXCEPT
    { return "vlc.protocol"; }

    std::string message(int ev) const
    {
        switch(static_cast<protocol_errc>(ev))
        {
        case protocol_errc::truncated:
            return "stream closed in the middle of a frame";
        case protocol_errc::malformed:
            return "malformed frame or message";
        }
        return "unknown protocol error";
    }
};

}

verify_error::verify_error(verify_errc code, const std::string & msg,
    unsigned pcr_index)
 :  vlc_exception(verify_errc_name(code), msg),
    _code(code),
    _pcr_index(pcr_index)
{ }

const boost::system::error_category & protocol_category()
{
    static protocol_category_impl instance;
    return instance;
}

boost::system::error_code make_error_code(protocol_errc e)
{
    return boost::system::error_code(static_cast<int>(e),
        protocol_category());
}

protocol_error::protocol_error(protocol_errc code, const std::string & msg)
 :  vlc_exception("protocol_error", msg),
    _code(code)
{ }

std::string openssl_error_string()
{
    std::stringstream s;
    char buf[256];

    unsigned long code;
    while((code = ERR_get_error()) != 0)
    {
        ERR_error_string_n(code, buf, sizeof(buf));
        s << (s.tellp() > 0 ? "; " : "") << buf;
    }

    std::string out = s.str();
    return out.empty() ? std::string("unknown error") : out;
}

}
}

