#ifndef VLC_ERROR_HPP
#define VLC_ERROR_HPP

#include <boost/system/system_error.hpp>
#include <boost/system/error_code.hpp>
#include <string>

#define VLC_ASSERT(arg)\
{\
    if(__builtin_expect(!(bool)(arg), 0))\
    {\
        throw vlc::error::vlc_exception(\
            "assertion_failure",\
            #arg,\
            __FILE__,\
            __PRETTY_FUNCTION__,\
            __LINE__);\
    }\
}

#define VLC_ASSERT_OPENSSL(arg)\
{\
    if(__builtin_expect((arg) <= 0, 0))\
    {\
        throw vlc::error::vlc_exception(\
            "openssl_failure",\
            std::string(#arg " => ") + vlc::error::openssl_error_string(),\
            __FILE__,\
            __PRETTY_FUNCTION__,\
            __LINE__);\
    }\
}

namespace vlc {
namespace error {

class vlc_exception : public std::exception
{
public:

    vlc_exception(
        const std::string & type,
        const std::string & msg,
        const std::string & file = "",
        const std::string & func = "",
        unsigned line_no = 0);

    ~vlc_exception() throw()
    {}

    virtual const char * what() const throw()
    { return _what.c_str(); }

    const std::string type;
    const std::string msg;
    const std::string file;
    const std::string func;
    const unsigned line_no;

private:

    std::string _what;
};

/// A non-genesis clock was wrapped as a fresh attested clock
class not_genesis : public vlc_exception
{
public:

    explicit not_genesis(const std::string & clock_repr);
};

enum verify_errc
{
    STALE_OR_INVALID_DOCUMENT = 1,
    PCR_MISMATCH = 2,
    FINGERPRINT_MISMATCH = 3
};

/*!
 * Raised when an attestation document does not vouch for the clock
 *  it's attached to. pcr_index() is meaningful only for PCR_MISMATCH.
 */
class verify_error : public vlc_exception
{
public:

    verify_error(verify_errc code, const std::string & msg,
        unsigned pcr_index = 0);

    verify_errc get_code() const
    { return _code; }

    unsigned pcr_index() const
    { return _pcr_index; }

private:

    verify_errc _code;
    unsigned _pcr_index;
};

enum class protocol_errc
{
    truncated = 1,
    malformed = 2
};

const boost::system::error_category & protocol_category();

boost::system::error_code make_error_code(protocol_errc);

/// Frame or message content is inconsistent with the wire format
class protocol_error : public vlc_exception
{
public:

    protocol_error(protocol_errc code, const std::string & msg);

    boost::system::error_code get_error_code() const
    { return make_error_code(_code); }

private:

    protocol_errc _code;
};

/// Drains the OpenSSL error queue into a printable string
std::string openssl_error_string();

}
}

namespace boost {
namespace system {

template<>
struct is_error_code_enum<vlc::error::protocol_errc>
{
    static const bool value = true;
};

}
}

#endif

