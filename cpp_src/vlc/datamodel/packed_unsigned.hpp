#ifndef VLC_DATAMODEL_PACKED_UNSIGNED_HPP
#define VLC_DATAMODEL_PACKED_UNSIGNED_HPP

#include <boost/endian/conversion.hpp>
#include <cstdint>
#include <ostream>

namespace vlc {
namespace datamodel {

// A uint64_t which streams as 8 little-endian bytes, irrespective
//  of host byte order. Only written: fingerprints are never parsed back.
struct packed_unsigned
{
public:

    uint64_t value;

    packed_unsigned(uint64_t v)
     : value(v)
    { }

    packed_unsigned()
     : value(0)
    { }

    operator uint64_t() const
    { return value; }
};

inline std::ostream & operator << (
    std::ostream & s, const packed_unsigned & r)
{
    uint64_t le = boost::endian::native_to_little(r.value);
    s.write((const char*) &le, sizeof(uint64_t));
    return s;
}

}
}

#endif
