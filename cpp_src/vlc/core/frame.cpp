#include "vlc/core/frame.hpp"
#include "vlc/error.hpp"
#include <boost/endian/conversion.hpp>
#include <algorithm>

namespace vlc {
namespace core {
namespace frame {

std::string encode_header(uint64_t payload_length)
{
    uint64_t le = boost::endian::native_to_little(payload_length);
    return std::string(reinterpret_cast<const char *>(&le), sizeof(le));
}

uint64_t decode_header(const std::string & header)
{
    if(header.size() != header_length)
    {
        throw error::protocol_error(error::protocol_errc::truncated,
            "frame header of " + std::to_string(header.size()) + " bytes");
    }

    uint64_t le;
    std::copy(header.begin(), header.end(),
        reinterpret_cast<char *>(&le));
    return boost::endian::little_to_native(le);
}

}
}
}
