#ifndef VLC_CORE_FRAME_HPP
#define VLC_CORE_FRAME_HPP

#include <cstddef>
#include <cstdint>
#include <string>

namespace vlc {
namespace core {

/*!
 * Both directions of a worker connection carry frames of
 *
 *   u64 (little-endian) payload length | payload
 *
 * with no magic or version prefix.
 */
namespace frame {

const size_t header_length = 8;

// 64 MiB
const uint64_t default_max_length = uint64_t(64) << 20;

std::string encode_header(uint64_t payload_length);

uint64_t decode_header(const std::string & header);

}

}
}

#endif
