#ifndef VLC_CORE_DIGEST_HPP
#define VLC_CORE_DIGEST_HPP

#include "vlc/core/fwd.hpp"
#include <string>

namespace vlc {
namespace core {

/// SHA-256 of a byte string
digest_t sha256(const std::string &);

/// The digest as a 32-byte string
std::string digest_bytes(const digest_t &);

/// The digest as 64 lower-case hex characters
std::string digest_hex(const digest_t &);

}
}

#endif
