#include "vlc/core/digest.hpp"
#include "vlc/error.hpp"
#include "vlc/log.hpp"
#include <openssl/evp.h>

namespace vlc {
namespace core {

digest_t sha256(const std::string & in)
{
    digest_t out;
    unsigned int out_len = 0;

    VLC_ASSERT_OPENSSL(EVP_Digest(in.data(), in.size(),
        out.data(), &out_len, EVP_sha256(), NULL));
    VLC_ASSERT(out_len == out.size());
    return out;
}

std::string digest_bytes(const digest_t & digest)
{
    return std::string(reinterpret_cast<const char *>(digest.data()),
        digest.size());
}

std::string digest_hex(const digest_t & digest)
{
    return log::hex(digest_bytes(digest));
}

}
}
