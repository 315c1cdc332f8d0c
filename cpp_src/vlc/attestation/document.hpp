#ifndef VLC_ATTESTATION_DOCUMENT_HPP
#define VLC_ATTESTATION_DOCUMENT_HPP

#include "vlc/attestation/fwd.hpp"
#include <cstdint>
#include <string>

namespace vlc {
namespace attestation {

/*! \brief Authenticated content of an attestation document

Produced by verifier::parse() once the document's signature, certificate
chain & validity window have been checked. Times are unix seconds.
*/
struct document
{
    std::string module_id;

    uint64_t timestamp;
    uint64_t not_before;
    uint64_t not_after;

    pcr_map_t pcrs;
    std::string user_data;

    document()
     :  timestamp(0),
        not_before(0),
        not_after(0)
    { }
};

}
}

#endif
