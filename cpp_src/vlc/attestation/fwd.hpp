#ifndef VLC_ATTESTATION_FWD_HPP
#define VLC_ATTESTATION_FWD_HPP

#include <map>
#include <memory>
#include <string>

namespace vlc {
namespace attestation {

// PCR index => measured value
typedef std::map<unsigned, std::string> pcr_map_t;

struct document;

class verifier;
typedef std::shared_ptr<const verifier> verifier_ptr_t;

class attester;
typedef std::shared_ptr<attester> attester_ptr_t;

struct verify_policy;

}
}

#endif
