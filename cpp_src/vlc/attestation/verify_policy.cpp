#include "vlc/attestation/verify_policy.hpp"
#include "vlc/core/protobuf/vlc.pb.h"
#include "vlc/core/config.hpp"

namespace vlc {
namespace attestation {

namespace spb = vlc::core::protobuf;

/* static */
verify_policy verify_policy::from_config(const spb::WorkerConfig & config)
{
    pcr_map_t expected;
    for(const spb::PcrValue & pcr : config.expected_pcr())
    {
        expected[pcr.index()] = pcr.value();
    }

    return verify_policy(
        std::make_shared<verifier>(
            core::read_file(config.trust_anchor_path())),
        std::move(expected));
}

}
}
