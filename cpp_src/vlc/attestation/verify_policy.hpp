#ifndef VLC_ATTESTATION_VERIFY_POLICY_HPP
#define VLC_ATTESTATION_VERIFY_POLICY_HPP

#include "vlc/attestation/fwd.hpp"
#include "vlc/attestation/verifier.hpp"
#include "vlc/core/protobuf/fwd.hpp"

namespace vlc {
namespace attestation {

/*!
 * What an attested clock's document must satisfy: authentication by
 *  the verifier's trust anchor, and an exact match of every expected
 *  PCR. A worker holds one policy, fixed for its lifetime.
 */
struct verify_policy
{
    verifier_ptr_t doc_verifier;
    pcr_map_t expected_pcrs;

    verify_policy()
    { }

    verify_policy(verifier_ptr_t doc_verifier, pcr_map_t expected_pcrs)
     :  doc_verifier(std::move(doc_verifier)),
        expected_pcrs(std::move(expected_pcrs))
    { }

    /// Builds from a WorkerConfig, reading the trust anchor PEM file
    static verify_policy from_config(const core::protobuf::WorkerConfig &);
};

}
}

#endif
