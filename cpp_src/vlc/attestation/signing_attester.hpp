#ifndef VLC_ATTESTATION_SIGNING_ATTESTER_HPP
#define VLC_ATTESTATION_SIGNING_ATTESTER_HPP

#include "vlc/attestation/attester.hpp"
#include "vlc/attestation/openssl_ptr.hpp"
#include "vlc/core/protobuf/fwd.hpp"
#include <cstdint>
#include <string>
#include <vector>

namespace vlc {
namespace attestation {

/*!
 * Software secure module: signs documents with a configured key.
 *
 * Documents carry a fixed set of measured PCRs and module id, and are
 *  valid for lifetime_s seconds from core::server_time at issue.
 */
class signing_attester : public attester
{
public:

    signing_attester(
        const std::string & signing_key_pem,
        const std::string & certificate_pem,
        const std::vector<std::string> & intermediates_pem,
        pcr_map_t measured_pcrs,
        std::string module_id,
        uint64_t lifetime_s);

    /// Builds from a WorkerConfig, reading referenced PEM files
    static attester_ptr_t from_config(const core::protobuf::WorkerConfig &);

    virtual std::string process_attestation(const std::string & user_data);

    const pcr_map_t & get_measured_pcrs() const
    { return _pcrs; }

private:

    pkey_ptr_t _key;
    std::string _certificate_der;
    std::vector<std::string> _cabundle_der;

    const pcr_map_t _pcrs;
    const std::string _module_id;
    const uint64_t _lifetime_s;
};

}
}

#endif
