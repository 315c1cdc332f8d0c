#ifndef VLC_ENCLAVE_WORKER_HPP
#define VLC_ENCLAVE_WORKER_HPP

#include "vlc/enclave/fwd.hpp"
#include "vlc/datamodel/update.hpp"
#include "vlc/attestation/attester.hpp"
#include "vlc/attestation/verify_policy.hpp"
#include <boost/noncopyable.hpp>
#include <boost/optional.hpp>
#include <string>
#include <vector>

namespace vlc {
namespace enclave {

/*!
 * Update handler run inside the isolated environment.
 *
 * For each request: verifies prev & every dependency under the worker's
 *  policy, advances prev merged with the dependencies at the requested
 *  dimension, and attests the fingerprint of the result.
 *
 * Handlers are stateless across requests, and handle_update() may be
 *  called concurrently.
 */
class worker : private boost::noncopyable
{
public:

    typedef worker_ptr_t ptr_t;

    worker(attestation::verify_policy, attestation::attester_ptr_t);

    /*!
     * Decodes & applies a serialized update_request.
     *
     * A request which fails to decode, verify, or attest is dropped:
     *  the failure is logged and boost::none returned.
     */
    boost::optional<datamodel::update_response> handle_update(
        const std::string & payload) const;

    /*!
     * Applies a decoded request. Throws error::verify_error if an
     *  input clock fails verification; a failing attester may throw
     *  any std::exception. stage_latency_ns is left for the caller.
     */
    datamodel::update_response update(
        const datamodel::update_request &,
        std::vector<uint64_t> & stage_latency_ns) const;

    const attestation::verify_policy & get_policy() const
    { return _policy; }

private:

    const attestation::verify_policy _policy;
    const attestation::attester_ptr_t _attester;
};

}
}

#endif
