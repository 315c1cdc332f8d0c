#ifndef VLC_ATTESTATION_VERIFIER_HPP
#define VLC_ATTESTATION_VERIFIER_HPP

#include "vlc/attestation/fwd.hpp"
#include "vlc/attestation/document.hpp"
#include "vlc/attestation/openssl_ptr.hpp"
#include <boost/noncopyable.hpp>
#include <cstdint>
#include <string>

namespace vlc {
namespace attestation {

/*!
 * Authenticates serialized attestation documents against a trust anchor.
 *
 * A document is accepted if its leaf certificate chains (through the
 *  document's bundled intermediates) to the anchor at the given time,
 *  its payload signature verifies under the leaf key, and the time
 *  falls within the payload's [not_before, not_after] window.
 *
 * Instances are immutable, and may be shared across threads.
 */
class verifier : private boost::noncopyable
{
public:

    typedef verifier_ptr_t ptr_t;

    explicit verifier(const std::string & trust_anchor_pem);

    /*!
     * Throws error::verify_error (STALE_OR_INVALID_DOCUMENT) if the
     *  document fails to parse or authenticate at time now.
     */
    document parse(const std::string & serialized, uint64_t now) const;

private:

    void verify_chain(X509 & leaf,
        const x509_stack_ptr_t & intermediates, uint64_t now) const;

    x509_ptr_t _anchor;
};

}
}

#endif
