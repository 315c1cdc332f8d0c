#ifndef VLC_ATTESTATION_ATTESTER_HPP
#define VLC_ATTESTATION_ATTESTER_HPP

#include "vlc/attestation/fwd.hpp"
#include <boost/noncopyable.hpp>
#include <string>

namespace vlc {
namespace attestation {

/*!
 * The isolated environment's attestation primitive.
 *
 * process_attestation() returns a serialized document whose user-data
 *  is exactly user_data, and whose PCRs reflect the measured identity
 *  of the running code. Implementations must be callable concurrently.
 */
class attester : private boost::noncopyable
{
public:

    typedef attester_ptr_t ptr_t;

    virtual ~attester()
    { }

    virtual std::string process_attestation(const std::string & user_data) = 0;
};

}
}

#endif
