#ifndef VLC_DATAMODEL_ATTESTED_CLOCK_HPP
#define VLC_DATAMODEL_ATTESTED_CLOCK_HPP

#include "vlc/datamodel/fwd.hpp"
#include "vlc/datamodel/ordinary_clock.hpp"
#include "vlc/attestation/fwd.hpp"
#include "vlc/core/protobuf/fwd.hpp"
#include <boost/optional.hpp>
#include <ostream>
#include <string>

namespace vlc {
namespace enclave {
class worker;
}

namespace datamodel {

/*! \brief A vector clock vouched for by an attestation document

The document (serialized attestation::document) binds the clock by
carrying its fingerprint as user-data. Equality & ordering consider
only the clock.

Outside of the worker, the only way to build an attested_clock is
from a genesis clock, with no document.
*/
class attested_clock
{
public:

    /// Throws error::not_genesis unless plain.is_genesis()
    static attested_clock from_genesis(const ordinary_clock & plain);

    const ordinary_clock & get_plain() const
    { return _plain; }

    const std::string & get_document() const
    { return _document; }

    /*!
     * Checks that the document vouches for the clock under policy.
     *
     * Returns boost::none for a genesis clock, which needs no document.
     *  Otherwise the document is authenticated at core::server_time,
     *  its PCRs are matched against the policy's expected PCRs, and its
     *  user-data against the clock's fingerprint; the first failure
     *  throws error::verify_error.
     */
    boost::optional<attestation::document> verify(
        const attestation::verify_policy & policy) const;

    static clock_ancestry compare(
        const attested_clock & lhs, const attested_clock & rhs)
    { return ordinary_clock::compare(lhs._plain, rhs._plain); }

    void to_protobuf(core::protobuf::AttestedClock &) const;

    /*!
     * Throws error::protocol_error (malformed) if the clock is
     *  malformed. The document is not verified.
     */
    static attested_clock from_protobuf(const core::protobuf::AttestedClock &);

    bool operator == (const attested_clock & other) const
    { return _plain == other._plain; }

    bool operator != (const attested_clock & other) const
    { return _plain != other._plain; }

private:

    friend class enclave::worker;

    attested_clock(ordinary_clock plain, std::string document)
     :  _plain(std::move(plain)),
        _document(std::move(document))
    { }

    ordinary_clock _plain;
    std::string _document;
};

inline uint64_t reduce(const attested_clock & clock)
{
    return reduce(clock.get_plain());
}

std::ostream & operator << (std::ostream &, const attested_clock &);

}
}

#endif
