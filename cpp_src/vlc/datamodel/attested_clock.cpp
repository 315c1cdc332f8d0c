#include "vlc/datamodel/attested_clock.hpp"
#include "vlc/attestation/document.hpp"
#include "vlc/attestation/verify_policy.hpp"
#include "vlc/core/protobuf/vlc.pb.h"
#include "vlc/core/digest.hpp"
#include "vlc/core/server_time.hpp"
#include "vlc/error.hpp"
#include "vlc/log.hpp"
#include <sstream>

namespace vlc {
namespace datamodel {

namespace spb = vlc::core::protobuf;

/* static */
attested_clock attested_clock::from_genesis(const ordinary_clock & plain)
{
    if(!plain.is_genesis())
    {
        std::stringstream repr;
        repr << plain;
        throw error::not_genesis(repr.str());
    }
    return attested_clock(plain, std::string());
}

boost::optional<attestation::document> attested_clock::verify(
    const attestation::verify_policy & policy) const
{
    if(_plain.is_genesis())
    {
        return boost::none;
    }

    VLC_ASSERT(policy.doc_verifier);

    attestation::document doc = policy.doc_verifier->parse(
        _document, core::server_time::get_time());

    for(const auto & expected : policy.expected_pcrs)
    {
        auto it = doc.pcrs.find(expected.first);

        if(it == doc.pcrs.end())
        {
            throw error::verify_error(error::PCR_MISMATCH,
                "document is missing PCR " + std::to_string(expected.first),
                expected.first);
        }
        if(it->second != expected.second)
        {
            throw error::verify_error(error::PCR_MISMATCH,
                "PCR " + std::to_string(expected.first) + " is " +
                log::hex(it->second) + "; expected " +
                log::hex(expected.second),
                expected.first);
        }
    }

    std::string fingerprint = core::digest_bytes(_plain.fingerprint());
    if(doc.user_data != fingerprint)
    {
        std::stringstream msg;
        msg << "document user-data " << log::hex(doc.user_data)
            << " doesn't match fingerprint " << log::hex(fingerprint)
            << " of " << _plain;

        throw error::verify_error(error::FINGERPRINT_MISMATCH, msg.str());
    }
    return doc;
}

void attested_clock::to_protobuf(spb::AttestedClock & out) const
{
    _plain.to_protobuf(*out.mutable_plain());
    out.set_document(_document);
}

/* static */
attested_clock attested_clock::from_protobuf(const spb::AttestedClock & in)
{
    return attested_clock(
        ordinary_clock::from_protobuf(in.plain()), in.document());
}

std::ostream & operator << (std::ostream & s, const attested_clock & clock)
{
    return s << clock.get_plain() << " (" << clock.get_document().size()
        << " byte document)";
}

}
}
