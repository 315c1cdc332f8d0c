#include "vlc/datamodel/update.hpp"
#include "vlc/core/protobuf/vlc.pb.h"
#include "vlc/error.hpp"

namespace vlc {
namespace datamodel {

namespace spb = vlc::core::protobuf;

std::string update_request::serialize() const
{
    spb::UpdateRequest pb_request;

    pb_request.set_request_id(request_id);
    prev.to_protobuf(*pb_request.mutable_prev());

    for(const attested_clock & dep : deps)
    {
        dep.to_protobuf(*pb_request.add_deps());
    }
    pb_request.set_id(id);

    std::string out;
    VLC_ASSERT(pb_request.SerializeToString(&out));
    return out;
}

/* static */
update_request update_request::parse(const std::string & serialized)
{
    spb::UpdateRequest pb_request;
    if(!pb_request.ParseFromString(serialized))
    {
        throw error::protocol_error(error::protocol_errc::malformed,
            "UpdateRequest failed to parse");
    }

    std::vector<attested_clock> deps;
    deps.reserve(pb_request.deps_size());

    for(const spb::AttestedClock & pb_dep : pb_request.deps())
    {
        deps.push_back(attested_clock::from_protobuf(pb_dep));
    }

    return update_request(pb_request.request_id(),
        attested_clock::from_protobuf(pb_request.prev()),
        std::move(deps),
        pb_request.id());
}

std::string update_response::serialize() const
{
    spb::UpdateResponse pb_response;

    pb_response.set_request_id(request_id);
    updated.to_protobuf(*pb_response.mutable_updated());

    for(uint64_t latency : stage_latency_ns)
    {
        pb_response.add_stage_latency_ns(latency);
    }

    std::string out;
    VLC_ASSERT(pb_response.SerializeToString(&out));
    return out;
}

/* static */
update_response update_response::parse(const std::string & serialized)
{
    spb::UpdateResponse pb_response;
    if(!pb_response.ParseFromString(serialized))
    {
        throw error::protocol_error(error::protocol_errc::malformed,
            "UpdateResponse failed to parse");
    }

    return update_response(pb_response.request_id(),
        attested_clock::from_protobuf(pb_response.updated()),
        std::vector<uint64_t>(pb_response.stage_latency_ns().begin(),
            pb_response.stage_latency_ns().end()));
}

const char * update_stage_name(unsigned stage)
{
    switch(stage)
    {
    case DECODE:
        return "decode";
    case VERIFY:
        return "verify";
    case UPDATE:
        return "update";
    case ATTEST:
        return "attest";
    case TOTAL:
        return "total";
    }
    return "unknown";
}

}
}
