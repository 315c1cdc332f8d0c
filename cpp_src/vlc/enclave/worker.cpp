#include "vlc/enclave/worker.hpp"
#include "vlc/core/digest.hpp"
#include "vlc/error.hpp"
#include "vlc/log.hpp"
#include <chrono>

namespace vlc {
namespace enclave {

namespace {

typedef std::chrono::steady_clock stage_clock;

uint64_t elapsed_ns(stage_clock::time_point start)
{
    return std::chrono::duration_cast<std::chrono::nanoseconds>(
        stage_clock::now() - start).count();
}

}

worker::worker(attestation::verify_policy policy,
    attestation::attester_ptr_t attester)
 :  _policy(std::move(policy)),
    _attester(std::move(attester))
{
    VLC_ASSERT(_policy.doc_verifier);
    VLC_ASSERT(_attester);
}

boost::optional<datamodel::update_response> worker::handle_update(
    const std::string & payload) const
{
    stage_clock::time_point start = stage_clock::now();
    std::vector<uint64_t> stage_latency_ns(datamodel::update_stage_count, 0);

    boost::optional<datamodel::update_request> request;
    try
    {
        request = datamodel::update_request::parse(payload);
    }
    catch(const error::protocol_error & e)
    {
        LOG_WARN("dropping undecodable request of " << payload.size()
            << " bytes: " << e.msg);
        return boost::none;
    }
    stage_latency_ns[datamodel::DECODE] = elapsed_ns(start);

    try
    {
        datamodel::update_response response = update(
            *request, stage_latency_ns);

        stage_latency_ns[datamodel::TOTAL] = elapsed_ns(start);
        response.stage_latency_ns = std::move(stage_latency_ns);
        return response;
    }
    catch(const error::verify_error & e)
    {
        LOG_WARN("dropping request " << request->request_id
            << ": input clock failed verification (" << e.get_code()
            << "): " << e.msg);
    }
    catch(const error::vlc_exception & e)
    {
        LOG_WARN("dropping request " << request->request_id
            << ": " << e.what());
    }
    catch(const std::exception & e)
    {
        // eg, the attestation device failed
        LOG_WARN("dropping request " << request->request_id
            << ": update failed: " << e.what());
    }
    return boost::none;
}

datamodel::update_response worker::update(
    const datamodel::update_request & request,
    std::vector<uint64_t> & stage_latency_ns) const
{
    VLC_ASSERT(stage_latency_ns.size() == datamodel::update_stage_count);

    stage_clock::time_point start = stage_clock::now();

    request.prev.verify(_policy);

    std::vector<datamodel::ordinary_clock> deps;
    deps.reserve(request.deps.size());

    for(const datamodel::attested_clock & dep : request.deps)
    {
        dep.verify(_policy);
        deps.push_back(dep.get_plain());
    }
    stage_latency_ns[datamodel::VERIFY] = elapsed_ns(start);

    start = stage_clock::now();
    datamodel::ordinary_clock updated = request.prev.get_plain().update(
        deps, request.id);
    stage_latency_ns[datamodel::UPDATE] = elapsed_ns(start);

    start = stage_clock::now();
    std::string document = _attester->process_attestation(
        core::digest_bytes(updated.fingerprint()));
    stage_latency_ns[datamodel::ATTEST] = elapsed_ns(start);

    LOG_DBG("request " << request.request_id << " advanced "
        << request.prev.get_plain() << " to " << updated);

    return datamodel::update_response(request.request_id,
        datamodel::attested_clock(std::move(updated), std::move(document)),
        stage_latency_ns);
}

}
}
