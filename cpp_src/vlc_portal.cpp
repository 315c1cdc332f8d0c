#include "vlc/portal/session.hpp"
#include "vlc/datamodel/attested_clock.hpp"
#include "vlc/datamodel/update.hpp"
#include "vlc/core/config.hpp"
#include "vlc/core/connection_factory.hpp"
#include "vlc/core/digest.hpp"
#include "vlc/core/protobuf/vlc.pb.h"
#include "vlc/error.hpp"
#include "vlc/log.hpp"
#include <boost/asio.hpp>
#include <iostream>

namespace spb = vlc::core::protobuf;

using namespace vlc;

namespace {

/*
 * Drives a chain of updates of one dimension, each request's prev
 *  being the clock returned by the last
 */
class update_chain
{
public:

    update_chain(portal::session_ptr_t session,
        uint64_t node_id, unsigned update_count)
     :  _session(std::move(session)),
        _node_id(node_id),
        _remaining(update_count),
        _next_request_id(1),
        _clock(datamodel::attested_clock::from_genesis(
            datamodel::ordinary_clock()))
    { }

    void on_next_update()
    {
        if(!_remaining)
        {
            // the writer drains & ends the session
            _session->close_requests();
            return;
        }
        --_remaining;

        uint64_t request_id = _next_request_id++;

        _session->submit(
            datamodel::update_request(request_id, _clock,
                std::vector<datamodel::attested_clock>(), _node_id),
            [this](boost::system::error_code ec,
                boost::optional<datamodel::update_response> response)
            {
                on_update(ec, std::move(response));
            });
    }

private:

    void on_update(boost::system::error_code ec,
        boost::optional<datamodel::update_response> response)
    {
        if(ec)
        {
            LOG_ERR("update failed: " << ec.message());
            return;
        }

        _clock = response->updated;

        std::cout << "request " << response->request_id << ": "
            << _clock.get_plain() << " fingerprint "
            << core::digest_hex(_clock.get_plain().fingerprint());

        for(unsigned i = 0; i != response->stage_latency_ns.size(); ++i)
        {
            std::cout << " " << datamodel::update_stage_name(i) << "="
                << response->stage_latency_ns[i] << "ns";
        }
        std::cout << std::endl;

        on_next_update();
    }

    portal::session_ptr_t _session;

    const uint64_t _node_id;
    unsigned _remaining;
    uint64_t _next_request_id;

    datamodel::attested_clock _clock;
};

}

int main(int argc, const char ** argv)
{
    if(argc != 2)
    {
        std::cerr << "usage: " << argv[0] << " <portal-config>" << std::endl;
        return 2;
    }

    boost::system::error_code result;
    try
    {
        spb::PortalConfig config = core::load_config<spb::PortalConfig>(argv[1]);
        log::set_level(config.log_level());

        core::io_service_ptr_t io_srv =
            std::make_shared<boost::asio::io_service>();

        core::endpoint_t endpoint = config.has_unix_path() ?
            core::connection_factory::unix_endpoint(config.unix_path()) :
            core::connection_factory::vsock_endpoint(
                config.cid(), config.port());

        // blocks; throws if the worker isn't reachable
        portal::session_ptr_t session = portal::session::connect_to(
            io_srv, endpoint, config.max_frame_length());

        update_chain chain(session, config.node_id(), config.update_count());

        session->start(
            [&result](boost::system::error_code ec)
            {
                result = ec;
            });

        chain.on_next_update();
        session.reset();

        io_srv->run();
    }
    catch(const std::exception & e)
    {
        LOG_ERR(e.what());
        return 1;
    }

    if(result)
    {
        LOG_ERR("session failed: " << result.message());
        return 1;
    }
    return 0;
}
