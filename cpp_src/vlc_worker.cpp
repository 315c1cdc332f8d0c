#include "vlc/enclave/listener.hpp"
#include "vlc/enclave/worker.hpp"
#include "vlc/attestation/signing_attester.hpp"
#include "vlc/attestation/verify_policy.hpp"
#include "vlc/core/config.hpp"
#include "vlc/core/connection_factory.hpp"
#include "vlc/core/proactor.hpp"
#include "vlc/core/protobuf/vlc.pb.h"
#include "vlc/error.hpp"
#include "vlc/log.hpp"
#include <boost/asio.hpp>
#include <sys/socket.h>
#include <linux/vm_sockets.h>
#include <unistd.h>
#include <csignal>
#include <iostream>

namespace spb = vlc::core::protobuf;

using namespace vlc;

int main(int argc, const char ** argv)
{
    if(argc != 2)
    {
        std::cerr << "usage: " << argv[0] << " <worker-config>" << std::endl;
        return 2;
    }

    try
    {
        spb::WorkerConfig config = core::load_config<spb::WorkerConfig>(argv[1]);
        log::set_level(config.log_level());

        enclave::worker_ptr_t worker = std::make_shared<enclave::worker>(
            attestation::verify_policy::from_config(config),
            attestation::signing_attester::from_config(config));

        core::proactor proactor(config.compute_threads());

        core::endpoint_t endpoint;
        if(config.has_unix_path())
        {
            // remove a socket left by an earlier run
            ::unlink(config.unix_path().c_str());
            endpoint = core::connection_factory::unix_endpoint(
                config.unix_path());
        }
        else
        {
            endpoint = core::connection_factory::vsock_endpoint(
                VMADDR_CID_ANY, config.port());
        }

        enclave::listener_ptr_t listener = std::make_shared<enclave::listener>(
            worker,
            proactor.serial_io_service(),
            proactor.concurrent_io_service(),
            endpoint,
            config.max_frame_length());

        listener->initialize();

        boost::asio::signal_set signals(*proactor.serial_io_service(),
            SIGINT, SIGTERM);

        signals.async_wait(
            [&](const boost::system::error_code & ec, int signal_number)
            {
                if(ec)
                    return;

                LOG_INFO("caught signal " << signal_number << "; shutting down");
                listener->shutdown();
                proactor.shutdown();
            });

        LOG_INFO("worker " << config.module_id() << " serving");
        proactor.run();
    }
    catch(const std::exception & e)
    {
        LOG_ERR(e.what());
        return 1;
    }

    LOG_INFO("run returned");
    return 0;
}
