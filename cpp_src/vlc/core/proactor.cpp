#include "vlc/core/proactor.hpp"
#include "vlc/error.hpp"
#include "vlc/log.hpp"

namespace vlc {
namespace core {

proactor::proactor(unsigned concurrent_thread_count)
 :  _serial_io_srv(std::make_shared<boost::asio::io_service>()),
    _serial_work(new boost::asio::io_service::work(*_serial_io_srv))
{
    if(!concurrent_thread_count)
    {
        LOG_DBG("no concurrent threads; serial service is shared");
        return;
    }

    _threaded_io_srv = std::make_shared<boost::asio::io_service>();
    _threaded_work.reset(new boost::asio::io_service::work(*_threaded_io_srv));

    for(unsigned i = 0; i != concurrent_thread_count; ++i)
    {
        _threads.create_thread(
            [io_srv = _threaded_io_srv]()
            {
                LOG_DBG("concurrent service thread started");

                // a failed handler doesn't take down the pool
                while(true)
                {
                    try
                    {
                        io_srv->run();
                        break;
                    }
                    catch(const std::exception & e)
                    {
                        LOG_ERR("concurrent handler failed: " << e.what());
                    }
                }
                LOG_DBG("concurrent service thread exiting");
            });
    }
}

proactor::~proactor()
{
    shutdown();
    _threads.join_all();

    LOG_DBG("called");
}

void proactor::run()
{
    _serial_io_srv->run();
}

void proactor::shutdown()
{
    spinlock::guard guard(_lock);

    if(_serial_work)
        LOG_DBG("draining io_services");

    _serial_work.reset();
    _threaded_work.reset();
}

}
}
