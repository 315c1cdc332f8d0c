#include "vlc/enclave/listener.hpp"
#include "vlc/enclave/connection.hpp"
#include "vlc/error.hpp"
#include "vlc/log.hpp"
#include <functional>

namespace vlc {
namespace enclave {

using namespace boost::asio;

listener::listener(worker_ptr_t worker,
    core::io_service_ptr_t io_srv,
    core::io_service_ptr_t compute_io_srv,
    const core::endpoint_t & endpoint,
    uint64_t max_frame_length)
 :  _worker(std::move(worker)),
    _io_srv(std::move(io_srv)),
    _compute_io_srv(std::move(compute_io_srv)),
    _max_frame_length(max_frame_length),
    _accept_sock(*_io_srv)
{
    // open & bind the listening socket; throws on failure
    _accept_sock.open(endpoint.protocol());
    _accept_sock.bind(endpoint);
    _accept_sock.listen();

    LOG_DBG("listening on family " << endpoint.protocol().family());
}

listener::~listener()
{
    LOG_DBG("");
}

void listener::initialize()
{
    // next connection to accept
    on_accept(boost::system::error_code());
}

void listener::shutdown()
{
    LOG_DBG("");

    boost::system::error_code ec;
    _accept_sock.close(ec);
    if(ec)
    {
        LOG_WARN("error closing listener: " << ec.message());
    }

    for(const connections_t::value_type & entry : _connections)
    {
        connection::ptr_t conn(entry.second.lock());

        if(conn)
        {
            conn->shutdown();
        }
    }
    _connections.clear();
}

void listener::on_accept(const boost::system::error_code & ec)
{
    if(ec == boost::asio::error::operation_aborted)
    {
        LOG_DBG("accept cancelled");
        return;
    }
    if(ec)
    {
        LOG_ERR(ec.message());
        return;
    }

    if(_next_sock)
    {
        LOG_INFO("accepted host connection");

        // Lifetime is managed by the connection's use in callbacks. Eg,
        //  it's auto-destroyed when it falls out of the event-loop
        connection::ptr_t conn = std::make_shared<connection>(
            _worker, _compute_io_srv, std::move(_next_sock),
            _io_srv, _max_frame_length);
        conn->initialize();

        // forget connections which have since been destroyed
        for(auto it = _connections.begin(); it != _connections.end();)
        {
            if(it->second.expired())
                it = _connections.erase(it);
            else
                ++it;
        }

        _connections[reinterpret_cast<size_t>(conn.get())] = conn;
    }

    // Next connection to accept
    _next_sock.reset(new core::socket_t(*_io_srv));

    // Schedule call on accept
    _accept_sock.async_accept(*_next_sock,
        std::bind(&listener::on_accept, shared_from_this(),
            std::placeholders::_1));
}

}
}
