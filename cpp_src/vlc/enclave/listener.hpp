#ifndef VLC_ENCLAVE_LISTENER_HPP
#define VLC_ENCLAVE_LISTENER_HPP

#include "vlc/enclave/fwd.hpp"
#include "vlc/core/fwd.hpp"
#include <boost/asio.hpp>
#include <memory>
#include <unordered_map>

namespace vlc {
namespace enclave {

/*!
 * Accepts host connections on an endpoint (vsock in deployment), and
 *  starts a connection serving the worker for each.
 */
class listener :
    public std::enable_shared_from_this<listener>
{
public:

    typedef listener_ptr_t ptr_t;

    // Opens, binds & listens on endpoint; throws on failure
    listener(worker_ptr_t worker,
        core::io_service_ptr_t io_srv,
        core::io_service_ptr_t compute_io_srv,
        const core::endpoint_t & endpoint,
        uint64_t max_frame_length);

    ~listener();

    core::endpoint_t get_endpoint() const
    { return _accept_sock.local_endpoint(); }

    void initialize();

    /// Closes the acceptor, and every connection it accepted
    void shutdown();

private:

    void on_accept(const boost::system::error_code & ec);

    const worker_ptr_t _worker;
    const core::io_service_ptr_t _io_srv;
    const core::io_service_ptr_t _compute_io_srv;
    const uint64_t _max_frame_length;

    boost::asio::basic_socket_acceptor<
        boost::asio::generic::stream_protocol> _accept_sock;

    // Next connection to accept
    core::socket_ptr_t _next_sock;

    // Accepted connections, keyed on address
    typedef std::unordered_map<size_t, std::weak_ptr<connection>
        > connections_t;
    connections_t _connections;
};

}
}

#endif
