#ifndef VLC_CORE_CONNECTION_FACTORY_HPP
#define VLC_CORE_CONNECTION_FACTORY_HPP

#include "vlc/core/fwd.hpp"
#include <boost/asio.hpp>
#include <string>

namespace vlc {
namespace core {

class connection_factory
{
public:

    /// Endpoint of a virtual socket (AF_VSOCK) context id & port
    static endpoint_t vsock_endpoint(unsigned cid, unsigned port);

    /// Endpoint of a unix-domain stream socket
    static endpoint_t unix_endpoint(const std::string & path);

    /*!
     * Opens a stream socket on io_srv and connects it to endpoint.
     *
     * Blocks; throws boost::system::system_error on failure.
     */
    static socket_ptr_t connect_to(
        const io_service_ptr_t & io_srv,
        const endpoint_t & endpoint);
};

}
}

#endif
