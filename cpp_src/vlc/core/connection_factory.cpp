#include "vlc/core/connection_factory.hpp"
#include "vlc/log.hpp"
#include <sys/socket.h>
#include <linux/vm_sockets.h>
#include <cstring>

namespace vlc {
namespace core {

using namespace boost::asio;

/* static */
endpoint_t connection_factory::vsock_endpoint(unsigned cid, unsigned port)
{
    sockaddr_vm addr;
    std::memset(&addr, 0, sizeof(addr));

    addr.svm_family = AF_VSOCK;
    addr.svm_cid = cid;
    addr.svm_port = port;

    return endpoint_t(&addr, sizeof(addr));
}

/* static */
endpoint_t connection_factory::unix_endpoint(const std::string & path)
{
    return endpoint_t(local::stream_protocol::endpoint(path));
}

/* static */
socket_ptr_t connection_factory::connect_to(
    const io_service_ptr_t & io_srv,
    const endpoint_t & endpoint)
{
    socket_ptr_t sock(new socket_t(*io_srv));

    // opens with the endpoint's protocol; throws on failure
    sock->connect(endpoint);

    LOG_DBG("connected to family " << endpoint.protocol().family());
    return sock;
}

}
}
