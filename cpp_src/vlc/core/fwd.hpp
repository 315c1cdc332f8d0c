#ifndef VLC_CORE_FWD_HPP
#define VLC_CORE_FWD_HPP

#include <boost/asio.hpp>
#include <boost/asio/generic/stream_protocol.hpp>
#include <array>
#include <cstdint>
#include <memory>

namespace vlc {
namespace core {

typedef std::shared_ptr<boost::asio::io_service> io_service_ptr_t;

// sessions run over any stream-oriented socket family (vsock in
//  deployment, unix-domain socket pairs under test)
typedef boost::asio::generic::stream_protocol::socket socket_t;
typedef std::unique_ptr<socket_t> socket_ptr_t;
typedef boost::asio::generic::stream_protocol::endpoint endpoint_t;

typedef std::array<uint8_t, 32> digest_t;

class stream_protocol;
typedef std::shared_ptr<stream_protocol> stream_protocol_ptr_t;

template<typename T>
class channel;

}
}

#endif

