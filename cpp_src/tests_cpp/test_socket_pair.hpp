#ifndef VLC_TESTS_TEST_SOCKET_PAIR_HPP
#define VLC_TESTS_TEST_SOCKET_PAIR_HPP

#include "vlc/core/fwd.hpp"
#include "vlc/core/frame.hpp"
#include "vlc/error.hpp"
#include <boost/asio.hpp>
#include <sys/socket.h>
#include <unistd.h>
#include <cerrno>
#include <string>

namespace vlc {
namespace test {

/*
 * A connected unix-domain stream pair: one end as an asio socket of
 *  io_srv, the other as a blocking descriptor driven by a test thread.
 */
struct socket_pair
{
    core::socket_ptr_t local;
    int peer_fd;
};

inline socket_pair make_socket_pair(const core::io_service_ptr_t & io_srv)
{
    int fds[2];
    VLC_ASSERT(::socketpair(AF_UNIX, SOCK_STREAM, 0, fds) == 0);

    socket_pair pair;
    pair.local.reset(new core::socket_t(*io_srv,
        boost::asio::generic::stream_protocol(AF_UNIX, 0), fds[0]));
    pair.peer_fd = fds[1];
    return pair;
}

// false on end-of-stream before length bytes are read
inline bool read_exact(int fd, std::string & out, size_t length)
{
    out.resize(length);

    size_t offset = 0;
    while(offset != length)
    {
        ssize_t count = ::read(fd, &out[offset], length - offset);
        if(count < 0 && errno == EINTR)
            continue;
        if(count <= 0)
            return false;
        offset += count;
    }
    return true;
}

inline void write_all(int fd, const std::string & data)
{
    size_t offset = 0;
    while(offset != data.size())
    {
        ssize_t count = ::send(fd, data.data() + offset,
            data.size() - offset, MSG_NOSIGNAL);
        if(count < 0 && errno == EINTR)
            continue;
        VLC_ASSERT(count > 0);
        offset += count;
    }
}

inline bool read_frame(int fd, std::string & payload)
{
    std::string header;
    if(!read_exact(fd, header, core::frame::header_length))
        return false;

    return read_exact(fd, payload, core::frame::decode_header(header));
}

inline void write_frame(int fd, const std::string & payload)
{
    write_all(fd, core::frame::encode_header(payload.size()) + payload);
}

// blocks until the other end closes
inline void drain_until_closed(int fd)
{
    char buf[4096];
    while(true)
    {
        ssize_t count = ::read(fd, buf, sizeof(buf));
        if(count < 0 && errno == EINTR)
            continue;
        if(count <= 0)
            return;
    }
}

}
}

#endif
