#ifndef VLC_CORE_STREAM_PROTOCOL_HPP
#define VLC_CORE_STREAM_PROTOCOL_HPP

#include "vlc/core/fwd.hpp"
#include <boost/asio.hpp>
#include <boost/noncopyable.hpp>
#include <boost/system/error_code.hpp>
#include <functional>
#include <string>
#include <vector>

namespace vlc {
namespace core {

class stream_protocol_read_interface
    : private boost::noncopyable
{
public:

    typedef std::shared_ptr<stream_protocol_read_interface> ptr_t;
    typedef std::weak_ptr<stream_protocol_read_interface> weak_ptr_t;

    stream_protocol_read_interface()
     :  _in_read(false)
    { }

    virtual ~stream_protocol_read_interface()
    { }

    typedef std::function<
        void(ptr_t, boost::system::error_code, std::string)
    > read_callback_t;

    /*!
     * Reads exactly length bytes.
     *
     * End-of-stream before the first byte is reported as
     *  boost::asio::error::eof; after a partial read, as
     *  error::protocol_errc::truncated.
     */
    void read(read_callback_t, weak_ptr_t self, size_t length);

    /*!
     * Reads one length-prefixed frame (see core/frame.hpp), passing
     *  its payload to the callback.
     *
     * A declared length above max_length is protocol_errc::malformed,
     *  and the payload is not read. End-of-stream on the frame boundary
     *  is eof; anywhere else, truncated.
     */
    void read_frame(read_callback_t, weak_ptr_t self, uint64_t max_length);

private:

    static void on_read(
        weak_ptr_t self,
        read_callback_t,
        boost::system::error_code,
        size_t bytes_transferred);

    static void on_frame_header(
        read_callback_t,
        uint64_t max_length,
        ptr_t self,
        boost::system::error_code,
        std::string header);

    bool _in_read;
    std::string _buffer;
};

class stream_protocol_write_interface
    : private boost::noncopyable
{
public:

    typedef std::shared_ptr<stream_protocol_write_interface> ptr_t;
    typedef std::weak_ptr<stream_protocol_write_interface> weak_ptr_t;

    stream_protocol_write_interface()
     :  _in_write(false)
    { }

    virtual ~stream_protocol_write_interface()
    { }

    // queue_write(*) - schedule buffer for later write using gather-IO
    //
    // It is an error to call queue_write() while a
    //  write operation is in progress.
    void queue_write(std::string);

    // Queues the frame header and payload as one gathered unit
    void queue_frame(std::string payload);

    typedef std::function<
        void(ptr_t, boost::system::error_code)
    > write_callback_t;

    // Initiates an asynchronous write of queued buffers
    //  to the socket. Callback is invoked when the entire
    //  write has completed, or an error occurs
    void write(write_callback_t, weak_ptr_t self);

private:

    bool _in_write;
    std::vector<std::string> _queued;
    std::vector<std::string> _writing;
};

class stream_protocol :
    public stream_protocol_read_interface,
    public stream_protocol_write_interface
{
public:

    typedef stream_protocol_read_interface read_interface_t;
    typedef stream_protocol_write_interface write_interface_t;

    stream_protocol(socket_ptr_t sock, io_service_ptr_t io_srv);

    virtual ~stream_protocol();

    bool is_open() const;

    /*!
     * Shuts down and closes the socket. Outstanding reads and
     *  writes complete with boost::asio::error::operation_aborted.
     * Must be called from the stream's io_service.
     */
    void close();

    const io_service_ptr_t & get_io_service()
    { return _io_srv; }

protected:

    // Underlying socket
    socket_t & get_socket()
    { return *_sock; }

    const socket_t & get_socket() const
    { return *_sock; }

private:

    friend class stream_protocol_read_interface;
    friend class stream_protocol_write_interface;

    socket_ptr_t _sock;
    io_service_ptr_t _io_srv;
};

}
}

#endif
