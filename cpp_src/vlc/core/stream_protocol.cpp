#include "vlc/core/stream_protocol.hpp"
#include "vlc/core/frame.hpp"
#include "vlc/error.hpp"
#include "vlc/log.hpp"
#include <functional>

namespace vlc {
namespace core {

using namespace boost::asio;

////////////////////////////////////////////////////////////////////////
//  stream_protocol_read_interface

void stream_protocol_read_interface::read(
    read_callback_t callback, weak_ptr_t w_self, size_t length)
{
    VLC_ASSERT(!_in_read);
    _in_read = true;

    _buffer.resize(length);

    socket_t & sock(
        static_cast<stream_protocol&>(*this).get_socket());

    // schedule read-till-completion of exactly length bytes
    async_read(sock, buffer(&_buffer[0], _buffer.size()), [
            w_self = std::move(w_self),
            callback = std::move(callback)
        ](boost::system::error_code ec, size_t bytes_transferred)
        {
            on_read(std::move(w_self), std::move(callback),
                ec, bytes_transferred);
        });
}

/* static */
void stream_protocol_read_interface::on_read(
    weak_ptr_t w_self,
    read_callback_t callback,
    boost::system::error_code ec,
    size_t bytes_transferred)
{
    // was stream_protocol destroyed during the operation?
    ptr_t self = w_self.lock();
    if(!self)
    {
        LOG_DBG("post-dtor callback");
        return;
    }

    self->_in_read = false;

    if(ec == boost::asio::error::eof && bytes_transferred != 0)
    {
        ec = vlc::error::make_error_code(
            vlc::error::protocol_errc::truncated);
    }
    if(ec)
    {
        self->_buffer.clear();
        callback(std::move(self), ec, std::string());
        return;
    }

    std::string out;
    out.swap(self->_buffer);
    callback(std::move(self), ec, std::move(out));
}

void stream_protocol_read_interface::read_frame(
    read_callback_t callback, weak_ptr_t w_self, uint64_t max_length)
{
    read(std::bind(&stream_protocol_read_interface::on_frame_header,
            std::move(callback), max_length,
            std::placeholders::_1,
            std::placeholders::_2,
            std::placeholders::_3),
        std::move(w_self), frame::header_length);
}

/* static */
void stream_protocol_read_interface::on_frame_header(
    read_callback_t callback,
    uint64_t max_length,
    ptr_t self,
    boost::system::error_code ec,
    std::string header)
{
    if(ec)
    {
        callback(std::move(self), ec, std::string());
        return;
    }

    uint64_t length = frame::decode_header(header);
    if(length > max_length)
    {
        LOG_WARN("frame of " << length << " bytes exceeds maximum of "
            << max_length);

        callback(std::move(self), vlc::error::make_error_code(
            vlc::error::protocol_errc::malformed), std::string());
        return;
    }

    stream_protocol_read_interface * raw_self = self.get();

    raw_self->read([callback = std::move(callback)](
            ptr_t self, boost::system::error_code ec, std::string payload)
        {
            // the header promised a payload: any end-of-stream is early
            if(ec == boost::asio::error::eof)
            {
                ec = vlc::error::make_error_code(
                    vlc::error::protocol_errc::truncated);
            }
            callback(std::move(self), ec, std::move(payload));
        },
        self, length);
}

////////////////////////////////////////////////////////////////////////
//  stream_protocol_write_interface

void stream_protocol_write_interface::queue_write(std::string str)
{
    VLC_ASSERT(!_in_write);
    _queued.push_back(std::move(str));
}

void stream_protocol_write_interface::queue_frame(std::string payload)
{
    queue_write(frame::encode_header(payload.size()));
    queue_write(std::move(payload));
}

void stream_protocol_write_interface::write(
    write_callback_t callback, weak_ptr_t w_self)
{
    VLC_ASSERT(!_in_write);
    _in_write = true;

    _writing.swap(_queued);
    _queued.clear();

    std::vector<const_buffer> regions;
    regions.reserve(_writing.size());

    for(const std::string & str : _writing)
    {
        regions.push_back(buffer(str));
    }

    socket_t & sock(
        static_cast<stream_protocol&>(*this).get_socket());

    // Schedule write-till-completion
    async_write(sock, regions, [
            w_self = std::move(w_self),
            callback = std::move(callback)
        ](boost::system::error_code ec, size_t)
        {
            ptr_t self = w_self.lock();
            if(!self)
            {
                // destroyed during operation
                LOG_DBG("post-dtor callback");
                return;
            }

            self->_in_write = false;
            self->_writing.clear();
            callback(std::move(self), ec);
        });
}

////////////////////////////////////////////////////////////////////////
//  stream_protocol

stream_protocol::stream_protocol(
    socket_ptr_t sock,
    io_service_ptr_t io_srv)
 :  _sock(std::move(sock)),
    _io_srv(std::move(io_srv))
{
    VLC_ASSERT(_sock);
    VLC_ASSERT(_io_srv);
}

/* virtual */
stream_protocol::~stream_protocol()
{
    close();
}

void stream_protocol::close()
{
    if(!_sock->is_open())
        return;

    boost::system::error_code ec;

    _sock->shutdown(socket_t::shutdown_both, ec);
    if(ec && ec != boost::asio::error::not_connected)
    {
        LOG_WARN("error shutting down connection: " << ec.message());
    }

    _sock->close(ec);
    if(ec)
    {
        LOG_WARN("error closing connection: " << ec.message());
    }
}

bool stream_protocol::is_open() const
{
    return _sock->is_open();
}

}
}
