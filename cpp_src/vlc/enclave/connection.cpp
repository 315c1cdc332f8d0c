#include "vlc/enclave/connection.hpp"
#include "vlc/enclave/worker.hpp"
#include "vlc/error.hpp"
#include "vlc/log.hpp"
#include <boost/asio.hpp>
#include <functional>

namespace vlc {
namespace enclave {

const unsigned connection::max_request_concurrency = 64;

connection::connection(worker_ptr_t worker,
    core::io_service_ptr_t compute_io_srv,
    core::socket_ptr_t sock,
    core::io_service_ptr_t io_srv,
    uint64_t max_frame_length)
 :  core::stream_protocol(std::move(sock), std::move(io_srv)),
    _worker(std::move(worker)),
    _compute_io_srv(std::move(compute_io_srv)),
    _max_frame_length(max_frame_length),
    _ready_for_read(true),
    _ready_for_write(true),
    _closed(false),
    _cur_requests_outstanding(0)
{
    VLC_ASSERT(_worker);
    VLC_ASSERT(_compute_io_srv);

    LOG_DBG("created " << this);
}

connection::~connection()
{
    LOG_DBG("destroyed " << this);
}

void connection::initialize()
{
    // begin the read loop
    get_io_service()->dispatch(
        std::bind(&connection::on_next_request, shared_from_this()));
}

void connection::shutdown()
{
    on_connection_error(boost::asio::error::operation_aborted);
}

void connection::on_next_request()
{
    if(_closed || !_ready_for_read)
        return;

    if(_cur_requests_outstanding >= max_request_concurrency)
    {
        LOG_WARN("reached maximum request concurrency; pausing read-loop");
        return;
    }

    _ready_for_read = false;

    read_frame(std::bind(&connection::on_request, shared_from_this(),
            std::placeholders::_1,
            std::placeholders::_2,
            std::placeholders::_3),
        shared_from_this(), _max_frame_length);
}

void connection::on_request(read_interface_t::ptr_t,
    boost::system::error_code ec, std::string payload)
{
    _ready_for_read = true;

    if(ec)
    {
        on_connection_error(ec);
        return;
    }
    if(_closed)
    {
        LOG_DBG("connection closed; discarding request");
        return;
    }

    ++_cur_requests_outstanding;

    // the connection's io_service has outstanding work until the
    //  response is posted back to it
    _compute_io_srv->post(
        [self = shared_from_this(), payload = std::move(payload),
         work = boost::asio::io_service::work(*get_io_service())]()
        {
            boost::optional<std::string> response_bytes;

            boost::optional<datamodel::update_response> response = \
                self->_worker->handle_update(payload);

            if(response)
            {
                response_bytes = response->serialize();
            }

            connection * raw_self = self.get();

            // return to the connection's io_service to write
            raw_self->get_io_service()->post(
                [self = std::move(self),
                 response_bytes = std::move(response_bytes)]()
                {
                    self->on_response(std::move(response_bytes));
                });
        });

    on_next_request();
}

void connection::on_response(boost::optional<std::string> response_bytes)
{
    VLC_ASSERT(_cur_requests_outstanding);
    --_cur_requests_outstanding;

    if(_closed)
    {
        LOG_DBG("connection closed; discarding response");
        return;
    }

    if(response_bytes)
    {
        _pending_responses.push_back(std::move(*response_bytes));
        on_next_write();
    }

    // resume a read-loop paused at max concurrency
    on_next_request();
}

void connection::on_next_write()
{
    if(_closed || !_ready_for_write || _pending_responses.empty())
        return;

    _ready_for_write = false;

    queue_frame(std::move(_pending_responses.front()));
    _pending_responses.pop_front();

    write(std::bind(&connection::on_write, shared_from_this(),
            std::placeholders::_1,
            std::placeholders::_2),
        shared_from_this());
}

void connection::on_write(write_interface_t::ptr_t,
    boost::system::error_code ec)
{
    _ready_for_write = true;

    if(ec)
    {
        on_connection_error(ec);
        return;
    }
    on_next_write();
}

void connection::on_connection_error(boost::system::error_code ec)
{
    if(_closed)
        return;

    if(ec == boost::asio::error::eof)
    {
        LOG_INFO("host closed the connection");
    }
    else if(ec != boost::asio::error::operation_aborted)
    {
        LOG_WARN("closing connection: " << ec.message());
    }

    _closed = true;
    _pending_responses.clear();

    close();
}

}
}
