#include "vlc/portal/session.hpp"
#include "vlc/core/connection_factory.hpp"
#include "vlc/error.hpp"
#include "vlc/log.hpp"
#include <boost/asio.hpp>
#include <functional>

namespace vlc {
namespace portal {

session::session(core::socket_ptr_t sock,
    core::io_service_ptr_t io_srv,
    uint64_t max_frame_length)
 :  core::stream_protocol(std::move(sock), io_srv),
    _max_frame_length(max_frame_length),
    _requests(io_srv),
    // waiters register before their request is written
    _responses(io_srv, false),
    _started(false),
    _finished(false)
{
    LOG_DBG("created " << this);
}

session::~session()
{
    LOG_DBG("destroyed " << this);
}

/* static */
session::ptr_t session::connect_to(
    const core::io_service_ptr_t & io_srv,
    const core::endpoint_t & endpoint,
    uint64_t max_frame_length)
{
    return std::make_shared<session>(
        core::connection_factory::connect_to(io_srv, endpoint),
        io_srv, max_frame_length);
}

void session::start(completion_callback_t callback)
{
    ptr_t self = shared_from_this();

    get_io_service()->dispatch(
        [self, callback = std::move(callback)]()
        {
            VLC_ASSERT(!self->_started);
            self->_started = true;
            self->_completion = std::move(callback);

            self->on_next_request();
            self->on_next_response();
        });
}

void session::submit(datamodel::update_request request,
    response_callback_t callback)
{
    uint64_t request_id = request.request_id;

    _responses.async_wait(request_id, std::move(callback));

    if(!_requests.push(std::move(request)))
    {
        LOG_WARN("request " << request_id << " submitted to a closed session");

        _responses.fail(request_id, boost::asio::error::operation_aborted);
    }
}

void session::cancel()
{
    get_io_service()->dispatch(
        std::bind(&session::finish, shared_from_this(),
            boost::system::error_code(boost::asio::error::operation_aborted)));
}

////////////////////////////////////////////////////////////////////////
//  writer loop

void session::on_next_request()
{
    _requests.async_pop(std::bind(&session::on_request,
        shared_from_this(), std::placeholders::_1));
}

void session::on_request(boost::optional<datamodel::update_request> request)
{
    if(_finished)
        return;

    if(!request)
    {
        LOG_DBG("request channel closed & drained");
        on_writer_finished(boost::system::error_code());
        return;
    }

    queue_frame(request->serialize());

    write(std::bind(&session::on_request_written, shared_from_this(),
            std::placeholders::_1,
            std::placeholders::_2),
        shared_from_this());
}

void session::on_request_written(write_interface_t::ptr_t,
    boost::system::error_code ec)
{
    if(_finished)
        return;

    if(ec)
    {
        on_writer_finished(ec);
        return;
    }
    on_next_request();
}

void session::on_writer_finished(boost::system::error_code ec)
{
    // a read failure completing in this turn takes precedence
    get_io_service()->post(
        std::bind(&session::finish, shared_from_this(), ec));
}

////////////////////////////////////////////////////////////////////////
//  reader loop

void session::on_next_response()
{
    read_frame(std::bind(&session::on_response, shared_from_this(),
            std::placeholders::_1,
            std::placeholders::_2,
            std::placeholders::_3),
        shared_from_this(), _max_frame_length);
}

void session::on_response(read_interface_t::ptr_t,
    boost::system::error_code ec, std::string payload)
{
    if(_finished)
        return;

    if(ec)
    {
        finish(ec);
        return;
    }

    try
    {
        _responses.publish(datamodel::update_response::parse(payload));
    }
    catch(const error::protocol_error & e)
    {
        LOG_WARN("undecodable response: " << e.msg);
        finish(e.get_error_code());
        return;
    }
    on_next_response();
}

void session::finish(boost::system::error_code ec)
{
    if(_finished)
        return;
    _finished = true;

    if(ec && ec != boost::asio::error::operation_aborted)
    {
        LOG_WARN("session ended: " << ec.message());
    }
    else
    {
        LOG_INFO("session ended: " << ec.message());
    }

    _requests.cancel_wait();
    _requests.close();

    // cancels the other loop's outstanding operation
    close();

    _responses.fail_all(ec ? ec :
        boost::system::error_code(boost::asio::error::operation_aborted));

    if(_completion)
    {
        completion_callback_t completion = std::move(_completion);
        _completion = completion_callback_t();
        completion(ec);
    }
}

}
}
