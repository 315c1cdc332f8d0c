#ifndef VLC_PORTAL_SESSION_HPP
#define VLC_PORTAL_SESSION_HPP

#include "vlc/portal/fwd.hpp"
#include "vlc/portal/response_table.hpp"
#include "vlc/core/fwd.hpp"
#include "vlc/core/channel.hpp"
#include "vlc/core/frame.hpp"
#include "vlc/core/stream_protocol.hpp"
#include "vlc/datamodel/update.hpp"
#include <boost/optional.hpp>
#include <functional>
#include <memory>

namespace vlc {
namespace portal {

/*!
 * Host side of a worker connection.
 *
 * A writer loop pops update requests from the request channel in FIFO
 *  order and writes each as one frame, not starting the next until the
 *  write completes. A reader loop reads response frames and publishes
 *  them to the response table by request id.
 *
 * The loops start & end together, and the first outcome wins:
 *  - a reader failure (stream error, malformed or truncated frame,
 *    or the worker closing the stream) ends the session at once.
 *  - a writer outcome (a write error, or a clean drain of the closed
 *    request channel) is deferred one event-loop turn, and ends the
 *    session only if the reader hasn't failed in the meantime.
 *
 * Ending the session closes the stream, drops the pending channel wait,
 *  and fails outstanding response waiters. The completion callback is
 *  invoked once, with the winning outcome.
 */
class session :
    public core::stream_protocol,
    public std::enable_shared_from_this<session>
{
public:

    typedef session_ptr_t ptr_t;

    typedef std::function<void(boost::system::error_code)> completion_callback_t;
    typedef response_table::callback_t response_callback_t;

    session(core::socket_ptr_t sock,
        core::io_service_ptr_t io_srv,
        uint64_t max_frame_length = core::frame::default_max_length);

    virtual ~session();

    /*!
     * Connects to endpoint & returns an un-started session.
     *
     * Blocks; throws boost::system::system_error on failure.
     */
    static ptr_t connect_to(
        const core::io_service_ptr_t & io_srv,
        const core::endpoint_t & endpoint,
        uint64_t max_frame_length = core::frame::default_max_length);

    using core::stream_protocol::get_io_service;

    /// Begins both loops. May be called once
    void start(completion_callback_t);

    /*!
     * Registers callback as the waiter of request's response, and
     *  queues the request for writing. Thread-safe.
     *
     * If the session has ended, callback is failed with its error.
     */
    void submit(datamodel::update_request request, response_callback_t);

    /*!
     * Closes the request channel. The writer finishes once queued
     *  requests are written, which ends the session.
     */
    void close_requests()
    { _requests.close(); }

    /// Ends the session with boost::asio::error::operation_aborted
    void cancel();

    core::channel<datamodel::update_request> & get_requests()
    { return _requests; }

    response_table & get_responses()
    { return _responses; }

    bool is_finished() const
    { return _finished; }

private:

    using stream_protocol::read_interface_t;
    using stream_protocol::write_interface_t;

    // writer loop

    void on_next_request();

    void on_request(boost::optional<datamodel::update_request>);

    void on_request_written(write_interface_t::ptr_t,
        boost::system::error_code);

    // reports a writer outcome one event-loop turn later
    void on_writer_finished(boost::system::error_code);

    // reader loop

    void on_next_response();

    void on_response(read_interface_t::ptr_t,
        boost::system::error_code, std::string);

    void finish(boost::system::error_code);

    const uint64_t _max_frame_length;

    core::channel<datamodel::update_request> _requests;
    response_table _responses;

    completion_callback_t _completion;

    bool _started /*= false*/;
    bool _finished /*= false*/;
};

}
}

#endif
