#ifndef VLC_ENCLAVE_CONNECTION_HPP
#define VLC_ENCLAVE_CONNECTION_HPP

#include "vlc/enclave/fwd.hpp"
#include "vlc/core/fwd.hpp"
#include "vlc/core/stream_protocol.hpp"
#include <boost/optional.hpp>
#include <functional>
#include <list>
#include <memory>
#include <string>

namespace vlc {
namespace enclave {

/*!
 * Serves update requests of one host connection.
 *
 * Request frames are read in a loop & handed to the worker on the
 *  compute io_service, so that several requests may be in progress at
 *  once. Responses are framed & written back one at a time, in
 *  completion order. Requests which the worker drops produce no frame.
 *
 * The connection is held alive by its own pending operations, and is
 *  destroyed once its stream fails or closes and in-flight requests
 *  complete.
 */
class connection :
    public core::stream_protocol,
    public std::enable_shared_from_this<connection>
{
public:

    typedef connection_ptr_t ptr_t;

    static const unsigned max_request_concurrency;

    connection(worker_ptr_t worker,
        core::io_service_ptr_t compute_io_srv,
        core::socket_ptr_t sock,
        core::io_service_ptr_t io_srv,
        uint64_t max_frame_length);

    virtual ~connection();

    using core::stream_protocol::get_io_service;

    void initialize();

    /*!
     * Closes the stream. Requests in progress complete, but their
     *  responses are discarded.
     */
    void shutdown();

private:

    using stream_protocol::read_interface_t;
    using stream_protocol::write_interface_t;

    /*
     * If a read-operation isn't already in progress, and
     *  we haven't yet reached max request concurrency,
     *  begin reading the next request frame
     */
    void on_next_request();

    /*
     * Posts the request to the compute io_service, and
     *  continues the read loop
     */
    void on_request(read_interface_t::ptr_t,
        boost::system::error_code, std::string);

    /*
     * Runs in the connection's io_service once the worker
     *  has finished (or dropped) a request
     */
    void on_response(boost::optional<std::string>);

    /*
     * If a write isn't already in progress, writes the next
     *  pending response
     */
    void on_next_write();

    void on_write(write_interface_t::ptr_t, boost::system::error_code);

    void on_connection_error(boost::system::error_code);

    const worker_ptr_t _worker;
    const core::io_service_ptr_t _compute_io_srv;
    const uint64_t _max_frame_length;

    bool _ready_for_read /*= true*/;
    bool _ready_for_write /*= true*/;
    bool _closed /*= false*/;

    std::list<std::string> _pending_responses;

    unsigned _cur_requests_outstanding /*= 0*/;
};

}
}

#endif
