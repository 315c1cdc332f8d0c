#ifndef VLC_CORE_PROACTOR_HPP
#define VLC_CORE_PROACTOR_HPP

#include "vlc/core/fwd.hpp"
#include "vlc/spinlock.hpp"
#include <boost/asio.hpp>
#include <boost/noncopyable.hpp>
#include <boost/thread/thread.hpp>
#include <memory>

namespace vlc {
namespace core {

/*!
 * Owns the io_services of a process.
 *
 * The serial io_service is run by a single thread (the caller of
 *  run()). Handlers running on it need no explicit synchronization,
 *  and are intended to be non-blocking, such as ones performing
 *  asynchronous network IO.
 *
 * The concurrent io_service is run by a pool of threads owned by the
 *  proactor, and is intended for CPU-bound or blocking handlers, such
 *  as ones verifying or signing attestations. With no pool threads,
 *  the serial io_service doubles as the concurrent one.
 *
 * Shutdown is a drain rather than a stop: io_services run until their
 *  outstanding operations complete, so no queued handler (and nothing
 *  it holds) outlives the proactor. Owners of open sockets must close
 *  them for run() to return.
 */
class proactor : private boost::noncopyable
{
public:

    explicit proactor(unsigned concurrent_thread_count);

    ~proactor();

    const io_service_ptr_t & serial_io_service()
    { return _serial_io_srv; }

    const io_service_ptr_t & concurrent_io_service()
    { return _threaded_io_srv ? _threaded_io_srv : _serial_io_srv; }

    /// Runs the serial io_service on this thread until it drains
    ///  after shutdown()
    void run();

    /// Releases the work keeping io_services running. Thread-safe
    void shutdown();

private:

    const io_service_ptr_t _serial_io_srv;
    io_service_ptr_t _threaded_io_srv;

    spinlock _lock;
    std::unique_ptr<boost::asio::io_service::work> _serial_work;
    std::unique_ptr<boost::asio::io_service::work> _threaded_work;

    boost::thread_group _threads;
};

}
}

#endif
