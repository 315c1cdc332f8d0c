#ifndef VLC_CORE_CHANNEL_HPP
#define VLC_CORE_CHANNEL_HPP

#include "vlc/core/fwd.hpp"
#include "vlc/spinlock.hpp"
#include "vlc/error.hpp"
#include <boost/noncopyable.hpp>
#include <boost/optional.hpp>
#include <deque>
#include <functional>

namespace vlc {
namespace core {

/*!
 * Multi-producer, single-consumer FIFO queue.
 *
 * push() and close() may be called from any thread. The consumer
 *  registers at most one waiter at a time with async_pop(); the waiter
 *  is always invoked from the channel's io_service, with the next value,
 *  or with boost::none once the channel is closed and drained.
 */
template<typename T>
class channel : private boost::noncopyable
{
public:

    typedef std::function<void(boost::optional<T>)> pop_callback_t;

    explicit channel(io_service_ptr_t io_srv)
     :  _io_srv(std::move(io_srv)),
        _closed(false)
    { }

    // Returns false (and drops the value) if the channel is closed
    bool push(T value)
    {
        pop_callback_t waiter;
        {
            spinlock::guard guard(_lock);

            if(_closed)
                return false;

            if(!_waiter)
            {
                _queue.push_back(std::move(value));
                return true;
            }
            waiter = std::move(_waiter);
            _waiter = pop_callback_t();
        }

        deliver(std::move(waiter), boost::optional<T>(std::move(value)));
        return true;
    }

    // Values already queued are still delivered
    void close()
    {
        pop_callback_t waiter;
        {
            spinlock::guard guard(_lock);

            if(_closed)
                return;
            _closed = true;

            if(!_waiter)
                return;

            VLC_ASSERT(_queue.empty());
            waiter = std::move(_waiter);
            _waiter = pop_callback_t();
        }

        deliver(std::move(waiter), boost::none);
    }

    void async_pop(pop_callback_t callback)
    {
        boost::optional<T> value;
        {
            spinlock::guard guard(_lock);
            VLC_ASSERT(!_waiter);

            if(!_queue.empty())
            {
                value = std::move(_queue.front());
                _queue.pop_front();
            }
            else if(!_closed)
            {
                _waiter = std::move(callback);
                return;
            }
        }

        deliver(std::move(callback), std::move(value));
    }

    // Drops a registered waiter, which will not be invoked
    void cancel_wait()
    {
        spinlock::guard guard(_lock);
        _waiter = pop_callback_t();
    }

private:

    void deliver(pop_callback_t callback, boost::optional<T> value)
    {
        _io_srv->post(
            [callback = std::move(callback), value = std::move(value)]()
            {
                callback(value);
            });
    }

    const io_service_ptr_t _io_srv;

    mutable spinlock _lock;
    std::deque<T> _queue;
    pop_callback_t _waiter;
    bool _closed;
};

}
}

#endif
