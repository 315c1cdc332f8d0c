#ifndef VLC_SPINLOCK_HPP
#define VLC_SPINLOCK_HPP

#include <boost/noncopyable.hpp>
#include <atomic>

namespace vlc {

// RAII spinlock over an atomic flag. Critical sections guarded by it
//  must be short and never block.
class spinlock : private boost::noncopyable
{
public:

    void acquire()
    {
        while(_lock.test_and_set(std::memory_order_acquire)) { }
    }

    void release()
    {
        _lock.clear(std::memory_order_release);
    }

    class guard : private boost::noncopyable
    {
    public:

        explicit guard(spinlock & sl)
         : _sl(sl)
        {
            _sl.acquire();
        }

        ~guard()
        {
            _sl.release();
        }

    private:
        spinlock & _sl;
    };

private:

    std::atomic_flag _lock = ATOMIC_FLAG_INIT;
};

}

#endif
