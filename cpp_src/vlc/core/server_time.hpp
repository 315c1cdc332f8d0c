#ifndef VLC_CORE_SERVER_TIME_HPP
#define VLC_CORE_SERVER_TIME_HPP

#include <atomic>
#include <cstdint>

namespace vlc {
namespace core {

/*!
 * Unix time (seconds) used for attestation validity checks.
 *
 * Follows the wall clock unless pinned with set_time(); set_time(0)
 *  releases a pinned time.
 */
class server_time
{
public:

    static uint64_t get_time();

    static void set_time(uint64_t);

private:

    static std::atomic<uint64_t> _time;
};

}
}

#endif

