#include "vlc/core/server_time.hpp"
#include <ctime>

namespace vlc {
namespace core {

std::atomic<uint64_t> server_time::_time(0);

uint64_t server_time::get_time()
{
    uint64_t pinned = _time.load();
    return pinned ? pinned : static_cast<uint64_t>(std::time(NULL));
}

void server_time::set_time(uint64_t new_time)
{
    _time = new_time;
}

}
}

