#ifndef VLC_DATAMODEL_LAMPORT_CLOCK_HPP
#define VLC_DATAMODEL_LAMPORT_CLOCK_HPP

#include <cstdint>

namespace vlc {
namespace datamodel {

/*! \brief Scalar reduction of a vector clock

Totally orders clocks by their summed counters. Monotone under
merge & update, but lossy: concurrent clocks compare as ordered.
*/
typedef uint64_t lamport_clock;

inline uint64_t reduce(lamport_clock clock)
{
    return clock;
}

}
}

#endif
