#ifndef VLC_DATAMODEL_FWD_HPP
#define VLC_DATAMODEL_FWD_HPP

#include <memory>

namespace vlc {
namespace datamodel {

enum clock_ancestry
{
    EQUAL = 0,
    MORE_RECENT = 1,
    LESS_RECENT = 2,
    DIVERGE = 3
};

class ordinary_clock;
class attested_clock;

struct update_request;
struct update_response;

}
}

#endif
