#ifndef VLC_PORTAL_FWD_HPP
#define VLC_PORTAL_FWD_HPP

#include <memory>

namespace vlc {
namespace portal {

class response_table;

class session;
typedef std::shared_ptr<session> session_ptr_t;

}
}

#endif
