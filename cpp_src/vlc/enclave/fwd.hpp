#ifndef VLC_ENCLAVE_FWD_HPP
#define VLC_ENCLAVE_FWD_HPP

#include <memory>

namespace vlc {
namespace enclave {

class worker;
typedef std::shared_ptr<const worker> worker_ptr_t;

class connection;
typedef std::shared_ptr<connection> connection_ptr_t;

class listener;
typedef std::shared_ptr<listener> listener_ptr_t;

}
}

#endif
