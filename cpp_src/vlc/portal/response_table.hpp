#ifndef VLC_PORTAL_RESPONSE_TABLE_HPP
#define VLC_PORTAL_RESPONSE_TABLE_HPP

#include "vlc/portal/fwd.hpp"
#include "vlc/core/fwd.hpp"
#include "vlc/datamodel/update.hpp"
#include "vlc/spinlock.hpp"
#include <boost/noncopyable.hpp>
#include <boost/optional.hpp>
#include <boost/system/error_code.hpp>
#include <functional>
#include <unordered_map>

namespace vlc {
namespace portal {

/*!
 * Routes update responses to their waiters by request id, irrespective
 *  of the order in which responses arrive.
 *
 * If hold_unclaimed, a response published before its waiter registers
 *  is held until claimed by async_wait() or take(). Otherwise (as when
 *  every waiter registers before its request is sent) a response with
 *  no waiter is late, duplicated or unsolicited, and is logged and
 *  dropped. Once failed, the table fails every current and future
 *  waiter with the failure's error.
 *
 * Methods may be called from any thread; waiters are invoked from
 *  the table's io_service.
 */
class response_table : private boost::noncopyable
{
public:

    typedef std::function<
        void(boost::system::error_code,
            boost::optional<datamodel::update_response>)
    > callback_t;

    response_table(core::io_service_ptr_t io_srv, bool hold_unclaimed);

    /*!
     * Delivers the response to its waiter, or holds or drops it. A
     *  second response of a held request id is logged and dropped.
     *
     * Returns true iff the response was delivered or held.
     */
    bool publish(datamodel::update_response);

    /// It's an error to register two waiters of one request id
    void async_wait(uint64_t request_id, callback_t);

    /// Removes & returns a held response, if there is one
    boost::optional<datamodel::update_response> take(uint64_t request_id);

    /// Fails the waiter of request_id, if there is one
    void fail(uint64_t request_id, boost::system::error_code ec);

    /// ec must be set
    void fail_all(boost::system::error_code ec);

    /// Number of registered waiters
    size_t pending_count() const;

    /// Number of held responses
    size_t held_count() const;

private:

    const core::io_service_ptr_t _io_srv;
    const bool _hold_unclaimed;

    mutable spinlock _lock;

    std::unordered_map<uint64_t, callback_t> _waiters;
    std::unordered_map<uint64_t, datamodel::update_response> _held;

    boost::system::error_code _failure;
};

}
}

#endif
