#include "vlc/portal/response_table.hpp"
#include "vlc/error.hpp"
#include "vlc/log.hpp"

namespace vlc {
namespace portal {

namespace {

void post_response(const core::io_service_ptr_t & io_srv,
    response_table::callback_t callback,
    boost::system::error_code ec,
    boost::optional<datamodel::update_response> response)
{
    io_srv->post(
        [callback = std::move(callback), ec,
         response = std::move(response)]()
        {
            callback(ec, response);
        });
}

}

response_table::response_table(core::io_service_ptr_t io_srv,
    bool hold_unclaimed)
 :  _io_srv(std::move(io_srv)),
    _hold_unclaimed(hold_unclaimed)
{
    VLC_ASSERT(_io_srv);
}

bool response_table::publish(datamodel::update_response response)
{
    callback_t callback;
    {
        spinlock::guard guard(_lock);

        auto it = _waiters.find(response.request_id);
        if(it == _waiters.end())
        {
            uint64_t request_id = response.request_id;

            if(!_hold_unclaimed)
            {
                LOG_WARN("dropping response to request " << request_id
                    << ", which has no waiter");
                return false;
            }
            if(!_held.insert(std::make_pair(
                request_id, std::move(response))).second)
            {
                LOG_WARN("dropping duplicate response to request "
                    << request_id);
                return false;
            }
            return true;
        }

        callback = std::move(it->second);
        _waiters.erase(it);
    }

    post_response(_io_srv, std::move(callback),
        boost::system::error_code(), std::move(response));
    return true;
}

void response_table::async_wait(uint64_t request_id, callback_t callback)
{
    boost::system::error_code ec;
    boost::optional<datamodel::update_response> response;
    {
        spinlock::guard guard(_lock);

        auto it = _held.find(request_id);
        if(it != _held.end())
        {
            response = std::move(it->second);
            _held.erase(it);
        }
        else if(_failure)
        {
            ec = _failure;
        }
        else
        {
            bool inserted = _waiters.insert(std::make_pair(
                request_id, std::move(callback))).second;

            VLC_ASSERT(inserted);
            return;
        }
    }

    post_response(_io_srv, std::move(callback), ec, std::move(response));
}

boost::optional<datamodel::update_response> response_table::take(
    uint64_t request_id)
{
    spinlock::guard guard(_lock);

    auto it = _held.find(request_id);
    if(it == _held.end())
        return boost::none;

    boost::optional<datamodel::update_response> response(
        std::move(it->second));
    _held.erase(it);
    return response;
}

void response_table::fail(uint64_t request_id,
    boost::system::error_code ec)
{
    callback_t callback;
    {
        spinlock::guard guard(_lock);

        auto it = _waiters.find(request_id);
        if(it == _waiters.end())
            return;

        callback = std::move(it->second);
        _waiters.erase(it);
    }

    post_response(_io_srv, std::move(callback), ec, boost::none);
}

void response_table::fail_all(boost::system::error_code ec)
{
    VLC_ASSERT(ec);

    std::unordered_map<uint64_t, callback_t> waiters;
    {
        spinlock::guard guard(_lock);

        if(!_failure)
        {
            _failure = ec;
        }
        waiters.swap(_waiters);
    }

    for(auto & entry : waiters)
    {
        LOG_DBG("failing waiter of request " << entry.first);
        post_response(_io_srv, std::move(entry.second), ec, boost::none);
    }
}

size_t response_table::pending_count() const
{
    spinlock::guard guard(_lock);
    return _waiters.size();
}

size_t response_table::held_count() const
{
    spinlock::guard guard(_lock);
    return _held.size();
}

}
}
