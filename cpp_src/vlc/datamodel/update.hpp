#ifndef VLC_DATAMODEL_UPDATE_HPP
#define VLC_DATAMODEL_UPDATE_HPP

#include "vlc/datamodel/fwd.hpp"
#include "vlc/datamodel/attested_clock.hpp"
#include <cstdint>
#include <string>
#include <vector>

namespace vlc {
namespace datamodel {

/// Asks the worker to advance prev, merged with deps, at dimension id
struct update_request
{
    uint64_t request_id;
    attested_clock prev;
    std::vector<attested_clock> deps;
    uint64_t id;

    update_request(uint64_t request_id, attested_clock prev,
        std::vector<attested_clock> deps, uint64_t id)
     :  request_id(request_id),
        prev(std::move(prev)),
        deps(std::move(deps)),
        id(id)
    { }

    std::string serialize() const;

    /// Throws error::protocol_error (malformed)
    static update_request parse(const std::string &);
};

// Latency stages of a worker update, in reported order
enum update_stage
{
    DECODE = 0,
    VERIFY = 1,
    UPDATE = 2,
    ATTEST = 3,
    TOTAL = 4
};

const unsigned update_stage_count = 5;

struct update_response
{
    uint64_t request_id;
    attested_clock updated;

    // Nanoseconds, indexed by update_stage. Advisory only
    std::vector<uint64_t> stage_latency_ns;

    update_response(uint64_t request_id, attested_clock updated,
        std::vector<uint64_t> stage_latency_ns)
     :  request_id(request_id),
        updated(std::move(updated)),
        stage_latency_ns(std::move(stage_latency_ns))
    { }

    std::string serialize() const;

    /// Throws error::protocol_error (malformed)
    static update_response parse(const std::string &);
};

const char * update_stage_name(unsigned stage);

}
}

#endif
