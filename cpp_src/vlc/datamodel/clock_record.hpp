#ifndef VLC_DATAMODEL_CLOCK_RECORD_HPP
#define VLC_DATAMODEL_CLOCK_RECORD_HPP

#include "vlc/datamodel/ordinary_clock.hpp"
#include "vlc/core/protobuf/fwd.hpp"
#include <string>

namespace vlc {
namespace datamodel {

namespace spb = vlc::core::protobuf;

/*!
 * Builds the rows an external store keeps of a node's clock history.
 *
 * Hashes are clock fingerprints in hex, counts are reduce()'d clocks,
 *  and timestamps are core::server_time.
 */
class clock_record
{
public:

    /// A clock as observed by node_id upon the identified message
    static void snapshot(
        const ordinary_clock & clock,
        uint64_t node_id,
        uint64_t message_id,
        const std::string & raw_message,
        spb::ClockInfo & out);

    /// A merge of from_id's clock into to_id, advancing start to end
    static void merge_log(
        uint64_t from_id,
        uint64_t to_id,
        const ordinary_clock & start,
        const ordinary_clock & end,
        spb::MergeLog & out);
};

}
}

#endif
