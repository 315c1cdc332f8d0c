#include "vlc/datamodel/clock_record.hpp"
#include "vlc/core/protobuf/vlc.pb.h"
#include "vlc/core/digest.hpp"
#include "vlc/core/server_time.hpp"

namespace vlc {
namespace datamodel {

/* static */
void clock_record::snapshot(
    const ordinary_clock & clock,
    uint64_t node_id,
    uint64_t message_id,
    const std::string & raw_message,
    spb::ClockInfo & out)
{
    out.Clear();

    clock.to_protobuf(*out.mutable_clock());
    out.set_clock_hash(core::digest_hex(clock.fingerprint()));
    out.set_node_id(node_id);
    out.set_message_id(message_id);
    out.set_raw_message(raw_message);
    out.set_event_count(reduce(clock));
    out.set_create_at(core::server_time::get_time());
}

/* static */
void clock_record::merge_log(
    uint64_t from_id,
    uint64_t to_id,
    const ordinary_clock & start,
    const ordinary_clock & end,
    spb::MergeLog & out)
{
    out.Clear();

    out.set_from_id(from_id);
    out.set_to_id(to_id);
    out.set_start_count(reduce(start));
    out.set_end_count(reduce(end));
    out.set_s_clock_hash(core::digest_hex(start.fingerprint()));
    out.set_e_clock_hash(core::digest_hex(end.fingerprint()));
    out.set_merge_at(core::server_time::get_time());
}

}
}
