#include "vlc/datamodel/ordinary_clock.hpp"
#include "vlc/datamodel/packed_unsigned.hpp"
#include "vlc/core/protobuf/vlc.pb.h"
#include "vlc/core/digest.hpp"
#include "vlc/error.hpp"
#include <algorithm>
#include <limits>
#include <sstream>

namespace vlc {
namespace datamodel {

namespace spb = vlc::core::protobuf;

namespace {

// True if every non-zero entry of rhs is met or exceeded by lhs
bool dominates(const ordinary_clock & lhs, const ordinary_clock & rhs)
{
    for(const auto & entry : rhs)
    {
        if(entry.second != 0 && lhs.get(entry.first) < entry.second)
            return false;
    }
    return true;
}

}

uint64_t ordinary_clock::get(uint64_t id) const
{
    auto it = _entries.find(id);
    return it == _entries.end() ? 0 : it->second;
}

bool ordinary_clock::is_genesis() const
{
    return std::all_of(_entries.begin(), _entries.end(),
        [](const entries_t::value_type & entry)
        { return entry.second == 0; });
}

/* static */
ordinary_clock ordinary_clock::merge(
    const ordinary_clock & lhs, const ordinary_clock & rhs)
{
    ordinary_clock out(lhs);

    for(const auto & entry : rhs._entries)
    {
        uint64_t & count = out._entries[entry.first];
        count = std::max(count, entry.second);
    }
    return out;
}

/* static */
clock_ancestry ordinary_clock::compare(
    const ordinary_clock & lhs, const ordinary_clock & rhs)
{
    bool lhs_ge = dominates(lhs, rhs);
    bool rhs_ge = dominates(rhs, lhs);

    if(lhs_ge && rhs_ge)
        return EQUAL;
    if(lhs_ge)
        return MORE_RECENT;
    if(rhs_ge)
        return LESS_RECENT;

    return DIVERGE;
}

/* static */
clock_ancestry ordinary_clock::dep_compare(
    const ordinary_clock & lhs, const ordinary_clock & rhs, uint64_t id)
{
    auto l_it = lhs._entries.find(id);
    auto r_it = rhs._entries.find(id);

    bool l_has = l_it != lhs._entries.end();
    bool r_has = r_it != rhs._entries.end();

    if(!l_has && !r_has)
        return EQUAL;
    if(!l_has)
        return LESS_RECENT;
    if(!r_has)
        return MORE_RECENT;

    if(l_it->second < r_it->second)
        return LESS_RECENT;
    if(l_it->second > r_it->second)
        return MORE_RECENT;

    return EQUAL;
}

/* static */
ordinary_clock ordinary_clock::diff(
    const ordinary_clock & lhs, const ordinary_clock & rhs)
{
    ordinary_clock out;

    for(const auto & entry : lhs._entries)
    {
        uint64_t other = rhs.get(entry.first);
        out._entries.insert(out._entries.end(),
            entries_t::value_type(entry.first,
                entry.second > other ? entry.second - other : 0));
    }
    return out;
}

std::string ordinary_clock::canonical_bytes() const
{
    std::stringstream out;

    out << packed_unsigned(_entries.size());
    for(const auto & entry : _entries)
    {
        out << packed_unsigned(entry.first) << packed_unsigned(entry.second);
    }
    return out.str();
}

core::digest_t ordinary_clock::fingerprint() const
{
    return core::sha256(canonical_bytes());
}

std::string ordinary_clock::index_key() const
{
    std::stringstream out;

    for(const auto & entry : _entries)
    {
        out << entry.first << "-" << entry.second << "-";
    }
    return out.str();
}

void ordinary_clock::to_protobuf(spb::OrdinaryClock & out) const
{
    out.Clear();

    for(const auto & entry : _entries)
    {
        spb::ClockEntry & pb_entry = *out.add_entry();
        pb_entry.set_id(entry.first);
        pb_entry.set_value(entry.second);
    }
}

/* static */
ordinary_clock ordinary_clock::from_protobuf(const spb::OrdinaryClock & in)
{
    ordinary_clock out;

    for(const spb::ClockEntry & pb_entry : in.entry())
    {
        if(!out._entries.insert(entries_t::value_type(
            pb_entry.id(), pb_entry.value())).second)
        {
            throw error::protocol_error(error::protocol_errc::malformed,
                "clock id " + std::to_string(pb_entry.id()) + " is repeated");
        }
    }
    return out;
}

uint64_t reduce(const ordinary_clock & clock)
{
    const uint64_t max = std::numeric_limits<uint64_t>::max();
    uint64_t sum = 0;

    for(const auto & entry : clock)
    {
        if(entry.second > max - sum)
            return max;

        sum += entry.second;
    }
    return sum;
}

std::ostream & operator << (std::ostream & s, const ordinary_clock & clock)
{
    s << "{";

    bool first = true;
    for(const auto & entry : clock)
    {
        if(!first)
            s << ", ";
        first = false;

        s << entry.first << ":" << entry.second;
    }
    return s << "}";
}

std::ostream & operator << (std::ostream & s, clock_ancestry ancestry)
{
    switch(ancestry)
    {
    case EQUAL:
        return s << "EQUAL";
    case MORE_RECENT:
        return s << "MORE_RECENT";
    case LESS_RECENT:
        return s << "LESS_RECENT";
    case DIVERGE:
        return s << "DIVERGE";
    }
    return s << "clock_ancestry(" << int(ancestry) << ")";
}

}
}
