#ifndef VLC_DATAMODEL_ORDINARY_CLOCK_HPP
#define VLC_DATAMODEL_ORDINARY_CLOCK_HPP

#include "vlc/datamodel/fwd.hpp"
#include "vlc/core/fwd.hpp"
#include "vlc/core/protobuf/fwd.hpp"
#include "vlc/error.hpp"
#include <cstdint>
#include <initializer_list>
#include <limits>
#include <algorithm>
#include <map>
#include <ostream>
#include <string>
#include <vector>

namespace vlc {
namespace datamodel {

/*! \brief A vector clock over sparse dimension ids

Maps each dimension id (one causal participant) to the count of
events observed from it. Entries are kept sorted by id, and a clock
is never modified once built: every operator returns a new clock.

An absent id reads as zero everywhere except base(), which excludes
clocks not carrying an id from that id's minimum.
*/
class ordinary_clock
{
public:

    typedef std::map<uint64_t, uint64_t> entries_t;
    typedef entries_t::const_iterator const_iterator;

    ordinary_clock()
    { }

    ordinary_clock(std::initializer_list<entries_t::value_type> entries)
     : _entries(entries)
    { }

    explicit ordinary_clock(entries_t entries)
     : _entries(std::move(entries))
    { }

    /// Count of id, or zero if absent
    uint64_t get(uint64_t id) const;

    bool contains(uint64_t id) const
    { return _entries.count(id) != 0; }

    size_t size() const
    { return _entries.size(); }

    const_iterator begin() const
    { return _entries.begin(); }

    const_iterator end() const
    { return _entries.end(); }

    const entries_t & entries() const
    { return _entries; }

    /// True iff every explicit entry is zero (including no entries)
    bool is_genesis() const;

    /// Element-wise maximum, absent ids reading as zero
    static ordinary_clock merge(
        const ordinary_clock & lhs, const ordinary_clock & rhs);

    /*!
     * Partial order. lhs dominates rhs if every non-zero entry of
     *  rhs is present in lhs with a count at least as large.
     *
     * Returns EQUAL if each dominates the other, MORE_RECENT if only
     *  lhs dominates, LESS_RECENT if only rhs dominates, and DIVERGE
     *  if the clocks are concurrent.
     */
    static clock_ancestry compare(
        const ordinary_clock & lhs, const ordinary_clock & rhs);

    /*!
     * Merges this clock with every clock of [begin, end), then
     *  increments the entry of id (inserting it as 1 if absent).
     *
     * Throws vlc_exception if the entry of id is already at its maximum.
     */
    template<typename Iterator>
    ordinary_clock update(
        const Iterator & begin, const Iterator & end, uint64_t id) const;

    ordinary_clock update(
        const std::vector<ordinary_clock> & deps, uint64_t id) const
    { return update(deps.begin(), deps.end(), id); }

    /*!
     * Common lower bound. For every id present in at least one clock,
     *  the minimum over only those clocks which carry the id.
     *
     * Eg, base({1:10, 2:0, 3:5}, {1:0, 2:20, 3:2}, {1:7, 2:15, 4:8})
     *  is {1:0, 2:0, 3:2, 4:8}.
     */
    template<typename Iterator>
    static ordinary_clock base(const Iterator & begin, const Iterator & end);

    static ordinary_clock base(const std::vector<ordinary_clock> & clocks)
    { return base(clocks.begin(), clocks.end()); }

    /*!
     * Orders two clocks on dimension id alone. A clock carrying id
     *  (even as zero) is MORE_RECENT than one which doesn't.
     */
    static clock_ancestry dep_compare(
        const ordinary_clock & lhs, const ordinary_clock & rhs, uint64_t id);

    /// For every id of lhs, lhs - rhs saturated at zero
    static ordinary_clock diff(
        const ordinary_clock & lhs, const ordinary_clock & rhs);

    /*!
     * Canonical byte form: u64 LE entry count, followed by
     *  (u64 LE id, u64 LE count) pairs in ascending id order.
     */
    std::string canonical_bytes() const;

    /// SHA-256 of canonical_bytes()
    core::digest_t fingerprint() const;

    /// "<id>-<count>-" for each entry, in ascending id order
    std::string index_key() const;

    void to_protobuf(core::protobuf::OrdinaryClock &) const;

    /// Throws error::protocol_error (malformed) on a repeated id
    static ordinary_clock from_protobuf(const core::protobuf::OrdinaryClock &);

    bool operator == (const ordinary_clock & other) const
    { return _entries == other._entries; }

    bool operator != (const ordinary_clock & other) const
    { return _entries != other._entries; }

private:

    entries_t _entries;
};

/// Sum of all counts, saturating at the uint64_t maximum
uint64_t reduce(const ordinary_clock &);

std::ostream & operator << (std::ostream &, const ordinary_clock &);
std::ostream & operator << (std::ostream &, clock_ancestry);

template<typename Iterator>
ordinary_clock ordinary_clock::update(
    const Iterator & begin, const Iterator & end, uint64_t id) const
{
    ordinary_clock out(*this);

    for(Iterator it = begin; it != end; ++it)
    {
        const ordinary_clock & dep = *it;

        for(const auto & entry : dep._entries)
        {
            uint64_t & count = out._entries[entry.first];
            count = std::max(count, entry.second);
        }
    }

    uint64_t & count = out._entries[id];
    VLC_ASSERT(count != std::numeric_limits<uint64_t>::max());

    count += 1;
    return out;
}

template<typename Iterator>
ordinary_clock ordinary_clock::base(
    const Iterator & begin, const Iterator & end)
{
    ordinary_clock out;

    for(Iterator it = begin; it != end; ++it)
    {
        const ordinary_clock & clock = *it;

        for(const auto & entry : clock._entries)
        {
            auto result = out._entries.insert(entry);
            if(!result.second)
            {
                uint64_t & count = result.first->second;
                count = std::min(count, entry.second);
            }
        }
    }
    return out;
}

}
}

#endif
