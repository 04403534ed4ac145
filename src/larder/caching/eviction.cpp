#include <larder/caching/eviction.h>

#include <algorithm>

namespace larder {

static bool
is_evicted_before(cache_record const& a, cache_record const& b)
{
    if (a.timestamp != b.timestamp)
        return a.timestamp < b.timestamp;
    return a.key < b.key;
}

void
sort_into_eviction_order(std::vector<cache_record>& records)
{
    std::sort(records.begin(), records.end(), is_evicted_before);
}

std::vector<cache_record>
select_eviction_victims(
    std::vector<cache_record> records, integer bytes_to_reclaim)
{
    std::vector<cache_record> victims;
    if (bytes_to_reclaim <= 0)
        return victims;
    sort_into_eviction_order(records);
    integer reclaimed = 0;
    for (auto& record : records)
    {
        if (reclaimed >= bytes_to_reclaim)
            break;
        reclaimed += record.size;
        victims.push_back(std::move(record));
    }
    return victims;
}

optional<cache_record>
select_oldest_record(std::vector<cache_record> const& records)
{
    auto oldest
        = std::min_element(records.begin(), records.end(), is_evicted_before);
    if (oldest == records.end())
        return none;
    return *oldest;
}

} // namespace larder
