#ifndef LARDER_CACHING_EVICTION_H
#define LARDER_CACHING_EVICTION_H

#include <vector>

#include <larder/caching/cache_record.hpp>

namespace larder {

// Sort records into eviction order: oldest timestamp first, with ties broken
// by key.
void
sort_into_eviction_order(std::vector<cache_record>& records);

// Select the records to evict in order to reclaim at least
// :bytes_to_reclaim bytes. Victims are taken in eviction order until their
// combined size reaches the target. If all the records together don't reach
// it, they're all returned.
std::vector<cache_record>
select_eviction_victims(
    std::vector<cache_record> records, integer bytes_to_reclaim);

// Select the single record that would be evicted first (if any).
optional<cache_record>
select_oldest_record(std::vector<cache_record> const& records);

} // namespace larder

#endif
