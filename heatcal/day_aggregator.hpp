#ifndef HEATCAL_DAY_AGGREGATOR_HPP
#define HEATCAL_DAY_AGGREGATOR_HPP

#include "commit.hpp"
#include <vector>

namespace heatcal {

// frequency count of the dates. Dates without commits are absent. Sum of all counts == dates.size().
DayCounts aggregate_days(const std::vector<CivilDate>& dates);

// the entries of counts with range_start <= date <= range_end.
DayCounts restrict_to_range(const DayCounts& counts, const CivilDate& range_start, const CivilDate& range_end);

unsigned long total_count(const DayCounts& counts);

}

#endif
