#include "day_aggregator.hpp"

namespace heatcal {

DayCounts aggregate_days(const std::vector<CivilDate>& dates) {
	DayCounts counts;
	for(const auto& d : dates) {
		counts[d] += 1;
	}
	return counts;
}

DayCounts restrict_to_range(const DayCounts& counts, const CivilDate& range_start, const CivilDate& range_end) {
	if(range_end < range_start) return {};
	return DayCounts(counts.lower_bound(range_start), counts.upper_bound(range_end));
}

unsigned long total_count(const DayCounts& counts) {
	unsigned long total{0};
	for(const auto& dc : counts) total += dc.second;
	return total;
}

}
