#include "intensity_bucketizer.hpp"
#include "errors.hpp"
#include <algorithm>

namespace heatcal {

std::vector<unsigned> compute_thresholds(const DayCounts& counts, const LevelConfig& cfg) {
	if(cfg.mode == ThresholdMode::fixed) return cfg.thresholds;

	std::vector<unsigned> vv{};
	for(const auto& dc : counts) { if(dc.second != 0) vv.push_back(dc.second); }
	std::sort(vv.begin(),vv.end());

	std::vector<unsigned> thresholds{};
	if(vv.empty()) return thresholds;
	size_t s      = vv.size();
	size_t slices = cfg.level_count-1;
	for(size_t k=1 ; k<slices ; ++k) {
		size_t idx = std::min( (k*s + slices-1)/slices , s-1 );
		unsigned t = vv[idx];
		if(t <= vv.front()) continue;
		if((not thresholds.empty()) and t <= thresholds.back()) continue;
		thresholds.push_back(t);
	}
	return thresholds;
}

Level level_for(unsigned count, const std::vector<unsigned>& thresholds) {
	if(count == 0) return 0;
	auto above = std::upper_bound(thresholds.begin(), thresholds.end(), count);
	return Level(1 + (above - thresholds.begin()));
}

DayLevels bucketize(const DayCounts& counts, const LevelConfig& cfg) {
	validate_config(cfg);
	DayLevels levels;
	if(counts.empty()) return levels;

	if(cfg.mode == ThresholdMode::quantile) {
		// zero counts do not take part, only the active days are split.
		unsigned lo{0}, hi{0};
		for(const auto& dc : counts) {
			if(dc.second == 0) continue;
			if(lo == 0 or dc.second < lo) lo = dc.second;
			if(dc.second > hi)            hi = dc.second;
		}
		if(lo == hi) {
			// at most one distinct active count, nothing to split.
			for(const auto& dc : counts) {
				levels.emplace_hint(levels.end(), dc.first, dc.second == 0 ? Level(0) : Level(cfg.level_count-1));
			}
			return levels;
		}
	}

	std::vector<unsigned> thresholds = compute_thresholds(counts, cfg);
	for(const auto& dc : counts) {
		levels.emplace_hint(levels.end(), dc.first, level_for(dc.second, thresholds));
	}
	return levels;
}

}
