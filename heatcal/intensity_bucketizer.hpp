#ifndef HEATCAL_INTENSITY_BUCKETIZER_HPP
#define HEATCAL_INTENSITY_BUCKETIZER_HPP

#include "commit.hpp"
#include "config.hpp"
#include <map>
#include <vector>

namespace heatcal {

typedef unsigned short                Level;      // 0 == no activity, level_count-1 == busiest
typedef std::map<CivilDate,Level>     DayLevels;

/* Lower bounds of levels 2 … level_count-1.
 *
 * fixed    : the configured list.
 * quantile : cut the sorted per-day counts into level_count-1 nearly equal slices, the first count of every slice
 *            but the first becomes a bound. Bounds that do not exceed the smallest count, or repeat the previous
 *            one, are dropped, so equal counts always share a level.
 */
std::vector<unsigned> compute_thresholds(const DayCounts& counts, const LevelConfig& cfg);

// count 0 is level 0, otherwise 1 + number of thresholds <= count (a count equal to a bound takes the higher level).
Level level_for(unsigned count, const std::vector<unsigned>& thresholds);

/* Level of every date in counts. In quantile mode with fewer than two distinct counts every active day gets the
 * top level. Throws HeatmapError(InvalidConfiguration) for a bad LevelConfig.
 */
DayLevels bucketize(const DayCounts& counts, const LevelConfig& cfg);

}

#endif
