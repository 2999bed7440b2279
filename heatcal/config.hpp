#ifndef HEATCAL_CONFIG_HPP
#define HEATCAL_CONFIG_HPP

#include "commit.hpp"
#include <vector>

namespace heatcal {

enum class ThresholdMode { fixed, quantile };

struct LevelConfig {
	int                   level_count{5};
	ThresholdMode         mode{ThresholdMode::quantile};
	std::vector<unsigned> thresholds{};   // only for ThresholdMode::fixed: level_count-2 ascending values, lower bounds of levels 2..level_count-1
};

struct NormalizerConfig {
	int  timezone_offset_minutes{0};
	bool use_origin_offset{false};        // each commit keeps the wall-clock day of its own offset
	int  min_year{1926};
	int  max_year{2126};
};

// the whole configuration surface of the pipeline. default year bounds are today ± 100 years, see default_config().
struct HeatmapConfig {
	NormalizerConfig normalizer{};
	Weekday          week_start{boost::date_time::Monday};
	LevelConfig      levels{};
	CivilDate        range_start{boost::date_time::not_a_date_time};
	CivilDate        range_end  {boost::date_time::not_a_date_time};
	size_t           max_cell_count{7*52*100};
};

bool operator==(const LevelConfig& a, const LevelConfig& b);
bool operator==(const NormalizerConfig& a, const NormalizerConfig& b);
bool operator==(const HeatmapConfig& a, const HeatmapConfig& b);

HeatmapConfig default_config();

// throws HeatmapError(InvalidConfiguration) on the first problem found.
void validate_config(const LevelConfig& cfg);
void validate_config(const NormalizerConfig& cfg);
void validate_config(const HeatmapConfig& cfg);

}

#endif
