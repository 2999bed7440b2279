#include "config.hpp"
#include "errors.hpp"
#include <boost/lexical_cast.hpp>
#include <cstdlib>

namespace heatcal {

namespace {
	const int max_offset_minutes = 24*60-1;

	void bad_config(const std::string& m) {
		throw HeatmapError(ErrorKind::InvalidConfiguration, Stage::config, m);
	}
}

bool operator==(const LevelConfig& a, const LevelConfig& b) {
	return a.level_count == b.level_count and a.mode == b.mode and a.thresholds == b.thresholds;
}

bool operator==(const NormalizerConfig& a, const NormalizerConfig& b) {
	return     a.timezone_offset_minutes == b.timezone_offset_minutes
		and a.use_origin_offset       == b.use_origin_offset
		and a.min_year                == b.min_year
		and a.max_year                == b.max_year;
}

bool operator==(const HeatmapConfig& a, const HeatmapConfig& b) {
	return     a.normalizer     == b.normalizer
		and a.week_start     == b.week_start
		and a.levels         == b.levels
		and a.range_start    == b.range_start
		and a.range_end      == b.range_end
		and a.max_cell_count == b.max_cell_count;
}

HeatmapConfig default_config() {
	HeatmapConfig cfg;
	int this_year = boost::gregorian::day_clock::universal_day().year();
	cfg.normalizer.min_year = this_year - 100;
	cfg.normalizer.max_year = this_year + 100;
	return cfg;
}

void validate_config(const LevelConfig& cfg) {
	if(cfg.level_count < 2) {
		bad_config("level count must be at least 2, got "+boost::lexical_cast<std::string>(cfg.level_count));
	}
	if(cfg.mode == ThresholdMode::quantile) return;
	if(cfg.thresholds.size() != size_t(cfg.level_count-2)) {
		bad_config("fixed mode with "+boost::lexical_cast<std::string>(cfg.level_count)+" levels needs "
			+boost::lexical_cast<std::string>(cfg.level_count-2)+" thresholds, got "
			+boost::lexical_cast<std::string>(cfg.thresholds.size()));
	}
	for(size_t i=0 ; i<cfg.thresholds.size() ; ++i) {
		if(cfg.thresholds[i] == 0) bad_config("thresholds must be positive");
		if(i>0 and cfg.thresholds[i] <= cfg.thresholds[i-1]) bad_config("thresholds must be strictly ascending");
	}
}

void validate_config(const NormalizerConfig& cfg) {
	if(std::abs(cfg.timezone_offset_minutes) > max_offset_minutes) {
		bad_config("timezone offset out of range: "+boost::lexical_cast<std::string>(cfg.timezone_offset_minutes)+" minutes");
	}
	// boost::gregorian only knows years 1400 … 9999, keep a spare year on both ends for the offsets.
	if(cfg.min_year < 1401 or cfg.max_year > 9998 or cfg.min_year > cfg.max_year) {
		bad_config("year bounds must satisfy 1401 <= min_year <= max_year <= 9998, got "
			+boost::lexical_cast<std::string>(cfg.min_year)+" .. "+boost::lexical_cast<std::string>(cfg.max_year));
	}
}

void validate_config(const HeatmapConfig& cfg) {
	validate_config(cfg.normalizer);
	validate_config(cfg.levels);
	if(cfg.week_start < boost::date_time::Sunday or cfg.week_start > boost::date_time::Saturday) {
		bad_config("week start is not a weekday");
	}
	if(cfg.max_cell_count < 7) {
		bad_config("max cell count must allow at least one week");
	}
}

}
