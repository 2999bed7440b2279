#include "time_normalizer.hpp"
#include "errors.hpp"
#include <boost/lexical_cast.hpp>
#include <cstdlib>

namespace heatcal {

namespace {
	const int max_event_offset_minutes = 24*60-1;

	void bad_timestamp(const std::string& m) {
		throw HeatmapError(ErrorKind::InvalidTimestamp, Stage::normalize, m);
	}
}

CivilDate normalize_commit(const CommitEvent& event, const NormalizerConfig& cfg) {
	if(event.instant.is_special()) {
		bad_timestamp("commit time is not a valid instant");
	}
	if(std::abs(event.utc_offset_minutes) > max_event_offset_minutes) {
		bad_timestamp("commit offset out of range: "+boost::lexical_cast<std::string>(event.utc_offset_minutes)+" minutes");
	}
	// the year check runs on the UTC date first, so that the shifted instant below is always representable.
	int utc_year = event.instant.date().year();
	if(utc_year < cfg.min_year or utc_year > cfg.max_year) {
		bad_timestamp("commit at "+boost::posix_time::to_simple_string(event.instant)+" is outside the supported years "
			+boost::lexical_cast<std::string>(cfg.min_year)+".."+boost::lexical_cast<std::string>(cfg.max_year));
	}
	// the instant is absolute, only the zone it is read in decides the day.
	int offset = cfg.use_origin_offset ? event.utc_offset_minutes : cfg.timezone_offset_minutes;
	return (event.instant + boost::posix_time::minutes(offset)).date();
}

std::vector<CivilDate> normalize_commits(const std::vector<CommitEvent>& events, const NormalizerConfig& cfg) {
	validate_config(cfg);
	std::vector<CivilDate> dates;
	dates.reserve(events.size());
	for(const auto& ev : events) {
		dates.push_back(normalize_commit(ev, cfg));
	}
	return dates;
}

}
