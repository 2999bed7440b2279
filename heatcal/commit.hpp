#ifndef HEATCAL_COMMIT_HPP
#define HEATCAL_COMMIT_HPP

#include <boost/date_time/posix_time/posix_time.hpp>
#include <boost/date_time/gregorian/gregorian.hpp>
#include <map>
#include <string>

namespace heatcal {

typedef boost::gregorian::date           CivilDate;
typedef boost::date_time::weekdays       Weekday;   // Sunday == 0 … Saturday == 6
typedef std::map<CivilDate,unsigned>     DayCounts;

// one commit as handed over by the ingester. instant is UTC, utc_offset_minutes is the offset the commit was recorded with (+120 == +0200).
struct CommitEvent {
	boost::posix_time::ptime instant;
	int                      utc_offset_minutes{0};
};

inline bool operator==(const CommitEvent& a, const CommitEvent& b) {
	return a.instant == b.instant and a.utc_offset_minutes == b.utc_offset_minutes;
}

}

#endif
