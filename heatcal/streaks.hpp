#ifndef HEATCAL_STREAKS_HPP
#define HEATCAL_STREAKS_HPP

#include "commit.hpp"
#include <boost/optional.hpp>

namespace heatcal {

struct StreakInfo {
	boost::optional<boost::gregorian::date_period> longest{};   // the most recent one when several are equally long
	boost::optional<boost::gregorian::date_period> current{};   // the run ending on today, none when today has no commits
};

StreakInfo compute_streaks(const DayCounts& counts, const CivilDate& today);

// number of days in the streak, both ends included.
long streak_days(const boost::gregorian::date_period& p);

}

#endif
