#include "streaks.hpp"

namespace heatcal {

long streak_days(const boost::gregorian::date_period& p) {
	return p.length().days();
}

StreakInfo compute_streaks(const DayCounts& counts, const CivilDate& today) {
	StreakInfo info;
	CivilDate run_begin{boost::date_time::not_a_date_time};
	CivilDate prev     {boost::date_time::not_a_date_time};

	auto close_run = [&]() {
		if(run_begin.is_special()) return;
		boost::gregorian::date_period run(run_begin, prev + boost::gregorian::days(1));
		if((not info.longest) or streak_days(run) >= streak_days(*info.longest)) info.longest = run;
		if(prev == today) info.current = run;
	};

	for(const auto& dc : counts) {
		if(dc.second == 0) continue;
		if(run_begin.is_special() or dc.first != prev + boost::gregorian::days(1)) {
			close_run();
			run_begin = dc.first;
		}
		prev = dc.first;
	}
	close_run();
	return info;
}

}
