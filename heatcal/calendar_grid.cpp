#include "calendar_grid.hpp"
#include "errors.hpp"
#include <boost/lexical_cast.hpp>
#include <utility>

namespace heatcal {

namespace {
	void bad_range(const std::string& m) {
		throw HeatmapError(ErrorKind::InvalidRange, Stage::grid, m);
	}
}

CalendarGrid::CalendarGrid(std::vector<Week> weeks, CivilDate range_start, CivilDate range_end, Weekday week_start)
	: weeks_(std::move(weeks))
	, range_start_(range_start)
	, range_end_(range_end)
	, week_start_(week_start)
{ }

const GridCell* CalendarGrid::find(const CivilDate& d) const {
	if(weeks_.empty() or d.is_special()) return nullptr;
	const CivilDate& first = *weeks_.front()[0].date;
	if(d < first) return nullptr;
	size_t offset = (d - first).days();
	if(offset >= cell_count()) return nullptr;
	return &weeks_[offset/7][offset%7];
}

bool operator==(const GridCell& a, const GridCell& b) {
	return a.date == b.date and a.level == b.level and a.in_range == b.in_range and a.count == b.count;
}

bool operator==(const CalendarGrid& a, const CalendarGrid& b) {
	return     a.weeks()       == b.weeks()
		and a.range_start() == b.range_start()
		and a.range_end()   == b.range_end()
		and a.week_start()  == b.week_start();
}

CivilDate first_grid_date(const CivilDate& d, Weekday week_start) {
	int back = (d.day_of_week().as_number() - int(week_start) + 7) % 7;
	return d - boost::gregorian::days(back);
}

CivilDate last_grid_date(const CivilDate& d, Weekday week_start) {
	int forward = (int(week_start) + 6 - d.day_of_week().as_number()) % 7;
	return d + boost::gregorian::days(forward);
}

CalendarGrid build_grid(const CivilDate& range_start, const CivilDate& range_end, Weekday week_start,
	const DayLevels& levels, const DayCounts& counts, size_t max_cell_count)
{
	if(range_start.is_special() or range_end.is_special()) {
		bad_range("range bounds must be valid dates");
	}
	if(range_end < range_start) {
		bad_range("range start "+boost::gregorian::to_iso_extended_string(range_start)
			+" is after range end "+boost::gregorian::to_iso_extended_string(range_end));
	}

	// the padding must stay inside boost's calendar, stepping past its ends gives day numbers that are no date.
	const CivilDate calendar_begin(boost::date_time::min_date_time);
	const CivilDate calendar_end  (boost::date_time::max_date_time);
	long back    = (range_start.day_of_week().as_number() - int(week_start) + 7) % 7;
	long forward = (int(week_start) + 6 - range_end.day_of_week().as_number()) % 7;
	if((range_start - calendar_begin).days() < back or (calendar_end - range_end).days() < forward) {
		bad_range("weeks around "+boost::gregorian::to_iso_extended_string(range_start)+" .. "
			+boost::gregorian::to_iso_extended_string(range_end)+" do not fit into "
			+boost::gregorian::to_iso_extended_string(calendar_begin)+" .. "
			+boost::gregorian::to_iso_extended_string(calendar_end));
	}
	CivilDate first = first_grid_date(range_start, week_start);
	CivilDate last  = last_grid_date (range_end  , week_start);

	size_t cells = (last - first).days() + 1;
	if(cells > max_cell_count) {
		throw HeatmapError(ErrorKind::RangeTooLarge, Stage::grid,
			"grid needs "+boost::lexical_cast<std::string>(cells)+" cells, limit is "+boost::lexical_cast<std::string>(max_cell_count));
	}

	std::vector<Week> weeks(cells/7);
	auto lvl = levels.lower_bound(range_start);
	auto cnt = counts.lower_bound(range_start);
	// counted, so that the walk never steps past last, which may be the last day boost knows.
	boost::gregorian::day_iterator it(first);
	for(size_t i=0 ; i<cells ; ++i) {
		if(i>0) ++it;
		GridCell& cell = weeks[i/7][i%7];
		cell.date     = *it;
		cell.in_range = (range_start <= *it) and (*it <= range_end);
		if(not cell.in_range) continue;
		cell.level = Level(0);
		if(lvl != levels.end() and lvl->first == *it) { cell.level = lvl->second; ++lvl; }
		if(cnt != counts.end() and cnt->first == *it) { cell.count = cnt->second; ++cnt; }
	}
	return CalendarGrid(std::move(weeks), range_start, range_end, week_start);
}

}
