#ifndef HEATCAL_CALENDAR_GRID_HPP
#define HEATCAL_CALENDAR_GRID_HPP

#include "commit.hpp"
#include "intensity_bucketizer.hpp"
#include <boost/optional.hpp>
#include <array>
#include <vector>

namespace heatcal {

struct GridCell {
	boost::optional<CivilDate> date{};
	boost::optional<Level>     level{};    // none for cells outside the requested range
	bool                       in_range{false};
	unsigned                   count{0};
};

typedef std::array<GridCell,7> Week;

// week-major, weekday-major within a week. Immutable once built.
class CalendarGrid {
	public:
		CalendarGrid(std::vector<Week> weeks, CivilDate range_start, CivilDate range_end, Weekday week_start);

		const std::vector<Week>& weeks()       const { return weeks_;       }
		const CivilDate&         range_start() const { return range_start_; }
		const CivilDate&         range_end()   const { return range_end_;   }
		Weekday                  week_start()  const { return week_start_;  }
		size_t                   cell_count()  const { return weeks_.size()*7; }

		// the cell showing d, nullptr when d is not in the grid.
		const GridCell*          find(const CivilDate& d) const;

	private:
		std::vector<Week> weeks_;
		CivilDate         range_start_;
		CivilDate         range_end_;
		Weekday           week_start_;
};

bool operator==(const GridCell& a, const GridCell& b);
bool operator==(const CalendarGrid& a, const CalendarGrid& b);

// the last date <= d that falls on week_start.
CivilDate first_grid_date(const CivilDate& d, Weekday week_start);
// the last date before the first week_start after d.
CivilDate last_grid_date(const CivilDate& d, Weekday week_start);

/* Lays [range_start, range_end] out in whole weeks starting on week_start.
 *
 * The grid spans first_grid_date(range_start) … last_grid_date(range_end). Cells before range_start or after
 * range_end keep their date but have in_range == false and no level. In-range dates missing from levels get level 0.
 *
 * Throws HeatmapError with
 *   InvalidRange  : range_start > range_end, or a bound is not a date (or too close to the ends of the calendar)
 *   RangeTooLarge : the grid would have more than max_cell_count cells
 */
CalendarGrid build_grid(const CivilDate& range_start, const CivilDate& range_end, Weekday week_start,
	const DayLevels& levels, const DayCounts& counts, size_t max_cell_count);

}

#endif
