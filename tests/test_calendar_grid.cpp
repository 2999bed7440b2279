#include <gtest/gtest.h>
#include "test_utils.hpp"
#include "heatcal/calendar_grid.hpp"
#include "heatcal/errors.hpp"

using namespace heatcal;
using namespace heatcal::test;

namespace {
	CalendarGrid grid_of(const std::string& from, const std::string& to, Weekday week_start, size_t max_cells = 100000) {
		return build_grid(day(from), day(to), week_start, DayLevels{}, DayCounts{}, max_cells);
	}

	size_t in_range_cells(const CalendarGrid& grid) {
		size_t n{0};
		for(const auto& week : grid.weeks()) {
			for(const auto& cell : week) { if(cell.in_range) ++n; }
		}
		return n;
	}
}

TEST(CalendarGridTest, AlignmentHelpers) {
	// 2024-01-03 is a Wednesday
	EXPECT_EQ(first_grid_date(day("2024-01-03"), boost::date_time::Monday), day("2024-01-01"));
	EXPECT_EQ(first_grid_date(day("2024-01-03"), boost::date_time::Sunday), day("2023-12-31"));
	EXPECT_EQ(first_grid_date(day("2024-01-03"), boost::date_time::Wednesday), day("2024-01-03"));
	EXPECT_EQ(first_grid_date(day("2024-01-03"), boost::date_time::Thursday), day("2023-12-28"));
	EXPECT_EQ(last_grid_date (day("2024-01-03"), boost::date_time::Monday), day("2024-01-07"));
	EXPECT_EQ(last_grid_date (day("2024-01-03"), boost::date_time::Sunday), day("2024-01-06"));
	EXPECT_EQ(last_grid_date (day("2024-01-03"), boost::date_time::Thursday), day("2024-01-03"));
}

TEST(CalendarGridTest, SingleDayRangeIsOneWeek) {
	CalendarGrid grid = grid_of("2024-01-03", "2024-01-03", boost::date_time::Monday);
	ASSERT_EQ(grid.weeks().size(), 1u);
	EXPECT_EQ(in_range_cells(grid), 1u);
	const GridCell& cell = grid.weeks()[0][2];
	EXPECT_TRUE(cell.in_range);
	EXPECT_EQ(*cell.date, day("2024-01-03"));
	EXPECT_EQ(*cell.level, 0);
}

TEST(CalendarGridTest, PaddingCellsKeepTheirDate) {
	CalendarGrid grid = grid_of("2024-01-03", "2024-01-03", boost::date_time::Monday);
	const GridCell& pad = grid.weeks()[0][0];
	EXPECT_FALSE(pad.in_range);
	ASSERT_TRUE(pad.date);
	EXPECT_EQ(*pad.date, day("2024-01-01"));
	EXPECT_FALSE(pad.level);
}

TEST(CalendarGridTest, CellCountAndInRangeCountForManyRanges) {
	CivilDate base = day("2023-12-20");
	for(int start=0 ; start<10 ; ++start) {
		for(int len=0 ; len<30 ; ++len) {
			for(int ws=0 ; ws<7 ; ++ws) {
				CivilDate from = base + boost::gregorian::days(start);
				CivilDate to   = from + boost::gregorian::days(len);
				CalendarGrid grid = build_grid(from, to, Weekday(ws), {}, {}, 100000);
				EXPECT_EQ(grid.cell_count() % 7, 0u);
				EXPECT_EQ(in_range_cells(grid), size_t(len+1));
				EXPECT_EQ(grid.weeks().front()[0].date->day_of_week().as_number(), ws);
				EXPECT_LE(grid.cell_count(), size_t(len+1+12));
			}
		}
	}
}

TEST(CalendarGridTest, DatesStrictlyIncreaseInIterationOrder) {
	CalendarGrid grid = grid_of("2023-11-15", "2024-03-10", boost::date_time::Sunday);
	CivilDate prev{boost::date_time::not_a_date_time};
	for(const auto& week : grid.weeks()) {
		for(const auto& cell : week) {
			ASSERT_TRUE(cell.date);
			if(not prev.is_special()) { EXPECT_EQ(*cell.date, prev + boost::gregorian::days(1)); }
			prev = *cell.date;
		}
	}
}

TEST(CalendarGridTest, LeapYearFebruary) {
	CalendarGrid grid = grid_of("2024-02-01", "2024-03-01", boost::date_time::Monday);
	ASSERT_NE(grid.find(day("2024-02-29")), nullptr);
	EXPECT_TRUE(grid.find(day("2024-02-29"))->in_range);
	EXPECT_EQ(in_range_cells(grid), 30u);

	CalendarGrid plain = grid_of("2023-02-01", "2023-03-01", boost::date_time::Monday);
	EXPECT_EQ(in_range_cells(plain), 29u);
}

TEST(CalendarGridTest, LevelsAndCountsFillInRangeCells) {
	DayLevels levels{ { day("2024-01-01"), 3 }, { day("2024-01-05"), 1 }, { day("2024-02-01"), 2 } };
	DayCounts counts{ { day("2024-01-01"), 7 }, { day("2024-01-05"), 1 }, { day("2024-02-01"), 4 } };
	CalendarGrid grid = build_grid(day("2024-01-01"), day("2024-01-10"), boost::date_time::Monday, levels, counts, 1000);
	EXPECT_EQ(*grid.find(day("2024-01-01"))->level, 3);
	EXPECT_EQ(grid.find(day("2024-01-01"))->count, 7u);
	EXPECT_EQ(*grid.find(day("2024-01-05"))->level, 1);
	EXPECT_EQ(*grid.find(day("2024-01-02"))->level, 0);
	EXPECT_EQ(grid.find(day("2024-01-02"))->count, 0u);
	EXPECT_EQ(grid.find(day("2024-02-01")), nullptr);
	// 2024-01-11 .. 2024-01-14 are padding
	EXPECT_FALSE(grid.find(day("2024-01-12"))->in_range);
	EXPECT_FALSE(grid.find(day("2024-01-12"))->level);
}

TEST(CalendarGridTest, MetadataIsKept) {
	CalendarGrid grid = grid_of("2024-05-05", "2024-06-07", boost::date_time::Saturday);
	EXPECT_EQ(grid.range_start(), day("2024-05-05"));
	EXPECT_EQ(grid.range_end(), day("2024-06-07"));
	EXPECT_EQ(grid.week_start(), boost::date_time::Saturday);
}

TEST(CalendarGridTest, ReversedRangeIsInvalidRange) {
	try {
		grid_of("2024-01-10", "2024-01-09", boost::date_time::Monday);
		FAIL() << "expected HeatmapError";
	} catch(const HeatmapError& err) {
		EXPECT_EQ(err.kind, ErrorKind::InvalidRange);
		EXPECT_EQ(err.stage, Stage::grid);
	}
}

TEST(CalendarGridTest, MissingBoundIsInvalidRange) {
	CivilDate none{boost::date_time::not_a_date_time};
	try {
		build_grid(none, day("2024-01-09"), boost::date_time::Monday, {}, {}, 1000);
		FAIL() << "expected HeatmapError";
	} catch(const HeatmapError& err) {
		EXPECT_EQ(err.kind, ErrorKind::InvalidRange);
	}
}

TEST(CalendarGridTest, PaddingPastCalendarEndsIsInvalidRange) {
	// 9999-12-31 is a Friday, a Monday week would need two more days.
	try {
		grid_of("9999-12-31", "9999-12-31", boost::date_time::Monday);
		FAIL() << "expected HeatmapError";
	} catch(const HeatmapError& err) {
		EXPECT_EQ(err.kind, ErrorKind::InvalidRange);
		EXPECT_EQ(err.stage, Stage::grid);
	}
	// 1400-01-01 is a Wednesday, a Sunday week would need three days before it.
	try {
		grid_of("1400-01-01", "1400-01-01", boost::date_time::Sunday);
		FAIL() << "expected HeatmapError";
	} catch(const HeatmapError& err) {
		EXPECT_EQ(err.kind, ErrorKind::InvalidRange);
	}
}

TEST(CalendarGridTest, WeeksEndingOnCalendarEndsAreBuilt) {
	CalendarGrid first = grid_of("1400-01-01", "1400-01-01", boost::date_time::Wednesday);
	ASSERT_EQ(first.cell_count(), 7u);
	EXPECT_EQ(*first.weeks().front()[0].date, day("1400-01-01"));
	EXPECT_TRUE(first.weeks().front()[0].in_range);

	CalendarGrid last = grid_of("9999-12-31", "9999-12-31", boost::date_time::Saturday);
	ASSERT_EQ(last.cell_count(), 7u);
	EXPECT_EQ(*last.weeks().back()[6].date, day("9999-12-31"));
	EXPECT_TRUE(last.weeks().back()[6].in_range);
	EXPECT_EQ(*last.weeks().back()[0].date, day("9999-12-25"));
}

TEST(CalendarGridTest, CellCeiling) {
	// 2024-01-01 is a Monday, four whole weeks
	EXPECT_EQ(grid_of("2024-01-01", "2024-01-28", boost::date_time::Monday, 28).cell_count(), 28u);
	try {
		grid_of("2024-01-01", "2024-01-29", boost::date_time::Monday, 28);
		FAIL() << "expected HeatmapError";
	} catch(const HeatmapError& err) {
		EXPECT_EQ(err.kind, ErrorKind::RangeTooLarge);
	}
}

TEST(CalendarGridTest, MultiDecadeRangeFitsDefaultCeiling) {
	HeatmapConfig cfg;
	CalendarGrid grid = build_grid(day("1990-01-01"), day("2039-12-31"), boost::date_time::Sunday, {}, {}, cfg.max_cell_count);
	EXPECT_EQ(in_range_cells(grid), size_t((day("2039-12-31") - day("1990-01-01")).days() + 1));
}
