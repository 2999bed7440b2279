#ifndef HEATCAL_HEATMAP_ASSEMBLER_HPP
#define HEATCAL_HEATMAP_ASSEMBLER_HPP

#include "calendar_grid.hpp"
#include "commit.hpp"
#include "config.hpp"
#include <vector>

namespace heatcal {

// statistics of the requested range.
struct HeatmapSummary {
	unsigned long total_commits{0};
	unsigned long active_day_count{0};
	unsigned      max_daily_count{0};
	unsigned long commits_outside_range{0};
};

bool operator==(const HeatmapSummary& a, const HeatmapSummary& b);

struct HeatmapResult {
	CalendarGrid   grid;
	HeatmapSummary summary;
	DayCounts      day_counts;   // in-range days with at least one commit
};

bool operator==(const HeatmapResult& a, const HeatmapResult& b);

/* commits → civil dates → day counts → levels → grid, with cfg handed to each stage unchanged.
 *
 * The only entry point a renderer or the command line needs. Pure: no I/O, no state kept between calls, so the same
 * input always gives the same result. Every failure is a HeatmapError tagged with the stage that found it.
 */
HeatmapResult assemble_heatmap(const std::vector<CommitEvent>& commits, const HeatmapConfig& cfg);

}

#endif
