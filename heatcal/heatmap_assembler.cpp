#include "heatmap_assembler.hpp"
#include "day_aggregator.hpp"
#include "errors.hpp"
#include "intensity_bucketizer.hpp"
#include "time_normalizer.hpp"
#include <algorithm>
#include <utility>

namespace heatcal {

bool operator==(const HeatmapSummary& a, const HeatmapSummary& b) {
	return     a.total_commits         == b.total_commits
		and a.active_day_count      == b.active_day_count
		and a.max_daily_count       == b.max_daily_count
		and a.commits_outside_range == b.commits_outside_range;
}

bool operator==(const HeatmapResult& a, const HeatmapResult& b) {
	return a.grid == b.grid and a.summary == b.summary and a.day_counts == b.day_counts;
}

HeatmapResult assemble_heatmap(const std::vector<CommitEvent>& commits, const HeatmapConfig& cfg) {
	validate_config(cfg);
	if(cfg.range_start.is_special() or cfg.range_end.is_special()) {
		throw HeatmapError(ErrorKind::InvalidRange, Stage::assemble, "range start and end must be set");
	}
	if(cfg.range_end < cfg.range_start) {
		throw HeatmapError(ErrorKind::InvalidRange, Stage::assemble,
			"range start "+boost::gregorian::to_iso_extended_string(cfg.range_start)
			+" is after range end "+boost::gregorian::to_iso_extended_string(cfg.range_end));
	}

	std::vector<CivilDate> dates = normalize_commits(commits, cfg.normalizer);
	DayCounts all_days            = aggregate_days(dates);
	DayCounts visible             = restrict_to_range(all_days, cfg.range_start, cfg.range_end);
	DayLevels levels              = bucketize(visible, cfg.levels);
	CalendarGrid grid             = build_grid(cfg.range_start, cfg.range_end, cfg.week_start, levels, visible, cfg.max_cell_count);

	HeatmapSummary summary;
	summary.total_commits         = total_count(visible);
	summary.active_day_count      = visible.size();
	summary.commits_outside_range = commits.size() - summary.total_commits;
	for(const auto& dc : visible) {
		summary.max_daily_count = std::max(summary.max_daily_count, dc.second);
	}
	return HeatmapResult{ std::move(grid), summary, std::move(visible) };
}

}
