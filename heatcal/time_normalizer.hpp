#ifndef HEATCAL_TIME_NORMALIZER_HPP
#define HEATCAL_TIME_NORMALIZER_HPP

#include "commit.hpp"
#include "config.hpp"
#include <vector>

namespace heatcal {

/* Converts commit instants into civil dates of one target timezone.
 *
 * The commit's own offset gives its wall clock at the origin, that wall clock is shifted back to UTC and then
 * read at the target offset. With use_origin_offset the wall clock at the origin is the answer, so a commit made
 * at 23:30 +0200 lands on its local day whatever the target zone is.
 *
 * Output has one date per event, same order. Throws HeatmapError(InvalidTimestamp) when an instant is not a
 * valid time or its date falls outside [min_year, max_year].
 */
CivilDate normalize_commit(const CommitEvent& event, const NormalizerConfig& cfg);
std::vector<CivilDate> normalize_commits(const std::vector<CommitEvent>& events, const NormalizerConfig& cfg);

}

#endif
