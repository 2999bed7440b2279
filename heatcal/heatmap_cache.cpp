#include "heatmap_cache.hpp"
#include <boost/functional/hash.hpp>

namespace heatcal {

size_t commit_fingerprint(const std::vector<CommitEvent>& commits) {
	// sum of per-event hashes, so that the ingester's ordering does not matter.
	size_t digest{0};
	for(const auto& ev : commits) {
		size_t h{0};
		boost::hash_combine(h, boost::posix_time::to_iso_string(ev.instant));
		boost::hash_combine(h, ev.utc_offset_minutes);
		digest += h;
	}
	return digest;
}

size_t hash_value(const HeatmapConfig& cfg) {
	size_t h{0};
	boost::hash_combine(h, cfg.normalizer.timezone_offset_minutes);
	boost::hash_combine(h, cfg.normalizer.use_origin_offset);
	boost::hash_combine(h, cfg.normalizer.min_year);
	boost::hash_combine(h, cfg.normalizer.max_year);
	boost::hash_combine(h, int(cfg.week_start));
	boost::hash_combine(h, cfg.levels.level_count);
	boost::hash_combine(h, int(cfg.levels.mode));
	boost::hash_range  (h, cfg.levels.thresholds.begin(), cfg.levels.thresholds.end());
	boost::hash_combine(h, boost::gregorian::to_iso_string(cfg.range_start));
	boost::hash_combine(h, boost::gregorian::to_iso_string(cfg.range_end));
	boost::hash_combine(h, cfg.max_cell_count);
	return h;
}

size_t HeatmapCache::KeyHash::operator()(const Key& k) const {
	size_t h{0};
	boost::hash_combine(h, k.fingerprint);
	boost::hash_combine(h, k.commit_count);
	boost::hash_combine(h, hash_value(k.config));
	return h;
}

bool HeatmapCache::KeyEqual::operator()(const Key& a, const Key& b) const {
	return a.fingerprint == b.fingerprint and a.commit_count == b.commit_count and a.config == b.config;
}

std::shared_ptr<const HeatmapResult> HeatmapCache::get_or_compute(const std::vector<CommitEvent>& commits, const HeatmapConfig& cfg) {
	Key key{ commit_fingerprint(commits), commits.size(), cfg };
	auto it = entries.find(key);
	if(it != entries.end()) {
		++hit_count;
		return it->second;
	}
	++miss_count;
	auto result = std::make_shared<const HeatmapResult>(assemble_heatmap(commits, cfg));
	entries.emplace(std::move(key), result);
	return result;
}

void HeatmapCache::clear() {
	entries.clear();
	hit_count  = 0;
	miss_count = 0;
}

}
