#ifndef HEATCAL_HEATMAP_CACHE_HPP
#define HEATCAL_HEATMAP_CACHE_HPP

#include "heatmap_assembler.hpp"
#include <memory>
#include <unordered_map>
#include <vector>

namespace heatcal {

// order-insensitive digest of a commit set, the same events in any order give the same value.
size_t commit_fingerprint(const std::vector<CommitEvent>& commits);

size_t hash_value(const HeatmapConfig& cfg);

/* Memoizes assemble_heatmap() on (commit fingerprint, commit count, configuration).
 *
 * The owner decides the lifetime, nothing is shared between instances. Failed computations are not stored.
 */
class HeatmapCache {
	public:
		std::shared_ptr<const HeatmapResult> get_or_compute(const std::vector<CommitEvent>& commits, const HeatmapConfig& cfg);

		size_t size()   const { return entries.size(); }
		size_t hits()   const { return hit_count;      }
		size_t misses() const { return miss_count;     }
		void   clear();

	private:
		struct Key {
			size_t        fingerprint;
			size_t        commit_count;
			HeatmapConfig config;
		};
		struct KeyHash  { size_t operator()(const Key& k) const; };
		struct KeyEqual { bool   operator()(const Key& a, const Key& b) const; };

		std::unordered_map<Key,std::shared_ptr<const HeatmapResult>,KeyHash,KeyEqual> entries{};
		size_t hit_count{0};
		size_t miss_count{0};
};

}

#endif
