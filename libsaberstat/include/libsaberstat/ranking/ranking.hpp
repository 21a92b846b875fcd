#pragma once

#include "libsaberstat/core/analysis_results.hpp"
#include "libsaberstat/core/student_record.hpp"
#include <algorithm>
#include <cmath>
#include <string>
#include <vector>

namespace libsaberstat {
namespace ranking {

struct RankedEntry {
	std::string entity_id;
	double value = 0.0;
	/// Records behind the value (informational)
	size_t count = 0;
};

/**
 * Stable bounded ranking
 *
 * Entries are ordered by value (descending for TopN, ascending for
 * BottomN) with ties broken by entity id ascending, so identical input
 * always yields the identical list. Non-finite values are dropped. An n
 * larger than the input returns every entry.
 */
class Ranking {
public:
	/// First n entries by value; ascending = true ranks lowest first
	static std::vector<RankedEntry> Select(std::vector<RankedEntry> entries, size_t n, bool ascending) {
		entries.erase(std::remove_if(entries.begin(), entries.end(),
		                             [](const RankedEntry &e) { return !std::isfinite(e.value); }),
		              entries.end());
		std::sort(entries.begin(), entries.end(), [ascending](const RankedEntry &a, const RankedEntry &b) {
			if (a.value != b.value) {
				return ascending ? a.value < b.value : a.value > b.value;
			}
			return a.entity_id < b.entity_id;
		});
		if (entries.size() > n) {
			entries.resize(n);
		}
		return entries;
	}

	static std::vector<RankedEntry> TopN(const std::vector<RankedEntry> &entries, size_t n) {
		return Select(entries, n, false);
	}

	static std::vector<RankedEntry> BottomN(const std::vector<RankedEntry> &entries, size_t n) {
		return Select(entries, n, true);
	}

	// ========================================================================
	// Adapters
	// ========================================================================

	static std::vector<RankedEntry> FromResiduals(const std::vector<core::ResidualResult> &results) {
		std::vector<RankedEntry> out;
		out.reserve(results.size());
		for (const auto &r : results) {
			out.push_back(RankedEntry {r.entity_id, r.residual, r.count});
		}
		return out;
	}

	/// Standardized (clipped) values of one subject
	static std::vector<RankedEntry> FromNormalized(const std::vector<core::NormalizedMeasure> &measures,
	                                               const std::string &subject) {
		std::vector<RankedEntry> out;
		for (const auto &m : measures) {
			if (m.subject == subject) {
				out.push_back(RankedEntry {core::JoinKey(m.group_key), m.value, m.count});
			}
		}
		return out;
	}

	/// Raw means of one subject
	static std::vector<RankedEntry> FromAggregates(const std::vector<core::AggregateRow> &rows,
	                                               const std::string &subject) {
		std::vector<RankedEntry> out;
		for (const auto &row : rows) {
			if (row.subject == subject) {
				out.push_back(RankedEntry {core::JoinKey(row.group_key), row.mean, row.count});
			}
		}
		return out;
	}
};

} // namespace ranking
} // namespace libsaberstat
