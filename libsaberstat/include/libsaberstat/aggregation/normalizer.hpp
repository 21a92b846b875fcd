#pragma once

#include "libsaberstat/core/analysis_options.hpp"
#include "libsaberstat/core/analysis_results.hpp"
#include "libsaberstat/core/diagnostic.hpp"
#include "libsaberstat/core/student_record.hpp"
#include "libsaberstat/utils/descriptive_stats.hpp"
#include <algorithm>
#include <map>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

namespace libsaberstat {
namespace aggregation {

/// Mean and standard deviation of one normalization population
struct NormalizationPopulation {
	std::string subject;
	/// Values of the partition key positions (e.g. the grade)
	std::vector<std::string> partition;
	size_t rows = 0;
	double mean = 0.0;
	double std_dev = 0.0;
	bool degenerate = false;
};

struct NormalizationResult {
	double bound = 0.0;

	/// Measures in the order of the input rows; rows of degenerate populations are absent
	std::vector<core::NormalizedMeasure> measures;

	std::vector<NormalizationPopulation> populations;

	core::DiagnosticList diagnostics;

	size_t ClippedCount() const {
		size_t n = 0;
		for (const auto &m : measures) {
			n += m.clipped ? 1 : 0;
		}
		return n;
	}
};

/**
 * Normalizer: population z-scores clipped to a symmetric bound
 *
 * The population is every row passed in with the same subject (and the
 * same values at the partition positions). Because z-scores are relative
 * to that population, callers pass a complete level table, never a subset.
 *
 * Population statistics are the unweighted mean of group means and their
 * sample standard deviation. A population with fewer than two rows or zero
 * spread is skipped with a DegenerateVariance diagnostic.
 */
class Normalizer {
public:
	/**
	 * @throws std::invalid_argument for a non-positive bound or a partition position
	 *         outside a row's group key
	 */
	static NormalizationResult Normalize(const std::vector<core::AggregateRow> &rows,
	                                     const core::NormalizationOptions &options = core::NormalizationOptions());

	static double Clip(double z, double bound) {
		return std::max(-bound, std::min(bound, z));
	}
};

// ============================================================================
// Implementation (header-only)
// ============================================================================

inline NormalizationResult Normalizer::Normalize(const std::vector<core::AggregateRow> &rows,
                                                 const core::NormalizationOptions &options) {
	options.Validate();

	NormalizationResult result;
	result.bound = options.bound;

	using PopulationKey = std::pair<std::string, std::vector<std::string>>;
	auto population_key = [&options](const core::AggregateRow &row) {
		std::vector<std::string> partition;
		for (size_t pos : options.partition_positions) {
			if (pos >= row.group_key.size()) {
				throw std::invalid_argument("partition position " + std::to_string(pos) +
				                            " is outside the group key (size " +
				                            std::to_string(row.group_key.size()) + ")");
			}
			partition.push_back(row.group_key[pos]);
		}
		return PopulationKey(row.subject, partition);
	};

	std::map<PopulationKey, utils::RunningStats> stats;
	for (const auto &row : rows) {
		stats[population_key(row)].Push(row.mean);
	}

	std::map<PopulationKey, NormalizationPopulation> populations;
	for (const auto &entry : stats) {
		NormalizationPopulation pop;
		pop.subject = entry.first.first;
		pop.partition = entry.first.second;
		pop.rows = entry.second.Count();
		pop.mean = entry.second.Mean();
		pop.std_dev = entry.second.StdDev();
		pop.degenerate = pop.rows < 2 || pop.std_dev <= options.min_std;
		if (pop.degenerate) {
			std::string scope = pop.subject;
			if (!pop.partition.empty()) {
				scope += "[" + core::JoinKey(pop.partition) + "]";
			}
			result.diagnostics.emplace_back(core::DiagnosticKind::DegenerateVariance, scope, pop.rows,
			                                pop.rows < 2 ? "population has fewer than 2 groups"
			                                             : "population standard deviation is zero");
		}
		result.populations.push_back(pop);
		populations.emplace(entry.first, pop);
	}

	for (const auto &row : rows) {
		const auto &pop = populations.at(population_key(row));
		if (pop.degenerate) {
			continue;
		}
		core::NormalizedMeasure measure;
		measure.group_key = row.group_key;
		measure.subject = row.subject;
		measure.raw_mean = row.mean;
		measure.count = row.count;
		measure.z_score = (row.mean - pop.mean) / pop.std_dev;
		measure.value = Clip(measure.z_score, options.bound);
		measure.clipped = measure.value != measure.z_score;
		result.measures.push_back(std::move(measure));
	}

	return result;
}

} // namespace aggregation
} // namespace libsaberstat
