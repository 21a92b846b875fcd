#pragma once

#include "libsaberstat/aggregation/aggregator.hpp"
#include "libsaberstat/core/analysis_options.hpp"
#include "libsaberstat/core/analysis_results.hpp"
#include "libsaberstat/core/student_record.hpp"
#include "libsaberstat/kpi/kpi_status.hpp"
#include "libsaberstat/residuals/residual_engine.hpp"
#include "libsaberstat/utils/descriptive_stats.hpp"
#include "libsaberstat/utils/string_utils.hpp"
#include <algorithm>
#include <cmath>
#include <map>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

namespace libsaberstat {
namespace kpi {

/// Lowest-scoring subject of a record set
struct WeakestSubject {
	std::string subject;
	double mean = 0.0;
};

/**
 * PolicyIndicators: headline numbers for a (filtered) territory
 *
 * Point-scale indicators reported next to the six equity KPIs, each with
 * the national reference bands used by the policy dashboards (e.g. an
 * average global score of 270+ is above the national level).
 */
class PolicyIndicators {
public:
	static const KpiDefinition &Definition(const std::string &key);

	/// Mean of the top-quintile strata means minus mean of the bottom-quintile strata means
	static core::KpiResult EquityGap(const core::RecordSet &records, const core::PolicyOptions &options);

	static core::KpiResult AverageScore(const core::RecordSet &records, const core::PolicyOptions &options);

	/// Share of entities with positive value added in a residual run
	static core::KpiResult ValueAddedShare(const residuals::ResidualRun &run);

	/// Mean urban score minus mean rural score (signed)
	static core::KpiResult UrbanRuralGap(const core::RecordSet &records, const core::PolicyOptions &options);

	/// |mean private - mean public| over school means
	static core::KpiResult PublicPrivateGap(const core::RecordSet &records, const core::PolicyOptions &options);

	/// Empty when fewer than three candidate subjects have scores
	static std::optional<WeakestSubject> FindWeakestSubject(const core::RecordSet &records,
	                                                        const core::PolicyOptions &options);

	/// All point-scale indicators; the value-added share only when a successful run is given
	static std::vector<core::KpiResult> ComputeAll(const core::RecordSet &records, const core::PolicyOptions &options,
	                                               const residuals::ResidualRun *run = nullptr);
};

// ============================================================================
// Implementation (header-only)
// ============================================================================

inline const KpiDefinition &PolicyIndicators::Definition(const std::string &key) {
	static const std::vector<KpiDefinition> catalog = {
	    {"EQUITY_GAP", "Socioeconomic Equity Gap", "Score gap between the highest and lowest housing strata",
	     "mean(top-quintile strata) - mean(bottom-quintile strata)", "pts", 30.0, core::Comparison::Less, 20.0},
	    {"AVG_GLOBAL", "Average Score", "Mean score against the national reference band", "mean(score)", "pts", 270.0,
	     core::Comparison::GreaterEqual, 20.0},
	    {"VALUE_ADDED_SHARE", "Value-Added Share", "Share of entities performing above their contextual prediction",
	     "100 * #(residual > 0) / #entities", "%", 55.0, core::Comparison::GreaterEqual, 10.0},
	    {"URBAN_RURAL_GAP", "Urban-Rural Gap", "Point difference between urban and rural students",
	     "mean_urban - mean_rural", "pts", 20.0, core::Comparison::Less, 15.0},
	    {"PUBLIC_PRIVATE_GAP", "Public-Private Gap", "Point difference between private and public school means",
	     "|mean_private - mean_public|", "pts", 15.0, core::Comparison::Less, 15.0},
	};
	for (const auto &def : catalog) {
		if (def.key == key) {
			return def;
		}
	}
	throw std::out_of_range("Unknown policy indicator key: '" + key + "'");
}

inline core::KpiResult PolicyIndicators::EquityGap(const core::RecordSet &records,
                                                   const core::PolicyOptions &options) {
	const auto &def = Definition("EQUITY_GAP");

	auto table = aggregation::Aggregator::Aggregate(records, {options.stratum_field}, {options.subject});
	size_t n = 0;
	std::vector<double> strata_means;
	for (const auto &row : table.rows) {
		n += row.count;
		strata_means.push_back(row.mean);
	}
	if (n < options.min_records) {
		return MakeUnavailable(def, "insufficient data: " + std::to_string(n) + " records with stratum and score", n);
	}
	if (strata_means.size() < 2) {
		return MakeUnavailable(def, "insufficient strata", n);
	}

	const size_t k = strata_means.size() / 5 + 1;
	std::sort(strata_means.begin(), strata_means.end());
	double bottom = 0.0;
	double top = 0.0;
	for (size_t i = 0; i < k; i++) {
		bottom += strata_means[i];
		top += strata_means[strata_means.size() - 1 - i];
	}
	bottom /= static_cast<double>(k);
	top /= static_cast<double>(k);

	auto result = MakeAvailable(def, top - bottom, n);
	result.details["top_quintile_mean"] = top;
	result.details["bottom_quintile_mean"] = bottom;
	result.details["strata"] = static_cast<double>(strata_means.size());
	return result;
}

inline core::KpiResult PolicyIndicators::AverageScore(const core::RecordSet &records,
                                                      const core::PolicyOptions &options) {
	const auto &def = Definition("AVG_GLOBAL");
	utils::RunningStats stats;
	for (const auto &record : records) {
		if (auto score = record.Score(options.subject)) {
			stats.Push(*score);
		}
	}
	if (stats.Count() == 0) {
		return MakeUnavailable(def, "no " + options.subject + " scores");
	}
	auto result = MakeAvailable(def, stats.Mean(), stats.Count());
	result.details["std_dev"] = stats.StdDev();
	return result;
}

inline core::KpiResult PolicyIndicators::ValueAddedShare(const residuals::ResidualRun &run) {
	const auto &def = Definition("VALUE_ADDED_SHARE");
	if (!run.ok() || run.results.empty()) {
		return MakeUnavailable(def, "no fitted residual run", run.records_used);
	}
	size_t positive = 0;
	for (const auto &r : run.results) {
		positive += r.residual > 0.0 ? 1 : 0;
	}
	auto result = MakeAvailable(def, 100.0 * static_cast<double>(positive) / static_cast<double>(run.results.size()),
	                            run.results.size());
	result.details["positive_entities"] = static_cast<double>(positive);
	return result;
}

inline core::KpiResult PolicyIndicators::UrbanRuralGap(const core::RecordSet &records,
                                                       const core::PolicyOptions &options) {
	const auto &def = Definition("URBAN_RURAL_GAP");
	utils::RunningStats urban;
	utils::RunningStats rural;
	for (const auto &record : records) {
		auto score = record.Score(options.subject);
		auto area = record.Field(options.area_field);
		if (!score || !area) {
			continue;
		}
		if (utils::EqualsIgnoreCase(*area, options.urban_value)) {
			urban.Push(*score);
		} else if (utils::EqualsIgnoreCase(*area, options.rural_value)) {
			rural.Push(*score);
		}
	}
	const size_t n = urban.Count() + rural.Count();
	if (n < options.min_records) {
		return MakeUnavailable(def, "insufficient data: " + std::to_string(n) + " urban or rural records", n);
	}
	if (urban.Count() == 0 || rural.Count() == 0) {
		return MakeUnavailable(def, "both urban and rural records are required", n);
	}
	auto result = MakeAvailable(def, urban.Mean() - rural.Mean(), n);
	result.details["mean_urban"] = urban.Mean();
	result.details["mean_rural"] = rural.Mean();
	return result;
}

inline core::KpiResult PolicyIndicators::PublicPrivateGap(const core::RecordSet &records,
                                                          const core::PolicyOptions &options) {
	const auto &def = Definition("PUBLIC_PRIVATE_GAP");

	std::vector<std::string> keys = options.school_keys;
	keys.push_back(options.sector_field);
	auto table = aggregation::Aggregator::Aggregate(records, keys, {options.subject});

	utils::RunningStats public_schools;
	utils::RunningStats private_schools;
	const size_t sector_pos = keys.size() - 1;
	for (const auto &row : table.rows) {
		const auto &sector = row.group_key[sector_pos];
		if (utils::EqualsIgnoreCase(sector, options.public_value)) {
			public_schools.Push(row.mean);
		} else if (utils::EqualsIgnoreCase(sector, options.private_value)) {
			private_schools.Push(row.mean);
		}
	}
	const size_t n = public_schools.Count() + private_schools.Count();
	if (n < options.min_schools) {
		return MakeUnavailable(def, "insufficient schools: " + std::to_string(n), n);
	}
	if (public_schools.Count() == 0 || private_schools.Count() == 0) {
		return MakeUnavailable(def, "both public and private schools are required", n);
	}
	auto result = MakeAvailable(def, std::fabs(private_schools.Mean() - public_schools.Mean()), n);
	result.details["mean_public"] = public_schools.Mean();
	result.details["mean_private"] = private_schools.Mean();
	return result;
}

inline std::optional<WeakestSubject> PolicyIndicators::FindWeakestSubject(const core::RecordSet &records,
                                                                          const core::PolicyOptions &options) {
	auto table = aggregation::Aggregator::Aggregate(records, {}, options.weakest_subject_candidates);
	if (table.rows.size() < 3) {
		return std::nullopt;
	}
	WeakestSubject weakest {table.rows.front().subject, table.rows.front().mean};
	for (const auto &row : table.rows) {
		if (row.mean < weakest.mean) {
			weakest = WeakestSubject {row.subject, row.mean};
		}
	}
	return weakest;
}

inline std::vector<core::KpiResult> PolicyIndicators::ComputeAll(const core::RecordSet &records,
                                                                 const core::PolicyOptions &options,
                                                                 const residuals::ResidualRun *run) {
	options.Validate();
	std::vector<core::KpiResult> out;
	out.push_back(EquityGap(records, options));
	out.push_back(AverageScore(records, options));
	if (run != nullptr) {
		out.push_back(ValueAddedShare(*run));
	}
	out.push_back(UrbanRuralGap(records, options));
	out.push_back(PublicPrivateGap(records, options));
	return out;
}

} // namespace kpi
} // namespace libsaberstat
