#pragma once

#include "libsaberstat/aggregation/aggregator.hpp"
#include "libsaberstat/core/analysis_options.hpp"
#include "libsaberstat/core/analysis_results.hpp"
#include "libsaberstat/core/diagnostic.hpp"
#include "libsaberstat/core/student_record.hpp"
#include "libsaberstat/kpi/kpi_status.hpp"
#include "libsaberstat/models/categorical_encoder.hpp"
#include "libsaberstat/solvers/ols_solver.hpp"
#include "libsaberstat/utils/descriptive_stats.hpp"
#include "libsaberstat/utils/string_utils.hpp"
#include <Eigen/Dense>
#include <cmath>
#include <map>
#include <string>
#include <vector>

namespace libsaberstat {
namespace kpi {

struct KpiReport {
	/// Always six entries, in the order EALG, RUCDI, ERR, GNCTP, MEF, SVS
	std::vector<core::KpiResult> indicators;

	size_t records_in = 0;

	/// Records left after excluding entities below the entity floor
	size_t records_used = 0;

	std::vector<std::string> excluded_entities;

	core::DiagnosticList diagnostics;

	const core::KpiResult *Find(const std::string &key) const {
		for (const auto &indicator : indicators) {
			if (indicator.key == key) {
				return &indicator;
			}
		}
		return nullptr;
	}
};

/**
 * KpiEngine: six orthogonal equity and efficiency indicators
 *
 * | Key   | Value                                               | Target      |
 * |-------|-----------------------------------------------------|-------------|
 * | EALG  | 1 - R² of score ~ stratum + area (one-hot OLS)      | > 0.85      |
 * | RUCDI | |Cohen's d| between urban and rural students       | < 0.30      |
 * | ERR   | minority mean / complement mean                     | > 0.95      |
 * | GNCTP | female coefficient in secondary ~ primary + female  | ≈ 0         |
 * | MEF   | % of municipalities above the 90th percentile       | > 15 %      |
 * | SVS   | 1 - median CV of subject means per school           | > 0.80      |
 *
 * Every indicator is a pure function of the records it is given. When a
 * field is absent or a subgroup is below options.min_subgroup_size, the
 * indicator is returned unavailable with a reason; no value is substituted.
 */
class KpiEngine {
public:
	static const std::vector<KpiDefinition> &Catalog();

	/// @throws std::out_of_range for unknown keys
	static const KpiDefinition &Definition(const std::string &key);

	/**
	 * Apply the entity floor, then compute all six indicators
	 *
	 * @throws std::invalid_argument if options are invalid
	 */
	static KpiReport ComputeAll(const core::RecordSet &records,
	                            const core::KpiOptions &options = core::KpiOptions());

	/**
	 * Drop records of entities with fewer than options.min_entity_size records
	 *
	 * Records lacking the entity key are kept. Each excluded entity gets an
	 * InsufficientSample diagnostic.
	 */
	static core::RecordSet ApplyEntityFloor(const core::RecordSet &records, const core::KpiOptions &options,
	                                        core::DiagnosticList &diagnostics,
	                                        std::vector<std::string> &excluded_entities);

	static core::KpiResult ComputeEALG(const core::RecordSet &records, const core::KpiOptions &options);
	static core::KpiResult ComputeRUCDI(const core::RecordSet &records, const core::KpiOptions &options);
	static core::KpiResult ComputeERR(const core::RecordSet &records, const core::KpiOptions &options);
	static core::KpiResult ComputeGNCTP(const core::RecordSet &records, const core::KpiOptions &options);
	static core::KpiResult ComputeMEF(const core::RecordSet &records, const core::KpiOptions &options);
	static core::KpiResult ComputeSVS(const core::RecordSet &records, const core::KpiOptions &options);

private:
	static std::string TooFew(const std::string &what, size_t have, size_t need) {
		return what + " has " + std::to_string(have) + " observations, at least " + std::to_string(need) +
		       " required";
	}
};

// ============================================================================
// Implementation (header-only)
// ============================================================================

inline const std::vector<KpiDefinition> &KpiEngine::Catalog() {
	static const std::vector<KpiDefinition> catalog = {
	    {"EALG", "Equity-Adjusted Learning Gap",
	     "Share of score variance not explained by socioeconomic stratum and area", "1 - R²(score ~ stratum + area)",
	     "", 0.85, core::Comparison::Greater, 0.10},
	    {"RUCDI", "Rural-Urban Competency Divergence Index",
	     "Standardized mean difference between urban and rural students",
	     "|mean_urban - mean_rural| / sd_pooled", "σ", 0.30, core::Comparison::Less, 0.20},
	    {"ERR", "Ethnic Resilience Ratio", "Minority-group mean relative to the rest of the students",
	     "mean_minority / mean_complement", "", 0.95, core::Comparison::Greater, 0.10},
	    {"GNCTP", "Gender-Neutral Critical Thinking Premium",
	     "Female score premium in the secondary subject controlling for the primary subject",
	     "β_female in secondary ~ primary + female", "pts", 0.0, core::Comparison::Approx, 1.5},
	    {"MEF", "Municipal Efficiency Frontier",
	     "Share of municipalities whose mean score exceeds the 90th percentile of municipalities",
	     "100 * #(mean > P90) / #municipalities", "%", 15.0, core::Comparison::Greater, 5.0},
	    {"SVS", "Subject Volatility Stabilizer", "Consistency of school performance across subjects",
	     "1 - median(CV of subject means per school)", "", 0.80, core::Comparison::Greater, 0.10},
	};
	return catalog;
}

inline const KpiDefinition &KpiEngine::Definition(const std::string &key) {
	for (const auto &def : Catalog()) {
		if (def.key == key) {
			return def;
		}
	}
	throw std::out_of_range("Unknown indicator key: '" + key + "'");
}

inline core::RecordSet KpiEngine::ApplyEntityFloor(const core::RecordSet &records, const core::KpiOptions &options,
                                                   core::DiagnosticList &diagnostics,
                                                   std::vector<std::string> &excluded_entities) {
	if (options.min_entity_size == 0) {
		return records;
	}

	std::map<std::vector<std::string>, size_t> sizes;
	std::vector<std::string> key;
	for (const auto &record : records) {
		if (core::ExtractKey(record, options.entity_floor_keys, key)) {
			sizes[key]++;
		}
	}

	for (const auto &entry : sizes) {
		if (entry.second < options.min_entity_size) {
			excluded_entities.push_back(core::JoinKey(entry.first));
			diagnostics.emplace_back(core::DiagnosticKind::InsufficientSample, core::JoinKey(entry.first), entry.second,
			                         "entity below the floor of " + std::to_string(options.min_entity_size) +
			                             " records, excluded from indicators");
		}
	}

	core::RecordSet kept;
	for (const auto &record : records) {
		if (core::ExtractKey(record, options.entity_floor_keys, key) && sizes[key] < options.min_entity_size) {
			continue;
		}
		kept.push_back(record);
	}
	return kept;
}

inline KpiReport KpiEngine::ComputeAll(const core::RecordSet &records, const core::KpiOptions &options) {
	options.Validate();

	KpiReport report;
	report.records_in = records.size();
	core::RecordSet kept = ApplyEntityFloor(records, options, report.diagnostics, report.excluded_entities);
	report.records_used = kept.size();

	report.indicators.push_back(ComputeEALG(kept, options));
	report.indicators.push_back(ComputeRUCDI(kept, options));
	report.indicators.push_back(ComputeERR(kept, options));
	report.indicators.push_back(ComputeGNCTP(kept, options));
	report.indicators.push_back(ComputeMEF(kept, options));
	report.indicators.push_back(ComputeSVS(kept, options));

	for (const auto &indicator : report.indicators) {
		if (!indicator.available()) {
			report.diagnostics.emplace_back(core::DiagnosticKind::InsufficientSample, indicator.key,
			                                indicator.sample_size, indicator.unavailable_reason);
		}
	}
	return report;
}

inline core::KpiResult KpiEngine::ComputeEALG(const core::RecordSet &records, const core::KpiOptions &options) {
	const auto &def = Definition("EALG");

	core::RecordSet complete;
	for (const auto &record : records) {
		if (record.HasScore(options.target_subject) && record.Field(options.stratum_field) &&
		    record.Field(options.area_field)) {
			complete.push_back(record);
		}
	}
	if (complete.size() < options.min_subgroup_size) {
		return MakeUnavailable(def, TooFew("complete " + options.target_subject + "/" + options.stratum_field + "/" +
		                                       options.area_field + " sample",
		                                   complete.size(), options.min_subgroup_size),
		                       complete.size());
	}

	utils::RunningStats spread;
	for (const auto &record : complete) {
		spread.Push(*record.Score(options.target_subject));
	}
	if (!(spread.Variance() > 0.0) || !std::isfinite(spread.Variance())) {
		return MakeUnavailable(def, "no score variance", complete.size());
	}

	auto encoder = models::CategoricalEncoder::Fit(complete, {options.stratum_field, options.area_field});
	const size_t width = encoder.OneHotWidth();
	if (width == 0) {
		return MakeUnavailable(def, "stratum and area take a single value each; nothing to explain",
		                       complete.size());
	}

	Eigen::MatrixXd X(static_cast<Eigen::Index>(complete.size()), static_cast<Eigen::Index>(width));
	Eigen::VectorXd y(static_cast<Eigen::Index>(complete.size()));
	std::vector<double> row;
	for (size_t i = 0; i < complete.size(); i++) {
		encoder.EncodeOneHot(complete[i], row);
		for (size_t j = 0; j < width; j++) {
			X(static_cast<Eigen::Index>(i), static_cast<Eigen::Index>(j)) = row[j];
		}
		y[static_cast<Eigen::Index>(i)] = *complete[i].Score(options.target_subject);
	}

	auto fit = solvers::OLSSolver::Fit(y, X);
	auto result = MakeAvailable(def, 1.0 - fit.r_squared, complete.size());
	result.details["r_squared"] = fit.r_squared;
	result.details["predictors"] = static_cast<double>(width);
	result.details["rank"] = static_cast<double>(fit.rank);
	return result;
}

inline core::KpiResult KpiEngine::ComputeRUCDI(const core::RecordSet &records, const core::KpiOptions &options) {
	const auto &def = Definition("RUCDI");

	utils::RunningStats urban;
	utils::RunningStats rural;
	for (const auto &record : records) {
		auto score = record.Score(options.target_subject);
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
	if (urban.Count() < options.min_subgroup_size) {
		return MakeUnavailable(def, TooFew("urban subgroup", urban.Count(), options.min_subgroup_size), n);
	}
	if (rural.Count() < options.min_subgroup_size) {
		return MakeUnavailable(def, TooFew("rural subgroup", rural.Count(), options.min_subgroup_size), n);
	}

	const double diff = urban.Mean() - rural.Mean();
	const double pooled = utils::PooledStdDev(urban.Count(), urban.StdDev(), rural.Count(), rural.StdDev());
	double d = 0.0;
	if (pooled > 1e-12) {
		d = diff / pooled;
	} else if (std::fabs(diff) > 1e-12) {
		return MakeUnavailable(def, "pooled standard deviation is zero with different subgroup means", n);
	}

	auto result = MakeAvailable(def, std::fabs(d), n);
	result.details["signed_d"] = d;
	result.details["mean_urban"] = urban.Mean();
	result.details["mean_rural"] = rural.Mean();
	result.details["n_urban"] = static_cast<double>(urban.Count());
	result.details["n_rural"] = static_cast<double>(rural.Count());
	result.details["sd_pooled"] = pooled;
	return result;
}

inline core::KpiResult KpiEngine::ComputeERR(const core::RecordSet &records, const core::KpiOptions &options) {
	const auto &def = Definition("ERR");

	utils::RunningStats minority;
	utils::RunningStats complement;
	for (const auto &record : records) {
		auto score = record.Score(options.resilience_subject);
		auto group = record.Field(options.minority_field);
		if (!score || !group) {
			continue;
		}
		bool is_minority = true;
		for (const auto &value : options.non_minority_values) {
			if (utils::EqualsIgnoreCase(*group, value)) {
				is_minority = false;
				break;
			}
		}
		(is_minority ? minority : complement).Push(*score);
	}

	const size_t n = minority.Count() + complement.Count();
	if (n == 0) {
		return MakeUnavailable(def, "field '" + options.minority_field + "' or subject '" +
		                                options.resilience_subject + "' is absent");
	}
	if (minority.Count() < options.min_subgroup_size) {
		return MakeUnavailable(def, TooFew("minority subgroup", minority.Count(), options.min_subgroup_size), n);
	}
	if (complement.Count() < options.min_subgroup_size) {
		return MakeUnavailable(def, TooFew("complement subgroup", complement.Count(), options.min_subgroup_size), n);
	}
	if (std::fabs(complement.Mean()) < 1e-12) {
		return MakeUnavailable(def, "complement mean is zero", n);
	}

	auto result = MakeAvailable(def, minority.Mean() / complement.Mean(), n);
	result.details["mean_minority"] = minority.Mean();
	result.details["mean_complement"] = complement.Mean();
	result.details["n_minority"] = static_cast<double>(minority.Count());
	result.details["n_complement"] = static_cast<double>(complement.Count());
	return result;
}

inline core::KpiResult KpiEngine::ComputeGNCTP(const core::RecordSet &records, const core::KpiOptions &options) {
	const auto &def = Definition("GNCTP");

	std::vector<double> secondary;
	std::vector<double> primary;
	std::vector<double> female;
	size_t n_female = 0;
	for (const auto &record : records) {
		auto y = record.Score(options.gap_subject);
		auto x = record.Score(options.gap_control_subject);
		auto gender = record.Field(options.gender_field);
		if (!y || !x || !gender) {
			continue;
		}
		bool is_female = utils::EqualsIgnoreCase(*gender, options.female_value);
		secondary.push_back(*y);
		primary.push_back(*x);
		female.push_back(is_female ? 1.0 : 0.0);
		n_female += is_female ? 1 : 0;
	}

	const size_t n = secondary.size();
	const size_t n_other = n - n_female;
	if (n_female < options.min_subgroup_size) {
		return MakeUnavailable(def, TooFew("female subgroup", n_female, options.min_subgroup_size), n);
	}
	if (n_other < options.min_subgroup_size) {
		return MakeUnavailable(def, TooFew("non-female subgroup", n_other, options.min_subgroup_size), n);
	}

	Eigen::MatrixXd X(static_cast<Eigen::Index>(n), 2);
	Eigen::VectorXd y(static_cast<Eigen::Index>(n));
	for (size_t i = 0; i < n; i++) {
		X(static_cast<Eigen::Index>(i), 0) = primary[i];
		X(static_cast<Eigen::Index>(i), 1) = female[i];
		y[static_cast<Eigen::Index>(i)] = secondary[i];
	}

	auto fit = solvers::OLSSolver::Fit(y, X);
	const double beta_female = fit.FeatureCoefficient(1);
	if (!std::isfinite(beta_female)) {
		return MakeUnavailable(def, "female indicator is collinear with the control subject", n);
	}

	auto result = MakeAvailable(def, beta_female, n);
	result.details["beta_control"] = fit.FeatureCoefficient(0);
	result.details["intercept"] = fit.intercept;
	result.details["r_squared"] = fit.r_squared;
	result.details["n_female"] = static_cast<double>(n_female);
	return result;
}

inline core::KpiResult KpiEngine::ComputeMEF(const core::RecordSet &records, const core::KpiOptions &options) {
	const auto &def = Definition("MEF");

	auto table = aggregation::Aggregator::Aggregate(records, options.efficiency_keys, {options.target_subject});
	std::vector<double> means;
	for (const auto &row : table.rows) {
		means.push_back(row.mean);
	}
	if (means.size() < options.min_entities) {
		return MakeUnavailable(def, TooFew("municipality table", means.size(), options.min_entities), means.size());
	}

	const double threshold = utils::Quantile(means, options.efficiency_percentile);
	size_t above = 0;
	for (double m : means) {
		above += m > threshold ? 1 : 0;
	}

	auto result = MakeAvailable(def, 100.0 * static_cast<double>(above) / static_cast<double>(means.size()),
	                            means.size());
	result.details["threshold"] = threshold;
	result.details["above_threshold"] = static_cast<double>(above);
	result.details["municipalities"] = static_cast<double>(means.size());
	return result;
}

inline core::KpiResult KpiEngine::ComputeSVS(const core::RecordSet &records, const core::KpiOptions &options) {
	const auto &def = Definition("SVS");

	auto table = aggregation::Aggregator::Aggregate(records, options.volatility_keys, options.volatility_subjects);
	std::map<std::vector<std::string>, std::vector<double>> per_entity;
	for (const auto &row : table.rows) {
		per_entity[row.group_key].push_back(row.mean);
	}

	std::vector<double> cvs;
	for (const auto &entry : per_entity) {
		if (entry.second.size() < 2) {
			continue;
		}
		double cv = utils::CoefficientOfVariation(entry.second);
		if (std::isfinite(cv)) {
			cvs.push_back(cv);
		}
	}
	if (cvs.empty()) {
		return MakeUnavailable(def, "no entity has means for at least 2 subjects", 0);
	}

	const double median_cv = utils::Median(cvs);
	auto result = MakeAvailable(def, 1.0 - median_cv, cvs.size());
	result.details["median_cv"] = median_cv;
	result.details["entities"] = static_cast<double>(cvs.size());
	return result;
}

} // namespace kpi
} // namespace libsaberstat
