#pragma once

#include "libsaberstat/core/analysis_options.hpp"
#include "libsaberstat/core/analysis_results.hpp"
#include "libsaberstat/core/diagnostic.hpp"
#include "libsaberstat/core/entity_level.hpp"
#include "libsaberstat/core/student_record.hpp"
#include "libsaberstat/metrics/fit_metrics.hpp"
#include "libsaberstat/models/categorical_encoder.hpp"
#include "libsaberstat/models/tree_ensemble.hpp"
#include <Eigen/Dense>
#include <algorithm>
#include <cmath>
#include <map>
#include <memory>
#include <numeric>
#include <random>
#include <stdexcept>
#include <string>
#include <vector>

namespace libsaberstat {
namespace residuals {

enum class ResidualStatus { Ok, InsufficientData };

inline const char *ResidualStatusName(ResidualStatus status) {
	return status == ResidualStatus::Ok ? "ok" : "insufficient_data";
}

/// Predictions of a fitted run applied to another record set
struct PredictionBatch {
	std::vector<std::string> record_ids;
	std::vector<double> predicted;

	/// Records skipped for a missing feature or a category unseen at fit time
	size_t skipped = 0;

	core::DiagnosticList diagnostics;
};

/**
 * Outcome of one residual fit
 *
 * A run is self-contained: it owns the encoder and model it was fitted
 * with, and every prediction derived from it goes through Predict(), so
 * residuals from two different encodings are never mixed.
 */
class ResidualRun {
public:
	ResidualStatus status = ResidualStatus::InsufficientData;

	std::string target_subject;
	std::vector<std::string> features;
	core::EntityLevel level = core::EntityLevel::School;
	std::vector<std::string> entity_keys;
	std::string model_type;

	size_t records_in = 0;
	size_t records_used = 0;
	size_t records_excluded = 0;
	size_t train_size = 0;
	size_t test_size = 0;

	/// Goodness of fit on the held-out split
	metrics::FitMetrics holdout;

	/// One importance per feature, summing to 1
	std::vector<double> feature_importance;

	/// Sorted by residual descending, ties by entity id ascending
	std::vector<core::ResidualResult> results;

	core::DiagnosticList diagnostics;

	bool ok() const {
		return status == ResidualStatus::Ok;
	}

	const models::CategoricalEncoder &Encoder() const {
		return encoder_;
	}

	/**
	 * Predict records with this run's encoder and model
	 *
	 * Unseen categories produce an EncodingMismatch diagnostic and the
	 * record is skipped.
	 *
	 * @throws std::runtime_error if the run has no fitted model (insufficient data)
	 */
	PredictionBatch Predict(const core::RecordSet &records) const;

private:
	models::CategoricalEncoder encoder_;
	std::shared_ptr<const models::IEnsembleRegressor> model_;

	friend class ResidualEngine;
};

/**
 * ResidualEngine: value added as actual minus context-predicted score
 *
 * Workflow of FitResiduals():
 * 1. Keep records with the target, every feature and the entity key
 * 2. Below options.min_sample: InsufficientData, no results
 * 3. Label-encode features (encoder kept in the run)
 * 4. Seeded shuffle, hold out test_fraction, fit the ensemble on the rest
 * 5. Report holdout R², MAE, RMSE
 * 6. Predict the full filtered set; average per entity above student level
 */
class ResidualEngine {
public:
	/**
	 * @throws std::invalid_argument if features is empty, the target is empty or options are invalid
	 */
	static ResidualRun FitResiduals(const core::RecordSet &records, const std::string &target_subject,
	                                const std::vector<std::string> &features, core::EntityLevel level,
	                                const core::ResidualOptions &options = core::ResidualOptions());

	/**
	 * Reject comparisons between runs with different targets or encodings
	 *
	 * @throws std::invalid_argument if the runs are not comparable
	 */
	static void CheckComparable(const ResidualRun &a, const ResidualRun &b);

	/// Deterministic train/test partition of [0, n): first `test` indices of a seeded shuffle are held out
	static void SplitIndices(size_t n, double test_fraction, uint32_t seed, std::vector<size_t> &train,
	                         std::vector<size_t> &test);
};

// ============================================================================
// Implementation (header-only)
// ============================================================================

inline PredictionBatch ResidualRun::Predict(const core::RecordSet &records) const {
	if (!model_) {
		throw std::runtime_error("ResidualRun: no fitted model (run status " +
		                         std::string(ResidualStatusName(status)) + ")");
	}

	PredictionBatch batch;
	std::map<std::string, size_t> mismatches;
	std::vector<std::vector<double>> rows;
	std::vector<double> codes;
	std::string failed;

	for (const auto &record : records) {
		if (!encoder_.EncodeLabels(record, codes, &failed)) {
			batch.skipped++;
			if (record.Field(failed)) {
				mismatches[failed]++;
			}
			continue;
		}
		rows.push_back(codes);
		batch.record_ids.push_back(record.record_id);
	}

	for (const auto &entry : mismatches) {
		batch.diagnostics.emplace_back(core::DiagnosticKind::EncodingMismatch, entry.first, entry.second,
		                               "category not seen when the model was fitted");
	}
	if (rows.empty()) {
		return batch;
	}

	Eigen::MatrixXd X(static_cast<Eigen::Index>(rows.size()), static_cast<Eigen::Index>(features.size()));
	for (size_t i = 0; i < rows.size(); i++) {
		for (size_t j = 0; j < features.size(); j++) {
			X(static_cast<Eigen::Index>(i), static_cast<Eigen::Index>(j)) = rows[i][j];
		}
	}
	Eigen::VectorXd pred = model_->Predict(X);
	batch.predicted.assign(pred.data(), pred.data() + pred.size());
	return batch;
}

inline void ResidualEngine::SplitIndices(size_t n, double test_fraction, uint32_t seed, std::vector<size_t> &train,
                                         std::vector<size_t> &test) {
	std::vector<size_t> order(n);
	std::iota(order.begin(), order.end(), 0);
	std::mt19937 rng(seed);
	std::shuffle(order.begin(), order.end(), rng);

	size_t n_test = static_cast<size_t>(std::ceil(test_fraction * static_cast<double>(n)));
	n_test = std::max<size_t>(1, std::min(n_test, n - 1));

	test.assign(order.begin(), order.begin() + static_cast<std::ptrdiff_t>(n_test));
	train.assign(order.begin() + static_cast<std::ptrdiff_t>(n_test), order.end());
	std::sort(test.begin(), test.end());
	std::sort(train.begin(), train.end());
}

inline ResidualRun ResidualEngine::FitResiduals(const core::RecordSet &records, const std::string &target_subject,
                                                const std::vector<std::string> &features, core::EntityLevel level,
                                                const core::ResidualOptions &options) {
	options.Validate();
	if (target_subject.empty()) {
		throw std::invalid_argument("FitResiduals: target subject must not be empty");
	}
	if (features.empty()) {
		throw std::invalid_argument("FitResiduals: at least one feature field is required");
	}

	ResidualRun run;
	run.target_subject = target_subject;
	run.features = features;
	run.level = level;
	run.entity_keys = core::LevelKeys(level);
	run.model_type = core::EnsembleTypeName(options.model.type);
	run.records_in = records.size();

	// Step 1: complete cases
	core::RecordSet filtered;
	std::map<std::string, size_t> missing_by_field;
	std::vector<std::string> key;
	for (const auto &record : records) {
		if (!record.HasScore(target_subject)) {
			missing_by_field[target_subject]++;
			continue;
		}
		bool complete = true;
		for (const auto &feature : features) {
			if (!record.Field(feature)) {
				missing_by_field[feature]++;
				complete = false;
				break;
			}
		}
		if (complete && !core::ExtractKey(record, run.entity_keys, key)) {
			missing_by_field[core::JoinKey(run.entity_keys, ',')]++;
			complete = false;
		}
		if (complete) {
			filtered.push_back(record);
		}
	}
	run.records_used = filtered.size();
	run.records_excluded = records.size() - filtered.size();
	for (const auto &entry : missing_by_field) {
		run.diagnostics.emplace_back(core::DiagnosticKind::MissingField, entry.first, entry.second,
		                             "records excluded from the fit");
	}

	// Step 2: sample floor
	if (filtered.size() < options.min_sample) {
		run.status = ResidualStatus::InsufficientData;
		run.diagnostics.emplace_back(core::DiagnosticKind::InsufficientSample, target_subject, filtered.size(),
		                             "insufficient data: " + std::to_string(filtered.size()) +
		                                 " complete records, at least " + std::to_string(options.min_sample) +
		                                 " required");
		return run;
	}

	// Step 3: encode
	run.encoder_ = models::CategoricalEncoder::Fit(filtered, features);
	const auto n = static_cast<Eigen::Index>(filtered.size());
	const auto p = static_cast<Eigen::Index>(features.size());
	Eigen::MatrixXd X(n, p);
	Eigen::VectorXd y(n);
	std::vector<double> codes;
	for (Eigen::Index i = 0; i < n; i++) {
		const auto &record = filtered[static_cast<size_t>(i)];
		if (!run.encoder_.EncodeLabels(record, codes)) {
			throw std::runtime_error("FitResiduals: record '" + record.record_id +
			                         "' could not be encoded by its own encoder");
		}
		for (Eigen::Index j = 0; j < p; j++) {
			X(i, j) = codes[static_cast<size_t>(j)];
		}
		y[i] = *record.Score(target_subject);
	}

	// Step 4: split and fit
	std::vector<size_t> train_idx;
	std::vector<size_t> test_idx;
	SplitIndices(filtered.size(), options.test_fraction, options.split_seed, train_idx, test_idx);
	run.train_size = train_idx.size();
	run.test_size = test_idx.size();

	auto gather = [&X, &y, p](const std::vector<size_t> &idx, Eigen::MatrixXd &Xs, Eigen::VectorXd &ys) {
		Xs.resize(static_cast<Eigen::Index>(idx.size()), p);
		ys.resize(static_cast<Eigen::Index>(idx.size()));
		for (size_t i = 0; i < idx.size(); i++) {
			Xs.row(static_cast<Eigen::Index>(i)) = X.row(static_cast<Eigen::Index>(idx[i]));
			ys[static_cast<Eigen::Index>(i)] = y[static_cast<Eigen::Index>(idx[i])];
		}
	};
	Eigen::MatrixXd X_train, X_test;
	Eigen::VectorXd y_train, y_test;
	gather(train_idx, X_train, y_train);
	gather(test_idx, X_test, y_test);

	std::shared_ptr<models::IEnsembleRegressor> model = models::CreateEnsemble(options.model);
	model->Fit(X_train, y_train);

	// Step 5: holdout metrics
	run.holdout = metrics::ComputeFitMetrics(y_test, model->Predict(X_test));
	run.feature_importance = model->FeatureImportance();
	run.model_ = model;

	// Step 6: full-set residuals, averaged per entity
	Eigen::VectorXd predicted = model->Predict(X);

	struct EntitySums {
		size_t count = 0;
		double actual = 0.0;
		double predicted = 0.0;
	};
	std::map<std::string, EntitySums> entities;
	for (Eigen::Index i = 0; i < n; i++) {
		const auto &record = filtered[static_cast<size_t>(i)];
		std::string entity_id;
		if (level == core::EntityLevel::Student) {
			entity_id = record.record_id;
		} else if (level == core::EntityLevel::National) {
			entity_id = "national";
		} else {
			core::ExtractKey(record, run.entity_keys, key);
			entity_id = core::JoinKey(key);
		}
		auto &sums = entities[entity_id];
		sums.count++;
		sums.actual += y[i];
		sums.predicted += predicted[i];
	}

	for (const auto &entry : entities) {
		core::ResidualResult result;
		result.entity_id = entry.first;
		result.count = entry.second.count;
		result.actual = entry.second.actual / static_cast<double>(entry.second.count);
		result.predicted = entry.second.predicted / static_cast<double>(entry.second.count);
		result.residual = result.actual - result.predicted;
		result.feature_importance = run.feature_importance;
		run.results.push_back(std::move(result));
	}
	std::sort(run.results.begin(), run.results.end(),
	          [](const core::ResidualResult &a, const core::ResidualResult &b) {
		          if (a.residual != b.residual) {
			          return a.residual > b.residual;
		          }
		          return a.entity_id < b.entity_id;
	          });

	run.status = ResidualStatus::Ok;
	return run;
}

inline void ResidualEngine::CheckComparable(const ResidualRun &a, const ResidualRun &b) {
	if (!a.ok() || !b.ok()) {
		throw std::invalid_argument("Residual runs without a fitted model cannot be compared");
	}
	if (a.target_subject != b.target_subject) {
		throw std::invalid_argument("Residual runs have different targets ('" + a.target_subject + "' vs '" +
		                            b.target_subject + "')");
	}
	if (a.Encoder().Fingerprint() != b.Encoder().Fingerprint()) {
		throw std::invalid_argument("Residual runs use different categorical encodings; residuals are not comparable");
	}
}

} // namespace residuals
} // namespace libsaberstat
