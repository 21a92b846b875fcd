#pragma once

#include <cmath>
#include <cstdint>
#include <stdexcept>
#include <string>
#include <vector>

namespace libsaberstat {
namespace core {

/**
 * Configuration structs for every pipeline stage
 *
 * Design notes:
 * - All defaults specified in-class (they reproduce the reference analysis:
 *   bound 3.5, regression floor 100, 80/20 split with seed 42)
 * - Each struct has Validate() which throws std::invalid_argument
 * - Options are plain values supplied by the caller; nothing is read from
 *   the environment
 */

// ============================================================================
// Record canonicalization
// ============================================================================

struct CanonicalizationOptions {
	/// Fields every kept record must carry; rows lacking one are dropped and counted
	std::vector<std::string> mandatory_fields = {"school_id"};

	/// Score values meaning "not attempted"; converted to missing
	std::vector<double> score_sentinels = {0.0};

	/// Upper-case categorical values so spelling variants share one category
	bool uppercase_categoricals = true;

	/// Grade assigned when a batch carries no grade column (SABER 11 files)
	int default_grade = 11;

	void Validate() const {
		if (mandatory_fields.empty()) {
			throw std::invalid_argument("mandatory_fields must name at least one identifier field");
		}
		if (default_grade < 0) {
			throw std::invalid_argument("default_grade must be non-negative (got " + std::to_string(default_grade) +
			                            ")");
		}
	}
};

// ============================================================================
// Aggregation and normalization
// ============================================================================

struct AggregationOptions {
	/// Groups with fewer contributing values are withheld with a diagnostic
	size_t min_count = 1;

	void Validate() const {
		if (min_count == 0) {
			throw std::invalid_argument("min_count must be at least 1");
		}
	}
};

struct NormalizationOptions {
	/// Symmetric clipping bound in standard deviations
	double bound = 3.5;

	/// Group-key positions that split the population (e.g. the grade position)
	std::vector<size_t> partition_positions;

	/// Population std at or below this is treated as zero
	double min_std = 1e-12;

	void Validate() const {
		if (!std::isfinite(bound) || bound <= 0.0) {
			throw std::invalid_argument("bound must be positive (got " + std::to_string(bound) + ")");
		}
		if (min_std < 0.0) {
			throw std::invalid_argument("min_std must be non-negative (got " + std::to_string(min_std) + ")");
		}
	}
};

// ============================================================================
// Tree ensembles and residual fits
// ============================================================================

enum class EnsembleType { RandomForest, GradientBoosting };

inline std::string EnsembleTypeName(EnsembleType type) {
	return type == EnsembleType::RandomForest ? "random_forest" : "gradient_boosting";
}

inline EnsembleType ParseEnsembleType(const std::string &name) {
	if (name == "random_forest") {
		return EnsembleType::RandomForest;
	}
	if (name == "gradient_boosting") {
		return EnsembleType::GradientBoosting;
	}
	throw std::invalid_argument("model must be 'random_forest' or 'gradient_boosting' (got '" + name + "')");
}

struct EnsembleOptions {
	EnsembleType type = EnsembleType::RandomForest;

	/// Trees (random forest) or boosting stages (gradient boosting)
	size_t n_estimators = 200;

	size_t max_depth = 10;
	size_t min_samples_split = 2;
	size_t min_samples_leaf = 1;

	/// Shrinkage applied to each boosting stage
	double learning_rate = 0.1;

	/// Bootstrap resampling for random forest trees
	bool bootstrap = true;

	uint32_t seed = 42;

	static EnsembleOptions RandomForest(size_t n_estimators_ = 200, size_t max_depth_ = 10) {
		EnsembleOptions opts;
		opts.type = EnsembleType::RandomForest;
		opts.n_estimators = n_estimators_;
		opts.max_depth = max_depth_;
		return opts;
	}

	static EnsembleOptions GradientBoosting(size_t n_estimators_ = 100, size_t max_depth_ = 5,
	                                        double learning_rate_ = 0.1) {
		EnsembleOptions opts;
		opts.type = EnsembleType::GradientBoosting;
		opts.n_estimators = n_estimators_;
		opts.max_depth = max_depth_;
		opts.learning_rate = learning_rate_;
		opts.bootstrap = false;
		return opts;
	}

	void Validate() const {
		if (n_estimators == 0) {
			throw std::invalid_argument("n_estimators must be positive");
		}
		if (max_depth == 0) {
			throw std::invalid_argument("max_depth must be positive");
		}
		if (min_samples_leaf == 0) {
			throw std::invalid_argument("min_samples_leaf must be positive");
		}
		if (min_samples_split < 2) {
			throw std::invalid_argument("min_samples_split must be at least 2 (got " +
			                            std::to_string(min_samples_split) + ")");
		}
		if (learning_rate <= 0.0 || learning_rate > 1.0) {
			throw std::invalid_argument("learning_rate must be in (0, 1] (got " + std::to_string(learning_rate) +
			                            ")");
		}
	}
};

struct ResidualOptions {
	EnsembleOptions model;

	/// Share of filtered records held out for goodness-of-fit reporting
	double test_fraction = 0.2;

	/// Seed of the train/test shuffle
	uint32_t split_seed = 42;

	/// Fits on fewer filtered records report insufficient data
	size_t min_sample = 100;

	void Validate() const {
		model.Validate();
		if (test_fraction <= 0.0 || test_fraction >= 1.0) {
			throw std::invalid_argument("test_fraction must be in (0, 1) (got " + std::to_string(test_fraction) + ")");
		}
		if (min_sample < 2) {
			throw std::invalid_argument("min_sample must be at least 2 (got " + std::to_string(min_sample) + ")");
		}
	}
};

// ============================================================================
// Equity indicators
// ============================================================================

struct KpiOptions {
	/// Score explained by context in EALG and compared in RUCDI and MEF
	std::string target_subject = "global";

	/// Minimum observations per subgroup (urban, rural, minority, ...)
	size_t min_subgroup_size = 30;

	/// Entities below this many records are excluded before any indicator (0 disables)
	size_t min_entity_size = 10;
	std::vector<std::string> entity_floor_keys = {"school_id"};

	// Socioeconomic explanatory power
	std::string stratum_field = "fami_estratovivienda";
	std::string area_field = "cole_area_ubicacion";
	std::string urban_value = "URBANO";
	std::string rural_value = "RURAL";

	// Minority resilience
	std::string minority_field = "estu_etnia";
	std::vector<std::string> non_minority_values = {"NINGUNO", "NO APLICA", "NO"};
	std::string resilience_subject = "c_naturales";

	// Gender premium
	std::string gender_field = "estu_genero";
	std::string female_value = "F";
	std::string gap_subject = "lectura_critica";
	std::string gap_control_subject = "matematicas";

	// Municipal efficiency
	std::vector<std::string> efficiency_keys = {"department_id", "municipality_id"};
	double efficiency_percentile = 0.9;
	size_t min_entities = 10;

	// Volatility
	std::vector<std::string> volatility_keys = {"school_id"};
	std::vector<std::string> volatility_subjects = {"lectura_critica", "matematicas", "c_naturales",
	                                                "sociales_ciudadanas", "ingles"};

	void Validate() const {
		if (min_subgroup_size == 0) {
			throw std::invalid_argument("min_subgroup_size must be positive");
		}
		if (efficiency_percentile <= 0.0 || efficiency_percentile >= 1.0) {
			throw std::invalid_argument("efficiency_percentile must be in (0, 1) (got " +
			                            std::to_string(efficiency_percentile) + ")");
		}
		if (min_entities < 2) {
			throw std::invalid_argument("min_entities must be at least 2");
		}
		if (efficiency_keys.empty() || volatility_keys.empty()) {
			throw std::invalid_argument("efficiency_keys and volatility_keys must not be empty");
		}
		if (min_entity_size > 0 && entity_floor_keys.empty()) {
			throw std::invalid_argument("entity_floor_keys must not be empty when min_entity_size is set");
		}
	}
};

// ============================================================================
// Headline policy indicators
// ============================================================================

struct PolicyOptions {
	std::string subject = "global";
	std::string stratum_field = "fami_estratovivienda";
	std::string area_field = "cole_area_ubicacion";
	std::string urban_value = "URBANO";
	std::string rural_value = "RURAL";
	std::string sector_field = "cole_naturaleza";
	std::string public_value = "OFICIAL";
	std::string private_value = "NO OFICIAL";
	std::vector<std::string> school_keys = {"school_id"};

	/// Complete records required by the strata and urban-rural gaps
	size_t min_records = 100;

	/// Schools required by the public-private gap
	size_t min_schools = 10;

	std::vector<std::string> weakest_subject_candidates = {"matematicas", "lectura_critica", "c_naturales",
	                                                       "sociales_ciudadanas", "ingles"};

	void Validate() const {
		if (subject.empty()) {
			throw std::invalid_argument("policy subject must not be empty");
		}
		if (school_keys.empty()) {
			throw std::invalid_argument("school_keys must not be empty");
		}
		if (min_records < 2 || min_schools < 2) {
			throw std::invalid_argument("min_records and min_schools must be at least 2");
		}
	}
};

// ============================================================================
// Ranking
// ============================================================================

struct RankingOptions {
	size_t top_n = 10;

	void Validate() const {
		if (top_n == 0) {
			throw std::invalid_argument("top_n must be positive");
		}
	}
};

} // namespace core
} // namespace libsaberstat
