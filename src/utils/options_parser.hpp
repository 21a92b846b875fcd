#pragma once

#include "libsaberstat/core/analysis_options.hpp"
#include "libsaberstat/core/entity_level.hpp"
#include <nlohmann/json.hpp>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace saberstat {

/// Which residual fit to run and on what
struct ResidualSpec {
	bool enabled = true;
	std::string target = "global";
	std::vector<std::string> features = {"cole_genero", "cole_naturaleza", "cole_caracter", "cole_area_ubicacion"};
	libsaberstat::core::EntityLevel level = libsaberstat::core::EntityLevel::School;
	libsaberstat::core::ResidualOptions options;
};

/// Year-over-year comparison; absent from AnalysisOptions unless configured
struct TemporalSpec {
	int year_start = 0;
	int year_end = 0;
	libsaberstat::core::EntityLevel level = libsaberstat::core::EntityLevel::School;
	std::string subject = "global";
	size_t horizon = 3;
};

/**
 * Options structure for one analysis run
 *
 * Every stage's library options plus the choices the driver makes between
 * stages (levels, subjects, filters). All options have defaults that
 * reproduce the reference analysis; a JSON document overrides any subset.
 */
struct AnalysisOptions {
	/// Empty keeps the Tracer's environment/build default
	std::string log_level;

	libsaberstat::core::CanonicalizationOptions canonicalization;

	/// Equality predicates (field, value) applied after canonicalization
	std::vector<std::pair<std::string, std::string>> filters;

	std::vector<libsaberstat::core::EntityLevel> levels = {libsaberstat::core::EntityLevel::School,
	                                                       libsaberstat::core::EntityLevel::Municipality,
	                                                       libsaberstat::core::EntityLevel::Department};

	/// Appended to every level's keys (e.g. {"year"} for per-year tables)
	std::vector<std::string> extra_dimensions;

	std::vector<std::string> subjects = {"lectura_critica", "matematicas",         "c_naturales",
	                                     "sociales_ciudadanas", "ingles", "global"};

	libsaberstat::core::AggregationOptions aggregation;

	double bound = 3.5;

	/// Group-key fields splitting each normalization population (resolved per level)
	std::vector<std::string> partition_by;

	ResidualSpec residuals;

	libsaberstat::core::KpiOptions kpi;

	libsaberstat::core::PolicyOptions policy;

	libsaberstat::core::RankingOptions ranking;

	/// Subject ranked on the standardized level tables
	std::string ranking_subject = "global";

	std::optional<TemporalSpec> temporal;

	/**
	 * Parse options from a JSON object
	 *
	 * @param config JSON object; null yields the defaults
	 * @return AnalysisOptions with parsed values or defaults
	 * @throws std::invalid_argument for unknown keys, wrongly typed values or invalid combinations
	 */
	static AnalysisOptions ParseFromJson(const nlohmann::json &config);

	/// @throws std::invalid_argument if the file cannot be read or parsed
	static AnalysisOptions LoadFromFile(const std::string &path);

	/**
	 * Validate option combinations
	 *
	 * @throws std::invalid_argument if validation fails
	 */
	void Validate() const;

	/// Normalization options for one level, with partition_by resolved to key positions
	libsaberstat::core::NormalizationOptions NormalizationFor(libsaberstat::core::EntityLevel level) const;

	static AnalysisOptions Defaults() {
		return AnalysisOptions();
	}
};

} // namespace saberstat
