#include "options_parser.hpp"
#include "tracing.hpp"
#include "validation.hpp"
#include <fstream>
#include <stdexcept>

namespace saberstat {

using libsaberstat::core::EntityLevel;
using nlohmann::json;

namespace {

[[noreturn]] void ThrowUnknownKey(const std::string &section, const std::string &key, const std::string &valid) {
	throw std::invalid_argument("Unknown option: '" + key + "' in " + section + ". Valid options are: " + valid);
}

std::vector<EntityLevel> ParseLevels(const json &value, const std::string &key) {
	std::vector<EntityLevel> out;
	for (const auto &name : ValidationUtils::GetStringList(value, key)) {
		out.push_back(libsaberstat::core::ParseEntityLevel(name));
	}
	return out;
}

void ParseCanonicalization(const json &section, libsaberstat::core::CanonicalizationOptions &opts) {
	ValidationUtils::RequireObject(section, "canonicalization");
	for (const auto &item : section.items()) {
		const auto &key = item.key();
		const auto &value = item.value();
		if (key == "mandatory_fields") {
			opts.mandatory_fields = ValidationUtils::GetStringList(value, key);
		} else if (key == "score_sentinels") {
			opts.score_sentinels = ValidationUtils::GetDoubleList(value, key);
		} else if (key == "uppercase_categoricals") {
			opts.uppercase_categoricals = ValidationUtils::GetBool(value, key);
		} else if (key == "default_grade") {
			opts.default_grade = ValidationUtils::GetInt(value, key);
		} else {
			ThrowUnknownKey("canonicalization", key,
			                "mandatory_fields, score_sentinels, uppercase_categoricals, default_grade");
		}
	}
}

void ParseModel(const json &section, libsaberstat::core::EnsembleOptions &model) {
	ValidationUtils::RequireObject(section, "residuals.model");

	// The type picks the defaults the other keys override
	auto type_it = section.find("type");
	if (type_it != section.end()) {
		auto type = libsaberstat::core::ParseEnsembleType(ValidationUtils::GetString(*type_it, "type"));
		model = type == libsaberstat::core::EnsembleType::RandomForest
		            ? libsaberstat::core::EnsembleOptions::RandomForest()
		            : libsaberstat::core::EnsembleOptions::GradientBoosting();
	}

	for (const auto &item : section.items()) {
		const auto &key = item.key();
		const auto &value = item.value();
		if (key == "type") {
			continue;
		} else if (key == "n_estimators") {
			model.n_estimators = ValidationUtils::GetSize(value, key);
		} else if (key == "max_depth") {
			model.max_depth = ValidationUtils::GetSize(value, key);
		} else if (key == "min_samples_split") {
			model.min_samples_split = ValidationUtils::GetSize(value, key);
		} else if (key == "min_samples_leaf") {
			model.min_samples_leaf = ValidationUtils::GetSize(value, key);
		} else if (key == "learning_rate") {
			model.learning_rate = ValidationUtils::GetDouble(value, key);
		} else if (key == "bootstrap") {
			model.bootstrap = ValidationUtils::GetBool(value, key);
		} else if (key == "seed") {
			model.seed = static_cast<uint32_t>(ValidationUtils::GetSize(value, key));
		} else {
			ThrowUnknownKey("residuals.model", key,
			                "type, n_estimators, max_depth, min_samples_split, min_samples_leaf, learning_rate, "
			                "bootstrap, seed");
		}
	}
}

void ParseResiduals(const json &section, ResidualSpec &spec) {
	ValidationUtils::RequireObject(section, "residuals");
	for (const auto &item : section.items()) {
		const auto &key = item.key();
		const auto &value = item.value();
		if (key == "enabled") {
			spec.enabled = ValidationUtils::GetBool(value, key);
		} else if (key == "target") {
			spec.target = ValidationUtils::GetString(value, key);
		} else if (key == "features") {
			spec.features = ValidationUtils::GetStringList(value, key);
		} else if (key == "level") {
			spec.level = libsaberstat::core::ParseEntityLevel(ValidationUtils::GetString(value, key));
		} else if (key == "test_fraction") {
			spec.options.test_fraction = ValidationUtils::GetDouble(value, key);
		} else if (key == "split_seed") {
			spec.options.split_seed = static_cast<uint32_t>(ValidationUtils::GetSize(value, key));
		} else if (key == "min_sample") {
			spec.options.min_sample = ValidationUtils::GetSize(value, key);
		} else if (key == "model") {
			ParseModel(value, spec.options.model);
		} else {
			ThrowUnknownKey("residuals", key,
			                "enabled, target, features, level, test_fraction, split_seed, min_sample, model");
		}
	}
}

void ParseKpi(const json &section, libsaberstat::core::KpiOptions &opts) {
	ValidationUtils::RequireObject(section, "kpi");
	for (const auto &item : section.items()) {
		const auto &key = item.key();
		const auto &value = item.value();
		if (key == "target_subject") {
			opts.target_subject = ValidationUtils::GetString(value, key);
		} else if (key == "min_subgroup_size") {
			opts.min_subgroup_size = ValidationUtils::GetSize(value, key);
		} else if (key == "min_entity_size") {
			opts.min_entity_size = ValidationUtils::GetSize(value, key);
		} else if (key == "entity_floor_keys") {
			opts.entity_floor_keys = ValidationUtils::GetStringList(value, key);
		} else if (key == "stratum_field") {
			opts.stratum_field = ValidationUtils::GetString(value, key);
		} else if (key == "area_field") {
			opts.area_field = ValidationUtils::GetString(value, key);
		} else if (key == "urban_value") {
			opts.urban_value = ValidationUtils::GetString(value, key);
		} else if (key == "rural_value") {
			opts.rural_value = ValidationUtils::GetString(value, key);
		} else if (key == "minority_field") {
			opts.minority_field = ValidationUtils::GetString(value, key);
		} else if (key == "non_minority_values") {
			opts.non_minority_values = ValidationUtils::GetStringList(value, key);
		} else if (key == "resilience_subject") {
			opts.resilience_subject = ValidationUtils::GetString(value, key);
		} else if (key == "gender_field") {
			opts.gender_field = ValidationUtils::GetString(value, key);
		} else if (key == "female_value") {
			opts.female_value = ValidationUtils::GetString(value, key);
		} else if (key == "gap_subject") {
			opts.gap_subject = ValidationUtils::GetString(value, key);
		} else if (key == "gap_control_subject") {
			opts.gap_control_subject = ValidationUtils::GetString(value, key);
		} else if (key == "efficiency_keys") {
			opts.efficiency_keys = ValidationUtils::GetStringList(value, key);
		} else if (key == "efficiency_percentile") {
			opts.efficiency_percentile = ValidationUtils::GetDouble(value, key);
		} else if (key == "min_entities") {
			opts.min_entities = ValidationUtils::GetSize(value, key);
		} else if (key == "volatility_keys") {
			opts.volatility_keys = ValidationUtils::GetStringList(value, key);
		} else if (key == "volatility_subjects") {
			opts.volatility_subjects = ValidationUtils::GetStringList(value, key);
		} else {
			ThrowUnknownKey("kpi", key,
			                "target_subject, min_subgroup_size, min_entity_size, entity_floor_keys, stratum_field, "
			                "area_field, urban_value, rural_value, minority_field, non_minority_values, "
			                "resilience_subject, gender_field, female_value, gap_subject, gap_control_subject, "
			                "efficiency_keys, efficiency_percentile, min_entities, volatility_keys, "
			                "volatility_subjects");
		}
	}
}

void ParsePolicy(const json &section, libsaberstat::core::PolicyOptions &opts) {
	ValidationUtils::RequireObject(section, "policy");
	for (const auto &item : section.items()) {
		const auto &key = item.key();
		const auto &value = item.value();
		if (key == "subject") {
			opts.subject = ValidationUtils::GetString(value, key);
		} else if (key == "stratum_field") {
			opts.stratum_field = ValidationUtils::GetString(value, key);
		} else if (key == "area_field") {
			opts.area_field = ValidationUtils::GetString(value, key);
		} else if (key == "urban_value") {
			opts.urban_value = ValidationUtils::GetString(value, key);
		} else if (key == "rural_value") {
			opts.rural_value = ValidationUtils::GetString(value, key);
		} else if (key == "sector_field") {
			opts.sector_field = ValidationUtils::GetString(value, key);
		} else if (key == "public_value") {
			opts.public_value = ValidationUtils::GetString(value, key);
		} else if (key == "private_value") {
			opts.private_value = ValidationUtils::GetString(value, key);
		} else if (key == "school_keys") {
			opts.school_keys = ValidationUtils::GetStringList(value, key);
		} else if (key == "min_records") {
			opts.min_records = ValidationUtils::GetSize(value, key);
		} else if (key == "min_schools") {
			opts.min_schools = ValidationUtils::GetSize(value, key);
		} else if (key == "weakest_subject_candidates") {
			opts.weakest_subject_candidates = ValidationUtils::GetStringList(value, key);
		} else {
			ThrowUnknownKey("policy", key,
			                "subject, stratum_field, area_field, urban_value, rural_value, sector_field, "
			                "public_value, private_value, school_keys, min_records, min_schools, "
			                "weakest_subject_candidates");
		}
	}
}

TemporalSpec ParseTemporal(const json &section) {
	ValidationUtils::RequireObject(section, "temporal");
	TemporalSpec spec;
	spec.year_start = ValidationUtils::GetInt(ValidationUtils::RequireKey(section, "year_start", "temporal"),
	                                          "year_start");
	spec.year_end = ValidationUtils::GetInt(ValidationUtils::RequireKey(section, "year_end", "temporal"), "year_end");
	for (const auto &item : section.items()) {
		const auto &key = item.key();
		const auto &value = item.value();
		if (key == "year_start" || key == "year_end") {
			continue;
		} else if (key == "level") {
			spec.level = libsaberstat::core::ParseEntityLevel(ValidationUtils::GetString(value, key));
		} else if (key == "subject") {
			spec.subject = ValidationUtils::GetString(value, key);
		} else if (key == "horizon") {
			spec.horizon = ValidationUtils::GetSize(value, key);
		} else {
			ThrowUnknownKey("temporal", key, "year_start, year_end, level, subject, horizon");
		}
	}
	return spec;
}

} // namespace

AnalysisOptions AnalysisOptions::ParseFromJson(const json &config) {
	AnalysisOptions opts;

	if (config.is_null()) {
		return opts;
	}
	ValidationUtils::RequireObject(config, "configuration");

	for (const auto &item : config.items()) {
		const auto &key = item.key();
		const auto &value = item.value();

		if (key == "log_level") {
			opts.log_level = ValidationUtils::GetString(value, key);
			Tracer::ParseLevel(opts.log_level);
		} else if (key == "canonicalization") {
			ParseCanonicalization(value, opts.canonicalization);
		} else if (key == "filters") {
			ValidationUtils::RequireObject(value, "filters");
			opts.filters.clear();
			for (const auto &filter : value.items()) {
				std::string text = filter.value().is_string() ? filter.value().get<std::string>() : filter.value().dump();
				opts.filters.emplace_back(filter.key(), text);
			}
		} else if (key == "levels") {
			opts.levels = ParseLevels(value, key);
		} else if (key == "extra_dimensions") {
			opts.extra_dimensions = ValidationUtils::GetStringList(value, key);
		} else if (key == "subjects") {
			opts.subjects = ValidationUtils::GetStringList(value, key);
		} else if (key == "min_count") {
			opts.aggregation.min_count = ValidationUtils::GetSize(value, key);
		} else if (key == "bound") {
			opts.bound = ValidationUtils::GetDouble(value, key);
		} else if (key == "partition_by") {
			opts.partition_by = ValidationUtils::GetStringList(value, key);
		} else if (key == "residuals") {
			ParseResiduals(value, opts.residuals);
		} else if (key == "kpi") {
			ParseKpi(value, opts.kpi);
		} else if (key == "policy") {
			ParsePolicy(value, opts.policy);
		} else if (key == "top_n") {
			opts.ranking.top_n = ValidationUtils::GetSize(value, key);
		} else if (key == "ranking_subject") {
			opts.ranking_subject = ValidationUtils::GetString(value, key);
		} else if (key == "temporal") {
			if (!value.is_null()) {
				opts.temporal = ParseTemporal(value);
			}
		} else {
			ThrowUnknownKey("configuration", key,
			                "log_level, canonicalization, filters, levels, extra_dimensions, subjects, min_count, "
			                "bound, partition_by, residuals, kpi, policy, top_n, ranking_subject, temporal");
		}
	}

	opts.Validate();
	return opts;
}

AnalysisOptions AnalysisOptions::LoadFromFile(const std::string &path) {
	std::ifstream in(path);
	if (!in) {
		throw std::invalid_argument("Cannot open configuration file '" + path + "'");
	}
	json config;
	try {
		in >> config;
	} catch (const json::parse_error &e) {
		throw std::invalid_argument("Malformed configuration file '" + path + "': " + e.what());
	}
	return ParseFromJson(config);
}

void AnalysisOptions::Validate() const {
	canonicalization.Validate();
	aggregation.Validate();
	kpi.Validate();
	policy.Validate();
	ranking.Validate();
	if (residuals.enabled) {
		residuals.options.Validate();
		if (residuals.features.empty()) {
			throw std::invalid_argument("residuals.features must name at least one feature");
		}
	}

	if (levels.empty()) {
		throw std::invalid_argument("levels must name at least one level");
	}
	for (auto level : levels) {
		if (level == EntityLevel::Student) {
			throw std::invalid_argument("levels: the student level is only valid for residual fits");
		}
	}
	if (subjects.empty()) {
		throw std::invalid_argument("subjects must name at least one subject");
	}
	ValidationUtils::ValidateUniqueNames(subjects, "subject");
	ValidationUtils::ValidateUniqueNames(extra_dimensions, "extra dimension");

	// Resolves partition_by against every level and checks the bound
	for (auto level : levels) {
		NormalizationFor(level).Validate();
	}

	if (temporal && temporal->year_start == temporal->year_end) {
		throw std::invalid_argument("temporal.year_start and temporal.year_end must differ (got " +
		                            std::to_string(temporal->year_start) + ")");
	}
}

libsaberstat::core::NormalizationOptions AnalysisOptions::NormalizationFor(EntityLevel level) const {
	libsaberstat::core::NormalizationOptions opts;
	opts.bound = bound;
	opts.partition_positions =
	    ValidationUtils::FindColumnsByNames(libsaberstat::core::LevelKeys(level, extra_dimensions), partition_by);
	return opts;
}

} // namespace saberstat
