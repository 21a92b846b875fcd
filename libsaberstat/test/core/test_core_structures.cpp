#include <catch2/catch_all.hpp>
#include "libsaberstat/core/analysis_options.hpp"
#include "libsaberstat/core/analysis_results.hpp"
#include "libsaberstat/core/diagnostic.hpp"
#include "libsaberstat/core/entity_level.hpp"
#include "libsaberstat/core/regression_result.hpp"
#include "libsaberstat/core/student_record.hpp"
#include <cmath>

using namespace libsaberstat::core;

TEST_CASE("StudentRecord - Field lookup", "[core][record]") {
	StudentRecord record;
	record.record_id = "r1";
	record.attributes = {{"school_id", "111001"}, {"estu_genero", "F"}, {"cole_jornada", ""}};
	record.scores = {{"matematicas", 55.0}};
	record.year = 2024;
	record.period = 1;
	record.grade = 11;

	SECTION("Attributes") {
		REQUIRE(record.Field("school_id").value() == "111001");
		REQUIRE(!record.Field("department_id").has_value());
	}

	SECTION("Empty attribute counts as missing") {
		REQUIRE(!record.Field("cole_jornada").has_value());
	}

	SECTION("Derived fields render as strings") {
		REQUIRE(record.Field("year").value() == "2024");
		REQUIRE(record.Field("grade").value() == "11");
		REQUIRE(record.Field("period").value() == "20241");
	}

	SECTION("Unknown year is missing") {
		record.year = 0;
		REQUIRE(!record.Field("year").has_value());
		REQUIRE(!record.Field("period").has_value());
	}

	SECTION("Scores") {
		REQUIRE(record.Score("matematicas").value() == 55.0);
		REQUIRE(!record.Score("ingles").has_value());
		REQUIRE(record.HasScore("matematicas"));
		REQUIRE(!record.HasScore("ingles"));
	}
}

TEST_CASE("StudentRecord - Key extraction", "[core][record]") {
	StudentRecord record;
	record.attributes = {{"department_id", "11"}, {"municipality_id", "001"}};
	std::vector<std::string> key;

	REQUIRE(ExtractKey(record, {"department_id", "municipality_id"}, key));
	REQUIRE(key == std::vector<std::string> {"11", "001"});
	REQUIRE(JoinKey(key) == "11|001");
	REQUIRE(!ExtractKey(record, {"school_id"}, key));

	SECTION("Empty key list is the national group") {
		REQUIRE(ExtractKey(record, {}, key));
		REQUIRE(key.empty());
		REQUIRE(JoinKey(key).empty());
	}
}

TEST_CASE("EntityLevel - Keys and names", "[core][level]") {
	REQUIRE(LevelKeys(EntityLevel::School) == std::vector<std::string> {"school_id"});
	REQUIRE(LevelKeys(EntityLevel::Municipality) == std::vector<std::string> {"department_id", "municipality_id"});
	REQUIRE(LevelKeys(EntityLevel::Department) == std::vector<std::string> {"department_id"});
	REQUIRE(LevelKeys(EntityLevel::National).empty());

	SECTION("Extra dimensions are appended once") {
		auto keys = LevelKeys(EntityLevel::Department, {"year", "department_id"});
		REQUIRE(keys == std::vector<std::string> {"department_id", "year"});
	}

	SECTION("Name round trip") {
		for (auto level : {EntityLevel::Student, EntityLevel::School, EntityLevel::Municipality,
		                   EntityLevel::Department, EntityLevel::National}) {
			REQUIRE(ParseEntityLevel(EntityLevelName(level)) == level);
		}
		REQUIRE_THROWS_AS(ParseEntityLevel("province"), std::invalid_argument);
	}
}

TEST_CASE("Options - Defaults and validation", "[core][options]") {
	SECTION("Defaults reproduce the reference analysis") {
		NormalizationOptions norm;
		ResidualOptions residual;
		KpiOptions kpi;
		REQUIRE(norm.bound == 3.5);
		REQUIRE(residual.min_sample == 100);
		REQUIRE(residual.test_fraction == 0.2);
		REQUIRE(residual.split_seed == 42);
		REQUIRE(residual.model.type == EnsembleType::RandomForest);
		REQUIRE(kpi.min_subgroup_size == 30);
		REQUIRE(RankingOptions().top_n == 10);
		REQUIRE_NOTHROW(norm.Validate());
		REQUIRE_NOTHROW(residual.Validate());
		REQUIRE_NOTHROW(kpi.Validate());
	}

	SECTION("Invalid bound") {
		NormalizationOptions norm;
		norm.bound = 0.0;
		REQUIRE_THROWS_AS(norm.Validate(), std::invalid_argument);
		norm.bound = -1.0;
		REQUIRE_THROWS_AS(norm.Validate(), std::invalid_argument);
	}

	SECTION("Invalid split") {
		ResidualOptions residual;
		residual.test_fraction = 1.0;
		REQUIRE_THROWS_AS(residual.Validate(), std::invalid_argument);
		residual.test_fraction = 0.0;
		REQUIRE_THROWS_AS(residual.Validate(), std::invalid_argument);
	}

	SECTION("Invalid floors") {
		AggregationOptions agg;
		agg.min_count = 0;
		REQUIRE_THROWS_AS(agg.Validate(), std::invalid_argument);

		KpiOptions kpi;
		kpi.min_subgroup_size = 0;
		REQUIRE_THROWS_AS(kpi.Validate(), std::invalid_argument);
	}

	SECTION("Model type names") {
		REQUIRE(ParseEnsembleType("gradient_boosting") == EnsembleType::GradientBoosting);
		REQUIRE(EnsembleTypeName(EnsembleType::RandomForest) == "random_forest");
		REQUIRE_THROWS_AS(ParseEnsembleType("xgboost"), std::invalid_argument);

		auto gb = EnsembleOptions::GradientBoosting();
		REQUIRE(gb.n_estimators == 100);
		REQUIRE(gb.max_depth == 5);
		REQUIRE(!gb.bootstrap);
	}
}

TEST_CASE("Diagnostics - Counting by kind", "[core][diagnostic]") {
	DiagnosticList list;
	list.emplace_back(DiagnosticKind::MissingField, "ingles", 0, "absent");
	list.emplace_back(DiagnosticKind::InsufficientSample, "C", 5, "small");
	list.emplace_back(DiagnosticKind::InsufficientSample, "D", 3, "small");

	REQUIRE(CountDiagnostics(list, DiagnosticKind::InsufficientSample) == 2);
	REQUIRE(CountDiagnostics(list, DiagnosticKind::EncodingMismatch) == 0);
	REQUIRE(std::string(DiagnosticKindName(DiagnosticKind::DegenerateVariance)) == "DegenerateVariance");
}

TEST_CASE("RegressionResult - Feature coefficients", "[core][result]") {
	RegressionResult result(10, 3, 3);
	result.has_intercept = true;
	result.coefficients << 1.0, 2.0, 3.0;

	REQUIRE(result.FeatureCoefficient(0) == 2.0);
	REQUIRE(result.FeatureCoefficient(1) == 3.0);
	REQUIRE(std::isnan(result.FeatureCoefficient(2)));
	REQUIRE(result.df_residual() == 7);
}

TEST_CASE("KpiResult - Availability", "[core][kpi]") {
	KpiResult result;
	REQUIRE(!result.available());
	REQUIRE(result.status == KpiStatus::Unavailable);
	result.value = 0.5;
	REQUIRE(result.available());
	REQUIRE(std::string(ComparisonSymbol(Comparison::Less)) == "<");
	REQUIRE(std::string(KpiStatusName(KpiStatus::Green)) == "green");
}
