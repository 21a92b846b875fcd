#include <catch2/catch_test_macros.hpp>
#include <catch2/matchers/catch_matchers_floating_point.hpp>

#include "bridge/json_batch_reader.hpp"
#include "bridge/json_export.hpp"
#include "pipeline/analysis_pipeline.hpp"
#include "utils/tracing.hpp"
#include <string>

using namespace saberstat;
using libsaberstat::core::EntityLevel;
using Catch::Matchers::WithinAbs;
using nlohmann::json;

const double TOLERANCE = 1e-9;

namespace {

/// Appends n sittings of one school whose scores average exactly `mean`
void AddSchool(json &rows, const std::string &period, const std::string &id, const std::string &area,
               const std::string &dept, const std::string &muni, int n, double mean) {
	for (int i = 0; i < n; i++) {
		double score = mean + ((i % 5) - 2) * 5.0;
		rows.push_back(json::array({period, id, area, dept, muni, score}));
	}
}

/**
 * Two exam sittings as the batch reader receives them
 *
 * 2022: A (urban, 55) x 50, B (rural, 50) x 40
 * 2023: A (urban, 60) x 50, B (rural, 50) x 40, C (rural, 45) x 5,
 *       one absent sitting in A and one row without a school code
 */
json TwoYearDocument() {
	const json columns = json::array({"PERIODO", "COLE_COD_DANE_ESTABLECIMIENTO", "COLE_AREA_UBICACION",
	                                  "COLE_COD_DEPTO_UBICACION", "COLE_COD_MCPIO_UBICACION", "PUNT_GLOBAL"});

	json rows_2022 = json::array();
	AddSchool(rows_2022, "20222", "A", "Urbano", "11", "11001", 50, 55.0);
	AddSchool(rows_2022, "20222", "B", "Rural", "11", "11002", 40, 50.0);

	json rows_2023 = json::array();
	AddSchool(rows_2023, "20232", "A", "Urbano", "11", "11001", 50, 60.0);
	AddSchool(rows_2023, "20232", "B", "Rural", "11", "11002", 40, 50.0);
	AddSchool(rows_2023, "20232", "C", "Rural", "25", "25003", 5, 45.0);
	rows_2023.push_back(json::array({"20232", "A", "Urbano", "11", "11001", 0}));
	rows_2023.push_back(json::array({"20232", nullptr, "Urbano", "11", "11001", 70}));

	json batches = json::array();
	batches.push_back(json {{"name", "saber11_2022"}, {"columns", columns}, {"rows", rows_2022}});
	batches.push_back(json {{"name", "saber11_2023"}, {"columns", columns}, {"rows", rows_2023}});
	return json {{"batches", batches}};
}

json BaseConfig() {
	return json::parse(R"({
		"log_level": "none",
		"levels": ["school", "department"],
		"subjects": ["global"],
		"residuals": {"enabled": false}
	})");
}

const RankingReport *FindRanking(const AnalysisReport &report, const std::string &name) {
	for (const auto &ranking : report.rankings) {
		if (ranking.name == name) {
			return &ranking;
		}
	}
	return nullptr;
}

} // namespace

TEST_CASE("Pipeline: Levels, indicators and rankings", "[pipeline][integration]") {
	Tracer::SetLogLevel(LogLevel::NONE);

	auto batches = bridge::JsonBatchReader::ReadBatches(TwoYearDocument());
	auto options = AnalysisOptions::ParseFromJson(BaseConfig());
	auto report = AnalysisPipeline::Execute(batches, options);

	// Step 1: canonicalization
	REQUIRE(report.canonicalization.batches == 2);
	REQUIRE(report.canonicalization.rows_in == 187);
	REQUIRE(report.canonicalization.rows_kept == 186);
	REQUIRE(report.canonicalization.dropped_missing_identifier == 1);
	REQUIRE(report.canonicalization.sentinel_scores == 1);
	REQUIRE(report.records_analyzed == 186);

	// Step 2: levels in configured order
	REQUIRE(report.levels.size() == 2);
	REQUIRE(report.levels[0].level == EntityLevel::School);
	REQUIRE(report.levels[1].level == EntityLevel::Department);

	const auto &schools = report.levels[0].aggregation;
	REQUIRE(schools.GroupCount() == 3);
	REQUIRE(schools.rows[0].group_key[0] == "A");
	REQUIRE(schools.rows[0].count == 100);
	REQUIRE_THAT(schools.rows[0].mean, WithinAbs(57.5, TOLERANCE));
	REQUIRE(report.levels[0].normalization.measures.size() == 3);

	const auto &departments = report.levels[1].aggregation;
	REQUIRE(departments.GroupCount() == 2);
	REQUIRE(departments.rows[1].group_key[0] == "25");
	REQUIRE(departments.rows[1].count == 5);

	// Step 3: residuals off, KPIs with the entity floor
	REQUIRE_FALSE(report.residuals.has_value());
	REQUIRE(report.kpis.indicators.size() == 6);
	REQUIRE(report.kpis.records_in == 186);
	REQUIRE(report.kpis.records_used == 181);
	REQUIRE(report.kpis.excluded_entities == std::vector<std::string> {"C"});

	// Step 4: policy indicators without a value-added run
	REQUIRE(report.policy_indicators.size() == 4);
	REQUIRE_FALSE(report.weakest_subject.has_value());

	// Step 5: rankings
	REQUIRE(report.rankings.size() == 2);
	const auto *school_ranking = FindRanking(report, "school_standardized");
	REQUIRE(school_ranking != nullptr);
	REQUIRE(school_ranking->top.front().entity_id == "A");
	REQUIRE(school_ranking->bottom.front().entity_id == "C");
	REQUIRE(FindRanking(report, "department_standardized") != nullptr);
	REQUIRE(FindRanking(report, "value_added") == nullptr);

	REQUIRE_FALSE(report.temporal.has_value());
	REQUIRE(report.DiagnosticCount() > 0);
}

TEST_CASE("Pipeline: Year-over-year comparison", "[pipeline][temporal]") {
	Tracer::SetLogLevel(LogLevel::NONE);

	auto config = BaseConfig();
	config["temporal"] = json {{"year_start", 2022}, {"year_end", 2023}};

	auto report = AnalysisPipeline::Execute(bridge::JsonBatchReader::ReadBatches(TwoYearDocument()),
	                                        AnalysisOptions::ParseFromJson(config));

	REQUIRE(report.temporal.has_value());
	const auto &cmp = report.temporal->comparison;
	REQUIRE(cmp.changes.size() == 2);
	REQUIRE(cmp.changes[0].entity_id == "A");
	REQUIRE_THAT(cmp.changes[0].change, WithinAbs(5.0, TOLERANCE));
	REQUIRE_THAT(cmp.changes[1].change, WithinAbs(0.0, TOLERANCE));
	REQUIRE(cmp.only_in_start == 0);
	REQUIRE(cmp.only_in_end == 1);

	SECTION("Yearly means without enough years for a trend") {
		const auto &yearly = report.temporal->yearly_means;
		REQUIRE(yearly.size() == 2);
		REQUIRE_THAT(yearly[0].mean, WithinAbs(4750.0 / 90.0, TOLERANCE));
		REQUIRE_THAT(yearly[1].mean, WithinAbs(55.0, TOLERANCE));
		REQUIRE_FALSE(report.temporal->projection.available);
	}

	SECTION("Change ranking follows the standardized ones") {
		REQUIRE(report.rankings.size() == 3);
		REQUIRE(report.rankings.back().name == "score_change");
		REQUIRE(report.rankings.back().top.front().entity_id == "A");
	}

	SECTION("Exported document") {
		auto doc = bridge::JsonExport::ToJson(report);
		REQUIRE(doc.contains("temporal"));
		REQUIRE(doc["temporal"]["changes"].size() == 2);
		REQUIRE(doc["temporal"]["projection"]["available"] == false);
	}
}

TEST_CASE("Pipeline: Value-added residual fit", "[pipeline][residuals]") {
	Tracer::SetLogLevel(LogLevel::NONE);

	auto config = BaseConfig();
	config["residuals"] = json::parse(R"({
		"enabled": true,
		"features": ["cole_area_ubicacion"],
		"min_sample": 50,
		"model": {"type": "random_forest", "n_estimators": 10, "max_depth": 3}
	})");

	auto report = AnalysisPipeline::Execute(bridge::JsonBatchReader::ReadBatches(TwoYearDocument()),
	                                        AnalysisOptions::ParseFromJson(config));

	REQUIRE(report.residuals.has_value());
	const auto &run = *report.residuals;
	REQUIRE(run.ok());
	REQUIRE(run.records_in == 186);
	REQUIRE(run.records_used == 185);
	REQUIRE(run.train_size + run.test_size == 185);
	REQUIRE(run.results.size() == 3);

	REQUIRE(report.policy_indicators.size() == 5);
	REQUIRE(report.rankings.front().name == "value_added");

	auto doc = bridge::JsonExport::ToJson(report);
	REQUIRE(doc["residuals"]["status"] == "ok");
	REQUIRE(doc["residuals"]["results"].size() == 3);
	REQUIRE(doc["residuals"]["feature_importance"].contains("cole_area_ubicacion"));
}

TEST_CASE("Pipeline: Filters", "[pipeline][filter]") {
	Tracer::SetLogLevel(LogLevel::NONE);
	auto batches = bridge::JsonBatchReader::ReadBatches(TwoYearDocument());

	SECTION("Rural schools only") {
		auto config = BaseConfig();
		config["filters"] = json {{"cole_area_ubicacion", "rural"}};

		libsaberstat::canonical::CanonicalizationReport canonicalization;
		auto context = AnalysisPipeline::Prepare(batches, AnalysisOptions::ParseFromJson(config), canonicalization);
		REQUIRE(canonicalization.rows_kept == 186);
		REQUIRE(context.Records().size() == 85);

		auto report = AnalysisPipeline::Run(context);
		REQUIRE(report.records_analyzed == 85);
		REQUIRE(report.levels[0].aggregation.GroupCount() == 2);
	}

	SECTION("A filter matching nothing still produces a report") {
		auto config = BaseConfig();
		config["filters"] = json {{"cole_area_ubicacion", "DESIERTO"}};

		AnalysisReport report;
		REQUIRE_NOTHROW(report = AnalysisPipeline::Execute(batches, AnalysisOptions::ParseFromJson(config)));
		REQUIRE(report.records_analyzed == 0);
		REQUIRE(report.levels[0].aggregation.GroupCount() == 0);
		REQUIRE(report.rankings.empty());
		for (const auto &kpi : report.kpis.indicators) {
			REQUIRE_FALSE(kpi.available());
		}

		auto doc = bridge::JsonExport::ToJson(report);
		REQUIRE(doc["records_analyzed"] == 0);
		REQUIRE(doc["residuals"].is_null());
		REQUIRE(doc["weakest_subject"].is_null());
		REQUIRE_FALSE(doc.contains("temporal"));
	}
}

TEST_CASE("Pipeline: Invalid configuration propagates", "[pipeline][validation]") {
	Tracer::SetLogLevel(LogLevel::NONE);

	AnalysisOptions options;
	options.subjects.clear();
	REQUIRE_THROWS_AS(AnalysisPipeline::Execute({}, options), std::invalid_argument);
}
