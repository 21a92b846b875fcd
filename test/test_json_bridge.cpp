#include <catch2/catch_test_macros.hpp>
#include <catch2/matchers/catch_matchers_floating_point.hpp>
#include <catch2/matchers/catch_matchers_string.hpp>

#include "bridge/json_batch_reader.hpp"
#include "bridge/json_export.hpp"
#include "libsaberstat/kpi/kpi_status.hpp"
#include <cstdio>
#include <fstream>
#include <limits>
#include <stdexcept>
#include <string>

using namespace saberstat;
using namespace libsaberstat;
using bridge::JsonBatchReader;
using bridge::JsonExport;
using Catch::Matchers::ContainsSubstring;
using Catch::Matchers::WithinAbs;
using nlohmann::json;

const double TOLERANCE = 1e-12;

// ============================================================================
// Batch reader
// ============================================================================

TEST_CASE("JsonBatchReader: Cell conversion", "[bridge][reader]") {
	REQUIRE(JsonBatchReader::CellToString(json(nullptr), "cell").empty());
	REQUIRE(JsonBatchReader::CellToString(json("11001"), "cell") == "11001");
	REQUIRE(JsonBatchReader::CellToString(json(true), "cell") == "true");
	REQUIRE(JsonBatchReader::CellToString(json(false), "cell") == "false");
	REQUIRE(JsonBatchReader::CellToString(json(250), "cell") == "250");
	REQUIRE(JsonBatchReader::CellToString(json(-3), "cell") == "-3");
	REQUIRE(JsonBatchReader::CellToString(json(61.5), "cell") == "61.5");

	REQUIRE_THROWS_AS(JsonBatchReader::CellToString(json::array(), "cell"), std::invalid_argument);
	REQUIRE_THROWS_WITH(JsonBatchReader::CellToString(json::object(), "batches[0].rows[3]"),
	                    ContainsSubstring("batches[0].rows[3]"));
}

TEST_CASE("JsonBatchReader: Batch documents", "[bridge][reader]") {
	auto document = json::parse(R"({"batches": [
		{"name": "saber11_2023", "source_year": 2023,
		 "columns": ["COLE_COD_DANE_ESTABLECIMIENTO", "PUNT_GLOBAL"],
		 "rows": [["111001000001", 250], ["111001000002", null], [111001000003, 301.5]]},
		{"columns": ["COLE_COD_DANE_ESTABLECIMIENTO"], "source_year": null, "rows": []}
	]})");

	auto batches = JsonBatchReader::ReadBatches(document);
	REQUIRE(batches.size() == 2);

	const auto &first = batches[0];
	REQUIRE(first.name == "saber11_2023");
	REQUIRE(first.source_year.has_value());
	REQUIRE(*first.source_year == 2023);
	REQUIRE(first.columns.size() == 2);
	REQUIRE(first.rows.size() == 3);
	REQUIRE(first.rows[0][1] == "250");
	REQUIRE(first.rows[1][1].empty());
	REQUIRE(first.rows[2][0] == "111001000003");
	REQUIRE(first.rows[2][1] == "301.5");

	SECTION("Unnamed batches are named by position") {
		REQUIRE(batches[1].name == "batches[1]");
		REQUIRE_FALSE(batches[1].source_year.has_value());
		REQUIRE(batches[1].rows.empty());
	}

	SECTION("Reader output feeds the canonicalizer") {
		auto table = canonical::RecordCanonicalizer::Canonicalize(batches);
		REQUIRE(table.report.rows_in == 3);
		REQUIRE(table.records.size() == 3);
		REQUIRE(table.records[0].year == 2023);
		REQUIRE_FALSE(table.records[1].HasScore("global"));
	}
}

TEST_CASE("JsonBatchReader: Malformed documents", "[bridge][reader]") {
	SECTION("Missing batches key") {
		REQUIRE_THROWS_AS(JsonBatchReader::ReadBatches(json::object()), std::invalid_argument);
		REQUIRE_THROWS_AS(JsonBatchReader::ReadBatches(json::array()), std::invalid_argument);
	}

	SECTION("Batches is not an array") {
		REQUIRE_THROWS_AS(JsonBatchReader::ReadBatches(json {{"batches", json::object()}}), std::invalid_argument);
	}

	SECTION("Unknown batch key") {
		auto doc = json::parse(R"({"batches": [{"columns": ["A"], "rows": [], "sheet": 1}]})");
		REQUIRE_THROWS_WITH(JsonBatchReader::ReadBatches(doc), ContainsSubstring("Unknown key 'sheet'"));
	}

	SECTION("No columns") {
		auto doc = json::parse(R"({"batches": [{"rows": [["1"]]}]})");
		REQUIRE_THROWS_WITH(JsonBatchReader::ReadBatches(doc), ContainsSubstring("has no columns"));
	}

	SECTION("Duplicate columns") {
		auto doc = json::parse(R"({"batches": [{"name": "b", "columns": ["A", "A"], "rows": []}]})");
		REQUIRE_THROWS_WITH(JsonBatchReader::ReadBatches(doc), ContainsSubstring("Duplicate column in b: 'A'"));
	}

	SECTION("Row is not an array") {
		auto doc = json::parse(R"({"batches": [{"columns": ["A"], "rows": ["1"]}]})");
		REQUIRE_THROWS_AS(JsonBatchReader::ReadBatches(doc), std::invalid_argument);
	}

	SECTION("Nested cell") {
		auto doc = json::parse(R"({"batches": [{"columns": ["A"], "rows": [[{"v": 1}]]}]})");
		REQUIRE_THROWS_AS(JsonBatchReader::ReadBatches(doc), std::invalid_argument);
	}

	SECTION("Missing file") {
		REQUIRE_THROWS_AS(JsonBatchReader::ReadFile("/nonexistent/saberstat/batches.json"), std::invalid_argument);
	}
}

// ============================================================================
// Export
// ============================================================================

static kpi::KpiDefinition TestDefinition() {
	return kpi::KpiDefinition {"TEST", "Test Indicator", "An indicator", "a - b", "pts", 10.0, core::Comparison::Greater,
	                           2.0};
}

TEST_CASE("JsonExport: Indicators", "[bridge][export]") {
	SECTION("Available value") {
		auto result = kpi::MakeAvailable(TestDefinition(), 11.5, 120);
		result.details["signed"] = -11.5;
		result.details["ratio"] = std::numeric_limits<double>::quiet_NaN();

		auto out = JsonExport::ToJson(result);
		REQUIRE(out["key"] == "TEST");
		REQUIRE_THAT(out["value"].get<double>(), WithinAbs(11.5, TOLERANCE));
		REQUIRE(out["status"] == "green");
		REQUIRE(out["comparison"] == ">");
		REQUIRE(out["sample_size"] == 120);
		REQUIRE_FALSE(out.contains("unavailable_reason"));
		REQUIRE_THAT(out["details"]["signed"].get<double>(), WithinAbs(-11.5, TOLERANCE));
		REQUIRE(out["details"]["ratio"].is_null());
	}

	SECTION("Unavailable value") {
		auto result = kpi::MakeUnavailable(TestDefinition(), "need at least 30 records (got 4)", 4);

		auto out = JsonExport::ToJson(result);
		REQUIRE(out["value"].is_null());
		REQUIRE(out["status"] == "unavailable");
		REQUIRE(out["unavailable_reason"] == "need at least 30 records (got 4)");
		REQUIRE(out["details"].is_object());
		REQUIRE(out["details"].empty());
	}
}

TEST_CASE("JsonExport: Diagnostics", "[bridge][export]") {
	core::DiagnosticList diagnostics;
	diagnostics.emplace_back(core::DiagnosticKind::MissingField, "school_id", 3, "rows without a school code");
	diagnostics.emplace_back(core::DiagnosticKind::DegenerateVariance, "ingles", 1, "zero spread");

	auto out = JsonExport::ToJson(diagnostics);
	REQUIRE(out.is_array());
	REQUIRE(out.size() == 2);
	REQUIRE(out[0]["kind"] == "MissingField");
	REQUIRE(out[0]["scope"] == "school_id");
	REQUIRE(out[0]["count"] == 3);
	REQUIRE(out[1]["kind"] == "DegenerateVariance");

	REQUIRE(JsonExport::ToJson(core::DiagnosticList {}).is_array());
}

TEST_CASE("JsonExport: Rankings and unsuccessful residual runs", "[bridge][export]") {
	SECTION("Ranking lists") {
		RankingReport report;
		report.name = "school_standardized";
		report.top.push_back(ranking::RankedEntry {"A", 1.2, 50});
		report.bottom.push_back(ranking::RankedEntry {"B", -1.2, 40});

		auto out = JsonExport::ToJson(report);
		REQUIRE(out["name"] == "school_standardized");
		REQUIRE(out["top"].size() == 1);
		REQUIRE(out["top"][0]["entity"] == "A");
		REQUIRE(out["bottom"][0]["count"] == 40);
	}

	SECTION("An insufficient run carries no metrics") {
		residuals::ResidualRun run;
		run.target_subject = "global";
		run.features = {"cole_naturaleza"};
		run.model_type = "random_forest";
		run.records_in = 12;

		auto out = JsonExport::ToJson(run);
		REQUIRE(out["status"] == "insufficient_data");
		REQUIRE(out["level"] == "school");
		REQUIRE(out["records_in"] == 12);
		REQUIRE_FALSE(out.contains("metrics"));
		REQUIRE_FALSE(out.contains("results"));
	}
}

TEST_CASE("JsonExport: Temporal comparison", "[bridge][export][temporal]") {
	TemporalReport report;
	report.comparison.year_start = 2022;
	report.comparison.year_end = 2023;
	report.comparison.subject = "global";
	report.comparison.changes.push_back(temporal::EntityChange {"A", 0.0, 5.0, 5.0, std::nullopt, 50, 50});
	report.comparison.only_in_end = 1;
	report.yearly_means = {{2022, 52.0, 90}, {2023, 55.0, 95}};
	report.projection.unavailable_reason = "need at least 3 years (got 2)";

	auto out = JsonExport::ToJson(report);
	REQUIRE(out["year_start"] == 2022);
	REQUIRE_THAT(out["mean_change"].get<double>(), WithinAbs(5.0, TOLERANCE));
	REQUIRE(out["changes"][0]["change_pct"].is_null());
	REQUIRE(out["only_in_end"] == 1);
	REQUIRE(out["yearly_means"].size() == 2);
	REQUIRE(out["projection"]["available"] == false);
	REQUIRE(out["projection"]["unavailable_reason"] == "need at least 3 years (got 2)");
	REQUIRE_FALSE(out["projection"].contains("slope"));
}

TEST_CASE("JsonExport: Writing documents", "[bridge][export]") {
	const std::string path = "saberstat_export_test.json";
	json document = {{"records_analyzed", 3}, {"mean", 61.5}};

	JsonExport::WriteFile(document, path);

	std::ifstream in(path);
	REQUIRE(in.good());
	json read_back;
	in >> read_back;
	in.close();
	std::remove(path.c_str());

	REQUIRE(read_back == document);

	REQUIRE_THROWS_AS(JsonExport::WriteFile(document, "/nonexistent/saberstat/out.json"), std::runtime_error);
}
