#include <catch2/catch_test_macros.hpp>
#include <catch2/matchers/catch_matchers_floating_point.hpp>

#include "libsaberstat/aggregation/aggregator.hpp"
#include "libsaberstat/aggregation/normalizer.hpp"
#include "libsaberstat/canonical/record_canonicalizer.hpp"
#include "libsaberstat/kpi/kpi_engine.hpp"
#include "libsaberstat/ranking/ranking.hpp"
#include <cmath>

using namespace libsaberstat;
using Catch::Matchers::WithinAbs;

const double TOLERANCE = 1e-6;

// Schools A (urban, 50 sittings averaging 60), B (rural, 40 averaging 50) and C (rural, 5 averaging 45)
static canonical::RawBatch ThreeSchoolBatch() {
	canonical::RawBatch batch;
	batch.name = "saber11_20232";
	batch.columns = {"PERIODO", "COLE_COD_DANE_ESTABLECIMIENTO", "COLE_AREA_UBICACION", "COLE_COD_DEPTO_UBICACION",
	                 "COLE_COD_MCPIO_UBICACION", "PUNT_GLOBAL"};

	struct School {
		const char *id;
		const char *area;
		const char *dept;
		const char *muni;
		int n;
		double mean;
	};
	const School schools[] = {{"A", "Urbano", "11", "11001", 50, 60.0},
	                          {"B", "Rural", "11", "11002", 40, 50.0},
	                          {"C", "Rural", "25", "25003", 5, 45.0}};
	for (const auto &school : schools) {
		for (int i = 0; i < school.n; i++) {
			double score = school.mean + ((i % 5) - 2) * 5.0;
			batch.rows.push_back({"20232", school.id, school.area, school.dept, school.muni, std::to_string(score)});
		}
	}
	// An absent sitting in school A and a row without a school code
	batch.rows.push_back({"20232", "A", "Urbano", "11", "11001", "0"});
	batch.rows.push_back({"20232", "", "Urbano", "11", "11001", "70"});
	return batch;
}

TEST_CASE("Integration: Canonicalize, aggregate, standardize and rank", "[integration][workflow]") {
	// Step 1: Canonicalize
	auto table = canonical::RecordCanonicalizer::Canonicalize({ThreeSchoolBatch()});
	REQUIRE(table.report.rows_in == 97);
	REQUIRE(table.records.size() == 96);
	REQUIRE(table.report.dropped_missing_identifier == 1);
	REQUIRE(table.report.sentinel_scores == 1);
	REQUIRE(table.records.front().year == 2023);
	REQUIRE(table.records.front().period == 2);

	// Step 2: Aggregate at school level with a floor of 10
	core::AggregationOptions floor;
	floor.min_count = 10;
	auto schools = aggregation::Aggregator::AggregateLevel(table.records, core::EntityLevel::School, {"global"}, {},
	                                                       floor);
	REQUIRE(schools.rows.size() == 2);
	REQUIRE(schools.rows[0].count == 50);
	REQUIRE_THAT(schools.rows[0].mean, WithinAbs(60.0, TOLERANCE));
	REQUIRE(schools.withheld.size() == 1);
	REQUIRE(schools.withheld[0].group_key[0] == "C");
	REQUIRE(core::CountDiagnostics(schools.diagnostics, core::DiagnosticKind::InsufficientSample) == 1);

	// Step 3: Standardize; C never enters the population
	auto standardized = aggregation::Normalizer::Normalize(schools.rows);
	REQUIRE(standardized.measures.size() == 2);
	REQUIRE_THAT(standardized.populations[0].mean, WithinAbs(55.0, TOLERANCE));
	REQUIRE_THAT(standardized.measures[0].value, WithinAbs(5.0 / std::sqrt(50.0), TOLERANCE));
	REQUIRE_THAT(standardized.measures[1].value, WithinAbs(-5.0 / std::sqrt(50.0), TOLERANCE));

	// Step 4: Rank
	auto entries = ranking::Ranking::FromNormalized(standardized.measures, "global");
	auto top = ranking::Ranking::TopN(entries, 10);
	REQUIRE(top.size() == 2);
	REQUIRE(top[0].entity_id == "A");
	REQUIRE(ranking::Ranking::BottomN(entries, 1)[0].entity_id == "B");
}

TEST_CASE("Integration: Equity indicators respect the entity floor", "[integration][workflow]") {
	auto table = canonical::RecordCanonicalizer::Canonicalize({ThreeSchoolBatch()});

	auto report = kpi::KpiEngine::ComputeAll(table.records);

	REQUIRE(report.excluded_entities == std::vector<std::string> {"C"});
	REQUIRE(report.records_used == 91);

	const auto *rucdi = report.Find("RUCDI");
	REQUIRE(rucdi->available());
	REQUIRE(rucdi->details.at("n_urban") == 50.0);
	REQUIRE(rucdi->details.at("n_rural") == 40.0);

	// Values of A and B only: urban sd 50/7, rural sd sqrt(2000/39)
	double pooled = std::sqrt((2500.0 + 2000.0) / 88.0);
	REQUIRE_THAT(*rucdi->value, WithinAbs(10.0 / pooled, TOLERANCE));
	REQUIRE(rucdi->status == core::KpiStatus::Red);

	// Nothing else can be computed from this table, and nothing is filled in
	for (const auto &indicator : report.indicators) {
		if (indicator.key != "RUCDI") {
			REQUIRE(!indicator.available());
			REQUIRE(!indicator.unavailable_reason.empty());
		}
	}
}
