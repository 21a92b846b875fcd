#include <catch2/catch_test_macros.hpp>
#include <catch2/matchers/catch_matchers_floating_point.hpp>

#include "libsaberstat/aggregation/aggregator.hpp"
#include "test_helpers.hpp"

using namespace libsaberstat;
using namespace libsaberstat::aggregation;
using Catch::Matchers::WithinAbs;
using test_helpers::MakeRecord;

const double TOLERANCE = 1e-9;

TEST_CASE("Aggregator: School level means are exact", "[aggregation]") {
	auto records = test_helpers::ThreeSchools();

	auto result = Aggregator::AggregateLevel(records, core::EntityLevel::School, {"global"});

	REQUIRE(result.group_keys == std::vector<std::string> {"school_id"});
	REQUIRE(result.GroupCount() == 3);
	REQUIRE(result.rows.size() == 3);
	REQUIRE(result.excluded_missing_key == 0);

	// Rows come out ordered by key tuple
	REQUIRE(result.rows[0].group_key[0] == "A");
	REQUIRE(result.rows[0].count == 50);
	REQUIRE_THAT(result.rows[0].mean, WithinAbs(60.0, TOLERANCE));
	REQUIRE_THAT(result.rows[0].std_dev, WithinAbs(50.0 / 7.0, 1e-9));

	REQUIRE(result.rows[1].group_key[0] == "B");
	REQUIRE_THAT(result.rows[1].mean, WithinAbs(50.0, TOLERANCE));
	REQUIRE(result.rows[2].group_key[0] == "C");
	REQUIRE(result.rows[2].count == 5);
	REQUIRE_THAT(result.rows[2].mean, WithinAbs(45.0, TOLERANCE));
}

TEST_CASE("Aggregator: Multi-key grouping", "[aggregation]") {
	auto records = test_helpers::ThreeSchools();

	SECTION("Department level") {
		auto result = Aggregator::AggregateLevel(records, core::EntityLevel::Department, {"global"});
		REQUIRE(result.rows.size() == 2);
		REQUIRE(result.rows[0].group_key == std::vector<std::string> {"11"});
		REQUIRE(result.rows[0].count == 90);
		REQUIRE_THAT(result.rows[0].mean, WithinAbs((50 * 60.0 + 40 * 50.0) / 90.0, TOLERANCE));
	}

	SECTION("Municipality crossed with year") {
		auto result = Aggregator::AggregateLevel(records, core::EntityLevel::Municipality, {"global"}, {"year"});
		REQUIRE(result.group_keys ==
		        std::vector<std::string> {"department_id", "municipality_id", "year"});
		REQUIRE(result.rows.size() == 3);
		REQUIRE(result.rows[1].group_key == std::vector<std::string> {"11", "002", "2023"});
	}

	SECTION("No keys means one national group") {
		auto result = Aggregator::Aggregate(records, {}, {"global"});
		REQUIRE(result.rows.size() == 1);
		REQUIRE(result.rows[0].count == 95);
	}
}

TEST_CASE("Aggregator: Missing values and keys", "[aggregation]") {
	core::RecordSet records = {
	    MakeRecord("1", {{"school_id", "A"}}, {{"matematicas", 50.0}}),
	    MakeRecord("2", {{"school_id", "A"}}, {{"matematicas", 70.0}, {"ingles", 40.0}}),
	    MakeRecord("3", {{"school_id", "B"}}, {{"ingles", 60.0}}),
	    MakeRecord("4", {}, {{"matematicas", 90.0}})};

	auto result = Aggregator::Aggregate(records, {"school_id"}, {"matematicas", "ingles", "c_naturales"});

	SECTION("Only present scores contribute") {
		auto math = result.RowsForSubject("matematicas");
		REQUIRE(math.size() == 1);
		REQUIRE(math[0].count == 2);
		REQUIRE_THAT(math[0].mean, WithinAbs(60.0, TOLERANCE));

		auto english = result.RowsForSubject("ingles");
		REQUIRE(english.size() == 2);
		REQUIRE(english[0].count == 1);
		REQUIRE_THAT(english[0].std_dev, WithinAbs(0.0, TOLERANCE));
	}

	SECTION("No count-0 rows are emitted") {
		for (const auto &row : result.rows) {
			REQUIRE(row.count > 0);
		}
		REQUIRE(result.RowsForSubject("c_naturales").empty());
	}

	SECTION("Records missing a key are excluded and reported") {
		REQUIRE(result.excluded_missing_key == 1);
		REQUIRE(core::CountDiagnostics(result.diagnostics, core::DiagnosticKind::MissingField) == 2);
		bool key_reported = false;
		for (const auto &d : result.diagnostics) {
			key_reported = key_reported || (d.scope == "school_id" && d.count == 1);
		}
		REQUIRE(key_reported);
	}
}

TEST_CASE("Aggregator: Minimum count floor", "[aggregation]") {
	auto records = test_helpers::ThreeSchools();
	core::AggregationOptions options;
	options.min_count = 10;

	auto result = Aggregator::Aggregate(records, {"school_id"}, {"global"}, options);

	REQUIRE(result.rows.size() == 2);
	REQUIRE(result.withheld.size() == 1);
	REQUIRE(result.withheld[0].group_key[0] == "C");
	REQUIRE(result.withheld[0].count == 5);
	REQUIRE(core::CountDiagnostics(result.diagnostics, core::DiagnosticKind::InsufficientSample) == 1);

	options.min_count = 0;
	REQUIRE_THROWS_AS(Aggregator::Aggregate(records, {"school_id"}, {"global"}, options), std::invalid_argument);
}
