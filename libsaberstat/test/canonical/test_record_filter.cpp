#include <catch2/catch_test_macros.hpp>

#include "libsaberstat/canonical/record_filter.hpp"
#include "test_helpers.hpp"

using namespace libsaberstat::canonical;
using test_helpers::MakeRecord;

TEST_CASE("RecordFilter: Equality predicates", "[canonical][filter]") {
	libsaberstat::core::RecordSet records = {
	    MakeRecord("1", {{"school_id", "A"}, {"cole_naturaleza", "OFICIAL"}}, {{"global", 250.0}}, 2022),
	    MakeRecord("2", {{"school_id", "B"}, {"cole_naturaleza", "NO OFICIAL"}}, {{"global", 300.0}}, 2023),
	    MakeRecord("3", {{"school_id", "C"}, {"cole_naturaleza", "OFICIAL"}}, {{"global", 240.0}}, 2023),
	    MakeRecord("4", {{"school_id", "D"}}, {{"global", 260.0}}, 2023)};

	SECTION("Empty filter keeps everything") {
		RecordFilter filter;
		REQUIRE(filter.Empty());
		REQUIRE(filter.Apply(records).size() == 4);
	}

	SECTION("Case-insensitive match") {
		auto out = RecordFilter().Where("cole_naturaleza", "oficial").Apply(records);
		REQUIRE(out.size() == 2);
		REQUIRE(out[0].record_id == "1");
		REQUIRE(out[1].record_id == "3");
	}

	SECTION("Predicates combine with AND") {
		auto out = RecordFilter().Where("cole_naturaleza", "OFICIAL").Year(2023).Apply(records);
		REQUIRE(out.size() == 1);
		REQUIRE(out[0].record_id == "3");
	}

	SECTION("Records lacking the field never match") {
		auto out = RecordFilter().Where("cole_naturaleza", "OFICIAL").Apply(records);
		for (const auto &r : out) {
			REQUIRE(r.record_id != "4");
		}
	}

	SECTION("Source records are untouched") {
		RecordFilter().Grade(9).Apply(records);
		REQUIRE(records.size() == 4);
	}
}
