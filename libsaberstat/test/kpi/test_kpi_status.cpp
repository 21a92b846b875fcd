#include <catch2/catch_test_macros.hpp>

#include "libsaberstat/kpi/kpi_status.hpp"
#include <limits>
#include <string>

using namespace libsaberstat;
using namespace libsaberstat::kpi;
using core::Comparison;
using core::KpiStatus;

TEST_CASE("ClassifyStatus: Greater-than targets", "[kpi][status]") {
	REQUIRE(ClassifyStatus(0.90, 0.85, Comparison::Greater, 0.10) == KpiStatus::Green);
	// The target itself is not above the target
	REQUIRE(ClassifyStatus(0.85, 0.85, Comparison::Greater, 0.10) == KpiStatus::Yellow);
	REQUIRE(ClassifyStatus(0.80, 0.85, Comparison::Greater, 0.10) == KpiStatus::Yellow);
	REQUIRE(ClassifyStatus(0.70, 0.85, Comparison::Greater, 0.10) == KpiStatus::Red);
}

TEST_CASE("ClassifyStatus: At-or-above targets", "[kpi][status]") {
	// Reference bands of the average score (270 / 250) and value-added share (55 / 45)
	REQUIRE(ClassifyStatus(270.0, 270.0, Comparison::GreaterEqual, 20.0) == KpiStatus::Green);
	REQUIRE(ClassifyStatus(250.0, 270.0, Comparison::GreaterEqual, 20.0) == KpiStatus::Yellow);
	REQUIRE(ClassifyStatus(249.9, 270.0, Comparison::GreaterEqual, 20.0) == KpiStatus::Red);
	REQUIRE(ClassifyStatus(55.0, 55.0, Comparison::GreaterEqual, 10.0) == KpiStatus::Green);
	REQUIRE(ClassifyStatus(45.0, 55.0, Comparison::GreaterEqual, 10.0) == KpiStatus::Yellow);
	REQUIRE(ClassifyStatus(44.9, 55.0, Comparison::GreaterEqual, 10.0) == KpiStatus::Red);
	REQUIRE(std::string(core::ComparisonSymbol(Comparison::GreaterEqual)) == "≥");
}

TEST_CASE("ClassifyStatus: Less-than targets", "[kpi][status]") {
	REQUIRE(ClassifyStatus(0.10, 0.30, Comparison::Less, 0.20) == KpiStatus::Green);
	REQUIRE(ClassifyStatus(0.30, 0.30, Comparison::Less, 0.20) == KpiStatus::Yellow);
	REQUIRE(ClassifyStatus(0.45, 0.30, Comparison::Less, 0.20) == KpiStatus::Yellow);
	REQUIRE(ClassifyStatus(0.60, 0.30, Comparison::Less, 0.20) == KpiStatus::Red);
}

TEST_CASE("ClassifyStatus: Approximate targets", "[kpi][status]") {
	REQUIRE(ClassifyStatus(1.0, 0.0, Comparison::Approx, 1.5) == KpiStatus::Green);
	REQUIRE(ClassifyStatus(-1.5, 0.0, Comparison::Approx, 1.5) == KpiStatus::Green);
	REQUIRE(ClassifyStatus(2.0, 0.0, Comparison::Approx, 1.5) == KpiStatus::Yellow);
	REQUIRE(ClassifyStatus(-4.0, 0.0, Comparison::Approx, 1.5) == KpiStatus::Red);
}

TEST_CASE("ClassifyStatus: Non-finite values are unavailable", "[kpi][status]") {
	double nan = std::numeric_limits<double>::quiet_NaN();
	REQUIRE(ClassifyStatus(nan, 0.0, Comparison::Greater, 1.0) == KpiStatus::Unavailable);
	REQUIRE(ClassifyStatus(std::numeric_limits<double>::infinity(), 0.0, Comparison::Less, 1.0) ==
	        KpiStatus::Unavailable);
}

TEST_CASE("KpiResult construction", "[kpi][status]") {
	KpiDefinition def {"TEST", "Test Indicator", "desc", "x", "pts", 10.0, Comparison::Greater, 2.0};

	auto available = MakeAvailable(def, 12.0, 40);
	REQUIRE(available.available());
	REQUIRE(available.status == KpiStatus::Green);
	REQUIRE(available.sample_size == 40);
	REQUIRE(available.key == "TEST");
	REQUIRE(available.unit == "pts");
	REQUIRE(std::string(core::KpiStatusName(available.status)) == "green");
	REQUIRE(std::string(core::ComparisonSymbol(available.comparison)) == ">");

	auto missing = MakeUnavailable(def, "no data");
	REQUIRE(!missing.available());
	REQUIRE(missing.status == KpiStatus::Unavailable);
	REQUIRE(missing.unavailable_reason == "no data");
	REQUIRE(missing.target == 10.0);
	REQUIRE(std::string(core::KpiStatusName(missing.status)) == "unavailable");
}
