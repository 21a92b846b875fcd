#include <catch2/catch_test_macros.hpp>
#include <catch2/matchers/catch_matchers_floating_point.hpp>

#include "libsaberstat/aggregation/normalizer.hpp"
#include <cmath>

using namespace libsaberstat;
using namespace libsaberstat::aggregation;
using Catch::Matchers::WithinAbs;

const double TOLERANCE = 1e-9;

static core::AggregateRow Row(const std::vector<std::string> &key, const std::string &subject, double mean,
                              size_t count = 20) {
	core::AggregateRow row;
	row.group_key = key;
	row.subject = subject;
	row.mean = mean;
	row.count = count;
	return row;
}

TEST_CASE("Normalizer: Standardizes against the population of group means", "[normalization]") {
	std::vector<core::AggregateRow> rows = {Row({"A"}, "global", 60.0), Row({"B"}, "global", 50.0),
	                                        Row({"C"}, "global", 45.0), Row({"D"}, "global", 65.0)};

	auto result = Normalizer::Normalize(rows);

	REQUIRE(result.measures.size() == 4);
	REQUIRE(result.populations.size() == 1);
	REQUIRE_THAT(result.populations[0].mean, WithinAbs(55.0, TOLERANCE));

	double sum = 0.0;
	double sum_sq = 0.0;
	for (const auto &m : result.measures) {
		sum += m.z_score;
		sum_sq += m.z_score * m.z_score;
	}
	REQUIRE_THAT(sum / 4.0, WithinAbs(0.0, TOLERANCE));
	// Sample standard deviation of the z-scores is one
	REQUIRE_THAT(std::sqrt(sum_sq / 3.0), WithinAbs(1.0, TOLERANCE));

	SECTION("Output keeps input order and raw means") {
		REQUIRE(result.measures[0].group_key[0] == "A");
		REQUIRE(result.measures[3].group_key[0] == "D");
		REQUIRE_THAT(result.measures[1].raw_mean, WithinAbs(50.0, TOLERANCE));
		REQUIRE(result.measures[1].count == 20);
	}

	SECTION("Ordering of means is preserved") {
		REQUIRE(result.measures[3].z_score > result.measures[0].z_score);
		REQUIRE(result.measures[0].z_score > result.measures[1].z_score);
		REQUIRE(result.measures[1].z_score > result.measures[2].z_score);
	}
}

TEST_CASE("Normalizer: Clipping to the bound", "[normalization]") {
	std::vector<core::AggregateRow> rows;
	for (int i = 0; i < 19; i++) {
		rows.push_back(Row({"S" + std::to_string(i)}, "global", 0.0));
	}
	rows.push_back(Row({"OUTLIER"}, "global", 100.0));

	auto result = Normalizer::Normalize(rows);

	const auto &outlier = result.measures.back();
	REQUIRE_THAT(outlier.z_score, WithinAbs(95.0 / std::sqrt(500.0), 1e-9));
	REQUIRE(outlier.z_score > 3.5);
	REQUIRE_THAT(outlier.value, WithinAbs(3.5, TOLERANCE));
	REQUIRE(outlier.clipped);
	REQUIRE(result.ClippedCount() == 1);

	for (const auto &m : result.measures) {
		REQUIRE(std::fabs(m.value) <= 3.5);
	}

	SECTION("Custom bound") {
		core::NormalizationOptions options;
		options.bound = 5.0;
		auto wide = Normalizer::Normalize(rows, options);
		REQUIRE(wide.ClippedCount() == 0);
	}

	SECTION("Clip helper") {
		REQUIRE(Normalizer::Clip(-7.0, 3.5) == -3.5);
		REQUIRE(Normalizer::Clip(1.25, 3.5) == 1.25);
	}
}

TEST_CASE("Normalizer: Degenerate populations", "[normalization]") {
	SECTION("Zero spread produces no measures") {
		std::vector<core::AggregateRow> rows = {Row({"A"}, "global", 50.0), Row({"B"}, "global", 50.0)};
		auto result = Normalizer::Normalize(rows);
		REQUIRE(result.measures.empty());
		REQUIRE(core::CountDiagnostics(result.diagnostics, core::DiagnosticKind::DegenerateVariance) == 1);
		REQUIRE(result.populations[0].degenerate);
	}

	SECTION("A single group is degenerate") {
		auto result = Normalizer::Normalize({Row({"A"}, "global", 50.0)});
		REQUIRE(result.measures.empty());
		REQUIRE(result.diagnostics.size() == 1);
	}

	SECTION("Other subjects are unaffected") {
		std::vector<core::AggregateRow> rows = {Row({"A"}, "ingles", 50.0), Row({"B"}, "ingles", 50.0),
		                                        Row({"A"}, "global", 240.0), Row({"B"}, "global", 260.0)};
		auto result = Normalizer::Normalize(rows);
		REQUIRE(result.measures.size() == 2);
		for (const auto &m : result.measures) {
			REQUIRE(m.subject == "global");
			REQUIRE(std::isfinite(m.value));
		}
	}
}

TEST_CASE("Normalizer: Idempotent on standardized input", "[normalization]") {
	std::vector<core::AggregateRow> rows = {Row({"A"}, "global", 61.0), Row({"B"}, "global", 48.0),
	                                        Row({"C"}, "global", 52.5), Row({"D"}, "global", 57.0)};
	auto first = Normalizer::Normalize(rows);

	std::vector<core::AggregateRow> again;
	for (const auto &m : first.measures) {
		again.push_back(Row(m.group_key, m.subject, m.value));
	}
	auto second = Normalizer::Normalize(again);

	REQUIRE(second.measures.size() == first.measures.size());
	for (size_t i = 0; i < first.measures.size(); i++) {
		REQUIRE_THAT(second.measures[i].value, WithinAbs(first.measures[i].value, 1e-9));
	}
}

TEST_CASE("Normalizer: Partitioned populations", "[normalization]") {
	// Key is (school, grade); grade 9 and grade 11 are standardized separately
	std::vector<core::AggregateRow> rows = {Row({"A", "9"}, "global", 10.0), Row({"B", "9"}, "global", 20.0),
	                                        Row({"A", "11"}, "global", 300.0), Row({"B", "11"}, "global", 400.0)};
	core::NormalizationOptions options;
	options.partition_positions = {1};

	auto result = Normalizer::Normalize(rows, options);

	REQUIRE(result.populations.size() == 2);
	REQUIRE(result.measures.size() == 4);
	REQUIRE_THAT(result.measures[0].z_score, WithinAbs(result.measures[2].z_score, TOLERANCE));
	REQUIRE_THAT(result.measures[1].z_score, WithinAbs(result.measures[3].z_score, TOLERANCE));

	options.partition_positions = {5};
	REQUIRE_THROWS_AS(Normalizer::Normalize(rows, options), std::invalid_argument);

	core::NormalizationOptions bad;
	bad.bound = 0.0;
	REQUIRE_THROWS_AS(Normalizer::Normalize(rows, bad), std::invalid_argument);
}
