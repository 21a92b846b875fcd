#include "json_export.hpp"
#include <cmath>
#include <fstream>
#include <stdexcept>

namespace saberstat {
namespace bridge {

using libsaberstat::core::EntityLevelName;
using nlohmann::json;

json JsonExport::Number(double value) {
	if (!std::isfinite(value)) {
		return nullptr;
	}
	return value;
}

json JsonExport::ToJson(const libsaberstat::core::Diagnostic &diagnostic) {
	return json {{"kind", libsaberstat::core::DiagnosticKindName(diagnostic.kind)},
	             {"scope", diagnostic.scope},
	             {"count", diagnostic.count},
	             {"message", diagnostic.message}};
}

json JsonExport::ToJson(const libsaberstat::core::DiagnosticList &diagnostics) {
	json out = json::array();
	for (const auto &d : diagnostics) {
		out.push_back(ToJson(d));
	}
	return out;
}

json JsonExport::ToJson(const libsaberstat::canonical::CanonicalizationReport &report) {
	return json {{"batches", report.batches},
	             {"rows_in", report.rows_in},
	             {"rows_kept", report.rows_kept},
	             {"dropped_missing_identifier", report.dropped_missing_identifier},
	             {"sentinel_scores", report.sentinel_scores},
	             {"unparseable_scores", report.unparseable_scores},
	             {"derived_years", report.derived_years},
	             {"out_of_range_years", report.out_of_range_years},
	             {"out_of_range_grades", report.out_of_range_grades},
	             {"present_subjects", report.present_subjects},
	             {"absent_subjects", report.absent_subjects},
	             {"present_categoricals", report.present_categoricals},
	             {"unmapped_columns", report.unmapped_columns},
	             {"diagnostics", ToJson(report.diagnostics)}};
}

json JsonExport::ToJson(const LevelReport &level) {
	json aggregates = json::array();
	for (const auto &row : level.aggregation.rows) {
		aggregates.push_back(json {{"group", row.group_key},
		                           {"subject", row.subject},
		                           {"count", row.count},
		                           {"mean", Number(row.mean)},
		                           {"std", Number(row.std_dev)}});
	}

	json standardized = json::array();
	for (const auto &m : level.normalization.measures) {
		standardized.push_back(json {{"group", m.group_key},
		                             {"subject", m.subject},
		                             {"count", m.count},
		                             {"raw_mean", Number(m.raw_mean)},
		                             {"z_score", Number(m.z_score)},
		                             {"value", Number(m.value)},
		                             {"clipped", m.clipped}});
	}

	json withheld = json::array();
	for (const auto &w : level.aggregation.withheld) {
		withheld.push_back(json {{"group", w.group_key}, {"subject", w.subject}, {"count", w.count}});
	}

	json diagnostics = ToJson(level.aggregation.diagnostics);
	for (const auto &d : level.normalization.diagnostics) {
		diagnostics.push_back(ToJson(d));
	}

	return json {{"level", EntityLevelName(level.level)},
	             {"group_keys", level.aggregation.group_keys},
	             {"groups", level.aggregation.GroupCount()},
	             {"excluded_missing_key", level.aggregation.excluded_missing_key},
	             {"bound", level.normalization.bound},
	             {"clipped", level.normalization.ClippedCount()},
	             {"aggregates", aggregates},
	             {"standardized", standardized},
	             {"withheld", withheld},
	             {"diagnostics", diagnostics}};
}

json JsonExport::ToJson(const libsaberstat::residuals::ResidualRun &run) {
	json out {{"status", libsaberstat::residuals::ResidualStatusName(run.status)},
	          {"target", run.target_subject},
	          {"features", run.features},
	          {"level", EntityLevelName(run.level)},
	          {"model", run.model_type},
	          {"records_in", run.records_in},
	          {"records_used", run.records_used},
	          {"records_excluded", run.records_excluded},
	          {"diagnostics", ToJson(run.diagnostics)}};
	if (!run.ok()) {
		return out;
	}

	out["train_size"] = run.train_size;
	out["test_size"] = run.test_size;
	out["metrics"] = json {{"r_squared", Number(run.holdout.r_squared)},
	                       {"mae", Number(run.holdout.mae)},
	                       {"rmse", Number(run.holdout.rmse)},
	                       {"n", run.holdout.n}};

	json importance = json::object();
	for (size_t j = 0; j < run.features.size() && j < run.feature_importance.size(); j++) {
		importance[run.features[j]] = Number(run.feature_importance[j]);
	}
	out["feature_importance"] = importance;

	json results = json::array();
	for (const auto &r : run.results) {
		results.push_back(json {{"entity", r.entity_id},
		                        {"count", r.count},
		                        {"actual", Number(r.actual)},
		                        {"predicted", Number(r.predicted)},
		                        {"residual", Number(r.residual)}});
	}
	out["results"] = results;
	return out;
}

json JsonExport::ToJson(const libsaberstat::core::KpiResult &kpi) {
	json out {{"key", kpi.key},
	          {"name", kpi.name},
	          {"description", kpi.description},
	          {"formula", kpi.formula},
	          {"unit", kpi.unit},
	          {"value", kpi.value ? Number(*kpi.value) : json(nullptr)},
	          {"target", kpi.target},
	          {"comparison", libsaberstat::core::ComparisonSymbol(kpi.comparison)},
	          {"tolerance", kpi.tolerance},
	          {"status", libsaberstat::core::KpiStatusName(kpi.status)},
	          {"sample_size", kpi.sample_size}};
	if (!kpi.available()) {
		out["unavailable_reason"] = kpi.unavailable_reason;
	}
	json details = json::object();
	for (const auto &entry : kpi.details) {
		details[entry.first] = Number(entry.second);
	}
	out["details"] = details;
	return out;
}

json JsonExport::ToJson(const libsaberstat::kpi::KpiReport &report) {
	json indicators = json::array();
	for (const auto &kpi : report.indicators) {
		indicators.push_back(ToJson(kpi));
	}
	return json {{"indicators", indicators},
	             {"records_in", report.records_in},
	             {"records_used", report.records_used},
	             {"excluded_entities", report.excluded_entities},
	             {"diagnostics", ToJson(report.diagnostics)}};
}

json JsonExport::ToJson(const RankingReport &ranking) {
	auto entries = [](const std::vector<libsaberstat::ranking::RankedEntry> &list) {
		json out = json::array();
		for (const auto &e : list) {
			out.push_back(json {{"entity", e.entity_id}, {"value", Number(e.value)}, {"count", e.count}});
		}
		return out;
	};
	return json {{"name", ranking.name}, {"top", entries(ranking.top)}, {"bottom", entries(ranking.bottom)}};
}

json JsonExport::ToJson(const TemporalReport &temporal) {
	const auto &cmp = temporal.comparison;
	json changes = json::array();
	for (const auto &c : cmp.changes) {
		changes.push_back(json {{"entity", c.entity_id},
		                        {"start", Number(c.start_value)},
		                        {"end", Number(c.end_value)},
		                        {"change", Number(c.change)},
		                        {"change_pct", c.change_pct ? Number(*c.change_pct) : json(nullptr)},
		                        {"start_count", c.start_count},
		                        {"end_count", c.end_count}});
	}

	json yearly = json::array();
	for (const auto &y : temporal.yearly_means) {
		yearly.push_back(json {{"year", y.year}, {"mean", Number(y.mean)}, {"count", y.count}});
	}

	json projection {{"available", temporal.projection.available}};
	if (temporal.projection.available) {
		projection["slope"] = Number(temporal.projection.slope);
		projection["intercept"] = Number(temporal.projection.intercept);
		projection["r_squared"] = Number(temporal.projection.r_squared);
		json points = json::array();
		for (const auto &p : temporal.projection.projected) {
			points.push_back(json {{"year", p.first}, {"mean", Number(p.second)}});
		}
		projection["projected"] = points;
	} else {
		projection["unavailable_reason"] = temporal.projection.unavailable_reason;
	}

	return json {{"year_start", cmp.year_start},
	             {"year_end", cmp.year_end},
	             {"subject", cmp.subject},
	             {"mean_change", Number(cmp.MeanChange())},
	             {"only_in_start", cmp.only_in_start},
	             {"only_in_end", cmp.only_in_end},
	             {"changes", changes},
	             {"yearly_means", yearly},
	             {"projection", projection},
	             {"diagnostics", ToJson(cmp.diagnostics)}};
}

json JsonExport::ToJson(const AnalysisReport &report) {
	json levels = json::array();
	for (const auto &level : report.levels) {
		levels.push_back(ToJson(level));
	}

	json policy = json::array();
	for (const auto &indicator : report.policy_indicators) {
		policy.push_back(ToJson(indicator));
	}

	json rankings = json::array();
	for (const auto &ranking : report.rankings) {
		rankings.push_back(ToJson(ranking));
	}

	json out {{"records_analyzed", report.records_analyzed},
	          {"canonicalization", ToJson(report.canonicalization)},
	          {"levels", levels},
	          {"residuals", report.residuals ? ToJson(*report.residuals) : json(nullptr)},
	          {"kpis", ToJson(report.kpis)},
	          {"policy_indicators", policy},
	          {"rankings", rankings}};

	if (report.weakest_subject) {
		out["weakest_subject"] =
		    json {{"subject", report.weakest_subject->subject}, {"mean", Number(report.weakest_subject->mean)}};
	} else {
		out["weakest_subject"] = nullptr;
	}
	if (report.temporal) {
		out["temporal"] = ToJson(*report.temporal);
	}
	return out;
}

void JsonExport::WriteFile(const json &document, const std::string &path) {
	std::ofstream out(path);
	if (!out) {
		throw std::runtime_error("Cannot write output file '" + path + "'");
	}
	out << document.dump(2) << '\n';
	if (!out) {
		throw std::runtime_error("Failed writing output file '" + path + "'");
	}
}

} // namespace bridge
} // namespace saberstat
