#include "analysis_pipeline.hpp"
#include "../utils/tracing.hpp"
#include "libsaberstat/canonical/record_filter.hpp"

namespace saberstat {

using libsaberstat::aggregation::Aggregator;
using libsaberstat::aggregation::Normalizer;
using libsaberstat::canonical::RawBatch;
using libsaberstat::canonical::RecordCanonicalizer;
using libsaberstat::canonical::RecordFilter;
using libsaberstat::core::EntityLevel;
using libsaberstat::core::EntityLevelName;
using libsaberstat::kpi::KpiEngine;
using libsaberstat::kpi::PolicyIndicators;
using libsaberstat::ranking::Ranking;
using libsaberstat::residuals::ResidualEngine;
using libsaberstat::temporal::ChangeAnalysis;

size_t AnalysisReport::DiagnosticCount() const {
	size_t n = canonicalization.diagnostics.size() + kpis.diagnostics.size();
	for (const auto &level : levels) {
		n += level.aggregation.diagnostics.size() + level.normalization.diagnostics.size();
	}
	if (residuals) {
		n += residuals->diagnostics.size();
	}
	if (temporal) {
		n += temporal->comparison.diagnostics.size();
	}
	return n;
}

void AnalysisPipeline::LogDiagnostics(const std::string &stage, const libsaberstat::core::DiagnosticList &diagnostics) {
	for (const auto &d : diagnostics) {
		SABERSTAT_WARN(stage << ": [" << libsaberstat::core::DiagnosticKindName(d.kind) << "] " << d.scope << " ("
		                     << d.count << "): " << d.message);
	}
}

AnalysisContext AnalysisPipeline::Prepare(const std::vector<RawBatch> &batches, const AnalysisOptions &options,
                                          libsaberstat::canonical::CanonicalizationReport &report) {
	options.Validate();

	SABERSTAT_TIMING_START();
	auto table = RecordCanonicalizer::Canonicalize(batches, options.canonicalization);
	SABERSTAT_TIMING_END("canonicalization");

	report = table.report;
	LogDiagnostics("canonicalization", report.diagnostics);
	SABERSTAT_INFO("Canonicalized " << report.rows_kept << " of " << report.rows_in << " rows from "
	                                << report.batches << " batches");

	if (options.filters.empty()) {
		return AnalysisContext(options, std::move(table.records));
	}

	RecordFilter filter;
	for (const auto &predicate : options.filters) {
		filter.Where(predicate.first, predicate.second);
	}
	auto filtered = filter.Apply(table.records);
	SABERSTAT_INFO("Filters kept " << filtered.size() << " of " << table.records.size() << " records");
	if (filtered.empty()) {
		SABERSTAT_WARN("No records match the configured filters");
	}
	return AnalysisContext(options, std::move(filtered));
}

LevelReport AnalysisPipeline::RunLevel(const AnalysisContext &context, EntityLevel level) {
	const auto &options = context.Options();
	const std::string name = EntityLevelName(level);

	LevelReport report;
	report.level = level;
	report.aggregation = Aggregator::AggregateLevel(context.Records(), level, options.subjects,
	                                                options.extra_dimensions, options.aggregation);
	report.normalization = Normalizer::Normalize(report.aggregation.rows, options.NormalizationFor(level));

	LogDiagnostics(name + " aggregation", report.aggregation.diagnostics);
	LogDiagnostics(name + " normalization", report.normalization.diagnostics);
	SABERSTAT_DEBUG(name << ": " << report.aggregation.GroupCount() << " groups, "
	                     << report.normalization.ClippedCount() << " clipped values");
	return report;
}

std::optional<TemporalReport> AnalysisPipeline::RunTemporal(const AnalysisContext &context) {
	const auto &spec = context.Options().temporal;
	if (!spec) {
		return std::nullopt;
	}

	TemporalReport report;
	report.comparison =
	    ChangeAnalysis::CompareYears(context.Records(), libsaberstat::core::LevelKeys(spec->level), spec->subject,
	                                 spec->year_start, spec->year_end, context.Options().aggregation);
	report.yearly_means = ChangeAnalysis::YearlyMeans(context.Records(), spec->subject);
	report.projection = ChangeAnalysis::ProjectTrend(report.yearly_means, spec->horizon);

	LogDiagnostics("temporal", report.comparison.diagnostics);
	if (!report.projection.available) {
		SABERSTAT_INFO("Trend projection unavailable: " << report.projection.unavailable_reason);
	}
	SABERSTAT_INFO("Compared " << report.comparison.changes.size() << " entities between " << spec->year_start
	                           << " and " << spec->year_end);
	return report;
}

std::vector<RankingReport> AnalysisPipeline::BuildRankings(const AnalysisContext &context,
                                                           const AnalysisReport &report) {
	const auto &options = context.Options();
	const size_t n = options.ranking.top_n;
	std::vector<RankingReport> out;

	auto add = [&](const std::string &name, const std::vector<libsaberstat::ranking::RankedEntry> &entries) {
		if (entries.empty()) {
			return;
		}
		out.push_back(RankingReport {name, Ranking::TopN(entries, n), Ranking::BottomN(entries, n)});
	};

	if (report.residuals && report.residuals->ok()) {
		add("value_added", Ranking::FromResiduals(report.residuals->results));
	}
	for (const auto &level : report.levels) {
		add(EntityLevelName(level.level) + "_standardized",
		    Ranking::FromNormalized(level.normalization.measures, options.ranking_subject));
	}
	if (report.temporal) {
		add("score_change", ChangeAnalysis::ToRanked(report.temporal->comparison.changes));
	}
	return out;
}

AnalysisReport AnalysisPipeline::Run(const AnalysisContext &context) {
	const auto &options = context.Options();
	const auto &records = context.Records();

	AnalysisReport report;
	report.records_analyzed = records.size();

	{
		SABERSTAT_TIMING_START();
		for (auto level : options.levels) {
			report.levels.push_back(RunLevel(context, level));
		}
		SABERSTAT_TIMING_END("aggregation and normalization");
	}

	if (options.residuals.enabled) {
		SABERSTAT_TIMING_START();
		report.residuals = ResidualEngine::FitResiduals(records, options.residuals.target, options.residuals.features,
		                                                options.residuals.level, options.residuals.options);
		SABERSTAT_TIMING_END("residual fit");

		const auto &run = *report.residuals;
		LogDiagnostics("residuals", run.diagnostics);
		if (run.ok()) {
			SABERSTAT_INFO("Residual fit (" << run.model_type << ") on " << run.records_used << " records: R2="
			                                << run.holdout.r_squared << " RMSE=" << run.holdout.rmse);
		}
	}

	{
		SABERSTAT_TIMING_START();
		report.kpis = KpiEngine::ComputeAll(records, options.kpi);
		report.policy_indicators = PolicyIndicators::ComputeAll(
		    records, options.policy, report.residuals ? &*report.residuals : nullptr);
		report.weakest_subject = PolicyIndicators::FindWeakestSubject(records, options.policy);
		SABERSTAT_TIMING_END("indicators");
	}
	LogDiagnostics("kpi", report.kpis.diagnostics);
	for (const auto &indicator : report.policy_indicators) {
		if (!indicator.available()) {
			SABERSTAT_INFO(indicator.key << " unavailable: " << indicator.unavailable_reason);
		}
	}

	report.temporal = RunTemporal(context);
	report.rankings = BuildRankings(context, report);

	SABERSTAT_INFO("Analysis finished with " << report.DiagnosticCount() << " diagnostics");
	return report;
}

AnalysisReport AnalysisPipeline::Execute(const std::vector<RawBatch> &batches, const AnalysisOptions &options) {
	libsaberstat::canonical::CanonicalizationReport canonicalization;
	auto context = Prepare(batches, options, canonicalization);
	auto report = Run(context);
	report.canonicalization = std::move(canonicalization);
	return report;
}

} // namespace saberstat
