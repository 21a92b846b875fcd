#pragma once

#include "../utils/options_parser.hpp"
#include "libsaberstat/aggregation/aggregator.hpp"
#include "libsaberstat/aggregation/normalizer.hpp"
#include "libsaberstat/canonical/record_canonicalizer.hpp"
#include "libsaberstat/core/entity_level.hpp"
#include "libsaberstat/core/student_record.hpp"
#include "libsaberstat/kpi/kpi_engine.hpp"
#include "libsaberstat/kpi/policy_indicators.hpp"
#include "libsaberstat/ranking/ranking.hpp"
#include "libsaberstat/residuals/residual_engine.hpp"
#include "libsaberstat/temporal/change_analysis.hpp"
#include <memory>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace saberstat {

/**
 * Options plus the immutable canonical record set of one run
 *
 * Passed explicitly to every stage; stages never reach for global state.
 * Copies share the record set.
 */
class AnalysisContext {
public:
	AnalysisContext(AnalysisOptions options, libsaberstat::core::RecordSet records)
	    : options_(std::move(options)),
	      records_(std::make_shared<const libsaberstat::core::RecordSet>(std::move(records))) {
	}

	const AnalysisOptions &Options() const {
		return options_;
	}

	const libsaberstat::core::RecordSet &Records() const {
		return *records_;
	}

private:
	AnalysisOptions options_;
	std::shared_ptr<const libsaberstat::core::RecordSet> records_;
};

struct LevelReport {
	libsaberstat::core::EntityLevel level = libsaberstat::core::EntityLevel::School;
	libsaberstat::aggregation::AggregationResult aggregation;
	libsaberstat::aggregation::NormalizationResult normalization;
};

struct RankingReport {
	std::string name;
	std::vector<libsaberstat::ranking::RankedEntry> top;
	std::vector<libsaberstat::ranking::RankedEntry> bottom;
};

struct TemporalReport {
	libsaberstat::temporal::YearComparison comparison;
	std::vector<libsaberstat::temporal::YearlyMean> yearly_means;
	libsaberstat::temporal::TrendProjection projection;
};

struct AnalysisReport {
	libsaberstat::canonical::CanonicalizationReport canonicalization;

	/// Records left after the configured filters
	size_t records_analyzed = 0;

	std::vector<LevelReport> levels;

	/// Absent when residual fits are disabled
	std::optional<libsaberstat::residuals::ResidualRun> residuals;

	libsaberstat::kpi::KpiReport kpis;

	std::vector<libsaberstat::core::KpiResult> policy_indicators;
	std::optional<libsaberstat::kpi::WeakestSubject> weakest_subject;

	std::vector<RankingReport> rankings;

	std::optional<TemporalReport> temporal;

	/// Diagnostics over every stage
	size_t DiagnosticCount() const;
};

/**
 * AnalysisPipeline: canonicalize, filter, then run every configured stage
 *
 * Stage order: levels (aggregate + normalize), residual fit, equity KPIs,
 * policy indicators, rankings, temporal comparison. Each library
 * diagnostic is logged at WARN; invalid configuration and malformed input
 * propagate as std::invalid_argument.
 */
class AnalysisPipeline {
public:
	/// Canonicalize the batches and apply the configured filters
	static AnalysisContext Prepare(const std::vector<libsaberstat::canonical::RawBatch> &batches,
	                               const AnalysisOptions &options,
	                               libsaberstat::canonical::CanonicalizationReport &report);

	static AnalysisReport Run(const AnalysisContext &context);

	/// Prepare() followed by Run()
	static AnalysisReport Execute(const std::vector<libsaberstat::canonical::RawBatch> &batches,
	                              const AnalysisOptions &options);

	static LevelReport RunLevel(const AnalysisContext &context, libsaberstat::core::EntityLevel level);

	static std::optional<TemporalReport> RunTemporal(const AnalysisContext &context);

	static std::vector<RankingReport> BuildRankings(const AnalysisContext &context, const AnalysisReport &report);

	static void LogDiagnostics(const std::string &stage, const libsaberstat::core::DiagnosticList &diagnostics);
};

} // namespace saberstat
