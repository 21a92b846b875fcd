#pragma once

#include "../pipeline/analysis_pipeline.hpp"
#include <nlohmann/json.hpp>
#include <string>

namespace saberstat {
namespace bridge {

/**
 * JsonExport: analysis results to JSON documents
 *
 * Non-finite numbers are written as null. Group keys are written as
 * arrays in the order of the level's key fields, which are listed once
 * per level under "group_keys".
 */
class JsonExport {
public:
	static nlohmann::json ToJson(const AnalysisReport &report);

	static nlohmann::json ToJson(const libsaberstat::core::Diagnostic &diagnostic);
	static nlohmann::json ToJson(const libsaberstat::core::DiagnosticList &diagnostics);
	static nlohmann::json ToJson(const libsaberstat::canonical::CanonicalizationReport &report);
	static nlohmann::json ToJson(const LevelReport &level);
	static nlohmann::json ToJson(const libsaberstat::residuals::ResidualRun &run);
	static nlohmann::json ToJson(const libsaberstat::core::KpiResult &kpi);
	static nlohmann::json ToJson(const libsaberstat::kpi::KpiReport &report);
	static nlohmann::json ToJson(const RankingReport &ranking);
	static nlohmann::json ToJson(const TemporalReport &temporal);

	/// @throws std::runtime_error if the file cannot be written
	static void WriteFile(const nlohmann::json &document, const std::string &path);

private:
	static nlohmann::json Number(double value);
};

} // namespace bridge
} // namespace saberstat
