#include "bridge/json_batch_reader.hpp"
#include "bridge/json_export.hpp"
#include "pipeline/analysis_pipeline.hpp"
#include "utils/options_parser.hpp"
#include "utils/tracing.hpp"
#include <exception>
#include <iostream>
#include <string>

namespace {

void PrintUsage(const char *program) {
	std::cerr << "Usage: " << program << " <config.json> <batches.json> [output.json]\n"
	          << "\n"
	          << "Runs the aggregation, normalization, value-added and equity indicator\n"
	          << "analysis over already-parsed exam batches. Results are written as JSON\n"
	          << "to output.json, or to stdout when no output path is given.\n"
	          << "\n"
	          << "Environment: SABERSTAT_LOG_LEVEL=trace|debug|info|warn|error|none\n";
}

} // namespace

int main(int argc, char **argv) {
	if (argc < 3 || argc > 4) {
		PrintUsage(argv[0]);
		return 2;
	}
	const std::string config_path = argv[1];
	const std::string batches_path = argv[2];
	const std::string output_path = argc == 4 ? argv[3] : "";

	saberstat::Tracer::Initialize();
	try {
		auto options = saberstat::AnalysisOptions::LoadFromFile(config_path);
		if (!options.log_level.empty()) {
			saberstat::Tracer::SetLogLevel(saberstat::Tracer::ParseLevel(options.log_level));
		}

		auto batches = saberstat::bridge::JsonBatchReader::ReadFile(batches_path);
		SABERSTAT_INFO("Loaded " << batches.size() << " batches from " << batches_path);

		auto report = saberstat::AnalysisPipeline::Execute(batches, options);
		auto document = saberstat::bridge::JsonExport::ToJson(report);

		if (output_path.empty()) {
			std::cout << document.dump(2) << '\n';
		} else {
			saberstat::bridge::JsonExport::WriteFile(document, output_path);
			SABERSTAT_INFO("Wrote results to " << output_path);
		}
	} catch (const std::invalid_argument &e) {
		SABERSTAT_ERROR("Invalid input: " << e.what());
		return 1;
	} catch (const std::exception &e) {
		SABERSTAT_ERROR(e.what());
		return 1;
	}
	return 0;
}
