#pragma once

#include "libsaberstat/canonical/column_vocabulary.hpp"
#include "libsaberstat/core/analysis_options.hpp"
#include "libsaberstat/core/diagnostic.hpp"
#include "libsaberstat/core/student_record.hpp"
#include "libsaberstat/utils/string_utils.hpp"
#include <cerrno>
#include <cmath>
#include <cstdlib>
#include <map>
#include <optional>
#include <set>
#include <stdexcept>
#include <string>
#include <vector>

namespace libsaberstat {
namespace canonical {

/**
 * One already-parsed tabular batch (a file, a sheet, a year)
 *
 * Empty cells are missing values. `source_year` is the year the ingestion
 * collaborator inferred from outside the table (e.g. the file name) and is
 * only used when no year or period column is present.
 */
struct RawBatch {
	std::string name;
	std::vector<std::string> columns;
	std::vector<std::vector<std::string>> rows;
	std::optional<int> source_year;
};

struct CanonicalizationReport {
	size_t batches = 0;
	size_t rows_in = 0;
	size_t rows_kept = 0;

	/// Rows dropped because a mandatory identifier was empty
	size_t dropped_missing_identifier = 0;

	/// Scores equal to a "not attempted" sentinel, converted to missing
	size_t sentinel_scores = 0;

	/// Non-numeric score cells, converted to missing
	size_t unparseable_scores = 0;

	/// Records whose year came from the period code or the batch hint
	size_t derived_years = 0;

	/// Year and grade cells outside the plausible range, treated as missing
	size_t out_of_range_years = 0;
	size_t out_of_range_grades = 0;

	std::vector<std::string> present_subjects;
	std::vector<std::string> absent_subjects;
	std::vector<std::string> present_categoricals;

	/// Source columns with no canonical field, per batch ("batch: column")
	std::vector<std::string> unmapped_columns;

	core::DiagnosticList diagnostics;
};

struct CanonicalTable {
	core::RecordSet records;
	CanonicalizationReport report;
};

/**
 * RecordCanonicalizer: heterogeneous batches to canonical StudentRecords
 *
 * Responsibilities:
 * - Resolve source columns case-insensitively through a ColumnVocabulary
 * - Derive year/semester from composite period codes (20241 -> 2024, 1)
 * - Drop rows lacking a mandatory identifier, counting them
 * - Convert sentinel and non-numeric scores to missing
 *
 * Columns absent from a batch simply leave the field missing on its rows;
 * only a mandatory identifier absent from every batch is fatal.
 */
class RecordCanonicalizer {
public:
	/// Plausible exam years and school grades; cells outside are treated as missing
	static constexpr int MIN_YEAR = 1900;
	static constexpr int MAX_YEAR = 2100;
	static constexpr int MIN_GRADE = 1;
	static constexpr int MAX_GRADE = 13;

	/**
	 * Canonicalize a set of batches into one record set
	 *
	 * @throws std::invalid_argument if a row's width differs from its batch's column list,
	 *         or if a mandatory identifier column is absent from every batch
	 */
	static CanonicalTable Canonicalize(const std::vector<RawBatch> &batches,
	                                   const core::CanonicalizationOptions &options = core::CanonicalizationOptions(),
	                                   const ColumnVocabulary &vocabulary = ColumnVocabulary::Default());

	/**
	 * Parse a numeric cell; accepts a decimal comma when no dot is present
	 *
	 * @return empty optional for empty or unparseable cells; `unparseable`
	 *         is set only for non-empty cells that are not finite numbers
	 */
	static std::optional<double> ParseNumber(const std::string &cell, bool &unparseable);

	/// Year part of a period code ("20241" -> 2024, "2019" -> 2019)
	static std::optional<int> YearFromPeriod(const std::string &period);

	/// Semester part of a period code ("20242" -> 2, "2019" -> 0)
	static int SemesterFromPeriod(const std::string &period);

private:
	/// Column index per canonical field for one batch
	static std::map<std::string, size_t> MapColumns(const RawBatch &batch, const ColumnVocabulary &vocabulary,
	                                                 CanonicalizationReport &report);

	static bool IsSentinel(double value, const std::vector<double> &sentinels);
};

// ============================================================================
// Implementation (header-only)
// ============================================================================

inline std::optional<double> RecordCanonicalizer::ParseNumber(const std::string &cell, bool &unparseable) {
	unparseable = false;
	std::string text = utils::Trim(cell);
	if (text.empty()) {
		return std::nullopt;
	}
	if (text.find('.') == std::string::npos) {
		auto comma = text.find(',');
		if (comma != std::string::npos && text.find(',', comma + 1) == std::string::npos) {
			text[comma] = '.';
		}
	}

	errno = 0;
	char *end = nullptr;
	double value = std::strtod(text.c_str(), &end);
	if (end == text.c_str() || *end != '\0' || errno == ERANGE || !std::isfinite(value)) {
		unparseable = true;
		return std::nullopt;
	}
	return value;
}

inline std::optional<int> RecordCanonicalizer::YearFromPeriod(const std::string &period) {
	std::string text = utils::Trim(period);
	// Periods exported as floats ("20241.0")
	auto dot = text.find('.');
	if (dot != std::string::npos) {
		text = text.substr(0, dot);
	}
	if (text.size() < 4) {
		return std::nullopt;
	}
	for (size_t i = 0; i < 4; i++) {
		if (!std::isdigit(static_cast<unsigned char>(text[i]))) {
			return std::nullopt;
		}
	}
	int year = std::stoi(text.substr(0, 4));
	if (year < MIN_YEAR || year > MAX_YEAR) {
		return std::nullopt;
	}
	return year;
}

inline int RecordCanonicalizer::SemesterFromPeriod(const std::string &period) {
	std::string text = utils::Trim(period);
	auto dot = text.find('.');
	if (dot != std::string::npos) {
		text = text.substr(0, dot);
	}
	if (text.size() == 5 && std::isdigit(static_cast<unsigned char>(text[4]))) {
		return text[4] - '0';
	}
	return 0;
}

inline bool RecordCanonicalizer::IsSentinel(double value, const std::vector<double> &sentinels) {
	for (double s : sentinels) {
		if (std::fabs(value - s) < 1e-12) {
			return true;
		}
	}
	return false;
}

inline std::map<std::string, size_t> RecordCanonicalizer::MapColumns(const RawBatch &batch,
                                                                     const ColumnVocabulary &vocabulary,
                                                                     CanonicalizationReport &report) {
	std::map<std::string, size_t> mapping;
	std::map<std::string, size_t> best_rank;
	const auto &fields = vocabulary.Fields();

	for (size_t col = 0; col < batch.columns.size(); col++) {
		auto resolved = vocabulary.Resolve(batch.columns[col]);
		if (!resolved) {
			report.unmapped_columns.push_back(batch.name + ": " + batch.columns[col]);
			continue;
		}
		const std::string &field = fields[resolved->field_index].name;
		auto it = best_rank.find(field);
		if (it == best_rank.end() || resolved->alias_rank < it->second) {
			best_rank[field] = resolved->alias_rank;
			mapping[field] = col;
		}
	}
	return mapping;
}

inline CanonicalTable RecordCanonicalizer::Canonicalize(const std::vector<RawBatch> &batches,
                                                        const core::CanonicalizationOptions &options,
                                                        const ColumnVocabulary &vocabulary) {
	options.Validate();

	CanonicalTable table;
	auto &report = table.report;
	report.batches = batches.size();

	// Column mapping per batch, and which fields any batch carries at all
	std::vector<std::map<std::string, size_t>> mappings;
	std::set<std::string> seen_fields;
	for (const auto &batch : batches) {
		mappings.push_back(MapColumns(batch, vocabulary, report));
		for (const auto &entry : mappings.back()) {
			seen_fields.insert(entry.first);
		}
	}

	for (const auto &field : options.mandatory_fields) {
		const CanonicalField *def = vocabulary.Find(field);
		if (def == nullptr) {
			throw std::invalid_argument("Mandatory field '" + field + "' is not part of the column vocabulary");
		}
		if (def->kind != FieldKind::Derived && seen_fields.count(field) == 0) {
			std::string aliases;
			for (size_t i = 0; i < def->aliases.size(); i++) {
				aliases += (i > 0 ? ", " : "") + def->aliases[i];
			}
			throw std::invalid_argument("Mandatory identifier '" + field +
			                            "' is absent from every batch (expected one of: " + aliases + ")");
		}
	}

	for (const auto &field : vocabulary.Fields()) {
		if (field.kind == FieldKind::Subject) {
			if (seen_fields.count(field.name) > 0) {
				report.present_subjects.push_back(field.name);
			} else {
				report.absent_subjects.push_back(field.name);
				report.diagnostics.emplace_back(core::DiagnosticKind::MissingField, field.name, 0,
				                                "subject column absent from every batch");
			}
		} else if (field.kind == FieldKind::Categorical && seen_fields.count(field.name) > 0) {
			report.present_categoricals.push_back(field.name);
		}
	}

	std::map<std::string, size_t> dropped_by_field;

	for (size_t b = 0; b < batches.size(); b++) {
		const auto &batch = batches[b];
		const auto &mapping = mappings[b];

		auto cell = [&mapping](const std::vector<std::string> &row, const std::string &field) -> std::string {
			auto it = mapping.find(field);
			if (it == mapping.end()) {
				return std::string();
			}
			return utils::Trim(row[it->second]);
		};

		for (size_t r = 0; r < batch.rows.size(); r++) {
			const auto &row = batch.rows[r];
			report.rows_in++;

			if (row.size() != batch.columns.size()) {
				throw std::invalid_argument("Batch '" + batch.name + "' row " + std::to_string(r) + " has " +
				                            std::to_string(row.size()) + " cells but " +
				                            std::to_string(batch.columns.size()) + " columns");
			}

			core::StudentRecord record;

			for (const auto &field : vocabulary.Fields()) {
				if (mapping.find(field.name) == mapping.end()) {
					continue;
				}
				std::string value = cell(row, field.name);

				if (field.kind == FieldKind::Subject) {
					bool unparseable = false;
					auto score = ParseNumber(value, unparseable);
					if (unparseable) {
						report.unparseable_scores++;
					} else if (score && IsSentinel(*score, options.score_sentinels)) {
						report.sentinel_scores++;
					} else if (score) {
						record.scores[field.name] = *score;
					}
				} else if (field.kind == FieldKind::Categorical) {
					if (!value.empty()) {
						record.attributes[field.name] = options.uppercase_categoricals ? utils::ToUpper(value) : value;
					}
				} else if (field.kind == FieldKind::Identifier) {
					if (!value.empty()) {
						record.attributes[field.name] = value;
					}
				}
			}

			// Derived fields
			std::string record_id = cell(row, "record_id");
			record.record_id = record_id.empty() ? batch.name + "#" + std::to_string(r) : record_id;

			std::string period = cell(row, "period");
			std::string year_text = cell(row, "year");
			bool unparseable = false;
			auto year_value = ParseNumber(year_text, unparseable);
			if (year_value && (*year_value < MIN_YEAR || *year_value > MAX_YEAR)) {
				report.out_of_range_years++;
				year_value.reset();
			}
			if (year_value) {
				record.year = static_cast<int>(*year_value);
			} else if (auto from_period = YearFromPeriod(period)) {
				record.year = *from_period;
				report.derived_years++;
			} else if (batch.source_year) {
				record.year = *batch.source_year;
				report.derived_years++;
			}
			if (!period.empty()) {
				record.period = SemesterFromPeriod(period);
			}

			auto grade_value = ParseNumber(cell(row, "grade"), unparseable);
			if (grade_value && (*grade_value < MIN_GRADE || *grade_value > MAX_GRADE)) {
				report.out_of_range_grades++;
				grade_value.reset();
			}
			record.grade = grade_value ? static_cast<int>(*grade_value) : options.default_grade;

			bool keep = true;
			for (const auto &field : options.mandatory_fields) {
				if (!record.Field(field)) {
					dropped_by_field[field]++;
					keep = false;
					break;
				}
			}
			if (!keep) {
				report.dropped_missing_identifier++;
				continue;
			}

			table.records.push_back(std::move(record));
		}
	}

	for (const auto &entry : dropped_by_field) {
		report.diagnostics.emplace_back(core::DiagnosticKind::MissingField, entry.first, entry.second,
		                                "records dropped for missing mandatory identifier");
	}
	if (report.sentinel_scores > 0) {
		report.diagnostics.emplace_back(core::DiagnosticKind::MissingField, "scores", report.sentinel_scores,
		                                "sentinel scores converted to missing");
	}
	if (report.unparseable_scores > 0) {
		report.diagnostics.emplace_back(core::DiagnosticKind::MissingField, "scores", report.unparseable_scores,
		                                "non-numeric scores converted to missing");
	}

	if (report.out_of_range_years > 0) {
		report.diagnostics.emplace_back(core::DiagnosticKind::MissingField, "year", report.out_of_range_years,
		                                "out-of-range years replaced by the period or batch year");
	}
	if (report.out_of_range_grades > 0) {
		report.diagnostics.emplace_back(core::DiagnosticKind::MissingField, "grade", report.out_of_range_grades,
		                                "out-of-range grades replaced by the default grade");
	}

	report.rows_kept = table.records.size();
	return table;
}

} // namespace canonical
} // namespace libsaberstat
