#include "json_batch_reader.hpp"
#include "../utils/tracing.hpp"
#include "../utils/validation.hpp"
#include <fstream>
#include <stdexcept>

namespace saberstat {
namespace bridge {

using libsaberstat::canonical::RawBatch;
using nlohmann::json;

std::string JsonBatchReader::CellToString(const json &cell, const std::string &where) {
	switch (cell.type()) {
	case json::value_t::null:
		return "";
	case json::value_t::string:
		return cell.get<std::string>();
	case json::value_t::boolean:
		return cell.get<bool>() ? "true" : "false";
	case json::value_t::number_integer:
		return std::to_string(cell.get<long long>());
	case json::value_t::number_unsigned:
		return std::to_string(cell.get<unsigned long long>());
	case json::value_t::number_float:
		return cell.dump();
	default:
		throw std::invalid_argument(where + ": cells must be strings, numbers, booleans or null (got " +
		                            std::string(cell.type_name()) + ")");
	}
}

std::vector<RawBatch> JsonBatchReader::ReadBatches(const json &document) {
	const auto &batches = ValidationUtils::RequireKey(document, "batches", "batch document");
	ValidationUtils::RequireArray(batches, "batches");

	std::vector<RawBatch> out;
	out.reserve(batches.size());
	for (size_t b = 0; b < batches.size(); b++) {
		const auto &entry = batches[b];
		const std::string where = "batches[" + std::to_string(b) + "]";
		ValidationUtils::RequireObject(entry, where);

		RawBatch batch;
		batch.name = where;
		for (const auto &item : entry.items()) {
			const auto &key = item.key();
			const auto &value = item.value();
			if (key == "name") {
				batch.name = ValidationUtils::GetString(value, where + ".name");
			} else if (key == "source_year") {
				if (!value.is_null()) {
					batch.source_year = ValidationUtils::GetInt(value, where + ".source_year");
				}
			} else if (key == "columns") {
				batch.columns = ValidationUtils::GetStringList(value, where + ".columns");
			} else if (key == "rows") {
				ValidationUtils::RequireArray(value, where + ".rows");
				batch.rows.reserve(value.size());
				for (size_t r = 0; r < value.size(); r++) {
					const std::string row_where = where + ".rows[" + std::to_string(r) + "]";
					ValidationUtils::RequireArray(value[r], row_where);
					std::vector<std::string> row;
					row.reserve(value[r].size());
					for (const auto &cell : value[r]) {
						row.push_back(CellToString(cell, row_where));
					}
					batch.rows.push_back(std::move(row));
				}
			} else {
				throw std::invalid_argument("Unknown key '" + key + "' in " + where +
				                            ". Valid keys are: name, source_year, columns, rows");
			}
		}
		if (batch.columns.empty()) {
			throw std::invalid_argument(where + " has no columns");
		}
		ValidationUtils::ValidateUniqueNames(batch.columns, "column in " + batch.name);

		SABERSTAT_DEBUG("Read batch '" << batch.name << "': " << batch.columns.size() << " columns, "
		                               << batch.rows.size() << " rows");
		out.push_back(std::move(batch));
	}
	return out;
}

std::vector<RawBatch> JsonBatchReader::ReadFile(const std::string &path) {
	std::ifstream in(path);
	if (!in) {
		throw std::invalid_argument("Cannot open batch file '" + path + "'");
	}
	json document;
	try {
		in >> document;
	} catch (const json::parse_error &e) {
		throw std::invalid_argument("Malformed batch file '" + path + "': " + e.what());
	}
	return ReadBatches(document);
}

} // namespace bridge
} // namespace saberstat
