#pragma once

#include "libsaberstat/canonical/record_canonicalizer.hpp"
#include <nlohmann/json.hpp>
#include <string>
#include <vector>

namespace saberstat {
namespace bridge {

/**
 * JsonBatchReader: already-parsed tables encoded as JSON to RawBatch
 *
 * Expected document:
 *   {"batches": [{"name": "saber11_2023", "source_year": 2023,
 *                 "columns": ["COLE_COD_DANE_ESTABLECIMIENTO", "PUNT_GLOBAL"],
 *                 "rows": [["111001000001", 250], ["111001000002", null]]}]}
 *
 * Cells may be strings, numbers, booleans or null (null becomes an empty,
 * i.e. missing, cell). "name" and "source_year" are optional.
 */
class JsonBatchReader {
public:
	/**
	 * @throws std::invalid_argument if the document does not have the expected shape
	 */
	static std::vector<libsaberstat::canonical::RawBatch> ReadBatches(const nlohmann::json &document);

	/// @throws std::invalid_argument if the file cannot be read or parsed
	static std::vector<libsaberstat::canonical::RawBatch> ReadFile(const std::string &path);

	/// Text form of one cell
	static std::string CellToString(const nlohmann::json &cell, const std::string &where);
};

} // namespace bridge
} // namespace saberstat
