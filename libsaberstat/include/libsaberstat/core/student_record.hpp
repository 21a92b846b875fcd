#pragma once

#include <map>
#include <optional>
#include <string>
#include <vector>

namespace libsaberstat {
namespace core {

/**
 * One exam sitting in canonical form
 *
 * Produced by the RecordCanonicalizer and never modified afterwards.
 * All downstream stages (aggregation, residual fits, KPIs) read records
 * through Field() and Score() so that derived fields (year, grade, period)
 * can be used as grouping keys exactly like categorical attributes.
 *
 * Design notes:
 * - A missing score is an absent key in `scores`, never NaN or a sentinel
 * - Categorical values are stored already trimmed (and upper-cased by default)
 * - year/period/grade use 0 for "unknown"
 */
struct StudentRecord {
	/// Source record identifier (ESTU_CONSECUTIVO or "<batch>#<row>")
	std::string record_id;

	/// Identifier and categorical fields keyed by canonical field name
	std::map<std::string, std::string> attributes;

	/// Subject scores keyed by canonical subject name
	std::map<std::string, double> scores;

	/// Exam year (0 = unknown)
	int year = 0;

	/// Exam semester within the year, from the period code (0 = unknown)
	int period = 0;

	/// School grade of the sitting (0 = unknown)
	int grade = 0;

	/// Look up a field by canonical name; year/grade/period are rendered as strings
	std::optional<std::string> Field(const std::string &name) const {
		if (name == "year") {
			return year > 0 ? std::optional<std::string>(std::to_string(year)) : std::nullopt;
		}
		if (name == "grade") {
			return grade > 0 ? std::optional<std::string>(std::to_string(grade)) : std::nullopt;
		}
		if (name == "period") {
			return (year > 0 && period > 0) ? std::optional<std::string>(std::to_string(year * 10 + period))
			                                : std::nullopt;
		}
		auto it = attributes.find(name);
		if (it == attributes.end() || it->second.empty()) {
			return std::nullopt;
		}
		return it->second;
	}

	std::optional<double> Score(const std::string &subject) const {
		auto it = scores.find(subject);
		if (it == scores.end()) {
			return std::nullopt;
		}
		return it->second;
	}

	bool HasScore(const std::string &subject) const {
		return scores.find(subject) != scores.end();
	}
};

using RecordSet = std::vector<StudentRecord>;

/**
 * Build the tuple of field values for the given keys
 *
 * @return false if any key is missing on the record (key is left partially filled)
 */
inline bool ExtractKey(const StudentRecord &record, const std::vector<std::string> &keys,
                       std::vector<std::string> &out) {
	out.clear();
	out.reserve(keys.size());
	for (const auto &key : keys) {
		auto value = record.Field(key);
		if (!value) {
			return false;
		}
		out.push_back(*value);
	}
	return true;
}

/// Join a key tuple into a single display id ("11001|Bogota")
inline std::string JoinKey(const std::vector<std::string> &key, char sep = '|') {
	std::string joined;
	for (size_t i = 0; i < key.size(); i++) {
		if (i > 0) {
			joined += sep;
		}
		joined += key[i];
	}
	return joined;
}

} // namespace core
} // namespace libsaberstat
