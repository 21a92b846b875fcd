#pragma once

#include <stdexcept>
#include <string>
#include <vector>

namespace libsaberstat {
namespace core {

/**
 * Organizational level at which statistics are reported
 *
 * A level is only a name for a grouping-key set; the Aggregator and the
 * ResidualEngine take the key set itself so extra dimensions (grade, year)
 * can be appended without a separate code path per level.
 */
enum class EntityLevel { Student, School, Municipality, Department, National };

inline std::string EntityLevelName(EntityLevel level) {
	switch (level) {
	case EntityLevel::Student:
		return "student";
	case EntityLevel::School:
		return "school";
	case EntityLevel::Municipality:
		return "municipality";
	case EntityLevel::Department:
		return "department";
	case EntityLevel::National:
		return "national";
	default:
		return "unknown";
	}
}

/**
 * Parse a level name ("school", "municipality", ...)
 *
 * @throws std::invalid_argument for unknown names
 */
inline EntityLevel ParseEntityLevel(const std::string &name) {
	if (name == "student") {
		return EntityLevel::Student;
	} else if (name == "school") {
		return EntityLevel::School;
	} else if (name == "municipality") {
		return EntityLevel::Municipality;
	} else if (name == "department") {
		return EntityLevel::Department;
	} else if (name == "national") {
		return EntityLevel::National;
	}
	throw std::invalid_argument("Unknown entity level: '" + name +
	                            "'. Valid levels are: student, school, municipality, department, national");
}

/**
 * Default grouping keys for a level
 *
 * Municipality codes are only unique within a department in older files,
 * so the municipality level is keyed by (department, municipality).
 * National and student levels have no entity key.
 */
inline std::vector<std::string> LevelKeys(EntityLevel level) {
	switch (level) {
	case EntityLevel::School:
		return {"school_id"};
	case EntityLevel::Municipality:
		return {"department_id", "municipality_id"};
	case EntityLevel::Department:
		return {"department_id"};
	case EntityLevel::National:
	case EntityLevel::Student:
	default:
		return {};
	}
}

/// Level keys with extra dimensions appended (e.g. {"grade", "year"}), skipping duplicates
inline std::vector<std::string> LevelKeys(EntityLevel level, const std::vector<std::string> &extra_dimensions) {
	auto keys = LevelKeys(level);
	for (const auto &dim : extra_dimensions) {
		bool present = false;
		for (const auto &k : keys) {
			if (k == dim) {
				present = true;
				break;
			}
		}
		if (!present) {
			keys.push_back(dim);
		}
	}
	return keys;
}

} // namespace core
} // namespace libsaberstat
