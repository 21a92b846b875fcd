#pragma once

#include "libsaberstat/core/student_record.hpp"
#include "libsaberstat/utils/string_utils.hpp"
#include <string>
#include <utility>
#include <vector>

namespace libsaberstat {
namespace canonical {

/**
 * Conjunction of field equality predicates over canonical records
 *
 * Produces the "filtered record sets" that indicators and residual fits
 * run on (e.g. only OFICIAL schools, only RURAL area, only year 2023).
 * Values compare case-insensitively; a record lacking a filtered field
 * never matches. An empty filter matches everything.
 */
class RecordFilter {
public:
	RecordFilter &Where(const std::string &field, const std::string &value) {
		predicates_.emplace_back(field, value);
		return *this;
	}

	RecordFilter &Year(int year) {
		return Where("year", std::to_string(year));
	}

	RecordFilter &Grade(int grade) {
		return Where("grade", std::to_string(grade));
	}

	bool Empty() const {
		return predicates_.empty();
	}

	const std::vector<std::pair<std::string, std::string>> &Predicates() const {
		return predicates_;
	}

	bool Matches(const core::StudentRecord &record) const {
		for (const auto &predicate : predicates_) {
			auto value = record.Field(predicate.first);
			if (!value || !utils::EqualsIgnoreCase(*value, predicate.second)) {
				return false;
			}
		}
		return true;
	}

	/// New record set with the matching records, in input order
	core::RecordSet Apply(const core::RecordSet &records) const {
		core::RecordSet out;
		for (const auto &record : records) {
			if (Matches(record)) {
				out.push_back(record);
			}
		}
		return out;
	}

private:
	std::vector<std::pair<std::string, std::string>> predicates_;
};

} // namespace canonical
} // namespace libsaberstat
