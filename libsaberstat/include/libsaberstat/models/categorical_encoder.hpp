#pragma once

#include "libsaberstat/core/student_record.hpp"
#include <cstdint>
#include <map>
#include <optional>
#include <set>
#include <stdexcept>
#include <string>
#include <vector>

namespace libsaberstat {
namespace models {

/**
 * CategoricalEncoder: explicit, immutable categorical-to-numeric mapping
 *
 * Fitted once on the records of a model fit and then carried with that
 * fit, so every prediction derived from the fit uses the same mapping.
 *
 * Two encodings are available from the same fitted classes:
 * - Label codes: classes sorted lexicographically, code = rank (tree models)
 * - One-hot dummies: one column per class except the first (linear models)
 *
 * Values not seen at fit time are reported as unknown, never given a new
 * code.
 */
class CategoricalEncoder {
public:
	CategoricalEncoder() = default;

	/**
	 * Collect the classes of each feature from the records
	 *
	 * Records lacking a feature contribute nothing for that feature.
	 *
	 * @throws std::invalid_argument if features is empty or a feature has no values
	 */
	static CategoricalEncoder Fit(const core::RecordSet &records, const std::vector<std::string> &features);

	const std::vector<std::string> &Features() const {
		return features_;
	}

	const std::vector<std::string> &Classes(size_t feature) const {
		return classes_.at(feature);
	}

	/// Label code of a value, empty if the value was not seen at fit time
	std::optional<size_t> Code(size_t feature, const std::string &value) const;

	/**
	 * Label-encode one record
	 *
	 * @param out Filled with one code per feature
	 * @param failed_feature Set to the first feature that is missing or unknown
	 * @return false if a feature is missing or holds an unseen value
	 */
	bool EncodeLabels(const core::StudentRecord &record, std::vector<double> &out,
	                  std::string *failed_feature = nullptr) const;

	/// Width of the one-hot design (sum over features of classes - 1)
	size_t OneHotWidth() const;

	/// Column names of the one-hot design ("feature=CLASS")
	std::vector<std::string> OneHotNames() const;

	/// One-hot encode one record; false if a feature is missing or unknown
	bool EncodeOneHot(const core::StudentRecord &record, std::vector<double> &out) const;

	/// Hash of features and classes; equal fingerprints mean interchangeable encodings
	uint64_t Fingerprint() const {
		return fingerprint_;
	}

	bool IsFitted() const {
		return !features_.empty();
	}

private:
	std::vector<std::string> features_;
	std::vector<std::vector<std::string>> classes_;
	std::vector<std::map<std::string, size_t>> codes_;
	uint64_t fingerprint_ = 0;
};

// ============================================================================
// Implementation (header-only)
// ============================================================================

inline CategoricalEncoder CategoricalEncoder::Fit(const core::RecordSet &records,
                                                  const std::vector<std::string> &features) {
	if (features.empty()) {
		throw std::invalid_argument("CategoricalEncoder: at least one feature is required");
	}

	CategoricalEncoder encoder;
	encoder.features_ = features;

	// FNV-1a over feature names and sorted classes
	uint64_t hash = 1469598103934665603ULL;
	auto mix = [&hash](const std::string &s) {
		for (unsigned char c : s) {
			hash ^= c;
			hash *= 1099511628211ULL;
		}
		hash ^= 0xFF;
		hash *= 1099511628211ULL;
	};

	for (const auto &feature : features) {
		std::set<std::string> values;
		for (const auto &record : records) {
			auto value = record.Field(feature);
			if (value) {
				values.insert(*value);
			}
		}
		if (values.empty()) {
			throw std::invalid_argument("CategoricalEncoder: feature '" + feature + "' has no values");
		}

		std::vector<std::string> classes(values.begin(), values.end());
		std::map<std::string, size_t> codes;
		mix(feature);
		for (size_t i = 0; i < classes.size(); i++) {
			codes[classes[i]] = i;
			mix(classes[i]);
		}
		encoder.classes_.push_back(std::move(classes));
		encoder.codes_.push_back(std::move(codes));
	}
	encoder.fingerprint_ = hash;
	return encoder;
}

inline std::optional<size_t> CategoricalEncoder::Code(size_t feature, const std::string &value) const {
	const auto &codes = codes_.at(feature);
	auto it = codes.find(value);
	if (it == codes.end()) {
		return std::nullopt;
	}
	return it->second;
}

inline bool CategoricalEncoder::EncodeLabels(const core::StudentRecord &record, std::vector<double> &out,
                                             std::string *failed_feature) const {
	out.assign(features_.size(), 0.0);
	for (size_t f = 0; f < features_.size(); f++) {
		auto value = record.Field(features_[f]);
		auto code = value ? Code(f, *value) : std::nullopt;
		if (!code) {
			if (failed_feature != nullptr) {
				*failed_feature = features_[f];
			}
			return false;
		}
		out[f] = static_cast<double>(*code);
	}
	return true;
}

inline size_t CategoricalEncoder::OneHotWidth() const {
	size_t width = 0;
	for (const auto &classes : classes_) {
		width += classes.size() - 1;
	}
	return width;
}

inline std::vector<std::string> CategoricalEncoder::OneHotNames() const {
	std::vector<std::string> names;
	for (size_t f = 0; f < features_.size(); f++) {
		for (size_t c = 1; c < classes_[f].size(); c++) {
			names.push_back(features_[f] + "=" + classes_[f][c]);
		}
	}
	return names;
}

inline bool CategoricalEncoder::EncodeOneHot(const core::StudentRecord &record, std::vector<double> &out) const {
	out.assign(OneHotWidth(), 0.0);
	size_t offset = 0;
	for (size_t f = 0; f < features_.size(); f++) {
		auto value = record.Field(features_[f]);
		auto code = value ? Code(f, *value) : std::nullopt;
		if (!code) {
			return false;
		}
		// First class is the reference level
		if (*code > 0) {
			out[offset + *code - 1] = 1.0;
		}
		offset += classes_[f].size() - 1;
	}
	return true;
}

} // namespace models
} // namespace libsaberstat
