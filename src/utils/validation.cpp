#include "validation.hpp"
#include <set>
#include <stdexcept>

namespace saberstat {

size_t ValidationUtils::FindColumnByName(const std::vector<std::string> &column_names, const std::string &col_name) {
	for (size_t i = 0; i < column_names.size(); i++) {
		if (column_names[i] == col_name) {
			return i;
		}
	}
	std::string known;
	for (const auto &name : column_names) {
		known += known.empty() ? name : ", " + name;
	}
	throw std::invalid_argument("Column '" + col_name + "' not found (available: " + known + ")");
}

std::vector<size_t> ValidationUtils::FindColumnsByNames(const std::vector<std::string> &column_names,
                                                        const std::vector<std::string> &col_names) {
	std::vector<size_t> result;
	result.reserve(col_names.size());

	for (const auto &name : col_names) {
		result.push_back(FindColumnByName(column_names, name));
	}

	return result;
}

void ValidationUtils::ValidateUniqueNames(const std::vector<std::string> &names, const std::string &what) {
	std::set<std::string> seen;
	for (const auto &name : names) {
		if (!seen.insert(name).second) {
			throw std::invalid_argument("Duplicate " + what + ": '" + name + "'");
		}
	}
}

void ValidationUtils::RequireObject(const nlohmann::json &value, const std::string &what) {
	if (!value.is_object()) {
		throw std::invalid_argument(what + " must be a JSON object (got " + std::string(value.type_name()) + ")");
	}
}

void ValidationUtils::RequireArray(const nlohmann::json &value, const std::string &what) {
	if (!value.is_array()) {
		throw std::invalid_argument(what + " must be a JSON array (got " + std::string(value.type_name()) + ")");
	}
}

const nlohmann::json &ValidationUtils::RequireKey(const nlohmann::json &object, const std::string &key,
                                                  const std::string &what) {
	RequireObject(object, what);
	auto it = object.find(key);
	if (it == object.end()) {
		throw std::invalid_argument(what + " is missing required key '" + key + "'");
	}
	return *it;
}

bool ValidationUtils::GetBool(const nlohmann::json &value, const std::string &key) {
	if (!value.is_boolean()) {
		throw std::invalid_argument("Option '" + key + "' must be a boolean");
	}
	return value.get<bool>();
}

double ValidationUtils::GetDouble(const nlohmann::json &value, const std::string &key) {
	if (!value.is_number()) {
		throw std::invalid_argument("Option '" + key + "' must be a number");
	}
	return value.get<double>();
}

size_t ValidationUtils::GetSize(const nlohmann::json &value, const std::string &key) {
	if (value.is_number_unsigned()) {
		return value.get<size_t>();
	}
	if (value.is_number_integer()) {
		auto v = value.get<long long>();
		if (v >= 0) {
			return static_cast<size_t>(v);
		}
	}
	throw std::invalid_argument("Option '" + key + "' must be a non-negative integer");
}

int ValidationUtils::GetInt(const nlohmann::json &value, const std::string &key) {
	if (!value.is_number_integer()) {
		throw std::invalid_argument("Option '" + key + "' must be an integer");
	}
	return value.get<int>();
}

std::string ValidationUtils::GetString(const nlohmann::json &value, const std::string &key) {
	if (!value.is_string()) {
		throw std::invalid_argument("Option '" + key + "' must be a string");
	}
	return value.get<std::string>();
}

std::vector<std::string> ValidationUtils::GetStringList(const nlohmann::json &value, const std::string &key) {
	if (!value.is_array()) {
		throw std::invalid_argument("Option '" + key + "' must be an array of strings");
	}
	std::vector<std::string> out;
	for (const auto &item : value) {
		out.push_back(GetString(item, key));
	}
	return out;
}

std::vector<double> ValidationUtils::GetDoubleList(const nlohmann::json &value, const std::string &key) {
	if (!value.is_array()) {
		throw std::invalid_argument("Option '" + key + "' must be an array of numbers");
	}
	std::vector<double> out;
	for (const auto &item : value) {
		out.push_back(GetDouble(item, key));
	}
	return out;
}

} // namespace saberstat
