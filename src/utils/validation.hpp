#pragma once

#include <nlohmann/json.hpp>
#include <string>
#include <vector>

namespace saberstat {

/**
 * @brief Input validation utilities for the configuration and batch readers
 *
 * Every failure throws std::invalid_argument naming the offending key,
 * column or position.
 */
class ValidationUtils {
public:
	/**
	 * @brief Find a column by name
	 *
	 * @param column_names Names to search
	 * @param col_name Name to find (exact match)
	 * @return Position of the column
	 * @throws std::invalid_argument if not found
	 */
	static size_t FindColumnByName(const std::vector<std::string> &column_names, const std::string &col_name);

	/**
	 * @brief Find all named columns
	 *
	 * @return Positions in the order of col_names
	 * @throws std::invalid_argument if any is not found
	 */
	static std::vector<size_t> FindColumnsByNames(const std::vector<std::string> &column_names,
	                                              const std::vector<std::string> &col_names);

	/// @throws std::invalid_argument if a name occurs twice
	static void ValidateUniqueNames(const std::vector<std::string> &names, const std::string &what);

	/// @throws std::invalid_argument if the value is not a JSON object
	static void RequireObject(const nlohmann::json &value, const std::string &what);

	/// @throws std::invalid_argument if the value is not a JSON array
	static void RequireArray(const nlohmann::json &value, const std::string &what);

	/// @throws std::invalid_argument if the object lacks the key
	static const nlohmann::json &RequireKey(const nlohmann::json &object, const std::string &key,
	                                        const std::string &what);

	// ========================================================================
	// Typed option values
	// ========================================================================

	static bool GetBool(const nlohmann::json &value, const std::string &key);
	static double GetDouble(const nlohmann::json &value, const std::string &key);
	/// Accepts non-negative integers only
	static size_t GetSize(const nlohmann::json &value, const std::string &key);
	static int GetInt(const nlohmann::json &value, const std::string &key);
	static std::string GetString(const nlohmann::json &value, const std::string &key);
	static std::vector<std::string> GetStringList(const nlohmann::json &value, const std::string &key);
	static std::vector<double> GetDoubleList(const nlohmann::json &value, const std::string &key);

private:
	ValidationUtils() = delete;
};

} // namespace saberstat
