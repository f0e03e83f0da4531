#pragma once

#include <nlohmann/json.hpp>
#include <cstdint>
#include <optional>
#include <string>

namespace fleetalert {

/**
 * @brief Lenient accessors over free-form attribute maps
 *
 * Attribute maps come from user-edited configuration, so numbers may arrive as
 * JSON numbers or numeric strings. Every accessor treats a missing, malformed
 * or non-finite value as absent instead of throwing.
 */
class Attributes {
public:
    static bool has(const nlohmann::json& attributes, const std::string& key);

    static std::optional<double> getDouble(const nlohmann::json& attributes, const std::string& key);
    static std::optional<int64_t> getLong(const nlohmann::json& attributes, const std::string& key);
    static std::optional<std::string> getString(const nlohmann::json& attributes, const std::string& key);

    /// Accepts JSON booleans and the strings "true"/"false" (any case) or "1"/"0"
    static bool getBoolean(const nlohmann::json& attributes, const std::string& key, bool defaultValue = false);

    static double doubleOr(const nlohmann::json& attributes, const std::string& key, double defaultValue) {
        return getDouble(attributes, key).value_or(defaultValue);
    }

    static void remove(nlohmann::json& attributes, const std::string& key);
};

} // namespace fleetalert
