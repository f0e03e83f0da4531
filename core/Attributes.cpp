#include "Attributes.hpp"
#include <algorithm>
#include <cctype>
#include <cmath>
#include <cstdlib>

namespace fleetalert {

namespace {

const nlohmann::json* find(const nlohmann::json& attributes, const std::string& key) {
    if (!attributes.is_object()) {
        return nullptr;
    }
    auto it = attributes.find(key);
    if (it == attributes.end() || it->is_null()) {
        return nullptr;
    }
    return &(*it);
}

std::optional<double> parseNumber(const std::string& text) {
    std::string value = text;
    value.erase(0, value.find_first_not_of(" \t"));
    value.erase(value.find_last_not_of(" \t") + 1);
    if (value.empty()) {
        return std::nullopt;
    }
    char* end = nullptr;
    double parsed = std::strtod(value.c_str(), &end);
    if (end == value.c_str() || *end != '\0' || !std::isfinite(parsed)) {
        return std::nullopt;
    }
    return parsed;
}

} // namespace

bool Attributes::has(const nlohmann::json& attributes, const std::string& key) {
    return find(attributes, key) != nullptr;
}

std::optional<double> Attributes::getDouble(const nlohmann::json& attributes, const std::string& key) {
    const auto* value = find(attributes, key);
    if (!value) {
        return std::nullopt;
    }
    if (value->is_number()) {
        double number = value->get<double>();
        return std::isfinite(number) ? std::optional<double>(number) : std::nullopt;
    }
    if (value->is_string()) {
        return parseNumber(value->get<std::string>());
    }
    return std::nullopt;
}

std::optional<int64_t> Attributes::getLong(const nlohmann::json& attributes, const std::string& key) {
    auto number = getDouble(attributes, key);
    if (!number) {
        return std::nullopt;
    }
    return static_cast<int64_t>(std::llround(*number));
}

std::optional<std::string> Attributes::getString(const nlohmann::json& attributes, const std::string& key) {
    const auto* value = find(attributes, key);
    if (!value) {
        return std::nullopt;
    }
    if (value->is_string()) {
        return value->get<std::string>();
    }
    return value->dump();
}

bool Attributes::getBoolean(const nlohmann::json& attributes, const std::string& key, bool defaultValue) {
    const auto* value = find(attributes, key);
    if (!value) {
        return defaultValue;
    }
    if (value->is_boolean()) {
        return value->get<bool>();
    }
    if (value->is_number()) {
        return value->get<double>() != 0.0;
    }
    if (value->is_string()) {
        std::string text = value->get<std::string>();
        std::transform(text.begin(), text.end(), text.begin(),
                       [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
        if (text == "true" || text == "1") {
            return true;
        }
        if (text == "false" || text == "0") {
            return false;
        }
    }
    return defaultValue;
}

void Attributes::remove(nlohmann::json& attributes, const std::string& key) {
    if (attributes.is_object()) {
        attributes.erase(key);
    }
}

} // namespace fleetalert
