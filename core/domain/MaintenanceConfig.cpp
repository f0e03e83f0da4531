#include "MaintenanceConfig.hpp"
#include "../Attributes.hpp"
#include "../IClock.hpp"
#include "../TimeZone.hpp"
#include <cmath>
#include <limits>

namespace fleetalert::domain {

namespace {

std::optional<int64_t> positive(std::optional<int64_t> value) {
    return value && *value > 0 ? value : std::nullopt;
}

std::optional<int64_t> instant(const nlohmann::json& attributes, const char* key) {
    auto text = Attributes::getString(attributes, key);
    if (!text || text->empty()) {
        return std::nullopt;
    }
    return Iso8601::parse(*text);
}

} // namespace

const nlohmann::json* MaintenanceConfig::block(const Device& device, const std::string& name) {
    if (!device.attributes.is_object()) {
        return nullptr;
    }
    auto maintenance = device.attributes.find(ATTRIBUTE_MAINTENANCE);
    if (maintenance == device.attributes.end() || !maintenance->is_object()) {
        return nullptr;
    }
    auto section = maintenance->find(name);
    if (section == maintenance->end() || !section->is_object()) {
        return nullptr;
    }
    return &(*section);
}

std::optional<int64_t> MaintenanceConfig::kmFromMeters(std::optional<double> meters) {
    if (!meters || !std::isfinite(*meters) || *meters <= 0) {
        return std::nullopt;
    }
    return static_cast<int64_t>(std::llround(*meters / 1000.0));
}

std::optional<OilChangeConfig> OilChangeConfig::fromDevice(const Device& device) {
    const auto* oil = MaintenanceConfig::block(device, "oil");
    if (!oil) {
        return std::nullopt;
    }

    OilChangeConfig config;
    config.enabled = Attributes::getBoolean(*oil, "enabled", true);
    config.odometerCurrentKm = Attributes::getLong(*oil, "odometerCurrent");
    config.lastServiceOdometerKm = Attributes::getLong(*oil, "lastServiceOdometer");
    config.lastServiceDate = instant(*oil, "lastServiceDate");
    config.intervalKm = positive(Attributes::getLong(*oil, "intervalKm"));
    auto months = positive(Attributes::getLong(*oil, "intervalMonths"));
    if (months && *months <= std::numeric_limits<int>::max()) {
        config.intervalMonths = static_cast<int>(*months);
    }
    config.baselineDistanceKm = Attributes::getLong(*oil, "baselineDistanceKm");
    config.baselineOdometerKm = Attributes::getLong(*oil, "baselineOdometerKm");
    return config;
}

std::optional<int64_t> OilChangeConfig::dueKm() const {
    if (!lastServiceOdometerKm || !intervalKm) {
        return std::nullopt;
    }
    return *lastServiceOdometerKm + *intervalKm;
}

std::optional<int64_t> OilChangeConfig::dueDate() const {
    if (!lastServiceDate || !intervalMonths) {
        return std::nullopt;
    }
    return TimeZone::utc().plusMonths(*lastServiceDate, *intervalMonths);
}

std::optional<TireRotationConfig> TireRotationConfig::fromDevice(const Device& device) {
    const auto* tire = MaintenanceConfig::block(device, "tireRotation");
    if (!tire) {
        return std::nullopt;
    }

    auto lastOdometer = Attributes::getLong(*tire, "lastRotationOdometerKm");
    if (!lastOdometer) {
        return std::nullopt;
    }

    TireRotationConfig config;
    config.lastRotationOdometerKm = *lastOdometer;
    config.intervalKm = positive(Attributes::getLong(*tire, "intervalKm")).value_or(DEFAULT_INTERVAL_KM);
    config.reminderThresholdKm = positive(Attributes::getLong(*tire, "reminderThresholdKm")).value_or(DEFAULT_REMINDER_KM);
    config.lastRotationDate = instant(*tire, "lastRotationDate");
    return config;
}

} // namespace fleetalert::domain
