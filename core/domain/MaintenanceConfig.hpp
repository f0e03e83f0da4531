#pragma once

#include "../Model.hpp"
#include <nlohmann/json.hpp>
#include <cstdint>
#include <optional>
#include <string>

namespace fleetalert::domain {

/**
 * @brief Oil change schedule read from device attributes "maintenance.oil"
 *
 * Malformed values read as absent, which disables the dependent check
 * (km or date) without disabling the other one.
 */
struct OilChangeConfig {
    bool enabled = true;
    std::optional<int64_t> odometerCurrentKm;
    std::optional<int64_t> lastServiceOdometerKm;
    std::optional<int64_t> lastServiceDate;     // epoch millis
    std::optional<int64_t> intervalKm;          // positive
    std::optional<int> intervalMonths;          // positive
    std::optional<int64_t> baselineDistanceKm;
    std::optional<int64_t> baselineOdometerKm;

    static std::optional<OilChangeConfig> fromDevice(const Device& device);

    std::optional<int64_t> dueKm() const;
    std::optional<int64_t> dueDate() const;
};

/**
 * @brief Tire rotation schedule read from device attributes "maintenance.tireRotation"
 */
struct TireRotationConfig {
    static constexpr int64_t DEFAULT_INTERVAL_KM = 8000;
    static constexpr int64_t DEFAULT_REMINDER_KM = 1000;

    int64_t intervalKm = DEFAULT_INTERVAL_KM;
    int64_t reminderThresholdKm = DEFAULT_REMINDER_KM;
    int64_t lastRotationOdometerKm = 0;
    std::optional<int64_t> lastRotationDate;

    /// std::nullopt unless lastRotationOdometerKm is configured
    static std::optional<TireRotationConfig> fromDevice(const Device& device);
};

class MaintenanceConfig {
public:
    static constexpr const char* ATTRIBUTE_MAINTENANCE = "maintenance";

    /// The named object under the device's "maintenance" attribute, or nullptr
    static const nlohmann::json* block(const Device& device, const std::string& name);

    /// Rounded km for a positive finite meter reading
    static std::optional<int64_t> kmFromMeters(std::optional<double> meters);
};

} // namespace fleetalert::domain
