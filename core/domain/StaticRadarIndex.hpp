#pragma once

#include "../IClock.hpp"
#include <cstdint>
#include <filesystem>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

namespace fleetalert::domain {

/**
 * @brief Static radar catalog settings
 */
struct StaticRadarConfig {
    bool enabled = false;
    std::string file;                       ///< GeoJSON FeatureCollection of Point features
    std::string overridesFile;              ///< JSON object: externalId -> radius meters
    double defaultRadiusMeters = 30.0;      ///< Used when a feature has no radiusMeters (floored at 5)
    double minSpeedKph = 0.0;               ///< Features below this limit are ignored
    double maxSpeedKph = 300.0;             ///< Features above this limit are ignored
    int64_t reloadIntervalMillis = 60000;   ///< Catalog mtime check period (floored at 10 s)
    double cellDegrees = 0.02;              ///< Grid cell edge
};

struct RadarMatch {
    int64_t radarId = 0;
    std::string externalId;
    std::string radarName;
    double speedLimitKph = 0.0;
    double radiusMeters = 0.0;
    double distanceMeters = 0.0;
};

/**
 * @brief Grid index over a fixed speed-camera catalog
 *
 * Entries are bucketed by (floor((lat+90)/cell), floor((lon+180)/cell)). A
 * query scans only the cells reachable within the largest radius in the
 * catalog and returns the closest entry whose own radius contains the point.
 *
 * The catalog is re-read when its modification time (or the overrides file)
 * changes, checked at most once per reload interval. A rebuilt index replaces
 * the previous one with a single atomic pointer store; queries load the
 * pointer once and never wait for a rebuild in progress.
 *
 * @note Thread-safe
 */
class StaticRadarIndex {
public:
    static constexpr double MIN_OVERRIDE_RADIUS_METERS = 5.0;
    static constexpr double MAX_OVERRIDE_RADIUS_METERS = 200.0;

    StaticRadarIndex(StaticRadarConfig config, std::shared_ptr<IClock> clock);

    bool isEnabled() const { return config_.enabled; }

    std::optional<RadarMatch> match(double latitude, double longitude);

    /// Rebuilds from disk now, ignoring the reload interval and unchanged mtimes
    void reload();

    size_t size() const;

    std::map<std::string, double> radiusOverrides();

    /**
     * @brief Persists a radius override for one catalog entry and reloads
     * @param externalId Catalog externalId, trimmed, must not be blank
     * @param radiusMeters Accepted range 5-200 m, stored rounded to 0.1 m
     * @return The stored radius
     * @throws std::invalid_argument for a blank id or out-of-range radius
     * @throws std::runtime_error when no overrides file is configured or writing fails
     */
    double setRadiusOverride(const std::string& externalId, double radiusMeters);

    /// Validates and rounds an operator-supplied override radius
    static double normalizeOverrideRadius(double radiusMeters);

private:
    struct Entry {
        int64_t radarId = 0;
        std::string externalId;
        std::string name;
        double latitude = 0.0;
        double longitude = 0.0;
        double speedLimitKph = 0.0;
        double radiusMeters = 0.0;
    };

    struct Snapshot {
        std::unordered_map<int64_t, std::vector<Entry>> buckets;
        int latitudeCellRange = 1;
        double maxRadiusMeters = 0.0;
        size_t count = 0;
    };

    using FileTime = std::filesystem::file_time_type;

    void reloadIfNeeded(bool force);
    bool refreshOverrides();
    std::shared_ptr<const Snapshot> loadSnapshot(const std::filesystem::path& file) const;
    void writeOverrides(const std::map<std::string, double>& overrides) const;
    std::vector<std::filesystem::path> candidatePaths() const;

    int latitudeCell(double latitude) const;
    int longitudeCell(double longitude) const;
    int longitudeCellRange(double maxRadiusMeters, double latitude) const;
    static int64_t bucketKey(int latitudeCell, int longitudeCell);
    static std::string radarName(const std::string& externalId, double speedLimitKph);

    StaticRadarConfig config_;
    std::shared_ptr<IClock> clock_;

    // Accessed only through std::atomic_load / std::atomic_store.
    std::shared_ptr<const Snapshot> snapshot_;

    std::mutex reloadMutex_;
    std::optional<int64_t> lastReloadCheck_;
    std::filesystem::path sourcePath_;
    std::optional<FileTime> sourceModifiedAt_;
    std::optional<FileTime> overridesModifiedAt_;
    std::map<std::string, double> overrides_;
    bool warnedMissing_ = false;
};

} // namespace fleetalert::domain
