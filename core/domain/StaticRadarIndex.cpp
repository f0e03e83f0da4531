#include "StaticRadarIndex.hpp"
#include "../Attributes.hpp"
#include "../Geo.hpp"
#include <nlohmann/json.hpp>
#include <algorithm>
#include <atomic>
#include <cctype>
#include <cmath>
#include <cstdlib>
#include <fstream>
#include <iostream>
#include <sstream>
#include <stdexcept>
#include <system_error>
#include <utility>

namespace fs = std::filesystem;

namespace fleetalert::domain {

namespace {

constexpr const char* kDefaultRelativeFile = "radars/static-radars.geojson";
constexpr const char* kDefaultInstallFile = "/usr/share/fleetalert/radars/static-radars.geojson";
constexpr int64_t kMinReloadIntervalMillis = 10000;

std::string trimmed(const std::string& value) {
    auto begin = value.find_first_not_of(" \t\r\n");
    if (begin == std::string::npos) {
        return "";
    }
    auto end = value.find_last_not_of(" \t\r\n");
    return value.substr(begin, end - begin + 1);
}

std::string textOrEmpty(const nlohmann::json& properties, const char* key) {
    if (!properties.is_object() || !properties.contains(key) || properties[key].is_null()) {
        return "";
    }
    const auto& value = properties[key];
    if (value.is_string()) {
        return trimmed(value.get<std::string>());
    }
    if (value.is_number_integer()) {
        return std::to_string(value.get<int64_t>());
    }
    return trimmed(value.dump());
}

std::optional<int64_t> parseRadarId(const std::string& externalId) {
    if (externalId.empty()) {
        return std::nullopt;
    }
    char* end = nullptr;
    long long parsed = std::strtoll(externalId.c_str(), &end, 10);
    if (end == externalId.c_str() || *end != '\0') {
        return std::nullopt;
    }
    return static_cast<int64_t>(parsed);
}

} // namespace

StaticRadarIndex::StaticRadarIndex(StaticRadarConfig config, std::shared_ptr<IClock> clock)
    : config_(std::move(config)), clock_(std::move(clock)),
      snapshot_(std::make_shared<const Snapshot>()) {
    config_.defaultRadiusMeters = std::max(5.0, config_.defaultRadiusMeters);
    config_.minSpeedKph = std::max(0.0, config_.minSpeedKph);
    config_.maxSpeedKph = std::max(config_.minSpeedKph, config_.maxSpeedKph);
    config_.reloadIntervalMillis = std::max(kMinReloadIntervalMillis, config_.reloadIntervalMillis);
    if (!(config_.cellDegrees > 0.0)) {
        config_.cellDegrees = 0.02;
    }
    config_.file = trimmed(config_.file);
    config_.overridesFile = trimmed(config_.overridesFile);
}

std::optional<RadarMatch> StaticRadarIndex::match(double latitude, double longitude) {
    if (!config_.enabled || !std::isfinite(latitude) || !std::isfinite(longitude)) {
        return std::nullopt;
    }

    {
        std::unique_lock<std::mutex> lock(reloadMutex_, std::try_to_lock);
        if (lock.owns_lock()) {
            reloadIfNeeded(false);
        }
    }

    auto current = std::atomic_load(&snapshot_);
    if (!current || current->count == 0) {
        return std::nullopt;
    }

    int latCell = latitudeCell(latitude);
    int lonCell = longitudeCell(longitude);
    int latRange = current->latitudeCellRange;
    int lonRange = longitudeCellRange(current->maxRadiusMeters, latitude);

    const Entry* best = nullptr;
    double bestDistance = 0.0;
    for (int latOffset = -latRange; latOffset <= latRange; ++latOffset) {
        for (int lonOffset = -lonRange; lonOffset <= lonRange; ++lonOffset) {
            auto it = current->buckets.find(bucketKey(latCell + latOffset, lonCell + lonOffset));
            if (it == current->buckets.end()) {
                continue;
            }
            for (const auto& entry : it->second) {
                double distance = Geo::distanceMeters(latitude, longitude, entry.latitude, entry.longitude);
                if (distance <= entry.radiusMeters && (!best || distance < bestDistance)) {
                    best = &entry;
                    bestDistance = distance;
                }
            }
        }
    }

    if (!best) {
        return std::nullopt;
    }

    RadarMatch result;
    result.radarId = best->radarId;
    result.externalId = best->externalId;
    result.radarName = best->name;
    result.speedLimitKph = best->speedLimitKph;
    result.radiusMeters = best->radiusMeters;
    result.distanceMeters = bestDistance;
    return result;
}

void StaticRadarIndex::reload() {
    std::lock_guard<std::mutex> lock(reloadMutex_);
    reloadIfNeeded(true);
}

size_t StaticRadarIndex::size() const {
    auto current = std::atomic_load(&snapshot_);
    return current ? current->count : 0;
}

std::map<std::string, double> StaticRadarIndex::radiusOverrides() {
    std::lock_guard<std::mutex> lock(reloadMutex_);
    refreshOverrides();
    return overrides_;
}

double StaticRadarIndex::normalizeOverrideRadius(double radiusMeters) {
    if (!std::isfinite(radiusMeters)
        || radiusMeters < MIN_OVERRIDE_RADIUS_METERS
        || radiusMeters > MAX_OVERRIDE_RADIUS_METERS) {
        throw std::invalid_argument("Radar radius must be between 5 and 200 meters");
    }
    return std::round(radiusMeters * 10.0) / 10.0;
}

double StaticRadarIndex::setRadiusOverride(const std::string& externalId, double radiusMeters) {
    std::string id = trimmed(externalId);
    if (id.empty()) {
        throw std::invalid_argument("Radar external id must not be blank");
    }
    double radius = normalizeOverrideRadius(radiusMeters);
    if (config_.overridesFile.empty()) {
        throw std::runtime_error("Static radar overrides file is not configured");
    }

    std::lock_guard<std::mutex> lock(reloadMutex_);
    refreshOverrides();

    auto updated = overrides_;
    updated[id] = radius;
    writeOverrides(updated);

    overrides_ = std::move(updated);
    std::error_code ec;
    auto modified = fs::last_write_time(config_.overridesFile, ec);
    if (!ec) {
        overridesModifiedAt_ = modified;
    }

    std::cout << "[Radar] Radius override " << id << " = " << radius << " m" << std::endl;
    reloadIfNeeded(true);
    return radius;
}

// Requires reloadMutex_.
void StaticRadarIndex::reloadIfNeeded(bool force) {
    if (!config_.enabled) {
        return;
    }

    int64_t now = clock_->epochMillis();
    if (!force && lastReloadCheck_ && now - *lastReloadCheck_ < config_.reloadIntervalMillis) {
        return;
    }
    lastReloadCheck_ = now;
    bool overridesChanged = refreshOverrides();

    auto candidates = candidatePaths();
    for (const auto& candidate : candidates) {
        std::error_code ec;
        if (!fs::is_regular_file(candidate, ec)) {
            continue;
        }
        auto modified = fs::last_write_time(candidate, ec);
        if (ec) {
            continue;
        }

        if (!force && !overridesChanged && candidate == sourcePath_
            && sourceModifiedAt_ && *sourceModifiedAt_ == modified) {
            return;
        }

        try {
            auto loaded = loadSnapshot(candidate);
            std::atomic_store(&snapshot_, loaded);
            sourcePath_ = candidate;
            sourceModifiedAt_ = modified;
            warnedMissing_ = false;
            std::cout << "[Radar] Loaded " << loaded->count << " static radars from " << candidate.string()
                      << " (overrides: " << overrides_.size() << ")" << std::endl;
            return;
        } catch (const std::exception& e) {
            if (candidate != sourcePath_ || !sourceModifiedAt_ || *sourceModifiedAt_ != modified) {
                std::cerr << "[Radar] Failed to load static radar catalog from " << candidate.string()
                          << ": " << e.what() << std::endl;
            }
            // Remember the broken file so it is not re-parsed and re-logged until it changes.
            std::atomic_store(&snapshot_, std::make_shared<const Snapshot>());
            sourcePath_ = candidate;
            sourceModifiedAt_ = modified;
            return;
        }
    }

    if (!warnedMissing_) {
        std::string checked;
        for (const auto& candidate : candidates) {
            checked += (checked.empty() ? "" : ", ") + candidate.string();
        }
        std::cerr << "[Radar] Static radar catalog file not found. Checked: " << checked << std::endl;
        warnedMissing_ = true;
    }
    std::atomic_store(&snapshot_, std::make_shared<const Snapshot>());
    sourcePath_.clear();
    sourceModifiedAt_.reset();
}

// Requires reloadMutex_. Returns true when the override set changed.
bool StaticRadarIndex::refreshOverrides() {
    std::error_code ec;
    if (config_.overridesFile.empty() || !fs::is_regular_file(config_.overridesFile, ec)) {
        bool changed = !overrides_.empty();
        overrides_.clear();
        overridesModifiedAt_.reset();
        return changed;
    }

    auto modified = fs::last_write_time(config_.overridesFile, ec);
    if (ec || (overridesModifiedAt_ && *overridesModifiedAt_ == modified)) {
        return false;
    }

    std::map<std::string, double> sanitized;
    try {
        std::ifstream in(config_.overridesFile);
        auto parsed = nlohmann::json::parse(in);
        if (parsed.is_object()) {
            for (const auto& [key, value] : parsed.items()) {
                std::string id = trimmed(key);
                if (id.empty() || !value.is_number()) {
                    continue;
                }
                double radius = value.get<double>();
                if (std::isfinite(radius) && radius > 0) {
                    sanitized[id] = radius;
                }
            }
        }
    } catch (const nlohmann::json::exception& e) {
        std::cerr << "[Radar] Failed to load radius overrides from " << config_.overridesFile
                  << ": " << e.what() << std::endl;
        overridesModifiedAt_ = modified;
        return false;
    }

    overrides_ = std::move(sanitized);
    overridesModifiedAt_ = modified;
    std::cout << "[Radar] Loaded " << overrides_.size() << " radius overrides from "
              << config_.overridesFile << std::endl;
    return true;
}

std::shared_ptr<const StaticRadarIndex::Snapshot> StaticRadarIndex::loadSnapshot(const fs::path& file) const {
    std::ifstream in(file);
    if (!in.is_open()) {
        throw std::runtime_error("cannot open file");
    }

    nlohmann::json root;
    try {
        root = nlohmann::json::parse(in);
    } catch (const nlohmann::json::parse_error& e) {
        throw std::runtime_error(e.what());
    }

    auto snapshot = std::make_shared<Snapshot>();
    snapshot->maxRadiusMeters = config_.defaultRadiusMeters;

    std::string type = root.is_object() ? root.value("type", "") : "";
    std::transform(type.begin(), type.end(), type.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    if (type != "featurecollection" || !root.contains("features") || !root["features"].is_array()) {
        return snapshot;
    }

    int64_t syntheticId = -1;
    for (const auto& feature : root["features"]) {
        if (!feature.is_object() || !feature.contains("geometry") || !feature["geometry"].is_object()) {
            continue;
        }
        const auto& geometry = feature["geometry"];
        std::string geometryType = geometry.value("type", "");
        std::transform(geometryType.begin(), geometryType.end(), geometryType.begin(),
                       [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
        if (geometryType != "point" || !geometry.contains("coordinates")) {
            continue;
        }
        const auto& coordinates = geometry["coordinates"];
        if (!coordinates.is_array() || coordinates.size() < 2
            || !coordinates[0].is_number() || !coordinates[1].is_number()) {
            continue;
        }
        double longitude = coordinates[0].get<double>();
        double latitude = coordinates[1].get<double>();
        if (!std::isfinite(latitude) || !std::isfinite(longitude)) {
            continue;
        }

        const nlohmann::json properties = feature.contains("properties") && feature["properties"].is_object()
            ? feature["properties"] : nlohmann::json::object();

        auto speedKph = Attributes::getDouble(properties, "speedKph");
        if (!speedKph || *speedKph < config_.minSpeedKph || *speedKph > config_.maxSpeedKph) {
            continue;
        }

        double radius = Attributes::getDouble(properties, "radiusMeters").value_or(0.0);
        if (!(radius > 0)) {
            radius = config_.defaultRadiusMeters;
        }

        Entry entry;
        entry.externalId = textOrEmpty(properties, "externalId");
        if (!entry.externalId.empty()) {
            auto overrideIt = overrides_.find(entry.externalId);
            if (overrideIt != overrides_.end()) {
                radius = overrideIt->second;
            }
        }

        auto parsedId = parseRadarId(entry.externalId);
        entry.radarId = parsedId ? *parsedId : syntheticId--;
        entry.name = radarName(entry.externalId, *speedKph);
        entry.latitude = latitude;
        entry.longitude = longitude;
        entry.speedLimitKph = *speedKph;
        entry.radiusMeters = radius;

        snapshot->buckets[bucketKey(latitudeCell(latitude), longitudeCell(longitude))].push_back(std::move(entry));
        snapshot->maxRadiusMeters = std::max(snapshot->maxRadiusMeters, radius);
        snapshot->count++;
    }

    snapshot->latitudeCellRange = std::max(1, static_cast<int>(std::ceil(
        Geo::latitudeDelta(snapshot->maxRadiusMeters) / config_.cellDegrees)));
    return snapshot;
}

void StaticRadarIndex::writeOverrides(const std::map<std::string, double>& overrides) const {
    fs::path target = fs::absolute(config_.overridesFile);
    std::error_code ec;
    if (target.has_parent_path()) {
        fs::create_directories(target.parent_path(), ec);
        if (ec) {
            throw std::runtime_error("Cannot create " + target.parent_path().string() + ": " + ec.message());
        }
    }

    nlohmann::json document = nlohmann::json::object();
    for (const auto& [id, radius] : overrides) {
        document[id] = radius;
    }

    fs::path temp = target;
    temp += ".tmp";
    {
        std::ofstream out(temp, std::ios::trunc);
        out << document.dump(2) << '\n';
        out.flush();
        if (!out) {
            throw std::runtime_error("Cannot write " + temp.string());
        }
    }

    fs::rename(temp, target, ec);
    if (ec) {
        fs::remove(temp, ec);
        throw std::runtime_error("Cannot replace " + target.string());
    }
}

std::vector<fs::path> StaticRadarIndex::candidatePaths() const {
    std::vector<fs::path> paths;
    if (!config_.file.empty()) {
        paths.emplace_back(config_.file);
    }
    for (const char* fallback : {kDefaultRelativeFile, kDefaultInstallFile}) {
        fs::path path(fallback);
        if (std::find(paths.begin(), paths.end(), path) == paths.end()) {
            paths.push_back(path);
        }
    }
    return paths;
}

int StaticRadarIndex::latitudeCell(double latitude) const {
    return static_cast<int>(std::floor((latitude + 90.0) / config_.cellDegrees));
}

int StaticRadarIndex::longitudeCell(double longitude) const {
    return static_cast<int>(std::floor((longitude + 180.0) / config_.cellDegrees));
}

int StaticRadarIndex::longitudeCellRange(double maxRadiusMeters, double latitude) const {
    return std::max(1, static_cast<int>(std::ceil(
        Geo::longitudeDelta(maxRadiusMeters, latitude) / config_.cellDegrees)));
}

int64_t StaticRadarIndex::bucketKey(int latitudeCell, int longitudeCell) {
    return (static_cast<int64_t>(latitudeCell) << 32)
        | static_cast<int64_t>(static_cast<uint32_t>(longitudeCell));
}

std::string StaticRadarIndex::radarName(const std::string& externalId, double speedLimitKph) {
    std::ostringstream name;
    name << "Radar " << std::llround(speedLimitKph) << " km/h";
    if (!externalId.empty()) {
        name << " #" << externalId;
    }
    return name.str();
}

} // namespace fleetalert::domain
