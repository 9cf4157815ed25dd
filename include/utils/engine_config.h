#pragma once

#include "utils/logger.h"

#include <string>
#include <utility>
#include <vector>
#include <nlohmann/json.hpp>

namespace cinemap {
namespace utils {

using json = nlohmann::json;

/**
 * @brief Process-wide settings of the query engine
 *
 * data:
 *   path: data/film_locations.jsonl
 * logging:
 *   file: data/logs/cinemap.log
 *   level: info
 * diagnostics:
 *   enabled: true
 *   path: data/logs/query_diagnostics.jsonl
 * query:
 *   default_top_n: 10
 *   actor_any_slot: true
 *   strip_city_qualifier: false
 * landmarks:
 *   - {name: "Ferry Building", lon: -122.3937, lat: 37.7955}
 */
struct EngineConfig {
    struct Status {
        bool ok = true;
        std::string message;
        static Status OK() { return {}; }
        static Status Error(std::string msg) { return Status{false, std::move(msg)}; }
    };

    struct DataConfig {
        std::string path = "data/film_locations.jsonl";
    } data;

    struct LoggingConfig {
        std::string file = "data/logs/cinemap.log";
        Logger::Level level = Logger::Level::INFO;
    } logging;

    struct DiagnosticsConfig {
        bool enabled = true;
        std::string path = "data/logs/query_diagnostics.jsonl";
    } diagnostics;

    struct QueryConfig {
        size_t default_top_n = 10;
        bool actor_any_slot = true;
        bool strip_city_qualifier = false;
    } query;

    struct LandmarkEntry {
        std::string name;
        double lon = 0.0;
        double lat = 0.0;
    };
    std::vector<LandmarkEntry> landmarks;

    /**
     * @brief Load configuration from YAML file
     *
     * Missing keys keep their defaults; unreadable files or wrongly typed
     * values yield an error status and the default configuration.
     */
    static std::pair<Status, EngineConfig> loadFromYaml(const std::string& yaml_path);

    /**
     * @brief Load configuration from JSON (same layout as the YAML file)
     */
    static std::pair<Status, EngineConfig> fromJson(const json& j);

    json toJson() const;
};

} // namespace utils
} // namespace cinemap
