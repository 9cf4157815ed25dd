#include "utils/engine_config.h"

#include <yaml-cpp/yaml.h>

namespace cinemap {
namespace utils {

namespace {

EngineConfig::LandmarkEntry landmarkFromYaml(const YAML::Node& node) {
    EngineConfig::LandmarkEntry e;
    e.name = node["name"].as<std::string>();
    e.lon = node["lon"].as<double>();
    e.lat = node["lat"].as<double>();
    return e;
}

} // namespace

std::pair<EngineConfig::Status, EngineConfig> EngineConfig::loadFromYaml(const std::string& yaml_path) {
    try {
        YAML::Node config = YAML::LoadFile(yaml_path);
        EngineConfig result;

        if (config["data"]) {
            result.data.path = config["data"]["path"].as<std::string>(result.data.path);
        }

        if (config["logging"]) {
            auto logging = config["logging"];
            result.logging.file = logging["file"].as<std::string>(result.logging.file);
            if (logging["level"]) {
                result.logging.level = Logger::levelFromString(logging["level"].as<std::string>());
            }
        }

        if (config["diagnostics"]) {
            auto diagnostics = config["diagnostics"];
            result.diagnostics.enabled = diagnostics["enabled"].as<bool>(true);
            result.diagnostics.path = diagnostics["path"].as<std::string>(result.diagnostics.path);
        }

        if (config["query"]) {
            auto query = config["query"];
            int top_n = query["default_top_n"].as<int>(10);
            if (top_n <= 0) {
                return {Status::Error("query.default_top_n must be positive"), EngineConfig()};
            }
            result.query.default_top_n = static_cast<size_t>(top_n);
            result.query.actor_any_slot = query["actor_any_slot"].as<bool>(true);
            result.query.strip_city_qualifier = query["strip_city_qualifier"].as<bool>(false);
        }

        if (config["landmarks"]) {
            for (const auto& lm : config["landmarks"]) {
                result.landmarks.push_back(landmarkFromYaml(lm));
            }
        }

        CINEMAP_INFO("Loaded engine configuration from {}", yaml_path);
        return {Status::OK(), result};
    } catch (const std::exception& e) {
        CINEMAP_ERROR("Failed to load engine configuration from {}: {}", yaml_path, e.what());
        return {Status::Error(yaml_path + ": " + e.what()), EngineConfig()};
    }
}

std::pair<EngineConfig::Status, EngineConfig> EngineConfig::fromJson(const json& j) {
    EngineConfig result;

    try {
        if (j.contains("data")) {
            result.data.path = j["data"].value("path", result.data.path);
        }

        if (j.contains("logging")) {
            auto logging = j["logging"];
            result.logging.file = logging.value("file", result.logging.file);
            if (logging.contains("level")) {
                result.logging.level = Logger::levelFromString(logging["level"].get<std::string>());
            }
        }

        if (j.contains("diagnostics")) {
            auto diagnostics = j["diagnostics"];
            result.diagnostics.enabled = diagnostics.value("enabled", true);
            result.diagnostics.path = diagnostics.value("path", result.diagnostics.path);
        }

        if (j.contains("query")) {
            auto query = j["query"];
            int top_n = query.value("default_top_n", 10);
            if (top_n <= 0) {
                return {Status::Error("query.default_top_n must be positive"), EngineConfig()};
            }
            result.query.default_top_n = static_cast<size_t>(top_n);
            result.query.actor_any_slot = query.value("actor_any_slot", true);
            result.query.strip_city_qualifier = query.value("strip_city_qualifier", false);
        }

        if (j.contains("landmarks")) {
            for (const auto& lm : j["landmarks"]) {
                LandmarkEntry e;
                e.name = lm.at("name").get<std::string>();
                e.lon = lm.at("lon").get<double>();
                e.lat = lm.at("lat").get<double>();
                result.landmarks.push_back(std::move(e));
            }
        }
    } catch (const std::exception& e) {
        CINEMAP_ERROR("Failed to parse engine configuration from JSON: {}", e.what());
        return {Status::Error(e.what()), EngineConfig()};
    }

    return {Status::OK(), result};
}

json EngineConfig::toJson() const {
    json j;

    j["data"]["path"] = data.path;

    j["logging"]["file"] = logging.file;
    j["logging"]["level"] = Logger::levelToString(logging.level);

    j["diagnostics"]["enabled"] = diagnostics.enabled;
    j["diagnostics"]["path"] = diagnostics.path;

    j["query"]["default_top_n"] = query.default_top_n;
    j["query"]["actor_any_slot"] = query.actor_any_slot;
    j["query"]["strip_city_qualifier"] = query.strip_city_qualifier;

    j["landmarks"] = json::array();
    for (const auto& lm : landmarks) {
        j["landmarks"].push_back({{"name", lm.name}, {"lon", lm.lon}, {"lat", lm.lat}});
    }
    return j;
}

} // namespace utils
} // namespace cinemap
