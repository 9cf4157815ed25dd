#include "query/errors.h"
#include "query/map_analyzer.h"
#include "query/query_engine.h"
#include "storage/record_store.h"
#include "utils/diagnostic_sink.h"
#include "utils/engine_config.h"
#include "utils/logger.h"

#include <fstream>
#include <iostream>
#include <iterator>
#include <optional>
#include <sstream>
#include <string>
#include <nlohmann/json.hpp>

using namespace cinemap;
using json = nlohmann::json;

namespace {

constexpr int kExitLoadFailure = 1;
constexpr int kExitModificationRejected = 2;
constexpr int kExitConfigurationError = 3;

void printUsage(const char* argv0) {
    std::cout << "Usage: " << argv0 << " [options]\n"
              << "Options:\n"
              << "  --config FILE     Engine configuration (YAML or JSON)\n"
              << "  --data FILE       Location records (.jsonl, JSON array or GeoJSON); overrides data.path\n"
              << "  --query FILE|-    Structured query JSON (default: stdin)\n"
              << "  --log-level LVL   trace, debug, info, warn, error, critical\n"
              << "  --map             Append map analysis of the result\n"
              << "  --help, -h        Show this help message\n";
}

bool endsWith(const std::string& s, const std::string& suffix) {
    return s.size() >= suffix.size() && s.compare(s.size() - suffix.size(), suffix.size(), suffix) == 0;
}

std::optional<std::string> readAll(const std::string& path) {
    if (path == "-") {
        return std::string(std::istreambuf_iterator<char>(std::cin), std::istreambuf_iterator<char>());
    }
    std::ifstream in(path);
    if (!in) return std::nullopt;
    std::ostringstream ss;
    ss << in.rdbuf();
    return ss.str();
}

} // namespace

int main(int argc, char* argv[]) {
    std::optional<std::string> config_path;
    std::optional<std::string> data_path;
    std::optional<std::string> log_level;
    std::string query_path = "-";
    bool with_map = false;

    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        if (arg == "--config" && i + 1 < argc) {
            config_path = argv[++i];
        } else if (arg == "--data" && i + 1 < argc) {
            data_path = argv[++i];
        } else if (arg == "--query" && i + 1 < argc) {
            query_path = argv[++i];
        } else if (arg == "--log-level" && i + 1 < argc) {
            log_level = argv[++i];
        } else if (arg == "--map") {
            with_map = true;
        } else if (arg == "--help" || arg == "-h") {
            printUsage(argv[0]);
            return 0;
        } else {
            std::cerr << "Unknown argument: " << arg << "\n";
            printUsage(argv[0]);
            return kExitConfigurationError;
        }
    }

    utils::EngineConfig config;
    if (config_path) {
        std::pair<utils::EngineConfig::Status, utils::EngineConfig> loaded;
        if (endsWith(*config_path, ".json")) {
            std::ifstream in(*config_path);
            json j;
            try {
                j = json::parse(in);
            } catch (const json::exception& e) {
                std::cerr << "Cannot read config " << *config_path << ": " << e.what() << "\n";
                return kExitLoadFailure;
            }
            loaded = utils::EngineConfig::fromJson(j);
        } else {
            loaded = utils::EngineConfig::loadFromYaml(*config_path);
        }
        if (!loaded.first.ok) {
            std::cerr << "Invalid config: " << loaded.first.message << "\n";
            return kExitLoadFailure;
        }
        config = std::move(loaded.second);
    }
    if (data_path) config.data.path = *data_path;
    if (log_level) config.logging.level = utils::Logger::levelFromString(*log_level);

    utils::Logger::init(config.logging.file, config.logging.level);
    CINEMAP_INFO("=== cinemap query ===");

    auto [status, store] = RecordStore::loadFile(config.data.path);
    if (!status.ok) {
        CINEMAP_ERROR("Failed to load records: {}", status.message);
        std::cerr << "Failed to load records: " << status.message << "\n";
        utils::Logger::shutdown();
        return kExitLoadFailure;
    }

    std::shared_ptr<utils::IDiagnosticSink> sink;
    if (config.diagnostics.enabled) {
        utils::DiagnosticSinkConfig sink_cfg;
        sink_cfg.path = config.diagnostics.path;
        sink = std::make_shared<utils::JsonlDiagnosticSink>(sink_cfg);
    } else {
        sink = std::make_shared<utils::NullDiagnosticSink>();
    }

    query::QueryEngine engine(store, sink, query::QueryEngine::optionsFrom(config),
                              query::QueryEngine::landmarksFrom(config));

    auto text = readAll(query_path);
    if (!text) {
        std::cerr << "Cannot read query " << query_path << "\n";
        utils::Logger::shutdown();
        return kExitLoadFailure;
    }

    int rc = 0;
    try {
        json request = json::parse(*text);
        query::ResultEnvelope result = engine.evaluate(request);
        json out = result.toJSON();
        if (with_map) {
            out["map"] = query::MapAnalyzer(*store).analyze(result);
        }
        std::cout << out.dump(2) << std::endl;
    } catch (const json::parse_error& e) {
        std::cerr << "Query is not valid JSON: " << e.what() << "\n";
        rc = kExitConfigurationError;
    } catch (const query::ModificationRejected& e) {
        json refusal = {
            {"error", true},
            {"message", e.what()},
            {"requested_operation", e.requestedOperation()}
        };
        std::cout << refusal.dump(2) << std::endl;
        rc = kExitModificationRejected;
    } catch (const query::ConfigurationError& e) {
        std::cerr << "Configuration error: " << e.what() << "\n";
        rc = kExitConfigurationError;
    }

    utils::Logger::shutdown();
    return rc;
}
