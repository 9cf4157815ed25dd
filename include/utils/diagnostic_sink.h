#pragma once

#include <cstddef>
#include <memory>
#include <mutex>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>

namespace cinemap {
namespace utils {

/**
 * @brief Append-only destination for per-evaluation diagnostics
 *
 * append() must never throw and never fail the caller; implementations
 * report their own failures through their own channel.
 */
class IDiagnosticSink {
public:
    virtual ~IDiagnosticSink() = default;
    virtual void append(const nlohmann::json& entry) noexcept = 0;
};

struct DiagnosticSinkConfig {
    bool enabled = true;
    std::string path = "data/logs/query_diagnostics.jsonl";
};

// One JSON document per line. Appends are serialized; I/O errors are
// counted, logged at WARN and otherwise dropped.
class JsonlDiagnosticSink : public IDiagnosticSink {
public:
    explicit JsonlDiagnosticSink(DiagnosticSinkConfig cfg);

    void append(const nlohmann::json& entry) noexcept override;

    size_t entriesWritten() const;
    size_t errorCount() const;
    std::string lastError() const;
    const DiagnosticSinkConfig& config() const { return cfg_; }

private:
    void appendJsonLine(const nlohmann::json& j);

    DiagnosticSinkConfig cfg_;
    mutable std::mutex file_mu_;
    size_t written_ = 0;
    size_t errors_ = 0;
    std::string last_error_;
};

// Keeps entries in memory; for tests and in-process inspection.
class MemoryDiagnosticSink : public IDiagnosticSink {
public:
    void append(const nlohmann::json& entry) noexcept override;

    std::vector<nlohmann::json> entries() const;
    size_t size() const;
    void clear();

private:
    mutable std::mutex mu_;
    std::vector<nlohmann::json> entries_;
};

class NullDiagnosticSink : public IDiagnosticSink {
public:
    void append(const nlohmann::json&) noexcept override {}
};

} // namespace utils
} // namespace cinemap
