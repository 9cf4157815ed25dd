#include "utils/diagnostic_sink.h"
#include "utils/logger.h"

#include <filesystem>
#include <fstream>
#include <stdexcept>

namespace cinemap {
namespace utils {

JsonlDiagnosticSink::JsonlDiagnosticSink(DiagnosticSinkConfig cfg)
    : cfg_(std::move(cfg)) {}

void JsonlDiagnosticSink::appendJsonLine(const nlohmann::json& j) {
    auto path = std::filesystem::path(cfg_.path);
    if (path.has_parent_path()) {
        std::filesystem::create_directories(path.parent_path());
    }
    std::ofstream ofs(cfg_.path, std::ios::app | std::ios::binary);
    if (!ofs) {
        throw std::runtime_error("cannot open " + cfg_.path);
    }
    ofs << j.dump() << "\n";
    ofs.flush();
    if (!ofs) {
        throw std::runtime_error("write to " + cfg_.path + " failed");
    }
}

void JsonlDiagnosticSink::append(const nlohmann::json& entry) noexcept {
    if (!cfg_.enabled) return;

    std::string failure;
    {
        std::lock_guard<std::mutex> lock(file_mu_);
        try {
            appendJsonLine(entry);
            ++written_;
            return;
        } catch (const std::exception& e) {
            ++errors_;
            last_error_ = e.what();
            failure = last_error_;
        }
    }
    try {
        CINEMAP_WARN("Diagnostic sink append failed: {}", failure);
    } catch (const std::exception&) {
        // logging is best effort here as well
    }
}

size_t JsonlDiagnosticSink::entriesWritten() const {
    std::lock_guard<std::mutex> lock(file_mu_);
    return written_;
}

size_t JsonlDiagnosticSink::errorCount() const {
    std::lock_guard<std::mutex> lock(file_mu_);
    return errors_;
}

std::string JsonlDiagnosticSink::lastError() const {
    std::lock_guard<std::mutex> lock(file_mu_);
    return last_error_;
}

void MemoryDiagnosticSink::append(const nlohmann::json& entry) noexcept {
    try {
        std::lock_guard<std::mutex> lock(mu_);
        entries_.push_back(entry);
    } catch (const std::exception&) {
        // out of memory: the entry is dropped
    }
}

std::vector<nlohmann::json> MemoryDiagnosticSink::entries() const {
    std::lock_guard<std::mutex> lock(mu_);
    return entries_;
}

size_t MemoryDiagnosticSink::size() const {
    std::lock_guard<std::mutex> lock(mu_);
    return entries_.size();
}

void MemoryDiagnosticSink::clear() {
    std::lock_guard<std::mutex> lock(mu_);
    entries_.clear();
}

} // namespace utils
} // namespace cinemap
