#include <gtest/gtest.h>

#include "utils/diagnostic_sink.h"

#include <filesystem>
#include <fstream>
#include <thread>

using namespace cinemap::utils;
using json = nlohmann::json;

class DiagnosticSinkTest : public ::testing::Test {
protected:
    void SetUp() override {
        dir_ = "data/test_diagnostics";
        std::filesystem::remove_all(dir_);
        log_path_ = dir_ + "/nested/diagnostics.jsonl";
    }

    void TearDown() override {
        std::filesystem::remove_all(dir_);
    }

    std::vector<json> readLines() const {
        std::vector<json> out;
        std::ifstream ifs(log_path_);
        std::string line;
        while (std::getline(ifs, line)) {
            out.push_back(json::parse(line));
        }
        return out;
    }

    std::string dir_;
    std::string log_path_;
};

TEST_F(DiagnosticSinkTest, AppendsOneLinePerEntry) {
    DiagnosticSinkConfig cfg;
    cfg.path = log_path_;
    JsonlDiagnosticSink sink(cfg);

    sink.append({{"query_id", "q-1"}, {"outcome", "success"}});
    sink.append({{"query_id", "q-2"}, {"outcome", "empty"}});

    ASSERT_TRUE(std::filesystem::exists(log_path_));
    auto lines = readLines();
    ASSERT_EQ(lines.size(), 2u);
    EXPECT_EQ(lines[0]["query_id"], "q-1");
    EXPECT_EQ(lines[1]["outcome"], "empty");
    EXPECT_EQ(sink.entriesWritten(), 2u);
    EXPECT_EQ(sink.errorCount(), 0u);
}

TEST_F(DiagnosticSinkTest, DisabledSinkWritesNothing) {
    DiagnosticSinkConfig cfg;
    cfg.enabled = false;
    cfg.path = log_path_;
    JsonlDiagnosticSink sink(cfg);

    sink.append({{"query_id", "q-1"}});
    EXPECT_FALSE(std::filesystem::exists(log_path_));
    EXPECT_EQ(sink.entriesWritten(), 0u);
}

TEST_F(DiagnosticSinkTest, WriteFailureIsCountedNotThrown) {
    // The target path is an existing directory
    std::filesystem::create_directories(log_path_);
    DiagnosticSinkConfig cfg;
    cfg.path = log_path_;
    JsonlDiagnosticSink sink(cfg);

    EXPECT_NO_THROW(sink.append({{"query_id", "q-1"}}));
    EXPECT_EQ(sink.errorCount(), 1u);
    EXPECT_EQ(sink.entriesWritten(), 0u);
    EXPECT_FALSE(sink.lastError().empty());
}

TEST_F(DiagnosticSinkTest, ConcurrentAppendsStayLineAtomic) {
    DiagnosticSinkConfig cfg;
    cfg.path = log_path_;
    JsonlDiagnosticSink sink(cfg);

    constexpr int kThreads = 8;
    constexpr int kPerThread = 50;
    std::vector<std::thread> workers;
    for (int t = 0; t < kThreads; ++t) {
        workers.emplace_back([&sink, t] {
            for (int i = 0; i < kPerThread; ++i) {
                sink.append({{"thread", t}, {"seq", i}, {"payload", std::string(200, 'x')}});
            }
        });
    }
    for (auto& w : workers) w.join();

    auto lines = readLines();
    EXPECT_EQ(lines.size(), static_cast<size_t>(kThreads * kPerThread));
    EXPECT_EQ(sink.entriesWritten(), static_cast<size_t>(kThreads * kPerThread));
}

TEST(MemoryDiagnosticSinkTest, KeepsEntries) {
    MemoryDiagnosticSink sink;
    sink.append({{"a", 1}});
    sink.append({{"b", 2}});
    ASSERT_EQ(sink.size(), 2u);
    EXPECT_EQ(sink.entries()[1]["b"], 2);
    sink.clear();
    EXPECT_EQ(sink.size(), 0u);
}
