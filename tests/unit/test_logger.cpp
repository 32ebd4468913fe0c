/**
 * @file test_logger.cpp
 * @brief Unit tests for the JSON-lines Logger and log level parsing.
 */

#include "core/json_util.hpp"
#include "core/logger.hpp"
#include "telemetry/json_sink.hpp"

#include <gtest/gtest.h>
#include <filesystem>
#include <fstream>

using namespace model_mesh;

class LoggerTest : public ::testing::Test {
protected:
    MemorySink* sink_{nullptr};
    std::unique_ptr<Logger> logger_;

    void SetUp() override {
        auto sink = std::make_unique<MemorySink>();
        sink_ = sink.get();
        logger_ = std::make_unique<Logger>(std::move(sink), LogLevel::Info);
    }

    Json::Value line(size_t index) {
        auto lines = sink_->lines();
        EXPECT_LT(index, lines.size());
        if (index >= lines.size()) return Json::Value{};
        auto parsed = json::parse(lines[index]);
        EXPECT_TRUE(parsed.has_value()) << lines[index];
        return parsed ? *parsed : Json::Value{};
    }
};

// ═══════════════════════════════════════════════
// Level parsing
// ═══════════════════════════════════════════════

TEST(LogLevelTest, ParsesKnownNames) {
    EXPECT_TRUE(parse_log_level("debug") == LogLevel::Debug);
    EXPECT_TRUE(parse_log_level("info") == LogLevel::Info);
    EXPECT_TRUE(parse_log_level("warn") == LogLevel::Warn);
    EXPECT_TRUE(parse_log_level("warning") == LogLevel::Warn);
    EXPECT_TRUE(parse_log_level("error") == LogLevel::Error);
    EXPECT_FALSE(parse_log_level("verbose").has_value());
}

TEST(LogLevelTest, EscapesControlCharacters) {
    EXPECT_EQ(escape_json("a\"b"), "a\\\"b");
    EXPECT_EQ(escape_json("line\nbreak"), "line\\nbreak");
    EXPECT_EQ(escape_json(std::string(1, '\x01')), "\\u0001");
}

// ═══════════════════════════════════════════════
// Output
// ═══════════════════════════════════════════════

TEST_F(LoggerTest, EmitsParseableJsonLines) {
    logger_->info("block \"llm_block_0\" stored");

    auto record = line(0);
    EXPECT_EQ(record["level"].asString(), "info");
    EXPECT_EQ(record["msg"].asString(), "block \"llm_block_0\" stored");
    EXPECT_FALSE(record.isMember("node"));
    EXPECT_EQ(record["ts"].asString().back(), 'Z');
}

TEST_F(LoggerTest, DropsLinesBelowMinimumLevel) {
    logger_->debug("hidden");
    logger_->warn("shown");
    ASSERT_EQ(sink_->lines().size(), 1u);

    logger_->set_level(LogLevel::Debug);
    logger_->debug("now visible");
    EXPECT_EQ(sink_->lines().size(), 2u);
    EXPECT_EQ(logger_->level(), LogLevel::Debug);
}

TEST_F(LoggerTest, TagsLinesWithNodeId) {
    logger_->set_node_id("admin-1");
    logger_->error("worker w1 unreachable");

    auto record = line(0);
    EXPECT_EQ(record["node"].asString(), "admin-1");
    EXPECT_EQ(record["level"].asString(), "error");
    EXPECT_EQ(logger_->node_id(), "admin-1");
}

// ═══════════════════════════════════════════════
// File sink rotation
// ═══════════════════════════════════════════════

TEST(JsonFileSinkTest, RotatesAndKeepsBoundedGenerations) {
    auto dir = std::filesystem::temp_directory_path() / "model_mesh_test_log_rotation";
    std::filesystem::remove_all(dir);

    {
        JsonFileSink sink(dir, "node", 1, 2);
        sink.set_max_file_size_bytes(64);
        const std::string record = R"({"level":"info","msg":"0123456789012345678901234567890123456789"})";
        for (int i = 0; i < 6; ++i) {
            sink.write(record);
        }
        sink.flush();
    }

    EXPECT_TRUE(std::filesystem::exists(dir / "node.ndjson"));
    EXPECT_TRUE(std::filesystem::exists(dir / "node.1.ndjson"));
    EXPECT_TRUE(std::filesystem::exists(dir / "node.2.ndjson"));
    EXPECT_FALSE(std::filesystem::exists(dir / "node.3.ndjson"));

    std::ifstream current(dir / "node.ndjson");
    std::string first;
    std::getline(current, first);
    EXPECT_FALSE(first.empty());

    std::filesystem::remove_all(dir);
}
