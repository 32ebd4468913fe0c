/**
 * @file test_metrics_collector.cpp
 * @brief Unit tests for MetricsCollector NDJSON records.
 */

#include "core/json_util.hpp"
#include "telemetry/json_sink.hpp"
#include "telemetry/metrics_collector.hpp"

#include <gtest/gtest.h>
#include <thread>

using namespace model_mesh;

class MetricsCollectorTest : public ::testing::Test {
protected:
    MemorySink* sink_{nullptr};
    std::unique_ptr<MetricsCollector> metrics_;

    void SetUp() override {
        auto sink = std::make_unique<MemorySink>();
        sink_ = sink.get();
        metrics_ = std::make_unique<MetricsCollector>(std::move(sink));
    }

    Json::Value last_record() {
        auto lines = sink_->lines();
        EXPECT_FALSE(lines.empty());
        if (lines.empty()) return Json::Value{};
        auto parsed = json::parse(lines.back());
        EXPECT_TRUE(parsed.has_value());
        return parsed ? *parsed : Json::Value{};
    }
};

TEST_F(MetricsCollectorTest, TransferSessionRecord) {
    TransferSession session;
    session.session_id = "sess-1";
    session.client_node_id = "worker-01";
    session.model_id = "llm";
    session.status = SessionStatus::Failed;
    session.blocks.resize(3);
    session.blocks[0].status = TransferStatus::Completed;
    session.blocks[1].status = TransferStatus::Completed;
    session.blocks[2].status = TransferStatus::Failed;
    const auto now = std::chrono::system_clock::now();
    session.started_at = now;
    session.completed_at = now + std::chrono::milliseconds{250};

    metrics_->record_transfer_session(session);

    auto r = last_record();
    EXPECT_EQ(r["event"].asString(), "transfer_session");
    EXPECT_EQ(r["session"].asString(), "sess-1");
    EXPECT_EQ(r["status"].asString(), "failed");
    EXPECT_EQ(r["blocks_total"].asUInt64(), 3u);
    EXPECT_EQ(r["blocks_completed"].asInt64(), 2);
    EXPECT_EQ(r["duration_ms"].asInt64(), 250);
    EXPECT_GT(r["ts"].asInt64(), 0);
}

TEST_F(MetricsCollectorTest, AllocationRecord) {
    ResourceAllocation allocation{
        .allocation_id = "alloc_net_1",
        .network_id = "net",
        .request_id = "req_net_1",
        .granted = ResourceQuota{.cpu_cores = 2.0, .worker_slots = 1},
    };
    metrics_->record_allocation(allocation, AllocationEvent::Expired);

    auto r = last_record();
    EXPECT_EQ(r["event"].asString(), "allocation");
    EXPECT_EQ(r["kind"].asString(), "expired");
    EXPECT_DOUBLE_EQ(r["granted"]["cpu_cores"].asDouble(), 2.0);
    EXPECT_EQ(r["granted"]["worker_slots"].asInt(), 1);
}

TEST_F(MetricsCollectorTest, HealthFailoverAndDegradationRecords) {
    metrics_->record_health_transition("w1", HealthStatus::Warning, HealthStatus::Critical);
    EXPECT_EQ(last_record()["to"].asString(), "critical");

    metrics_->record_failover(FailoverEvent{.event_id = "e1", .event_type = "worker_failure",
                                            .source_id = "w1", .success = true});
    auto f = last_record();
    EXPECT_EQ(f["event"].asString(), "failover");
    EXPECT_EQ(f["source"].asString(), "w1");
    EXPECT_TRUE(f["success"].asBool());

    metrics_->record_degradation(DegradationLevel::None, DegradationLevel::EssentialOnly, "3/5");
    auto d = last_record();
    EXPECT_EQ(d["from"].asString(), "NONE");
    EXPECT_EQ(d["to"].asString(), "ESSENTIAL_ONLY");
    EXPECT_EQ(d["reason"].asString(), "3/5");

    EXPECT_EQ(sink_->lines().size(), 3u);
}

TEST_F(MetricsCollectorTest, CustomRecordNestsPayload) {
    Json::Value payload(Json::objectValue);
    payload["blocks"] = 4;
    metrics_->record_custom("model_export", payload);

    auto r = last_record();
    EXPECT_EQ(r["event"].asString(), "model_export");
    EXPECT_EQ(r["data"]["blocks"].asInt(), 4);
}

TEST_F(MetricsCollectorTest, ConcurrentWritesProduceWholeLines) {
    std::vector<std::thread> threads;
    for (int t = 0; t < 4; ++t) {
        threads.emplace_back([this, t] {
            for (int i = 0; i < 25; ++i) {
                metrics_->record_health_transition("w" + std::to_string(t),
                                                   HealthStatus::Healthy, HealthStatus::Warning);
            }
        });
    }
    for (auto& t : threads) t.join();
    metrics_->flush();

    auto lines = sink_->lines();
    ASSERT_EQ(lines.size(), 100u);
    for (const auto& line : lines) EXPECT_TRUE(json::parse(line).has_value());
    EXPECT_EQ(sink_->count_containing("\"w2\""), 25u);
}
