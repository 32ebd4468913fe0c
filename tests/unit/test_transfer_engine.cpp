/**
 * @file test_transfer_engine.cpp
 * @brief Unit tests for BlockTransferEngine: sessions, retries, integrity and lifecycle.
 */

#include "core/license_gate.hpp"
#include "crypto/block_cipher.hpp"
#include "telemetry/json_sink.hpp"
#include "transfer/block_channel.hpp"
#include "transfer/block_receiver.hpp"
#include "transfer/transfer_engine.hpp"

#include <gtest/gtest.h>
#include <atomic>
#include <memory>
#include <mutex>
#include <map>
#include <numeric>
#include <set>
#include <stdexcept>
#include <thread>

using namespace model_mesh;

namespace {

/**
 * @brief Channel that forwards to a receiver unless scripted to fail.
 *
 * Failing blocks answer with a transport error (retryable) or, when
 * integrity_failure is set, with the receiver's integrity message.
 * attempts() counts first chunks seen, one per send attempt.
 */
class ScriptedChannel : public IBlockChannel {
public:
    explicit ScriptedChannel(BlockReceiver& receiver) : receiver_(receiver) {}

    Result<std::string> exchange(std::string_view message,
                                 std::chrono::milliseconds /*timeout*/) override {
        auto chunk = decode_chunk(message);
        if (!chunk) return Error{"bad chunk", ErrorKind::InvalidInput};
        {
            std::lock_guard lock(mutex_);
            if (chunk->chunk_index == 0) ++attempts_[chunk->block_id];
            auto budget = fail_budget_.find(chunk->block_id);
            if (budget != fail_budget_.end() && budget->second > 0) {
                --budget->second;
                return Error{"connection refused", ErrorKind::TransientTransport};
            }
            if (failing_.contains(chunk->block_id)) {
                if (integrity_failure_) {
                    return encode_ack(TransferAck::failure(std::string{INTEGRITY_FAILURE_MESSAGE}));
                }
                return Error{"connection reset", ErrorKind::TransientTransport};
            }
        }
        return receiver_.handle_message(message);
    }

    [[nodiscard]] TransferMethod method() const noexcept override {
        return TransferMethod::Loopback;
    }

    void fail_block(const BlockId& id) {
        std::lock_guard lock(mutex_);
        failing_.insert(id);
    }
    void fail_times(const BlockId& id, size_t times) {
        std::lock_guard lock(mutex_);
        fail_budget_[id] = times;
    }
    void heal() {
        std::lock_guard lock(mutex_);
        failing_.clear();
    }
    void report_integrity_failure() {
        std::lock_guard lock(mutex_);
        integrity_failure_ = true;
    }
    size_t attempts(const BlockId& id) {
        std::lock_guard lock(mutex_);
        return attempts_[id];
    }

private:
    BlockReceiver& receiver_;
    std::mutex mutex_;
    std::set<BlockId> failing_;
    std::map<BlockId, size_t> attempts_;
    std::map<BlockId, size_t> fail_budget_;
    bool integrity_failure_{false};
};

TransferConfig fast_config() {
    TransferConfig config;
    config.max_concurrent_transfers = 3;
    config.max_retries = 3;
    config.retry_base_delay_ms = 1;
    config.max_retry_delay_ms = 8;
    config.chunk_size_bytes = 256;
    config.ack_timeout_ms = 1000;
    return config;
}

}  // namespace

class TransferEngineTest : public ::testing::Test {
protected:
    Logger logger_{std::make_unique<NullSink>()};
    BlockRepository source_;
    BlockRepository client_store_;
    StaticLicenseGate license_{true, LicenseTier::Pro, {"*"}, 20};
    std::unique_ptr<BlockTransferEngine> engine_;
    std::unique_ptr<BlockReceiver> receiver_;
    std::shared_ptr<ScriptedChannel> channel_;

    void SetUp() override { build(fast_config()); }

    void build(TransferConfig config) {
        engine_.reset();
        receiver_ = std::make_unique<BlockReceiver>(
            client_store_,
            [this](const SessionId& id) { return engine_->session_key(id); },
            logger_);
        channel_ = std::make_shared<ScriptedChannel>(*receiver_);
        engine_ = std::make_unique<BlockTransferEngine>(
            config, source_, license_,
            [this](const NodeId& client) -> std::shared_ptr<IBlockChannel> {
                if (client == "unreachable") return nullptr;
                return channel_;
            },
            logger_);
    }

    std::vector<EncryptedBlock> export_model(const ModelId& model, size_t size, size_t block_size) {
        Bytes plain(size);
        std::iota(plain.begin(), plain.end(), uint8_t{1});
        auto blocks = source_.export_model(model, plain, block_size);
        EXPECT_TRUE(blocks.has_value());
        return *blocks;
    }

    SessionId start(const std::vector<EncryptedBlock>& blocks, const NodeId& client = "client-1") {
        auto session = engine_->start_session("admin", client, blocks.front().model_id, blocks);
        EXPECT_TRUE(session.has_value()) << session.error().message;
        return *session;
    }

    const BlockTransferInfo& block_info(const TransferSession& s, const BlockId& id) {
        for (const auto& b : s.blocks) {
            if (b.block_id == id) return b;
        }
        throw std::runtime_error("block not in session: " + id);
    }
};

// ═══════════════════════════════════════════════
// Session creation
// ═══════════════════════════════════════════════

TEST_F(TransferEngineTest, StartSessionBuildsPendingBlocks) {
    auto blocks = export_model("tiny", 600, 256);
    ASSERT_EQ(blocks.size(), 3u);

    auto id = start(blocks);
    auto s = engine_->session(id);
    ASSERT_TRUE(s.has_value());
    EXPECT_EQ(s->status, SessionStatus::Pending);
    EXPECT_EQ(s->total_blocks, 3u);
    uint64_t expected_total = 0;
    for (const auto& b : blocks) expected_total += b.encrypted_size;
    EXPECT_EQ(s->total_size, expected_total);
    for (const auto& b : s->blocks) {
        EXPECT_EQ(b.status, TransferStatus::Pending);
        EXPECT_EQ(b.transfer_id, id + "/" + std::to_string(b.block_index));
    }
    EXPECT_EQ(s->encryption_key.key_id, "session_" + id);
}

TEST_F(TransferEngineTest, SessionIdsAreUnique) {
    auto blocks = export_model("tiny", 100, 64);
    EXPECT_NE(start(blocks), start(blocks));
}

TEST_F(TransferEngineTest, RejectsEmptyAndDuplicateBlocks) {
    auto empty = engine_->start_session("admin", "client-1", "tiny", {});
    ASSERT_FALSE(empty.has_value());
    EXPECT_EQ(empty.error().kind, ErrorKind::InvalidInput);

    auto blocks = export_model("tiny", 100, 64);
    blocks.push_back(blocks.front());
    auto dup = engine_->start_session("admin", "client-1", "tiny", blocks);
    ASSERT_FALSE(dup.has_value());
    EXPECT_EQ(dup.error().kind, ErrorKind::InvalidInput);
}

TEST_F(TransferEngineTest, UnreachableClient) {
    auto blocks = export_model("tiny", 100, 64);
    auto result = engine_->start_session("admin", "unreachable", "tiny", blocks);
    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error().kind, ErrorKind::NotFound);
}

TEST_F(TransferEngineTest, InvalidLicenseDenied) {
    auto blocks = export_model("tiny", 100, 64);
    license_.set_valid(false);
    auto result = engine_->start_session("admin", "client-1", "tiny", blocks);
    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error().kind, ErrorKind::LicenseDenied);
}

TEST_F(TransferEngineTest, UnlicensedModelDenied) {
    auto blocks = export_model("tiny", 100, 64);
    license_.set_allowed_models({"other-model"});
    auto result = engine_->start_session("admin", "client-1", "tiny", blocks);
    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error().kind, ErrorKind::LicenseDenied);
}

TEST_F(TransferEngineTest, ClientLimitDenied) {
    auto blocks = export_model("tiny", 100, 64);
    license_.set_max_clients(1);
    start(blocks, "client-1");
    // Same client may open another session
    start(blocks, "client-1");

    auto second = engine_->start_session("admin", "client-2", "tiny", blocks);
    ASSERT_FALSE(second.has_value());
    EXPECT_EQ(second.error().kind, ErrorKind::LicenseDenied);
}

// ═══════════════════════════════════════════════
// Transfer
// ═══════════════════════════════════════════════

TEST_F(TransferEngineTest, TransfersSixHundredByteModel) {
    auto blocks = export_model("tiny", 600, 256);
    auto id = start(blocks);

    EXPECT_TRUE(engine_->transfer_blocks(id));

    auto s = engine_->session(id);
    ASSERT_TRUE(s.has_value());
    EXPECT_EQ(s->status, SessionStatus::Completed);
    EXPECT_EQ(s->completed_blocks, 3u);
    EXPECT_EQ(s->transferred_size, s->total_size);
    EXPECT_DOUBLE_EQ(s->progress_percentage(), 100.0);
    ASSERT_TRUE(s->completed_at.has_value());

    auto key = source_.find_key("tiny_key");
    ASSERT_TRUE(key.has_value());
    for (const auto& b : blocks) {
        auto received = client_store_.find_block(b.block_id);
        ASSERT_TRUE(received.has_value());
        EXPECT_TRUE(verify_block_integrity(*received, *key));
        EXPECT_EQ(block_info(*s, b.block_id).attempts, 1u);
    }

    auto stats = engine_->statistics();
    EXPECT_EQ(stats.completed_sessions, 1u);
    EXPECT_EQ(stats.total_blocks_transferred, 3u);
    EXPECT_EQ(stats.total_bytes_transferred, s->total_size);
}

TEST_F(TransferEngineTest, TransientFailureRetriesThenFails) {
    auto blocks = export_model("tiny", 200, 256);
    ASSERT_EQ(blocks.size(), 1u);
    channel_->fail_block(blocks[0].block_id);
    auto id = start(blocks);

    EXPECT_FALSE(engine_->transfer_blocks(id));

    auto s = engine_->session(id);
    ASSERT_TRUE(s.has_value());
    EXPECT_EQ(s->status, SessionStatus::Failed);
    const auto& b = block_info(*s, blocks[0].block_id);
    EXPECT_EQ(b.status, TransferStatus::Failed);
    EXPECT_EQ(b.attempts, 4u);
    EXPECT_EQ(b.retry_count, 3u);
    EXPECT_FALSE(b.can_retry());
    EXPECT_EQ(channel_->attempts(blocks[0].block_id), 4u);
    EXPECT_EQ(engine_->statistics().retry_attempts, 3u);
    EXPECT_EQ(engine_->statistics().failed_sessions, 1u);
}

TEST_F(TransferEngineTest, TransientFailureRecovers) {
    auto blocks = export_model("tiny", 200, 256);
    channel_->fail_times(blocks[0].block_id, 2);
    auto id = start(blocks);

    EXPECT_TRUE(engine_->transfer_blocks(id));

    auto s = engine_->session(id);
    ASSERT_TRUE(s.has_value());
    const auto& b = block_info(*s, blocks[0].block_id);
    EXPECT_EQ(b.status, TransferStatus::Completed);
    EXPECT_EQ(b.attempts, 3u);
    EXPECT_EQ(b.retry_count, 2u);
    EXPECT_TRUE(b.error_message.empty());
}

TEST_F(TransferEngineTest, SourceIntegrityFailureIsTerminal) {
    auto blocks = export_model("tiny", 200, 256);
    auto corrupted = blocks[0];
    corrupted.checksum = std::string(64, '0');
    source_.put_block(corrupted);
    auto id = start({corrupted});

    EXPECT_FALSE(engine_->transfer_blocks(id));

    auto s = engine_->session(id);
    ASSERT_TRUE(s.has_value());
    const auto& b = block_info(*s, corrupted.block_id);
    EXPECT_EQ(b.status, TransferStatus::Failed);
    EXPECT_EQ(b.attempts, 1u);
    EXPECT_EQ(b.retry_count, 0u);
    EXPECT_FALSE(b.retryable);
    EXPECT_EQ(b.error_message, INTEGRITY_FAILURE_MESSAGE);
    EXPECT_EQ(channel_->attempts(corrupted.block_id), 0u);
    EXPECT_EQ(engine_->statistics().integrity_failures, 1u);
}

TEST_F(TransferEngineTest, ReceiverIntegrityFailureIsTerminal) {
    auto blocks = export_model("tiny", 200, 256);
    channel_->fail_block(blocks[0].block_id);
    channel_->report_integrity_failure();
    auto id = start(blocks);

    EXPECT_FALSE(engine_->transfer_blocks(id));

    auto s = engine_->session(id);
    ASSERT_TRUE(s.has_value());
    const auto& b = block_info(*s, blocks[0].block_id);
    EXPECT_EQ(b.attempts, 1u);
    EXPECT_EQ(b.error_message, INTEGRITY_FAILURE_MESSAGE);
}

TEST_F(TransferEngineTest, MissingPayloadIsTerminal) {
    auto blocks = export_model("tiny", 200, 256);
    source_.remove_block(blocks[0].block_id);
    auto id = start(blocks);

    EXPECT_FALSE(engine_->transfer_blocks(id));
    auto s = engine_->session(id);
    ASSERT_TRUE(s.has_value());
    const auto& b = block_info(*s, blocks[0].block_id);
    EXPECT_EQ(b.attempts, 1u);
    EXPECT_FALSE(b.retryable);
}

TEST_F(TransferEngineTest, PartialCompletionFailsSession) {
    auto blocks = export_model("tiny", 600, 256);
    channel_->fail_block(blocks[1].block_id);
    auto id = start(blocks);

    EXPECT_FALSE(engine_->transfer_blocks(id));

    auto s = engine_->session(id);
    ASSERT_TRUE(s.has_value());
    EXPECT_EQ(s->status, SessionStatus::Failed);
    EXPECT_EQ(s->completed_blocks, 2u);
    EXPECT_EQ(block_info(*s, blocks[0].block_id).status, TransferStatus::Completed);
    EXPECT_EQ(block_info(*s, blocks[1].block_id).status, TransferStatus::Failed);
    EXPECT_EQ(block_info(*s, blocks[2].block_id).status, TransferStatus::Completed);
}

// ═══════════════════════════════════════════════
// Lifecycle
// ═══════════════════════════════════════════════

TEST_F(TransferEngineTest, ResumeRetriesOnlyFailedBlocks) {
    auto blocks = export_model("tiny", 600, 256);
    channel_->fail_block(blocks[1].block_id);
    auto id = start(blocks);
    ASSERT_FALSE(engine_->transfer_blocks(id));

    channel_->heal();
    EXPECT_TRUE(engine_->resume_transfer(id));

    auto s = engine_->session(id);
    ASSERT_TRUE(s.has_value());
    EXPECT_EQ(s->status, SessionStatus::Completed);
    EXPECT_EQ(block_info(*s, blocks[0].block_id).attempts, 1u);
    EXPECT_EQ(block_info(*s, blocks[1].block_id).attempts, 5u);
    EXPECT_EQ(channel_->attempts(blocks[0].block_id), 1u);
}

TEST_F(TransferEngineTest, ResumeCompletedIsIdempotent) {
    auto blocks = export_model("tiny", 600, 256);
    auto id = start(blocks);
    ASSERT_TRUE(engine_->transfer_blocks(id));

    EXPECT_TRUE(engine_->resume_transfer(id));
    EXPECT_TRUE(engine_->resume_transfer(id));
    for (const auto& b : blocks) EXPECT_EQ(channel_->attempts(b.block_id), 1u);
    EXPECT_EQ(engine_->statistics().completed_sessions, 1u);
}

TEST_F(TransferEngineTest, CancelPendingSession) {
    auto blocks = export_model("tiny", 600, 256);
    auto id = start(blocks);

    EXPECT_TRUE(engine_->cancel_transfer(id));
    auto s = engine_->session(id);
    ASSERT_TRUE(s.has_value());
    EXPECT_EQ(s->status, SessionStatus::Cancelled);
    for (const auto& b : s->blocks) EXPECT_EQ(b.status, TransferStatus::Cancelled);

    EXPECT_FALSE(engine_->transfer_blocks(id));
    EXPECT_FALSE(engine_->resume_transfer(id));
    EXPECT_TRUE(engine_->cancel_transfer(id));
    for (const auto& b : blocks) EXPECT_EQ(channel_->attempts(b.block_id), 0u);
}

TEST_F(TransferEngineTest, CancelDuringRetries) {
    auto config = fast_config();
    config.retry_base_delay_ms = 200;
    config.max_retry_delay_ms = 200;
    build(config);

    auto blocks = export_model("tiny", 200, 256);
    channel_->fail_block(blocks[0].block_id);
    auto id = start(blocks);

    std::thread canceller([this, id] {
        std::this_thread::sleep_for(std::chrono::milliseconds(50));
        engine_->cancel_transfer(id);
    });
    EXPECT_FALSE(engine_->transfer_blocks(id));
    canceller.join();

    auto s = engine_->session(id);
    ASSERT_TRUE(s.has_value());
    EXPECT_EQ(s->status, SessionStatus::Cancelled);
    EXPECT_LT(block_info(*s, blocks[0].block_id).attempts, 4u);
    EXPECT_EQ(block_info(*s, blocks[0].block_id).status, TransferStatus::Cancelled);
}

TEST_F(TransferEngineTest, CancelKeepsTerminallyFailedBlocks) {
    auto blocks = export_model("tiny", 600, 256);
    channel_->fail_block(blocks[0].block_id);
    channel_->report_integrity_failure();
    auto id = start(blocks);
    ASSERT_FALSE(engine_->transfer_blocks(id));
    ASSERT_EQ(engine_->session(id)->status, SessionStatus::Failed);

    EXPECT_TRUE(engine_->cancel_transfer(id));

    auto s = engine_->session(id);
    ASSERT_TRUE(s.has_value());
    EXPECT_EQ(s->status, SessionStatus::Cancelled);
    EXPECT_EQ(block_info(*s, blocks[0].block_id).status, TransferStatus::Failed);
    EXPECT_EQ(block_info(*s, blocks[0].block_id).error_message, INTEGRITY_FAILURE_MESSAGE);
    EXPECT_EQ(block_info(*s, blocks[1].block_id).status, TransferStatus::Completed);
    EXPECT_EQ(block_info(*s, blocks[2].block_id).status, TransferStatus::Completed);
}

TEST_F(TransferEngineTest, PauseThenResume) {
    auto blocks = export_model("tiny", 600, 256);
    auto id = start(blocks);

    EXPECT_TRUE(engine_->pause_transfer(id));
    EXPECT_EQ(engine_->session(id)->status, SessionStatus::Paused);

    EXPECT_TRUE(engine_->resume_transfer(id));
    EXPECT_EQ(engine_->session(id)->status, SessionStatus::Completed);
}

TEST_F(TransferEngineTest, UnknownSession) {
    EXPECT_FALSE(engine_->transfer_blocks("nope"));
    EXPECT_FALSE(engine_->resume_transfer("nope"));
    EXPECT_FALSE(engine_->cancel_transfer("nope"));
    EXPECT_FALSE(engine_->get_progress("nope").has_value());
}

// ═══════════════════════════════════════════════
// Session retention
// ═══════════════════════════════════════════════

TEST_F(TransferEngineTest, PrunesCompletedAndCancelledSessions) {
    auto config = fast_config();
    config.session_retention_s = 0;
    build(config);

    auto done_blocks = export_model("done", 200, 256);
    auto dropped_blocks = export_model("dropped", 200, 256);
    auto broken_blocks = export_model("broken", 200, 256);
    channel_->fail_block(broken_blocks[0].block_id);
    channel_->report_integrity_failure();

    auto done = start(done_blocks);
    auto dropped = start(dropped_blocks);
    auto broken = start(broken_blocks);
    ASSERT_TRUE(engine_->transfer_blocks(done));
    ASSERT_TRUE(engine_->cancel_transfer(dropped));
    ASSERT_FALSE(engine_->transfer_blocks(broken));

    EXPECT_EQ(engine_->prune_finished_sessions(std::chrono::system_clock::now()), 2u);
    EXPECT_FALSE(engine_->session(done).has_value());
    EXPECT_FALSE(engine_->session(dropped).has_value());
    EXPECT_FALSE(engine_->session_key(done).has_value());
    ASSERT_TRUE(engine_->session(broken).has_value());
    EXPECT_EQ(engine_->session_ids(), std::vector<SessionId>{broken});

    auto stats = engine_->statistics();
    EXPECT_EQ(stats.total_sessions, 3u);
    EXPECT_EQ(stats.completed_sessions, 1u);
    EXPECT_EQ(stats.failed_sessions, 1u);
}

TEST_F(TransferEngineTest, KeepsFinishedSessionsWithinRetention) {
    auto blocks = export_model("tiny", 200, 256);
    auto id = start(blocks);
    ASSERT_TRUE(engine_->transfer_blocks(id));

    auto now = std::chrono::system_clock::now();
    EXPECT_EQ(engine_->prune_finished_sessions(now), 0u);
    EXPECT_TRUE(engine_->session(id).has_value());

    EXPECT_EQ(engine_->prune_finished_sessions(now + std::chrono::hours{2}), 1u);
    EXPECT_FALSE(engine_->session(id).has_value());
}

TEST_F(TransferEngineTest, StartSessionDropsExpiredSessions) {
    auto config = fast_config();
    config.session_retention_s = 0;
    build(config);

    auto first = start(export_model("first", 200, 256));
    ASSERT_TRUE(engine_->transfer_blocks(first));

    auto second = start(export_model("second", 200, 256));
    EXPECT_FALSE(engine_->session(first).has_value());
    EXPECT_EQ(engine_->session_ids(), std::vector<SessionId>{second});
}

// ═══════════════════════════════════════════════
// Progress and callbacks
// ═══════════════════════════════════════════════

TEST_F(TransferEngineTest, ProgressSnapshot) {
    auto blocks = export_model("tiny", 600, 256);
    auto id = start(blocks);

    auto before = engine_->get_progress(id);
    ASSERT_TRUE(before.has_value());
    EXPECT_EQ(before->completed_blocks, 0u);
    EXPECT_DOUBLE_EQ(before->progress_percentage, 0.0);
    EXPECT_FALSE(before->estimated_completion.has_value());

    ASSERT_TRUE(engine_->transfer_blocks(id));
    auto after = engine_->get_progress(id);
    ASSERT_TRUE(after.has_value());
    EXPECT_EQ(after->status, SessionStatus::Completed);
    EXPECT_EQ(after->completed_blocks, 3u);
    EXPECT_DOUBLE_EQ(after->progress_percentage, 100.0);
}

TEST_F(TransferEngineTest, ThrowingCallbacksDoNotBreakTransfer) {
    std::atomic<int> progress_calls{0};
    std::atomic<int> finished_calls{0};
    engine_->on_progress([](const SessionId&, double) { throw std::runtime_error("bad"); });
    engine_->on_progress([&](const SessionId&, double) { ++progress_calls; });
    engine_->on_session_finished([](const TransferSession&) { throw std::runtime_error("bad"); });
    engine_->on_session_finished([&](const TransferSession& s) {
        EXPECT_EQ(s.status, SessionStatus::Completed);
        ++finished_calls;
    });

    auto id = start(export_model("tiny", 600, 256));
    EXPECT_TRUE(engine_->transfer_blocks(id));
    EXPECT_EQ(progress_calls.load(), 3);
    EXPECT_EQ(finished_calls.load(), 1);
}

TEST_F(TransferEngineTest, SessionStartedCallbackCarriesKey) {
    std::string seen_key;
    engine_->on_session_started([&](const TransferSession& s) {
        seen_key = s.encryption_key.key_id;
    });
    auto id = start(export_model("tiny", 100, 256));
    EXPECT_EQ(seen_key, "session_" + id);
}

TEST_F(TransferEngineTest, VerifiesBlocksAgainstAtRestKey) {
    auto blocks = export_model("tiny", 100, 256);
    EXPECT_TRUE(engine_->verify_block_integrity(blocks[0]));

    auto tampered = blocks[0];
    tampered.ciphertext[0] ^= 0x01;
    EXPECT_FALSE(engine_->verify_block_integrity(tampered));

    auto unknown_key = blocks[0];
    unknown_key.key_id = "missing_key";
    EXPECT_FALSE(engine_->verify_block_integrity(unknown_key));
}
