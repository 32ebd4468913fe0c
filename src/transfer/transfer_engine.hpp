/**
 * @file transfer_engine.hpp
 * @brief BlockTransferEngine: chunked, encrypted, resumable block transfer.
 *
 * Each session moves the blocks of one model from this admin node to one
 * client. Blocks of a session run concurrently on a bounded WorkerPool
 * (max_concurrent_transfers slots shared by all sessions). Every block is
 * loaded from the block source, checked by the integrity gate, re-encrypted
 * with the session's transport key and streamed as JSON chunk messages
 * through the client's IBlockChannel.
 *
 * Retry policy per block: transient failures are retried with exponential
 * backoff (base * 2^(retry-1), capped) until max_retries retries have been
 * consumed; integrity failures and missing payloads are terminal.
 *
 * Cancellation and pause are cooperative: in-flight attempts observe them
 * after their current exchange returns.
 */

#pragma once

#include "core/config.hpp"
#include "core/license_gate.hpp"
#include "core/logger.hpp"
#include "core/result.hpp"
#include "executor/worker_pool.hpp"
#include "storage/block_repository.hpp"
#include "transfer/block_channel.hpp"
#include "transfer/transfer_types.hpp"

#include <boost/uuid/random_generator.hpp>

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <unordered_map>
#include <vector>

namespace model_mesh {

class BlockTransferEngine {
public:
    /// Resolves the channel used to reach a client node; nullptr = unreachable.
    using ChannelFactory = std::function<std::shared_ptr<IBlockChannel>(const NodeId&)>;
    using ProgressCallback = std::function<void(const SessionId&, double)>;
    using SessionCallback = std::function<void(const TransferSession&)>;

    BlockTransferEngine(TransferConfig config,
                        const IBlockSource& source,
                        const LicenseGate& license,
                        ChannelFactory channels,
                        Logger& logger);
    ~BlockTransferEngine();

    // Non-copyable, non-movable
    BlockTransferEngine(const BlockTransferEngine&) = delete;
    BlockTransferEngine& operator=(const BlockTransferEngine&) = delete;

    // ── Session lifecycle ────────────────────

    /**
     * @brief Create a session for @p blocks of @p model_id.
     *
     * Fails with InvalidInput on empty ids, an empty block list, duplicate
     * block ids or blocks of another model; LicenseDenied when the license
     * is invalid, the model is not licensed or the client limit is reached;
     * NotFound when no channel to the client exists.
     */
    Result<SessionId> start_session(const NodeId& admin_id, const NodeId& client_id,
                                    const ModelId& model_id,
                                    const std::vector<EncryptedBlock>& blocks);

    /// Transfer every Pending or retryable-Failed block. True iff all blocks complete.
    bool transfer_blocks(const SessionId& session_id);

    /// Resume a Paused or Failed session. True iff it ends Completed.
    bool resume_transfer(const SessionId& session_id);

    /// Request a pause; the session ends Paused once in-flight attempts return.
    bool pause_transfer(const SessionId& session_id);

    /**
     * @brief Cancel the session. Idempotent.
     *
     * Pending and InProgress blocks, and Failed blocks still waiting out a
     * retry backoff, become Cancelled. Blocks that failed terminally
     * (integrity failure, missing payload, retries exhausted) stay Failed.
     */
    bool cancel_transfer(const SessionId& session_id);

    /**
     * @brief Forget Completed and Cancelled sessions that finished more than
     *        session_retention_s before @p now. Returns how many were dropped.
     *
     * Failed and Paused sessions are kept so they can still be resumed.
     * start_session() calls this with the current time.
     */
    size_t prune_finished_sessions(Timestamp now);

    // ── Queries ──────────────────────────────
    [[nodiscard]] std::optional<TransferProgress> get_progress(const SessionId& session_id) const;
    [[nodiscard]] std::optional<TransferSession> session(const SessionId& session_id) const;
    [[nodiscard]] std::optional<EncryptionKey> session_key(const SessionId& session_id) const;
    [[nodiscard]] std::vector<SessionId> session_ids() const;
    [[nodiscard]] TransferStats statistics() const;

    /// Integrity gate using the at-rest key held by the block source.
    [[nodiscard]] bool verify_block_integrity(const EncryptedBlock& block) const;

    // ── Callbacks ────────────────────────────
    void on_progress(ProgressCallback callback);
    /// Fired once a session is registered, before any block is sent.
    void on_session_started(SessionCallback callback);
    void on_session_finished(SessionCallback callback);

private:
    struct SessionState {
        mutable std::mutex mutex;
        std::condition_variable wake;
        TransferSession session;
        std::shared_ptr<IBlockChannel> channel;
        std::atomic<bool> cancel_requested{false};
        std::atomic<bool> pause_requested{false};
        std::atomic<bool> running{false};
        std::optional<Timestamp> finished_at;   ///< Set once Completed or Cancelled
    };

    std::shared_ptr<SessionState> find_state(const SessionId& session_id) const;
    bool run_transfer(const std::shared_ptr<SessionState>& state);
    void transfer_block_with_retry(SessionState& state, size_t index);
    Result<void> transfer_single_block(SessionState& state, size_t index);
    [[nodiscard]] std::chrono::milliseconds backoff_delay(uint32_t retry_count) const;
    static void recount(TransferSession& session);
    void notify_progress(const SessionId& session_id, double percentage);
    void notify_session(const std::vector<SessionCallback>& callbacks,
                        const TransferSession& snapshot);
    void notify_started(const TransferSession& snapshot);
    void notify_finished(const TransferSession& snapshot);

    TransferConfig config_;
    const IBlockSource& source_;
    const LicenseGate& license_;
    ChannelFactory channels_;
    Logger& logger_;

    mutable std::mutex mutex_;
    std::unordered_map<SessionId, std::shared_ptr<SessionState>> sessions_;
    boost::uuids::random_generator uuid_gen_;

    mutable std::mutex stats_mutex_;
    TransferStats stats_;

    std::mutex callback_mutex_;
    std::vector<ProgressCallback> progress_callbacks_;
    std::vector<SessionCallback> started_callbacks_;
    std::vector<SessionCallback> finished_callbacks_;

    WorkerPool pool_;
};

}  // namespace model_mesh
