/**
 * @file transfer_engine.cpp
 * @brief BlockTransferEngine implementation.
 */

#include "transfer/transfer_engine.hpp"

#include "core/json_util.hpp"
#include "crypto/block_cipher.hpp"
#include "storage/block_codec.hpp"
#include "transfer/wire_codec.hpp"

#include <boost/uuid/uuid.hpp>
#include <boost/uuid/uuid_io.hpp>

#include <algorithm>
#include <exception>
#include <future>
#include <unordered_set>

namespace model_mesh {

namespace {

bool is_active(SessionStatus status) noexcept {
    return status == SessionStatus::Pending
        || status == SessionStatus::InProgress
        || status == SessionStatus::Paused;
}

struct RunningFlagReset {
    std::atomic<bool>& flag;
    ~RunningFlagReset() { flag = false; }
};

}  // anonymous namespace

// ─────────────────────────────────────────────
// Construction
// ─────────────────────────────────────────────

BlockTransferEngine::BlockTransferEngine(TransferConfig config,
                                         const IBlockSource& source,
                                         const LicenseGate& license,
                                         ChannelFactory channels,
                                         Logger& logger)
    : config_(std::move(config))
    , source_(source)
    , license_(license)
    , channels_(std::move(channels))
    , logger_(logger)
    , pool_(config_.max_concurrent_transfers) {}

BlockTransferEngine::~BlockTransferEngine() {
    std::vector<std::shared_ptr<SessionState>> states;
    {
        std::lock_guard lock(mutex_);
        for (auto& [id, state] : sessions_) states.push_back(state);
    }
    for (auto& state : states) {
        std::lock_guard lock(state->mutex);
        state->cancel_requested = true;
        state->wake.notify_all();
    }
    pool_.shutdown();
}

// ─────────────────────────────────────────────
// Session lifecycle
// ─────────────────────────────────────────────

Result<SessionId> BlockTransferEngine::start_session(const NodeId& admin_id,
                                                     const NodeId& client_id,
                                                     const ModelId& model_id,
                                                     const std::vector<EncryptedBlock>& blocks) {
    if (admin_id.empty() || client_id.empty() || model_id.empty()) {
        return Error{"admin, client and model ids are required", ErrorKind::InvalidInput};
    }
    if (blocks.empty()) {
        return Error{"no blocks to transfer for model " + model_id, ErrorKind::InvalidInput};
    }

    std::unordered_set<BlockId> seen;
    for (const auto& block : blocks) {
        if (block.block_id.empty() || !seen.insert(block.block_id).second) {
            return Error{"duplicate or empty block id: " + block.block_id,
                         ErrorKind::InvalidInput};
        }
        if (block.model_id != model_id) {
            return Error{"block " + block.block_id + " does not belong to model " + model_id,
                         ErrorKind::InvalidInput};
        }
    }

    if (!license_.is_valid()) {
        return Error{"license is not valid", ErrorKind::LicenseDenied};
    }
    if (!license_.allows_model(model_id)) {
        return Error{"license does not cover model " + model_id, ErrorKind::LicenseDenied};
    }

    auto channel = channels_ ? channels_(client_id) : nullptr;
    if (!channel) {
        return Error{"no channel to client " + client_id, ErrorKind::NotFound};
    }

    prune_finished_sessions(std::chrono::system_clock::now());

    SessionId session_id;
    {
        std::lock_guard lock(mutex_);
        session_id = boost::uuids::to_string(uuid_gen_());
    }

    auto key = crypto::generate_key("session_" + session_id);
    if (!key) return key.error();

    auto state = std::make_shared<SessionState>();
    auto& s = state->session;
    s.session_id = session_id;
    s.admin_node_id = admin_id;
    s.client_node_id = client_id;
    s.model_id = model_id;
    s.encryption_key = std::move(*key);
    s.method = channel->method();
    s.created_at = std::chrono::system_clock::now();
    s.total_blocks = static_cast<uint32_t>(blocks.size());
    for (const auto& block : blocks) {
        BlockTransferInfo info;
        info.transfer_id = make_transfer_id(session_id, block.block_index);
        info.block_id = block.block_id;
        info.block_index = block.block_index;
        info.total_size = block.encrypted_size;
        info.max_retries = config_.max_retries;
        s.total_size += block.encrypted_size;
        s.blocks.push_back(std::move(info));
    }
    state->channel = std::move(channel);

    {
        std::lock_guard lock(mutex_);
        std::unordered_set<NodeId> active_clients;
        for (const auto& [id, other] : sessions_) {
            std::lock_guard other_lock(other->mutex);
            if (is_active(other->session.status)) {
                active_clients.insert(other->session.client_node_id);
            }
        }
        if (!active_clients.contains(client_id)
            && active_clients.size() >= license_.max_clients()) {
            return Error{"license client limit reached (" +
                         std::to_string(license_.max_clients()) + ")",
                         ErrorKind::LicenseDenied};
        }
        sessions_.emplace(session_id, state);
    }

    {
        std::lock_guard lock(stats_mutex_);
        ++stats_.total_sessions;
    }

    TransferSession snapshot;
    {
        std::lock_guard lock(state->mutex);
        snapshot = s;
    }
    logger_.info("Transfer session " + session_id + " created: model=" + model_id
                 + " client=" + client_id + " blocks=" + std::to_string(blocks.size())
                 + " bytes=" + std::to_string(snapshot.total_size));
    notify_started(snapshot);
    return session_id;
}

bool BlockTransferEngine::transfer_blocks(const SessionId& session_id) {
    auto state = find_state(session_id);
    if (!state) {
        logger_.warn("transfer_blocks: unknown session " + session_id);
        return false;
    }
    return run_transfer(state);
}

bool BlockTransferEngine::resume_transfer(const SessionId& session_id) {
    auto state = find_state(session_id);
    if (!state) {
        logger_.warn("resume_transfer: unknown session " + session_id);
        return false;
    }

    {
        std::lock_guard lock(state->mutex);
        auto& s = state->session;
        if (s.status == SessionStatus::Completed) return true;
        if (s.status == SessionStatus::Cancelled || s.status == SessionStatus::InProgress
            || state->running) {
            logger_.warn("Cannot resume session " + session_id + " in state "
                         + std::string{to_string(s.status)});
            return false;
        }

        size_t reset = 0;
        for (auto& block : s.blocks) {
            if (block.status == TransferStatus::Failed) {
                block.status = TransferStatus::Pending;
                block.retry_count = 0;
                block.retryable = true;
                block.error_message.clear();
                ++reset;
            }
        }
        state->pause_requested = false;
        logger_.info("Resuming session " + session_id + ": " + std::to_string(reset)
                     + " failed block(s) reset, " + std::to_string(s.completed_blocks)
                     + "/" + std::to_string(s.total_blocks) + " already complete");
    }
    return run_transfer(state);
}

bool BlockTransferEngine::pause_transfer(const SessionId& session_id) {
    auto state = find_state(session_id);
    if (!state) return false;

    std::lock_guard lock(state->mutex);
    auto& s = state->session;
    if (s.status == SessionStatus::Pending) {
        s.status = SessionStatus::Paused;
        return true;
    }
    if (s.status != SessionStatus::InProgress) return false;

    state->pause_requested = true;
    state->wake.notify_all();
    logger_.info("Pause requested for session " + session_id);
    return true;
}

bool BlockTransferEngine::cancel_transfer(const SessionId& session_id) {
    auto state = find_state(session_id);
    if (!state) {
        logger_.warn("cancel_transfer: unknown session " + session_id);
        return false;
    }

    std::lock_guard lock(state->mutex);
    auto& s = state->session;
    if (s.status == SessionStatus::Completed || s.status == SessionStatus::Cancelled) {
        return true;
    }

    state->cancel_requested = true;
    s.status = SessionStatus::Cancelled;
    state->finished_at = std::chrono::system_clock::now();
    for (auto& block : s.blocks) {
        if (block.status == TransferStatus::Pending
            || block.status == TransferStatus::InProgress
            || block.can_retry()) {
            block.status = TransferStatus::Cancelled;
        }
    }
    recount(s);
    state->wake.notify_all();
    logger_.info("Transfer session " + session_id + " cancelled");
    return true;
}

size_t BlockTransferEngine::prune_finished_sessions(Timestamp now) {
    const auto retention = std::chrono::seconds{config_.session_retention_s};
    size_t dropped = 0;
    {
        std::lock_guard lock(mutex_);
        dropped = std::erase_if(sessions_, [&](const auto& entry) {
            const auto& state = entry.second;
            if (state->running) return false;
            std::lock_guard state_lock(state->mutex);
            const auto status = state->session.status;
            if (status != SessionStatus::Completed && status != SessionStatus::Cancelled) {
                return false;
            }
            return state->finished_at && *state->finished_at + retention <= now;
        });
    }
    if (dropped > 0) {
        logger_.debug("Pruned " + std::to_string(dropped) + " finished transfer sessions");
    }
    return dropped;
}

// ─────────────────────────────────────────────
// Transfer execution
// ─────────────────────────────────────────────

bool BlockTransferEngine::run_transfer(const std::shared_ptr<SessionState>& state) {
    if (state->running.exchange(true)) {
        logger_.warn("Session " + state->session.session_id + " is already transferring");
        return false;
    }
    RunningFlagReset reset{state->running};

    std::vector<size_t> work;
    {
        std::lock_guard lock(state->mutex);
        auto& s = state->session;
        if (s.status == SessionStatus::Completed) return true;
        if (s.status == SessionStatus::Cancelled || state->cancel_requested) return false;

        state->pause_requested = false;
        s.status = SessionStatus::InProgress;
        if (!s.started_at) s.started_at = std::chrono::system_clock::now();

        for (size_t i = 0; i < s.blocks.size(); ++i) {
            const auto& block = s.blocks[i];
            if (block.status == TransferStatus::Pending || block.can_retry()) {
                work.push_back(i);
            }
        }
    }

    std::vector<std::future<void>> futures;
    futures.reserve(work.size());
    for (size_t index : work) {
        futures.push_back(pool_.submit([this, state, index] {
            transfer_block_with_retry(*state, index);
        }));
    }
    for (auto& f : futures) f.get();

    TransferSession snapshot;
    bool success = false;
    {
        std::lock_guard lock(state->mutex);
        auto& s = state->session;
        recount(s);
        if (state->cancel_requested || s.status == SessionStatus::Cancelled) {
            s.status = SessionStatus::Cancelled;
            if (!state->finished_at) state->finished_at = std::chrono::system_clock::now();
        } else if (s.is_complete()) {
            s.status = SessionStatus::Completed;
            s.completed_at = std::chrono::system_clock::now();
            state->finished_at = s.completed_at;
            success = true;
        } else if (state->pause_requested) {
            s.status = SessionStatus::Paused;
        } else {
            s.status = SessionStatus::Failed;
        }
        snapshot = s;
    }

    if (snapshot.status == SessionStatus::Completed || snapshot.status == SessionStatus::Failed) {
        {
            std::lock_guard lock(stats_mutex_);
            if (success) ++stats_.completed_sessions; else ++stats_.failed_sessions;
        }
        notify_finished(snapshot);
    }

    logger_.info("Transfer session " + snapshot.session_id + " finished as "
                 + std::string{to_string(snapshot.status)} + ": "
                 + std::to_string(snapshot.completed_blocks) + "/"
                 + std::to_string(snapshot.total_blocks) + " blocks");
    return success;
}

void BlockTransferEngine::transfer_block_with_retry(SessionState& state, size_t index) {
    for (;;) {
        {
            std::lock_guard lock(state.mutex);
            auto& block = state.session.blocks[index];
            if (state.cancel_requested) {
                if (!block.is_complete()) block.status = TransferStatus::Cancelled;
                return;
            }
            if (state.pause_requested) return;

            block.status = TransferStatus::InProgress;
            if (!block.started_at) block.started_at = std::chrono::system_clock::now();
            ++block.attempts;
        }

        auto result = transfer_single_block(state, index);

        std::unique_lock lock(state.mutex);
        auto& block = state.session.blocks[index];

        if (state.cancel_requested || block.status == TransferStatus::Cancelled) {
            block.status = TransferStatus::Cancelled;
            return;
        }

        if (result) {
            block.status = TransferStatus::Completed;
            block.transferred_size = block.total_size;
            block.completed_at = std::chrono::system_clock::now();
            block.error_message.clear();
            recount(state.session);
            auto session_id = state.session.session_id;
            auto percentage = state.session.progress_percentage();
            auto bytes = block.total_size;
            lock.unlock();

            {
                std::lock_guard stats_lock(stats_mutex_);
                stats_.total_bytes_transferred += bytes;
                ++stats_.total_blocks_transferred;
            }
            notify_progress(session_id, percentage);
            return;
        }

        const auto& err = result.error();
        block.status = TransferStatus::Failed;

        if (err.kind == ErrorKind::IntegrityFailure) {
            block.retryable = false;
            block.error_message = std::string{INTEGRITY_FAILURE_MESSAGE};
            logger_.error("Block " + block.block_id + " failed integrity verification: "
                          + err.message);
            std::lock_guard stats_lock(stats_mutex_);
            ++stats_.integrity_failures;
            return;
        }

        block.error_message = err.message;
        if (err.kind != ErrorKind::TransientTransport) {
            block.retryable = false;
            logger_.error("Block " + block.block_id + " failed permanently: " + err.message);
            return;
        }

        if (block.retry_count >= block.max_retries) {
            logger_.error("Block " + block.block_id + " failed after "
                          + std::to_string(block.attempts) + " attempts: " + err.message);
            return;
        }

        ++block.retry_count;
        auto delay = backoff_delay(block.retry_count);
        logger_.warn("Block " + block.block_id + " attempt " + std::to_string(block.attempts)
                     + " failed (" + err.message + "), retrying in "
                     + std::to_string(delay.count()) + "ms");
        {
            std::lock_guard stats_lock(stats_mutex_);
            ++stats_.retry_attempts;
        }

        state.wake.wait_for(lock, delay, [&state] {
            return state.cancel_requested.load() || state.pause_requested.load();
        });
    }
}

Result<void> BlockTransferEngine::transfer_single_block(SessionState& state, size_t index) {
    BlockId block_id;
    std::string transfer_id;
    uint32_t block_index = 0;
    EncryptionKey session_key;
    std::shared_ptr<IBlockChannel> channel;
    {
        std::lock_guard lock(state.mutex);
        const auto& info = state.session.blocks[index];
        block_id = info.block_id;
        transfer_id = info.transfer_id;
        block_index = info.block_index;
        session_key = state.session.encryption_key;
        channel = state.channel;
    }

    auto block = source_.find_block(block_id);
    if (!block) {
        return Error{"block payload not found: " + block_id, ErrorKind::NotFound};
    }

    auto at_rest_key = source_.find_key(block->key_id);
    if (!at_rest_key) {
        return Error{"at-rest key " + block->key_id + " unavailable for " + block_id,
                     ErrorKind::IntegrityFailure};
    }
    if (!::model_mesh::verify_block_integrity(*block, *at_rest_key)) {
        return Error{"checksum mismatch for " + block_id, ErrorKind::IntegrityFailure};
    }

    auto payload = json::write_compact(block_to_json(*block));
    auto wire = crypto::encrypt_for_transport(
        session_key, std::span<const uint8_t>{reinterpret_cast<const uint8_t*>(payload.data()),
                                              payload.size()});
    if (!wire) return wire.error();

    auto chunks = split_into_chunks(*wire, config_.chunk_size_bytes);
    const auto timeout = std::chrono::milliseconds{config_.ack_timeout_ms};

    for (size_t i = 0; i < chunks.size(); ++i) {
        if (state.cancel_requested) {
            return Error{"transfer cancelled", ErrorKind::Internal};
        }

        ChunkMessage message{
            .transfer_id = transfer_id,
            .block_id = block_id,
            .block_index = block_index,
            .total_size = wire->size(),
            .chunk_index = static_cast<uint32_t>(i),
            .chunk_data = crypto::base64_encode(chunks[i]),
            .is_final_chunk = i + 1 == chunks.size(),
        };

        auto reply = channel->exchange(encode_chunk(message), timeout);
        if (!reply) return reply.error();

        auto ack = decode_ack(*reply);
        if (!ack) {
            return Error{"malformed acknowledgment: " + ack.error().message,
                         ErrorKind::TransientTransport};
        }
        if (!ack->success) {
            auto kind = ack->error == INTEGRITY_FAILURE_MESSAGE ? ErrorKind::IntegrityFailure
                                                                : ErrorKind::TransientTransport;
            return Error{"peer rejected chunk " + std::to_string(i) + ": " + ack->error, kind};
        }
    }
    return Result<void>{};
}

std::chrono::milliseconds BlockTransferEngine::backoff_delay(uint32_t retry_count) const {
    const uint32_t exponent = std::min<uint32_t>(retry_count == 0 ? 0 : retry_count - 1, 20);
    const uint64_t delay = static_cast<uint64_t>(config_.retry_base_delay_ms) << exponent;
    return std::chrono::milliseconds{std::min<uint64_t>(delay, config_.max_retry_delay_ms)};
}

void BlockTransferEngine::recount(TransferSession& session) {
    uint32_t completed = 0;
    uint64_t transferred = 0;
    for (const auto& block : session.blocks) {
        if (block.is_complete()) ++completed;
        transferred += block.transferred_size;
    }
    session.completed_blocks = completed;
    session.transferred_size = transferred;
}

// ─────────────────────────────────────────────
// Queries
// ─────────────────────────────────────────────

std::shared_ptr<BlockTransferEngine::SessionState> BlockTransferEngine::find_state(
    const SessionId& session_id) const {
    std::lock_guard lock(mutex_);
    auto it = sessions_.find(session_id);
    return it == sessions_.end() ? nullptr : it->second;
}

std::optional<TransferProgress> BlockTransferEngine::get_progress(
    const SessionId& session_id) const {
    auto state = find_state(session_id);
    if (!state) return std::nullopt;

    std::lock_guard lock(state->mutex);
    const auto& s = state->session;
    TransferProgress progress{
        .session_id = s.session_id,
        .status = s.status,
        .completed_blocks = s.completed_blocks,
        .total_blocks = s.total_blocks,
        .transferred_size = s.transferred_size,
        .total_size = s.total_size,
        .progress_percentage = s.progress_percentage(),
        .estimated_completion = std::nullopt,
    };

    if (s.status == SessionStatus::InProgress && s.started_at && s.transferred_size > 0) {
        auto now = std::chrono::system_clock::now();
        auto elapsed = std::chrono::duration<double>(now - *s.started_at).count();
        auto remaining = static_cast<double>(s.total_size - s.transferred_size);
        auto seconds_left = elapsed * remaining / static_cast<double>(s.transferred_size);
        progress.estimated_completion =
            now + std::chrono::duration_cast<std::chrono::system_clock::duration>(
                      std::chrono::duration<double>(seconds_left));
    }
    return progress;
}

std::optional<TransferSession> BlockTransferEngine::session(const SessionId& session_id) const {
    auto state = find_state(session_id);
    if (!state) return std::nullopt;
    std::lock_guard lock(state->mutex);
    return state->session;
}

std::optional<EncryptionKey> BlockTransferEngine::session_key(const SessionId& session_id) const {
    auto state = find_state(session_id);
    if (!state) return std::nullopt;
    std::lock_guard lock(state->mutex);
    return state->session.encryption_key;
}

std::vector<SessionId> BlockTransferEngine::session_ids() const {
    std::lock_guard lock(mutex_);
    std::vector<SessionId> ids;
    ids.reserve(sessions_.size());
    for (const auto& [id, state] : sessions_) ids.push_back(id);
    return ids;
}

TransferStats BlockTransferEngine::statistics() const {
    std::lock_guard lock(stats_mutex_);
    return stats_;
}

bool BlockTransferEngine::verify_block_integrity(const EncryptedBlock& block) const {
    auto key = source_.find_key(block.key_id);
    return key && ::model_mesh::verify_block_integrity(block, *key);
}

// ─────────────────────────────────────────────
// Callbacks
// ─────────────────────────────────────────────

void BlockTransferEngine::on_progress(ProgressCallback callback) {
    std::lock_guard lock(callback_mutex_);
    progress_callbacks_.push_back(std::move(callback));
}

void BlockTransferEngine::on_session_started(SessionCallback callback) {
    std::lock_guard lock(callback_mutex_);
    started_callbacks_.push_back(std::move(callback));
}

void BlockTransferEngine::on_session_finished(SessionCallback callback) {
    std::lock_guard lock(callback_mutex_);
    finished_callbacks_.push_back(std::move(callback));
}

void BlockTransferEngine::notify_progress(const SessionId& session_id, double percentage) {
    std::vector<ProgressCallback> callbacks;
    {
        std::lock_guard lock(callback_mutex_);
        callbacks = progress_callbacks_;
    }
    for (const auto& callback : callbacks) {
        try {
            callback(session_id, percentage);
        } catch (const std::exception& e) {
            logger_.warn("Progress callback failed for session " + session_id + ": " + e.what());
        }
    }
}

void BlockTransferEngine::notify_started(const TransferSession& snapshot) {
    std::vector<SessionCallback> callbacks;
    {
        std::lock_guard lock(callback_mutex_);
        callbacks = started_callbacks_;
    }
    notify_session(callbacks, snapshot);
}

void BlockTransferEngine::notify_finished(const TransferSession& snapshot) {
    std::vector<SessionCallback> callbacks;
    {
        std::lock_guard lock(callback_mutex_);
        callbacks = finished_callbacks_;
    }
    notify_session(callbacks, snapshot);
}

void BlockTransferEngine::notify_session(const std::vector<SessionCallback>& callbacks,
                                         const TransferSession& snapshot) {
    for (const auto& callback : callbacks) {
        try {
            callback(snapshot);
        } catch (const std::exception& e) {
            logger_.warn("Session callback failed for " + snapshot.session_id + ": " + e.what());
        }
    }
}

}  // namespace model_mesh
