/**
 * @file transfer_types.hpp
 * @brief Block transfer state: per-block info, sessions, progress and statistics.
 */

#pragma once

#include "core/types.hpp"
#include "crypto/encrypted_block.hpp"

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace model_mesh {

/// Error text reported for blocks that fail the integrity gate.
inline constexpr std::string_view INTEGRITY_FAILURE_MESSAGE = "integrity verification failed";

inline constexpr uint32_t DEFAULT_MAX_RETRIES = 3;

// ─────────────────────────────────────────────
// Status enums
// ─────────────────────────────────────────────

enum class TransferStatus : uint8_t {
    Pending,
    InProgress,
    Completed,
    Failed,
    Cancelled
};

[[nodiscard]] constexpr std::string_view to_string(TransferStatus status) noexcept {
    switch (status) {
        case TransferStatus::Pending:    return "pending";
        case TransferStatus::InProgress: return "in_progress";
        case TransferStatus::Completed:  return "completed";
        case TransferStatus::Failed:     return "failed";
        case TransferStatus::Cancelled:  return "cancelled";
    }
    return "unknown";
}

enum class SessionStatus : uint8_t {
    Pending,
    InProgress,
    Paused,
    Completed,
    Failed,
    Cancelled
};

[[nodiscard]] constexpr std::string_view to_string(SessionStatus status) noexcept {
    switch (status) {
        case SessionStatus::Pending:    return "pending";
        case SessionStatus::InProgress: return "in_progress";
        case SessionStatus::Paused:     return "paused";
        case SessionStatus::Completed:  return "completed";
        case SessionStatus::Failed:     return "failed";
        case SessionStatus::Cancelled:  return "cancelled";
    }
    return "unknown";
}

/// How chunk messages reach the peer.
enum class TransferMethod : uint8_t {
    WebSocket,
    DirectStream,
    Loopback
};

[[nodiscard]] constexpr std::string_view to_string(TransferMethod method) noexcept {
    switch (method) {
        case TransferMethod::WebSocket:    return "websocket";
        case TransferMethod::DirectStream: return "direct_stream";
        case TransferMethod::Loopback:     return "loopback";
    }
    return "unknown";
}

// ─────────────────────────────────────────────
// BlockTransferInfo
// ─────────────────────────────────────────────

/**
 * @brief Transfer state of one block within a session.
 *
 * retry_count counts retries consumed (attempts - 1 on exhaustion).
 * retryable is cleared by terminal failures (integrity, missing payload).
 */
struct BlockTransferInfo {
    std::string transfer_id;
    BlockId block_id;
    uint32_t block_index{0};
    uint64_t total_size{0};
    uint64_t transferred_size{0};
    TransferStatus status{TransferStatus::Pending};
    uint32_t retry_count{0};
    uint32_t max_retries{DEFAULT_MAX_RETRIES};
    uint32_t attempts{0};
    bool retryable{true};
    std::string error_message;
    std::optional<Timestamp> started_at;
    std::optional<Timestamp> completed_at;

    [[nodiscard]] double progress_percentage() const noexcept {
        if (total_size == 0) return status == TransferStatus::Completed ? 100.0 : 0.0;
        return static_cast<double>(transferred_size) / static_cast<double>(total_size) * 100.0;
    }

    [[nodiscard]] bool is_complete() const noexcept {
        return status == TransferStatus::Completed;
    }

    [[nodiscard]] bool can_retry() const noexcept {
        return status == TransferStatus::Failed && retryable && retry_count < max_retries;
    }
};

// ─────────────────────────────────────────────
// TransferSession
// ─────────────────────────────────────────────

/**
 * @brief All blocks of one model moving between one admin and one client.
 */
struct TransferSession {
    SessionId session_id;
    NodeId admin_node_id;
    NodeId client_node_id;
    ModelId model_id;
    std::vector<BlockTransferInfo> blocks;
    uint32_t total_blocks{0};
    uint32_t completed_blocks{0};
    uint64_t total_size{0};
    uint64_t transferred_size{0};
    SessionStatus status{SessionStatus::Pending};
    EncryptionKey encryption_key;
    TransferMethod method{TransferMethod::DirectStream};
    Timestamp created_at;
    std::optional<Timestamp> started_at;
    std::optional<Timestamp> completed_at;

    [[nodiscard]] bool is_complete() const noexcept {
        return !blocks.empty() && completed_blocks == blocks.size();
    }

    [[nodiscard]] double progress_percentage() const noexcept {
        if (total_size == 0) return 0.0;
        return static_cast<double>(transferred_size) / static_cast<double>(total_size) * 100.0;
    }
};

/**
 * @brief Point-in-time progress snapshot of a session.
 */
struct TransferProgress {
    SessionId session_id;
    SessionStatus status{SessionStatus::Pending};
    uint32_t completed_blocks{0};
    uint32_t total_blocks{0};
    uint64_t transferred_size{0};
    uint64_t total_size{0};
    double progress_percentage{0.0};
    std::optional<Timestamp> estimated_completion;
};

/**
 * @brief Engine-wide counters.
 */
struct TransferStats {
    uint64_t total_sessions{0};
    uint64_t completed_sessions{0};
    uint64_t failed_sessions{0};
    uint64_t total_bytes_transferred{0};
    uint64_t total_blocks_transferred{0};
    uint64_t retry_attempts{0};
    uint64_t integrity_failures{0};
};

}  // namespace model_mesh
