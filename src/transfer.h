#pragma once

#include <chrono>
#include <cstdint>
#include <string>

namespace peerdrop {

/**
 * Lifecycle of one transfer as seen by one endpoint.
 *
 * Outgoing: REQUESTED -> NEGOTIATING -> TRANSFERRING -> DONE, or REJECTED.
 * Incoming: PENDING -> ACCEPTED -> NEGOTIATING -> TRANSFERRING -> DONE, or REJECTED.
 * Any non-terminal state may end in FAILED.
 */
enum class TransferState {
    PENDING,        // Incoming request waiting for the local decision
    REQUESTED,      // Outgoing request waiting for the peer's decision
    ACCEPTED,       // Incoming request accepted, waiting for the offer
    NEGOTIATING,    // Channel negotiation in progress
    TRANSFERRING,   // Chunks flowing
    DONE,
    REJECTED,
    FAILED
};

enum class TransferDirection {
    OUTGOING,
    INCOMING
};

std::string transfer_state_to_string(TransferState state);
std::string transfer_direction_to_string(TransferDirection direction);
bool is_terminal_state(TransferState state);

struct Transfer {
    std::string transfer_id;
    TransferDirection direction;
    TransferState state;

    std::string file_name;
    uint64_t file_size;
    std::string file_type;
    std::string sender_id;
    std::string receiver_id;

    std::string local_path;         // Source file when sending, artifact once received
    uint64_t bytes_transferred;
    int progress;                   // 0..100, never decreases
    std::string error_message;

    std::chrono::steady_clock::time_point created_at;

    Transfer() : direction(TransferDirection::OUTGOING), state(TransferState::PENDING),
                 file_size(0), bytes_transferred(0), progress(0),
                 created_at(std::chrono::steady_clock::now()) {}

    bool is_terminal() const { return is_terminal_state(state); }

    const std::string& peer_id() const {
        return direction == TransferDirection::OUTGOING ? receiver_id : sender_id;
    }
};

/**
 * min(100, 100 * done / total); 0 for an empty total
 */
int compute_progress(uint64_t done, uint64_t total);

/**
 * 32 random hex characters
 */
std::string generate_transfer_id();

/**
 * MIME type from the file extension, application/octet-stream if unknown
 */
std::string get_mime_type(const std::string& file_path);

} // namespace peerdrop
