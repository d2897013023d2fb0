#pragma once

/**
 * @file reassembly.h
 * @brief Receive-side buffer for one incoming transfer
 *
 * Segments are kept in arrival order and concatenated only when the artifact
 * is written. The running total may never exceed the size declared by
 * file-meta, and must equal it at file-end.
 */

#include <cstdint>
#include <cstddef>
#include <string>
#include <vector>

namespace peerdrop {

class ReassemblyBuffer {
public:
    ReassemblyBuffer();

    /**
     * Start a fresh, empty buffer for a transfer of the declared size.
     */
    void begin(uint64_t expected_size);

    /**
     * Append a segment.
     * @return false if the buffer is not active or the segment would exceed the declared size
     */
    bool append(const std::vector<uint8_t>& segment);

    /**
     * Check the total and write the concatenated segments to path.
     * The buffer is discarded whether or not this succeeds.
     * @param error Receives the reason on failure
     * @return true if the artifact was written
     */
    bool finalize(const std::string& path, std::string& error);

    /**
     * Drop all segments without writing anything.
     */
    void discard();

    bool is_active() const { return active_; }
    uint64_t expected_size() const { return expected_size_; }
    uint64_t received_bytes() const { return received_bytes_; }
    size_t segment_count() const { return segments_.size(); }

    /**
     * min(100, 100 * received / expected); never decreases while active
     */
    int progress() const { return progress_; }

private:
    std::vector<std::vector<uint8_t>> segments_;
    uint64_t expected_size_;
    uint64_t received_bytes_;
    int progress_;
    bool active_;
};

} // namespace peerdrop
