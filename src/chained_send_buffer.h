#pragma once

/**
 * @file chained_send_buffer.h
 * @brief Outbound frame queue of a TCP byte channel
 *
 * The sending side pushes encoded frames, the writer thread takes them one at
 * a time. A frame taken by the writer stays counted until finish_write(), so
 * buffered_amount() covers everything not yet handed to the socket.
 * Not synchronized; the channel holds its send lock around every call.
 */

#include <cstddef>
#include <cstdint>
#include <deque>
#include <vector>

namespace peerdrop {

class ChainedSendBuffer {
public:
    ChainedSendBuffer() = default;

    /**
     * @brief Queue an encoded frame. Empty frames are ignored.
     */
    void push(std::vector<uint8_t> frame);

    /**
     * @brief Take the next frame for writing and count it as in flight
     * @return The frame, or an empty vector if nothing is queued or a write
     *         is already in flight
     */
    std::vector<uint8_t> begin_write();

    /**
     * @brief Mark the in-flight frame as written
     * @param low_threshold Buffered-amount-low threshold of the channel
     * @return true if this write took the buffered amount from above the
     *         threshold to at or below it
     */
    bool finish_write(size_t low_threshold);

    /** Queued plus in-flight bytes */
    size_t buffered_amount() const { return queued_bytes_ + in_flight_bytes_; }

    bool has_queued_frames() const { return !frames_.empty(); }

    size_t queued_frame_count() const { return frames_.size(); }

    bool write_in_flight() const { return in_flight_bytes_ > 0; }

    /** Drop queued frames; an in-flight frame stays counted until finish_write() */
    void clear();

private:
    std::deque<std::vector<uint8_t>> frames_;
    size_t queued_bytes_ = 0;
    size_t in_flight_bytes_ = 0;
};

} // namespace peerdrop
