#include "chained_send_buffer.h"

namespace peerdrop {

void ChainedSendBuffer::push(std::vector<uint8_t> frame) {
    if (frame.empty()) return;

    queued_bytes_ += frame.size();
    frames_.push_back(std::move(frame));
}

std::vector<uint8_t> ChainedSendBuffer::begin_write() {
    if (frames_.empty() || in_flight_bytes_ > 0) {
        return {};
    }

    std::vector<uint8_t> frame = std::move(frames_.front());
    frames_.pop_front();
    queued_bytes_ -= frame.size();
    in_flight_bytes_ = frame.size();
    return frame;
}

bool ChainedSendBuffer::finish_write(size_t low_threshold) {
    size_t before = buffered_amount();
    in_flight_bytes_ = 0;
    size_t after = buffered_amount();
    return before > low_threshold && after <= low_threshold;
}

void ChainedSendBuffer::clear() {
    frames_.clear();
    queued_bytes_ = 0;
}

} // namespace peerdrop
