#include "transfer.h"
#include "fs.h"
#include <algorithm>
#include <cctype>
#include <random>
#include <sstream>
#include <unordered_map>

namespace peerdrop {

std::string transfer_state_to_string(TransferState state) {
    switch (state) {
        case TransferState::PENDING: return "pending";
        case TransferState::REQUESTED: return "requested";
        case TransferState::ACCEPTED: return "accepted";
        case TransferState::NEGOTIATING: return "negotiating";
        case TransferState::TRANSFERRING: return "transferring";
        case TransferState::DONE: return "done";
        case TransferState::REJECTED: return "rejected";
        case TransferState::FAILED: return "failed";
        default: return "unknown";
    }
}

std::string transfer_direction_to_string(TransferDirection direction) {
    return direction == TransferDirection::OUTGOING ? "outgoing" : "incoming";
}

bool is_terminal_state(TransferState state) {
    return state == TransferState::DONE ||
           state == TransferState::REJECTED ||
           state == TransferState::FAILED;
}

int compute_progress(uint64_t done, uint64_t total) {
    if (total == 0) {
        return 0;
    }
    if (done >= total) {
        return 100;
    }
    return static_cast<int>((done * 100) / total);
}

std::string generate_transfer_id() {
    std::random_device rd;
    std::mt19937 gen(rd());
    std::uniform_int_distribution<> dis(0, 15);

    std::stringstream ss;
    ss << std::hex;
    for (int i = 0; i < 32; ++i) {
        ss << dis(gen);
    }

    return ss.str();
}

std::string get_mime_type(const std::string& file_path) {
    std::string extension = get_file_extension(file_path);
    std::transform(extension.begin(), extension.end(), extension.begin(), ::tolower);

    static const std::unordered_map<std::string, std::string> mime_types = {
        {".txt", "text/plain"},
        {".csv", "text/csv"},
        {".md", "text/markdown"},
        {".json", "application/json"},
        {".xml", "application/xml"},
        {".html", "text/html"},
        {".css", "text/css"},
        {".js", "application/javascript"},
        {".pdf", "application/pdf"},
        {".doc", "application/msword"},
        {".docx", "application/vnd.openxmlformats-officedocument.wordprocessingml.document"},
        {".xlsx", "application/vnd.openxmlformats-officedocument.spreadsheetml.sheet"},
        {".png", "image/png"},
        {".jpg", "image/jpeg"},
        {".jpeg", "image/jpeg"},
        {".gif", "image/gif"},
        {".bmp", "image/bmp"},
        {".webp", "image/webp"},
        {".svg", "image/svg+xml"},
        {".mp3", "audio/mpeg"},
        {".wav", "audio/wav"},
        {".mp4", "video/mp4"},
        {".avi", "video/x-msvideo"},
        {".zip", "application/zip"},
        {".tar", "application/x-tar"},
        {".gz", "application/gzip"}
    };

    auto it = mime_types.find(extension);
    return (it != mime_types.end()) ? it->second : "application/octet-stream";
}

} // namespace peerdrop
