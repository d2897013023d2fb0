#include "transfer_record.h"
#include "logger.h"
#include <nlohmann/json.hpp>

namespace peerdrop {

std::string transfer_record_to_json(const TransferRecord& record) {
    nlohmann::json json;
    json["transfer_id"] = record.transfer_id;
    json["fileName"] = record.file_name;
    json["fileSize"] = record.file_size;
    json["fileType"] = record.file_type;
    json["sender_id"] = record.sender_id;
    json["receiver_id"] = record.receiver_id;
    json["timestamp"] = record.timestamp;
    return json.dump();
}

bool LoggingRecordSink::persist(const TransferRecord& record) {
    LOG_INFO("records", "Transfer record: " << transfer_record_to_json(record));
    return true;
}

} // namespace peerdrop
