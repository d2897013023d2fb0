#pragma once

#include <cstdint>
#include <string>

namespace peerdrop {

/**
 * Completed-transfer record handed to the persistence collaborator
 */
struct TransferRecord {
    std::string transfer_id;
    std::string file_name;
    uint64_t file_size;
    std::string file_type;
    std::string sender_id;
    std::string receiver_id;
    int64_t timestamp;      // Unix seconds at completion

    TransferRecord() : file_size(0), timestamp(0) {}
};

std::string transfer_record_to_json(const TransferRecord& record);

class TransferRecordSink {
public:
    virtual ~TransferRecordSink() = default;

    /**
     * Persist one record. Called once per completed incoming transfer.
     * @return false if the record could not be stored; the transfer stays DONE
     */
    virtual bool persist(const TransferRecord& record) = 0;
};

/**
 * Writes each record to the log
 */
class LoggingRecordSink : public TransferRecordSink {
public:
    bool persist(const TransferRecord& record) override;
};

} // namespace peerdrop
