#include <gtest/gtest.h>
#include "transfer_endpoint.h"
#include "fake_transport.h"
#include "chunk_protocol.h"
#include "fs.h"
#include <chrono>
#include <functional>
#include <memory>
#include <string>
#include <vector>

using namespace peerdrop;
using namespace peerdrop::testing_support;

namespace {

const char* FILES_DIR = "test_endpoint_files";
const char* ALICE_DOWNLOADS = "test_endpoint_downloads_alice";
const char* BOB_DOWNLOADS = "test_endpoint_downloads_bob";

class RecordingSink : public TransferRecordSink {
public:
    bool persist(const TransferRecord& record) override {
        records.push_back(record);
        return true;
    }

    std::vector<TransferRecord> records;
};

std::vector<uint8_t> make_pattern(size_t size) {
    std::vector<uint8_t> data(size);
    for (size_t i = 0; i < size; ++i) {
        data[i] = static_cast<uint8_t>((i * 31 + 7) & 0xFF);
    }
    return data;
}

std::vector<uint8_t> read_whole_file(const std::string& path) {
    int64_t size = get_file_size(path);
    std::vector<uint8_t> data(size > 0 ? static_cast<size_t>(size) : 0);
    if (!data.empty()) {
        read_file_chunk(path, 0, data.data(), data.size());
    }
    return data;
}

} // namespace

class TransferEndpointTest : public ::testing::Test {
protected:
    TransferEndpointTest()
        : network_(loop_), relay_(loop_),
          alice_identity_("1", "alice", "alice@example.com"),
          bob_identity_("2", "bob", "bob@example.com"),
          alice_signaling_(relay_, alice_identity_),
          bob_signaling_(relay_, bob_identity_),
          alice_records_(std::make_shared<RecordingSink>()),
          bob_records_(std::make_shared<RecordingSink>()) {
        config_.chunk_size = 16384;
        config_.negotiation_timeout_ms = 2000;
    }

    void SetUp() override {
        cleanup();
        ASSERT_TRUE(create_directories(FILES_DIR));
    }

    void TearDown() override {
        alice_.reset();
        bob_.reset();
        cleanup();
    }

    void cleanup() {
        for (const char* name : {"report.pdf", "empty.txt", "big.bin", "notes.txt"}) {
            delete_file(combine_paths(FILES_DIR, name));
            delete_file(combine_paths(BOB_DOWNLOADS, name));
        }
        delete_file(combine_paths(BOB_DOWNLOADS, "report (1).pdf"));
        delete_file(combine_paths(BOB_DOWNLOADS, "payload.bin"));
        delete_file(FILES_DIR);
        delete_file(BOB_DOWNLOADS);
        delete_file(ALICE_DOWNLOADS);
    }

    void create_endpoints() {
        EndpointConfig alice_config = config_;
        alice_config.download_directory = ALICE_DOWNLOADS;
        alice_.reset(new TransferEndpoint(loop_, alice_signaling_,
                                          std::make_shared<FakePeerConnectionFactory>(network_),
                                          alice_config, alice_records_));
        alice_->set_local_identity(alice_identity_);
        relay_.attach(alice_identity_.user_id, alice_.get());

        EndpointConfig bob_config = config_;
        bob_config.download_directory = BOB_DOWNLOADS;
        bob_.reset(new TransferEndpoint(loop_, bob_signaling_,
                                        std::make_shared<FakePeerConnectionFactory>(network_),
                                        bob_config, bob_records_));
        bob_->set_local_identity(bob_identity_);
        relay_.attach(bob_identity_.user_id, bob_.get());

        bob_->set_incoming_request_callback([this](const Transfer& transfer) {
            bob_requests_.push_back(transfer);
        });
        bob_->set_progress_callback([this](const Transfer& transfer) {
            bob_progress_.push_back(transfer.progress);
            bob_progress_reports_.push_back(transfer);
        });
        bob_->set_completed_callback([this](const Transfer& transfer, const std::string& path) {
            bob_completed_.push_back(transfer);
            bob_artifact_path_ = path;
        });
        bob_->set_failed_callback([this](const Transfer& transfer) {
            bob_failed_.push_back(transfer);
        });
        alice_->set_progress_callback([this](const Transfer& transfer) {
            alice_progress_.push_back(transfer.progress);
        });
        alice_->set_completed_callback([this](const Transfer& transfer, const std::string&) {
            alice_completed_.push_back(transfer);
        });
        alice_->set_rejected_callback([this](const Transfer& transfer) {
            alice_rejected_.push_back(transfer);
        });
        alice_->set_failed_callback([this](const Transfer& transfer) {
            alice_failed_.push_back(transfer);
        });
    }

    std::string write_source_file(const std::string& name, const std::vector<uint8_t>& data) {
        std::string path = combine_paths(FILES_DIR, name);
        EXPECT_TRUE(create_file_binary(path.c_str(), data.data(), data.size()));
        return path;
    }

    bool wait_for(const std::function<bool()>& predicate, int timeout_ms = 3000) {
        return loop_.run_until(predicate, std::chrono::milliseconds(timeout_ms));
    }

    // Sends the file from alice and has bob accept it as soon as the request arrives
    std::string send_and_accept(const std::string& path) {
        std::string transfer_id = alice_->send_file(bob_identity_.user_id, path);
        EXPECT_FALSE(transfer_id.empty());
        EXPECT_TRUE(wait_for([this]() { return !bob_requests_.empty(); }));
        if (!bob_requests_.empty()) {
            EXPECT_TRUE(bob_->accept_transfer(bob_requests_.back().transfer_id));
        }
        return transfer_id;
    }

    std::shared_ptr<FakePeerConnection> alice_connection() const {
        return network_.created.empty() ? nullptr : network_.created.front();
    }

    EventLoop loop_;
    FakeNetwork network_;
    FakeRelay relay_;
    Identity alice_identity_;
    Identity bob_identity_;
    FakeSignaling alice_signaling_;
    FakeSignaling bob_signaling_;
    std::shared_ptr<RecordingSink> alice_records_;
    std::shared_ptr<RecordingSink> bob_records_;
    EndpointConfig config_;

    std::vector<Transfer> bob_requests_;
    std::vector<int> bob_progress_;
    std::vector<Transfer> bob_progress_reports_;
    std::vector<Transfer> bob_completed_;
    std::vector<Transfer> bob_failed_;
    std::string bob_artifact_path_;
    std::vector<int> alice_progress_;
    std::vector<Transfer> alice_completed_;
    std::vector<Transfer> alice_rejected_;
    std::vector<Transfer> alice_failed_;

    std::unique_ptr<TransferEndpoint> alice_;
    std::unique_ptr<TransferEndpoint> bob_;
};

TEST_F(TransferEndpointTest, TransfersFileInTwoChunks) {
    create_endpoints();
    auto content = make_pattern(32768);
    std::string path = write_source_file("report.pdf", content);

    std::string transfer_id = send_and_accept(path);
    ASSERT_EQ(bob_requests_.size(), 1u);
    EXPECT_EQ(bob_requests_[0].transfer_id, transfer_id);
    EXPECT_EQ(bob_requests_[0].file_name, "report.pdf");
    EXPECT_EQ(bob_requests_[0].file_size, 32768u);
    EXPECT_EQ(bob_requests_[0].file_type, "application/pdf");
    EXPECT_EQ(bob_requests_[0].sender_id, "1");

    ASSERT_TRUE(wait_for([this]() { return !alice_completed_.empty() && !bob_completed_.empty(); }));

    // Two 16 KiB slices
    ASSERT_NE(alice_connection(), nullptr);
    EXPECT_EQ(alice_connection()->channel()->binary_frames_sent(), 2u);

    ASSERT_FALSE(bob_progress_.empty());
    EXPECT_EQ(bob_progress_.back(), 100);

    // file-meta, first slice, second slice, then completion
    ASSERT_EQ(bob_progress_reports_.size(), 4u);
    EXPECT_EQ(bob_progress_reports_[1].state, TransferState::TRANSFERRING);
    EXPECT_EQ(bob_progress_reports_[1].bytes_transferred, 16384u);
    EXPECT_EQ(bob_progress_reports_[1].progress, 50);
    EXPECT_EQ(bob_progress_reports_[2].state, TransferState::TRANSFERRING);
    EXPECT_EQ(bob_progress_reports_[2].bytes_transferred, 32768u);
    EXPECT_EQ(bob_progress_reports_[2].progress, 100);
    EXPECT_EQ(bob_progress_reports_[3].state, TransferState::DONE);
    for (size_t i = 1; i < bob_progress_.size(); ++i) {
        EXPECT_GE(bob_progress_[i], bob_progress_[i - 1]);
    }
    EXPECT_EQ(alice_progress_.back(), 100);

    EXPECT_EQ(bob_artifact_path_, combine_paths(BOB_DOWNLOADS, "report.pdf"));
    EXPECT_EQ(get_file_size(bob_artifact_path_), 32768);
    EXPECT_EQ(read_whole_file(bob_artifact_path_), content);

    EXPECT_EQ(bob_completed_[0].state, TransferState::DONE);
    EXPECT_EQ(alice_completed_[0].state, TransferState::DONE);
    EXPECT_EQ(alice_->get_active_transfer_count(), 0u);
    EXPECT_EQ(bob_->get_active_transfer_count(), 0u);

    ASSERT_EQ(bob_records_->records.size(), 1u);
    EXPECT_EQ(bob_records_->records[0].transfer_id, transfer_id);
    EXPECT_EQ(bob_records_->records[0].sender_id, "1");
    EXPECT_EQ(bob_records_->records[0].receiver_id, "2");
    EXPECT_EQ(bob_records_->records[0].file_size, 32768u);
    EXPECT_TRUE(alice_records_->records.empty());
}

TEST_F(TransferEndpointTest, RejectedTransferNeverNegotiates) {
    create_endpoints();
    std::string path = write_source_file("notes.txt", make_pattern(100));

    std::string transfer_id = alice_->send_file(bob_identity_.user_id, path);
    ASSERT_FALSE(transfer_id.empty());
    ASSERT_TRUE(wait_for([this]() { return !bob_requests_.empty(); }));

    EXPECT_TRUE(bob_->reject_transfer(transfer_id));
    ASSERT_TRUE(wait_for([this]() { return !alice_rejected_.empty(); }));

    EXPECT_EQ(alice_rejected_[0].state, TransferState::REJECTED);
    EXPECT_FALSE(alice_->get_transfer(transfer_id).has_value());
    EXPECT_FALSE(bob_->get_transfer(transfer_id).has_value());
    EXPECT_TRUE(alice_signaling_.sent_of_type("offer").empty());
    EXPECT_TRUE(network_.created.empty());

    auto finished = alice_->get_finished_transfers();
    ASSERT_EQ(finished.size(), 1u);
    EXPECT_EQ(finished[0].state, TransferState::REJECTED);
}

TEST_F(TransferEndpointTest, ChannelThatNeverOpensFailsBothSides) {
    config_.negotiation_timeout_ms = 200;
    network_.never_open = true;
    create_endpoints();
    std::string path = write_source_file("notes.txt", make_pattern(100));

    std::string transfer_id = send_and_accept(path);
    ASSERT_TRUE(wait_for([this]() { return !alice_failed_.empty() && !bob_failed_.empty(); }));

    EXPECT_EQ(alice_failed_[0].transfer_id, transfer_id);
    EXPECT_EQ(alice_failed_[0].state, TransferState::FAILED);
    EXPECT_NE(alice_failed_[0].error_message.find("negotiation failed"), std::string::npos);
    EXPECT_EQ(bob_failed_[0].state, TransferState::FAILED);
    EXPECT_TRUE(bob_completed_.empty());
    EXPECT_FALSE(file_exists(combine_paths(BOB_DOWNLOADS, "notes.txt")));
}

TEST_F(TransferEndpointTest, DuplicateCandidateIsHarmless) {
    const std::string candidate = "candidate:1 1 tcp 2130706431 127.0.0.1 40000 typ host";
    network_.answer_candidates = {candidate, candidate};
    create_endpoints();
    auto content = make_pattern(5000);
    std::string path = write_source_file("notes.txt", content);

    send_and_accept(path);
    ASSERT_TRUE(wait_for([this]() { return !alice_completed_.empty() && !bob_completed_.empty(); }));

    EXPECT_EQ(bob_signaling_.sent_of_type("ice-candidate").size(), 2u);
    ASSERT_NE(alice_connection(), nullptr);
    ASSERT_EQ(alice_connection()->applied_candidates().size(), 1u);
    EXPECT_EQ(alice_connection()->applied_candidates()[0], candidate);
    EXPECT_EQ(read_whole_file(bob_artifact_path_), content);
}

TEST_F(TransferEndpointTest, BackpressureKeepsBufferBounded) {
    config_.send_high_water_mark = 32768;
    config_.send_low_water_mark = 8192;
    create_endpoints();
    auto content = make_pattern(100000);
    std::string path = write_source_file("big.bin", content);

    send_and_accept(path);
    ASSERT_TRUE(wait_for([this]() { return !alice_completed_.empty() && !bob_completed_.empty(); }));

    EXPECT_EQ(alice_connection()->channel()->binary_frames_sent(), 7u);
    EXPECT_EQ(read_whole_file(bob_artifact_path_), content);
}

TEST_F(TransferEndpointTest, ZeroLengthFileCompletes) {
    create_endpoints();
    std::string path = write_source_file("empty.txt", {});

    send_and_accept(path);
    ASSERT_TRUE(wait_for([this]() { return !alice_completed_.empty() && !bob_completed_.empty(); }));

    ASSERT_GE(bob_progress_.size(), 2u);
    EXPECT_EQ(bob_progress_.front(), 0);
    EXPECT_EQ(bob_progress_.back(), 100);
    EXPECT_TRUE(file_exists(bob_artifact_path_));
    EXPECT_EQ(get_file_size(bob_artifact_path_), 0);
    EXPECT_EQ(alice_connection()->channel()->binary_frames_sent(), 0u);
}

TEST_F(TransferEndpointTest, ExistingArtifactIsNotOverwritten) {
    create_endpoints();
    ASSERT_TRUE(create_directories(BOB_DOWNLOADS));
    ASSERT_TRUE(create_file(combine_paths(BOB_DOWNLOADS, "report.pdf"), std::string("older")));
    std::string path = write_source_file("report.pdf", make_pattern(1000));

    send_and_accept(path);
    ASSERT_TRUE(wait_for([this]() { return !bob_completed_.empty(); }));

    EXPECT_EQ(bob_artifact_path_, combine_paths(BOB_DOWNLOADS, "report (1).pdf"));
    EXPECT_EQ(get_file_size(bob_artifact_path_), 1000);
    EXPECT_EQ(read_file_text(combine_paths(BOB_DOWNLOADS, "report.pdf")), "older");
}

TEST_F(TransferEndpointTest, RoomUsersExcludeSelf) {
    create_endpoints();
    std::vector<std::string> joined;
    std::vector<std::string> left;
    bob_->set_room_joined_callback([&joined](const std::string& room_id) { joined.push_back(room_id); });
    bob_->set_room_left_callback([&left](const std::string& room_id) { left.push_back(room_id); });

    ASSERT_TRUE(bob_->join_room("lobby"));
    ASSERT_EQ(bob_signaling_.sent_of_type("join_room").size(), 1u);
    EXPECT_EQ(bob_signaling_.sent_of_type("join_room")[0]["room_id"], "lobby");

    bob_->handle_signaling_message(make_room_joined_message("lobby"));
    nlohmann::json users = nlohmann::json::array();
    users.push_back(identity_to_json(alice_identity_));
    users.push_back(identity_to_json(bob_identity_));
    bob_->handle_signaling_message(make_room_users_message("lobby", users));

    EXPECT_EQ(bob_->get_current_room(), "lobby");
    ASSERT_EQ(bob_->get_peers().size(), 1u);
    EXPECT_EQ(bob_->get_peers()[0].user_id, "1");
    EXPECT_EQ(bob_->get_peers()[0].username, "alice");
    ASSERT_EQ(joined.size(), 1u);

    bob_->handle_signaling_message(make_room_left_message("lobby"));
    EXPECT_TRUE(bob_->get_current_room().empty());
    EXPECT_TRUE(bob_->get_peers().empty());
    ASSERT_EQ(left.size(), 1u);
    EXPECT_EQ(left[0], "lobby");

    EXPECT_FALSE(bob_->join_room(""));
}

TEST_F(TransferEndpointTest, UnsolicitedOfferIsDropped) {
    create_endpoints();

    nlohmann::json offer = make_offer_message("2", "unknown-transfer", {{"type", "offer"}, {"fake_id", 1}});
    bob_->handle_signaling_message(annotate_forwarded_message(offer, "1", "alice"));

    // An offer from someone other than the sender of an accepted transfer
    nlohmann::json request = make_transfer_request_message("2", "t1", "notes.txt", 10, "text/plain");
    bob_->handle_signaling_message(annotate_forwarded_message(request, "1", "alice"));
    ASSERT_TRUE(bob_->accept_transfer("t1"));
    nlohmann::json foreign = make_offer_message("2", "t1", {{"type", "offer"}, {"fake_id", 1}});
    bob_->handle_signaling_message(annotate_forwarded_message(foreign, "3", "mallory"));

    EXPECT_TRUE(network_.created.empty());
    EXPECT_TRUE(bob_signaling_.sent_of_type("answer").empty());
    ASSERT_TRUE(bob_->get_transfer("t1").has_value());
    EXPECT_EQ(bob_->get_transfer("t1")->state, TransferState::ACCEPTED);
}

TEST_F(TransferEndpointTest, SizeMismatchAtFileEndFails) {
    create_endpoints();
    nlohmann::json request = make_transfer_request_message("2", "t1", "payload.bin", 10, "application/octet-stream");
    bob_->handle_signaling_message(annotate_forwarded_message(request, "1", "alice"));
    ASSERT_TRUE(bob_->accept_transfer("t1"));

    // Play the sending side by hand
    auto sender = std::make_shared<FakePeerConnection>(network_);
    ASSERT_NE(sender->create_channel("t1"), nullptr);
    auto offer = sender->create_offer();
    ASSERT_TRUE(offer.has_value());
    bob_->handle_signaling_message(annotate_forwarded_message(make_offer_message("2", "t1", *offer), "1", "alice"));

    auto answers = bob_signaling_.sent_of_type("answer");
    ASSERT_EQ(answers.size(), 1u);
    ASSERT_TRUE(sender->set_remote_answer(answers[0]["answer"]));
    ASSERT_TRUE(wait_for([&sender]() { return sender->channel()->state() == ChannelState::OPEN; }));

    FileMeta meta;
    meta.file_name = "payload.bin";
    meta.file_size = 10;
    meta.file_type = "application/octet-stream";
    meta.sender_id = "1";
    ASSERT_TRUE(sender->channel()->send_text(encode_file_meta(meta)));
    ASSERT_TRUE(sender->channel()->send_binary(std::vector<uint8_t>(4, 0x42)));
    ASSERT_TRUE(sender->channel()->send_text(encode_file_end()));

    ASSERT_TRUE(wait_for([this]() { return !bob_failed_.empty(); }));
    EXPECT_EQ(bob_failed_[0].state, TransferState::FAILED);
    EXPECT_NE(bob_failed_[0].error_message.find("received 4 bytes"), std::string::npos);
    EXPECT_FALSE(file_exists(combine_paths(BOB_DOWNLOADS, "payload.bin")));
    EXPECT_TRUE(bob_records_->records.empty());
}

TEST_F(TransferEndpointTest, FileMetaFromAnotherSenderIsLogged) {
    create_endpoints();
    nlohmann::json request = make_transfer_request_message("2", "t1", "payload.bin", 10, "application/octet-stream");
    bob_->handle_signaling_message(annotate_forwarded_message(request, "1", "alice"));
    ASSERT_TRUE(bob_->accept_transfer("t1"));

    auto sender = std::make_shared<FakePeerConnection>(network_);
    ASSERT_NE(sender->create_channel("t1"), nullptr);
    auto offer = sender->create_offer();
    ASSERT_TRUE(offer.has_value());
    bob_->handle_signaling_message(annotate_forwarded_message(make_offer_message("2", "t1", *offer), "1", "alice"));
    auto answers = bob_signaling_.sent_of_type("answer");
    ASSERT_EQ(answers.size(), 1u);
    ASSERT_TRUE(sender->set_remote_answer(answers[0]["answer"]));
    ASSERT_TRUE(wait_for([&sender]() { return sender->channel()->state() == ChannelState::OPEN; }));

    FileMeta meta;
    meta.file_name = "payload.bin";
    meta.file_size = 10;
    meta.file_type = "application/octet-stream";
    meta.sender_id = "99";

    ::testing::internal::CaptureStdout();
    bool sent = sender->channel()->send_text(encode_file_meta(meta)) &&
                sender->channel()->send_binary(std::vector<uint8_t>(10, 0x42)) &&
                sender->channel()->send_text(encode_file_end());
    bool finished = wait_for([this]() { return !bob_completed_.empty() || !bob_failed_.empty(); });
    std::string output = ::testing::internal::GetCapturedStdout();

    ASSERT_TRUE(sent);
    ASSERT_TRUE(finished);
    EXPECT_NE(output.find("file-meta names sender '99'"), std::string::npos);

    // The warning does not stop the transfer
    ASSERT_EQ(bob_completed_.size(), 1u);
    EXPECT_EQ(bob_completed_[0].sender_id, "1");
    EXPECT_EQ(get_file_size(combine_paths(BOB_DOWNLOADS, "payload.bin")), 10);
}

TEST_F(TransferEndpointTest, OverflowingDataFails) {
    create_endpoints();
    nlohmann::json request = make_transfer_request_message("2", "t1", "payload.bin", 10, "application/octet-stream");
    bob_->handle_signaling_message(annotate_forwarded_message(request, "1", "alice"));
    ASSERT_TRUE(bob_->accept_transfer("t1"));

    auto sender = std::make_shared<FakePeerConnection>(network_);
    ASSERT_NE(sender->create_channel("t1"), nullptr);
    auto offer = sender->create_offer();
    ASSERT_TRUE(offer.has_value());
    bob_->handle_signaling_message(annotate_forwarded_message(make_offer_message("2", "t1", *offer), "1", "alice"));
    auto answers = bob_signaling_.sent_of_type("answer");
    ASSERT_EQ(answers.size(), 1u);
    ASSERT_TRUE(sender->set_remote_answer(answers[0]["answer"]));
    ASSERT_TRUE(wait_for([&sender]() { return sender->channel()->state() == ChannelState::OPEN; }));

    FileMeta meta;
    meta.file_name = "payload.bin";
    meta.file_size = 10;
    meta.file_type = "application/octet-stream";
    ASSERT_TRUE(sender->channel()->send_text(encode_file_meta(meta)));
    ASSERT_TRUE(sender->channel()->send_binary(std::vector<uint8_t>(12, 0x42)));

    ASSERT_TRUE(wait_for([this]() { return !bob_failed_.empty(); }));
    EXPECT_NE(bob_failed_[0].error_message.find("more data"), std::string::npos);
}

TEST_F(TransferEndpointTest, AcceptedTransferWithoutOfferTimesOut) {
    config_.negotiation_timeout_ms = 100;
    create_endpoints();
    nlohmann::json request = make_transfer_request_message("2", "t1", "notes.txt", 10, "text/plain");
    bob_->handle_signaling_message(annotate_forwarded_message(request, "1", "alice"));
    ASSERT_TRUE(bob_->accept_transfer("t1"));

    ASSERT_TRUE(wait_for([this]() { return !bob_failed_.empty(); }));
    EXPECT_NE(bob_failed_[0].error_message.find("no offer"), std::string::npos);
    EXPECT_FALSE(bob_->get_transfer("t1").has_value());
}

TEST_F(TransferEndpointTest, BusyEndpointRejectsExtraRequests) {
    create_endpoints();
    nlohmann::json first = make_transfer_request_message("2", "t1", "a.txt", 10, "text/plain");
    nlohmann::json second = make_transfer_request_message("2", "t2", "b.txt", 10, "text/plain");
    bob_->handle_signaling_message(annotate_forwarded_message(first, "1", "alice"));
    bob_->handle_signaling_message(annotate_forwarded_message(second, "1", "alice"));

    EXPECT_EQ(bob_requests_.size(), 1u);
    EXPECT_TRUE(bob_->get_transfer("t1").has_value());
    EXPECT_FALSE(bob_->get_transfer("t2").has_value());

    auto responses = bob_signaling_.sent_of_type("transfer-response");
    ASSERT_EQ(responses.size(), 1u);
    EXPECT_EQ(responses[0]["transfer_id"], "t2");
    EXPECT_EQ(responses[0]["accepted"], false);
    EXPECT_EQ(responses[0]["target"], "1");
}

TEST_F(TransferEndpointTest, CancellingPendingRequestRejectsIt) {
    create_endpoints();
    nlohmann::json request = make_transfer_request_message("2", "t1", "a.txt", 10, "text/plain");
    bob_->handle_signaling_message(annotate_forwarded_message(request, "1", "alice"));

    EXPECT_TRUE(bob_->cancel_transfer("t1"));
    auto responses = bob_signaling_.sent_of_type("transfer-response");
    ASSERT_EQ(responses.size(), 1u);
    EXPECT_EQ(responses[0]["accepted"], false);
    EXPECT_FALSE(bob_->cancel_transfer("t1"));
}

TEST_F(TransferEndpointTest, LostSignalingFailsActiveTransfers) {
    create_endpoints();
    std::string path = write_source_file("notes.txt", make_pattern(100));
    std::string transfer_id = alice_->send_file(bob_identity_.user_id, path);
    ASSERT_FALSE(transfer_id.empty());

    alice_->handle_signaling_closed();
    ASSERT_EQ(alice_failed_.size(), 1u);
    EXPECT_EQ(alice_failed_[0].transfer_id, transfer_id);
    EXPECT_EQ(alice_->get_active_transfer_count(), 0u);
}

TEST_F(TransferEndpointTest, SendFileValidatesInput) {
    create_endpoints();
    std::string path = write_source_file("notes.txt", make_pattern(100));

    EXPECT_TRUE(alice_->send_file(bob_identity_.user_id, "does/not/exist.bin").empty());
    EXPECT_TRUE(alice_->send_file("", path).empty());
    EXPECT_TRUE(alice_->send_file(alice_identity_.user_id, path).empty());

    alice_signaling_.set_fail_sends(true);
    EXPECT_TRUE(alice_->send_file(bob_identity_.user_id, path).empty());
    EXPECT_EQ(alice_->get_active_transfer_count(), 0u);
}
