#include <gtest/gtest.h>
#include "fs.h"
#include <string>
#include <vector>

using namespace peerdrop;

class FSTest : public ::testing::Test {
protected:
    void SetUp() override {
        cleanup();
    }

    void TearDown() override {
        cleanup();
    }

    void cleanup() {
        delete_file("test_file.txt");
        delete_file("test_binary.bin");
        delete_file("test_segments.bin");
        delete_file("test_chunks.bin");
        delete_file("test_directory/nested/deep");
        delete_file("test_directory/nested");
        delete_file("test_directory");
    }
};

TEST_F(FSTest, TextFileRoundTrip) {
    EXPECT_FALSE(file_exists("test_file.txt"));

    ASSERT_TRUE(create_file("test_file.txt", std::string("{\"relay_port\": 8765}")));
    EXPECT_TRUE(file_exists("test_file.txt"));
    EXPECT_TRUE(is_file("test_file.txt"));
    EXPECT_FALSE(directory_exists("test_file.txt"));

    auto content = read_file_text("test_file.txt");
    ASSERT_TRUE(content.has_value());
    EXPECT_EQ(*content, "{\"relay_port\": 8765}");
    EXPECT_EQ(get_file_size("test_file.txt"), 20);
}

TEST_F(FSTest, NestedDirectories) {
    ASSERT_TRUE(create_directories("test_directory/nested/deep"));
    EXPECT_TRUE(directory_exists("test_directory"));
    EXPECT_TRUE(directory_exists("test_directory/nested/deep"));

    // Existing directories are fine
    EXPECT_TRUE(create_directories("test_directory/nested"));
}

TEST_F(FSTest, WriteSegmentsConcatenatesInOrder) {
    std::vector<std::vector<uint8_t>> segments = {
        {1, 2, 3},
        {},
        {4, 5},
        std::vector<uint8_t>(100, 0x7F)
    };

    ASSERT_TRUE(write_file_segments("test_segments.bin", segments));
    EXPECT_EQ(get_file_size("test_segments.bin"), 105);

    std::vector<uint8_t> head(5);
    EXPECT_EQ(read_file_chunk("test_segments.bin", 0, head.data(), head.size()), 5);
    EXPECT_EQ(head, (std::vector<uint8_t>{1, 2, 3, 4, 5}));
}

TEST_F(FSTest, WriteNoSegmentsCreatesEmptyFile) {
    ASSERT_TRUE(write_file_segments("test_segments.bin", {}));
    EXPECT_TRUE(file_exists("test_segments.bin"));
    EXPECT_EQ(get_file_size("test_segments.bin"), 0);
}

TEST_F(FSTest, ReadChunksAtOffsets) {
    std::vector<uint8_t> data(40000);
    for (size_t i = 0; i < data.size(); ++i) {
        data[i] = static_cast<uint8_t>(i % 251);
    }
    ASSERT_TRUE(create_file_binary("test_chunks.bin", data.data(), data.size()));

    std::vector<uint8_t> buffer(16384);
    EXPECT_EQ(read_file_chunk("test_chunks.bin", 16384, buffer.data(), buffer.size()), 16384);
    EXPECT_EQ(buffer[0], data[16384]);

    // Last slice is shorter
    EXPECT_EQ(read_file_chunk("test_chunks.bin", 32768, buffer.data(), buffer.size()), 40000 - 32768);
    EXPECT_EQ(buffer[0], data[32768]);

    // Past the end reads nothing
    EXPECT_EQ(read_file_chunk("test_chunks.bin", 50000, buffer.data(), buffer.size()), 0);
}

TEST_F(FSTest, NonExistentFile) {
    char byte;
    EXPECT_EQ(get_file_size("does_not_exist.bin"), -1);
    EXPECT_EQ(read_file_chunk("does_not_exist.bin", 0, &byte, 1), -1);
    EXPECT_FALSE(read_file_text("does_not_exist.bin").has_value());
    EXPECT_FALSE(delete_file("does_not_exist.bin"));
}

TEST_F(FSTest, PathUtilities) {
    EXPECT_EQ(get_filename_from_path("/home/user/report.pdf"), "report.pdf");
    EXPECT_EQ(get_filename_from_path("C:\\docs\\report.pdf"), "report.pdf");
    EXPECT_EQ(get_filename_from_path("report.pdf"), "report.pdf");

    EXPECT_EQ(get_file_extension("/home/user/report.pdf"), ".pdf");
    EXPECT_EQ(get_file_extension("archive.tar.gz"), ".gz");
    EXPECT_EQ(get_file_extension("README"), "");
    EXPECT_EQ(get_file_extension(".bashrc"), "");

    EXPECT_EQ(get_file_stem("dir/report.pdf"), "report");
    EXPECT_EQ(get_file_stem("README"), "README");

    EXPECT_EQ(combine_paths("downloads", "report.pdf"), "downloads/report.pdf");
    EXPECT_EQ(combine_paths("downloads/", "report.pdf"), "downloads/report.pdf");
    EXPECT_EQ(combine_paths("", "report.pdf"), "report.pdf");
}
