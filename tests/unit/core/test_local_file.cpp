/**
 * @file test_local_file.cpp
 * @brief Unit tests for local file access, atomic publish and glob expansion
 */

#include <gtest/gtest.h>

#include <kcenon/stage_transfer/core/local_file.h>

#include <filesystem>
#include <fstream>
#include <random>
#include <string>

#include <fcntl.h>
#include <unistd.h>

namespace kcenon::stage_transfer::test {

class LocalFileTest : public ::testing::Test {
protected:
    void SetUp() override {
        dir_ = std::filesystem::temp_directory_path() /
               ("stage_transfer_local_" + std::to_string(std::random_device{}()));
        std::filesystem::create_directories(dir_);
    }

    void TearDown() override {
        std::error_code ec;
        std::filesystem::remove_all(dir_, ec);
    }

    auto write_file(const std::string& name, const std::string& content)
        -> std::filesystem::path {
        auto path = dir_ / name;
        std::filesystem::create_directories(path.parent_path());
        std::ofstream out(path, std::ios::binary);
        out << content;
        return path;
    }

    auto leftover_temporaries() const -> std::size_t {
        std::size_t count = 0;
        for (const auto& entry : std::filesystem::directory_iterator(dir_)) {
            if (entry.path().filename().string().find(".st_tmp.") != std::string::npos) {
                ++count;
            }
        }
        return count;
    }

    std::filesystem::path dir_;
};

TEST_F(LocalFileTest, ReadWholeFile) {
    auto path = write_file("a.csv", "1,2,3\n");

    auto content = read_local_file(path);
    ASSERT_TRUE(content.has_value());
    EXPECT_EQ(to_string(content.value()), "1,2,3\n");

    auto size = local_file_size(path);
    ASSERT_TRUE(size.has_value());
    EXPECT_EQ(size.value(), 6u);
}

TEST_F(LocalFileTest, ReadHeadStopsAtLimit) {
    auto path = write_file("b.csv", "0123456789");

    auto head = read_local_file_head(path, 4);
    ASSERT_TRUE(head.has_value());
    EXPECT_EQ(to_string(head.value()), "0123");

    auto whole = read_local_file_head(path, 64);
    ASSERT_TRUE(whole.has_value());
    EXPECT_EQ(whole.value().size(), 10u);
}

TEST_F(LocalFileTest, MissingFileIsLocalFileNotFound) {
    auto content = read_local_file(dir_ / "missing.csv");
    ASSERT_FALSE(content.has_value());
    EXPECT_EQ(content.error().code, error_code::local_file_not_found);

    auto size = local_file_size(dir_ / "missing.csv");
    ASSERT_FALSE(size.has_value());
    EXPECT_EQ(size.error().code, error_code::local_file_not_found);
}

TEST_F(LocalFileTest, DirectoryIsNotARegularFile) {
    auto size = local_file_size(dir_);
    ASSERT_FALSE(size.has_value());
    EXPECT_EQ(size.error().code, error_code::local_io_error);
}

TEST_F(LocalFileTest, AtomicWritePublishesOnCommit) {
    const auto destination = dir_ / "out.csv";
    auto writer = atomic_file_writer::open(destination);
    ASSERT_TRUE(writer.has_value());

    ASSERT_TRUE(writer.value().write(as_bytes("hello")).has_value());
    EXPECT_FALSE(std::filesystem::exists(destination));
    EXPECT_TRUE(std::filesystem::exists(writer.value().temporary_path()));

    ASSERT_TRUE(writer.value().commit().has_value());
    EXPECT_TRUE(std::filesystem::exists(destination));
    EXPECT_EQ(leftover_temporaries(), 0u);

    auto content = read_local_file(destination);
    ASSERT_TRUE(content.has_value());
    EXPECT_EQ(to_string(content.value()), "hello");
}

TEST_F(LocalFileTest, AbandonedWriterRemovesTemporary) {
    const auto destination = dir_ / "abandoned.csv";
    {
        auto writer = atomic_file_writer::open(destination);
        ASSERT_TRUE(writer.has_value());
        ASSERT_TRUE(writer.value().write(as_bytes("partial")).has_value());
    }
    EXPECT_FALSE(std::filesystem::exists(destination));
    EXPECT_EQ(leftover_temporaries(), 0u);
}

TEST_F(LocalFileTest, AtomicWriteReplacesExistingFile) {
    const auto destination = write_file("replace.csv", "old");

    ASSERT_TRUE(write_local_file_atomically(destination, as_bytes("new")).has_value());

    auto content = read_local_file(destination);
    ASSERT_TRUE(content.has_value());
    EXPECT_EQ(to_string(content.value()), "new");
}

TEST_F(LocalFileTest, WriteIntoMissingDirectoryFails) {
    auto written = write_local_file_atomically(dir_ / "no" / "such" / "dir.csv",
                                               as_bytes("x"));
    ASSERT_FALSE(written.has_value());
    EXPECT_EQ(written.error().code, error_code::local_file_not_found);
}

TEST_F(LocalFileTest, FullDeviceIsNoSpaceLeft) {
    const int fd = ::open("/dev/full", O_WRONLY | O_CLOEXEC);
    if (fd < 0) {
        GTEST_SKIP() << "/dev/full is not available";
    }
    auto written = write_fully(fd, as_bytes("payload"));
    ::close(fd);

    ASSERT_FALSE(written.has_value());
    EXPECT_EQ(written.error().code, error_code::no_space_left);
}

TEST_F(LocalFileTest, ErrorMessageNamesOperationAndPath) {
    auto failure = make_local_io_error(ENOSPC, "write", "/tmp/x.csv");
    EXPECT_EQ(failure.code, error_code::no_space_left);
    EXPECT_NE(failure.message.find("write '/tmp/x.csv'"), std::string::npos);
}

// ============================================================================
// Pattern Expansion
// ============================================================================

TEST_F(LocalFileTest, ExpandWildcardSorted) {
    write_file("b.csv", "b");
    write_file("a.csv", "a");
    write_file("c.txt", "c");
    std::filesystem::create_directories(dir_ / "d.csv");

    auto matched = expand_local_pattern((dir_ / "*.csv").string());
    ASSERT_TRUE(matched.has_value());
    ASSERT_EQ(matched.value().size(), 2u);
    EXPECT_EQ(matched.value()[0].filename(), "a.csv");
    EXPECT_EQ(matched.value()[1].filename(), "b.csv");
}

TEST_F(LocalFileTest, ExpandLiteralPath) {
    auto path = write_file("only.csv", "x");

    auto matched = expand_local_pattern(path.string());
    ASSERT_TRUE(matched.has_value());
    ASSERT_EQ(matched.value().size(), 1u);

    auto missing = expand_local_pattern((dir_ / "absent.csv").string());
    ASSERT_TRUE(missing.has_value());
    EXPECT_TRUE(missing.value().empty());
}

TEST_F(LocalFileTest, ExpandWithoutMatches) {
    auto matched = expand_local_pattern((dir_ / "*.parquet").string());
    ASSERT_TRUE(matched.has_value());
    EXPECT_TRUE(matched.value().empty());
}

TEST_F(LocalFileTest, EmptyPatternIsInvalid) {
    auto matched = expand_local_pattern("");
    ASSERT_FALSE(matched.has_value());
    EXPECT_EQ(matched.error().code, error_code::invalid_command);
}

}  // namespace kcenon::stage_transfer::test
