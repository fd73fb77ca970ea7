/**
 * @file test_fixtures.h
 * @brief Test fixtures for integration tests
 */

#ifndef KCENON_STAGE_TRANSFER_TEST_FIXTURES_H
#define KCENON_STAGE_TRANSFER_TEST_FIXTURES_H

#include <gtest/gtest.h>

#include <kcenon/stage_transfer/stage_transfer.h>

#include <atomic>
#include <chrono>
#include <filesystem>
#include <fstream>
#include <mutex>
#include <optional>
#include <random>
#include <string>
#include <thread>
#include <vector>

namespace kcenon::stage_transfer::test {

/**
 * @brief stage_session describing a LOCAL_FS stage rooted in a directory
 */
class local_stage_session : public stage_session {
public:
    explicit local_stage_session(std::filesystem::path root) : root_(std::move(root)) {}

    /**
     * @brief Attach client-side encryption with a base64 master key
     */
    void set_master_key(std::string key) { master_key_ = std::move(key); }

    auto describe_stage(const stage_request& request) -> result<std::string> override {
        ++requests_;
        if (request.stage_name != "local_stage") {
            return unexpected{error{error_code::stage_not_found,
                "stage " + request.stage_name + " does not exist"}};
        }
        std::string descriptor =
            R"({"locationType":"LOCAL_FS","location":")" + root_.string() + R"(/")";
        if (!master_key_.empty()) {
            descriptor += R"(,"encryptionMaterial":{"queryStageMasterKey":")" + master_key_ +
                          R"(","queryId":"it-query","smkId":7})";
        }
        return descriptor + "}";
    }

    [[nodiscard]] auto request_count() const -> std::size_t { return requests_.load(); }

private:
    std::filesystem::path root_;
    std::string master_key_;
    std::atomic<std::size_t> requests_{0};
};

/**
 * @brief storage_client that delays every transfer call of a wrapped client
 */
class latency_storage_client : public storage_client {
public:
    latency_storage_client(std::shared_ptr<storage_client> inner,
                           std::chrono::milliseconds latency)
        : inner_(std::move(inner)), latency_(latency) {}

    [[nodiscard]] auto provider() const -> provider_kind override { return inner_->provider(); }

    auto upload(const std::string& key, std::span<const std::byte> data,
                const object_metadata& metadata) -> result<uint64_t> override {
        std::this_thread::sleep_for(latency_);
        return inner_->upload(key, data, metadata);
    }

    auto download(const std::string& key) -> result<byte_buffer> override {
        std::this_thread::sleep_for(latency_);
        return inner_->download(key);
    }

    auto download_range(const std::string& key, uint64_t offset, uint64_t length)
        -> result<byte_buffer> override {
        std::this_thread::sleep_for(latency_);
        return inner_->download_range(key, offset, length);
    }

    auto get_object_metadata(const std::string& key) -> result<object_metadata> override {
        return inner_->get_object_metadata(key);
    }

    auto list(const std::string& prefix) -> result<std::vector<object_summary>> override {
        return inner_->list(prefix);
    }

    auto delete_object(const std::string& key) -> result<void> override {
        return inner_->delete_object(key);
    }

    auto begin_multipart(const std::string& key, const object_metadata& metadata)
        -> result<multipart_upload> override {
        return inner_->begin_multipart(key, metadata);
    }

    auto upload_part(const multipart_upload& upload, uint32_t part_number,
                     std::span<const std::byte> data) -> result<completed_part> override {
        std::this_thread::sleep_for(latency_);
        return inner_->upload_part(upload, part_number, data);
    }

    auto complete_multipart(const multipart_upload& upload,
                            const std::vector<completed_part>& parts) -> result<void> override {
        return inner_->complete_multipart(upload, parts);
    }

    auto abort_multipart(const multipart_upload& upload) -> result<void> override {
        return inner_->abort_multipart(upload);
    }

    [[nodiscard]] auto supports_multipart() const -> bool override {
        return inner_->supports_multipart();
    }

private:
    std::shared_ptr<storage_client> inner_;
    std::chrono::milliseconds latency_;
};

/**
 * @brief Test fixture for temporary directory management
 */
class TempDirectoryFixture : public ::testing::Test {
protected:
    void SetUp() override {
        test_dir_ = std::filesystem::temp_directory_path() /
                    ("stage_trans_test_" + std::to_string(std::random_device{}()));
        std::filesystem::create_directories(test_dir_);
        upload_dir_ = test_dir_ / "uploads";
        std::filesystem::create_directories(upload_dir_);
        stage_dir_ = test_dir_ / "stage";
        std::filesystem::create_directories(stage_dir_);
        download_dir_ = test_dir_ / "downloads";
        std::filesystem::create_directories(download_dir_);
    }

    void TearDown() override {
        std::error_code ec;
        std::filesystem::remove_all(test_dir_, ec);
    }

    auto create_text_file(const std::string& name, std::size_t size)
        -> std::filesystem::path {
        auto path = upload_dir_ / name;
        std::ofstream file(path, std::ios::binary);

        // Highly compressible content
        const std::string pattern = "The quick brown fox jumps over the lazy dog. ";
        std::string content;
        while (content.size() < size) {
            content += pattern;
        }
        content.resize(size);
        file << content;
        return path;
    }

    auto create_binary_file(const std::string& name, std::size_t size)
        -> std::filesystem::path {
        auto path = upload_dir_ / name;
        std::ofstream file(path, std::ios::binary);

        std::mt19937 gen(42);  // Fixed seed for reproducibility
        std::uniform_int_distribution<> dis(0, 255);
        for (std::size_t i = 0; i < size; ++i) {
            char byte = static_cast<char>(dis(gen));
            file.write(&byte, 1);
        }
        return path;
    }

    static auto read_file(const std::filesystem::path& path) -> std::string {
        std::ifstream file(path, std::ios::binary);
        return std::string((std::istreambuf_iterator<char>(file)),
                           std::istreambuf_iterator<char>());
    }

    static auto files_equal(const std::filesystem::path& a, const std::filesystem::path& b)
        -> bool {
        return read_file(a) == read_file(b);
    }

    std::filesystem::path test_dir_;
    std::filesystem::path upload_dir_;
    std::filesystem::path stage_dir_;
    std::filesystem::path download_dir_;
};

/**
 * @brief Test fixture running commands against a LOCAL_FS stage
 */
class StageFixture : public TempDirectoryFixture {
protected:
    void SetUp() override {
        TempDirectoryFixture::SetUp();
        session_ = std::make_shared<local_stage_session>(stage_dir_);
    }

    void TearDown() override {
        session_.reset();
        TempDirectoryFixture::TearDown();
    }

    auto make_context() -> transfer_context {
        transfer_context context;
        context.session_handle = session_;
        context.retry = retry_policy::immediate(2);
        context.multipart = multipart_;
        context.command_id = ::testing::UnitTest::GetInstance()->current_test_info()->name();
        if (latency_.count() > 0) {
            auto latency = latency_;
            context.client_factory = [latency](const stage_info& stage,
                                               const storage_client_options& options)
                -> result<std::shared_ptr<storage_client>> {
                auto inner = storage_client_factory::create(stage, options);
                if (!inner) {
                    return inner;
                }
                return std::static_pointer_cast<storage_client>(
                    std::make_shared<latency_storage_client>(inner.value(), latency));
            };
        }
        return context;
    }

    auto put(const std::string& sources, const std::string& options = "")
        -> result<transfer_report> {
        return run("PUT file://" + (upload_dir_ / sources).string() +
                   " @local_stage/daily " + options);
    }

    auto get(const std::string& options = "") -> result<transfer_report> {
        return run("GET @local_stage/daily file://" + download_dir_.string() + " " + options);
    }

    auto run(const std::string& command) -> result<transfer_report> {
        auto agent = transfer_agent::create(command, make_context());
        if (!agent) {
            return unexpected{agent.error()};
        }
        return agent.value()->execute();
    }

    auto staged_path(const std::string& name) const -> std::filesystem::path {
        return stage_dir_ / "daily" / name;
    }

    std::shared_ptr<local_stage_session> session_;
    std::chrono::milliseconds latency_{0};
    std::optional<multipart_config> multipart_;
};

}  // namespace kcenon::stage_transfer::test

#endif  // KCENON_STAGE_TRANSFER_TEST_FIXTURES_H
