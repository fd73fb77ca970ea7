/**
 * @file test_file_transfer_metadata.cpp
 * @brief Unit tests for uploads made without a session
 */

#include <gtest/gtest.h>

#include <kcenon/stage_transfer/client/file_transfer_metadata.h>
#include <kcenon/stage_transfer/core/compression_engine.h>

#include "../mocks/memory_storage_client.h"

#include <memory>
#include <sstream>
#include <string>
#include <vector>

namespace kcenon::stage_transfer::test {

namespace {

auto local_stage() -> stage_info {
    stage_info stage;
    stage.kind = provider_kind::s3;
    stage.bucket = "bucket";
    stage.prefix = "stages/";
    stage.credentials = temporary_keys{"AKIA", "secret", ""};
    return stage;
}

auto stream_of(const std::string& text) -> std::shared_ptr<std::istream> {
    return std::make_shared<std::istringstream>(text);
}

}  // namespace

class FileTransferMetadataTest : public ::testing::Test {
protected:
    void SetUp() override {
        client_ = std::make_shared<memory_storage_client>();
        factory_ = [this](const stage_info&, const storage_client_options&)
            -> result<std::shared_ptr<storage_client>> {
            return std::static_pointer_cast<storage_client>(client_);
        };
    }

    void TearDown() override {}

    std::shared_ptr<memory_storage_client> client_;
    storage_client_factory_fn factory_;
};

TEST_F(FileTransferMetadataTest, BuilderRequiresMetadata) {
    auto config = upload_config::builder().with_input_stream(stream_of("x")).build();
    ASSERT_FALSE(config.has_value());
    EXPECT_EQ(config.error().code, error_code::invalid_parameter);
}

TEST_F(FileTransferMetadataTest, MultiFileUpload) {
    auto metadata = file_transfer_metadata::multi_file(local_stage(), transfer_options{});
    EXPECT_FALSE(metadata.is_single_file());

    auto config = upload_config::builder()
                      .with_metadata(metadata)
                      .with_input_stream(stream_of("id,name\n1,a\n"))
                      .with_destination_filename("rows.csv")
                      .with_ingest_client_name("ingest")
                      .build();
    ASSERT_TRUE(config.has_value());

    auto row = upload_without_connection(config.value(), factory_);
    ASSERT_TRUE(row.has_value());
    EXPECT_EQ(row.value().status, transfer_status::uploaded);
    EXPECT_EQ(row.value().target, "rows.csv");
    EXPECT_EQ(to_string(client_->object("rows.csv").data), "id,name\n1,a\n");
    EXPECT_EQ(client_->object("rows.csv").metadata.get("st_ingest_client_name"), "ingest");

    // Multi-file metadata can be reused
    auto again = upload_config::builder()
                     .with_metadata(metadata)
                     .with_input_stream(stream_of("2,b\n"))
                     .with_destination_filename("more.csv")
                     .build();
    ASSERT_TRUE(again.has_value());
    EXPECT_TRUE(upload_without_connection(again.value(), factory_).has_value());
    EXPECT_FALSE(metadata.is_consumed());
}

TEST_F(FileTransferMetadataTest, MultiFileNeedsDestination) {
    auto config = upload_config::builder()
                      .with_metadata(file_transfer_metadata::multi_file(local_stage(), {}))
                      .with_input_stream(stream_of("x"))
                      .build();
    ASSERT_TRUE(config.has_value());

    auto row = upload_without_connection(config.value(), factory_);
    ASSERT_FALSE(row.has_value());
    EXPECT_EQ(row.error().code, error_code::invalid_parameter);
    EXPECT_EQ(client_->calls("upload"), 0u);
}

TEST_F(FileTransferMetadataTest, SingleFileIsConsumedOnce) {
    auto metadata = file_transfer_metadata::single_file(local_stage(), {}, "a.csv");
    ASSERT_TRUE(metadata.is_single_file());
    EXPECT_EQ(metadata.destination_filename(), "a.csv");

    auto first = upload_config::builder()
                     .with_metadata(metadata)
                     .with_input_stream(stream_of("1"))
                     .build();
    ASSERT_TRUE(first.has_value());
    ASSERT_TRUE(upload_without_connection(first.value(), factory_).has_value());
    EXPECT_TRUE(client_->has_object("a.csv"));
    EXPECT_TRUE(metadata.is_consumed());

    auto second = upload_config::builder()
                      .with_metadata(metadata)
                      .with_input_stream(stream_of("2"))
                      .build();
    ASSERT_TRUE(second.has_value());
    auto row = upload_without_connection(second.value(), factory_);
    ASSERT_FALSE(row.has_value());
    EXPECT_EQ(row.error().code, error_code::metadata_already_consumed);
    EXPECT_EQ(to_string(client_->object("a.csv").data), "1");
}

TEST_F(FileTransferMetadataTest, SingleFileRejectsOtherName) {
    auto metadata = file_transfer_metadata::single_file(local_stage(), {}, "a.csv");
    auto config = upload_config::builder()
                      .with_metadata(metadata)
                      .with_input_stream(stream_of("1"))
                      .with_destination_filename("b.csv")
                      .build();
    ASSERT_TRUE(config.has_value());

    auto row = upload_without_connection(config.value(), factory_);
    ASSERT_FALSE(row.has_value());
    EXPECT_EQ(row.error().code, error_code::invalid_parameter);
    EXPECT_FALSE(metadata.is_consumed());
}

TEST_F(FileTransferMetadataTest, MissingStream) {
    auto config = upload_config::builder()
                      .with_metadata(file_transfer_metadata::single_file(local_stage(), {}, "a"))
                      .build();
    ASSERT_TRUE(config.has_value());

    auto row = upload_without_connection(config.value(), factory_);
    ASSERT_FALSE(row.has_value());
    EXPECT_EQ(row.error().code, error_code::invalid_parameter);
}

TEST_F(FileTransferMetadataTest, RequireCompress) {
    auto config = upload_config::builder()
                      .with_metadata(file_transfer_metadata::multi_file(local_stage(), {}))
                      .with_input_stream(stream_of(std::string(4000, 'z')))
                      .with_destination_filename("rows.csv")
                      .with_require_compress(true)
                      .build();
    ASSERT_TRUE(config.has_value());

    auto row = upload_without_connection(config.value(), factory_);
    ASSERT_TRUE(row.has_value());
    if (compression_engine::is_available()) {
        EXPECT_EQ(row.value().target, "rows.csv.lz4");
        EXPECT_LT(row.value().destination_size, 4000u);
    } else {
        EXPECT_EQ(row.value().target, "rows.csv");
    }
}

TEST_F(FileTransferMetadataTest, TransferFailureIsReturned) {
    client_->fail_next("upload", error_code::access_denied);
    auto config = upload_config::builder()
                      .with_metadata(file_transfer_metadata::multi_file(local_stage(), {}))
                      .with_input_stream(stream_of("1"))
                      .with_destination_filename("a.csv")
                      .build();
    ASSERT_TRUE(config.has_value());

    auto row = upload_without_connection(config.value(), factory_);
    ASSERT_FALSE(row.has_value());
    EXPECT_EQ(row.error().code, error_code::access_denied);
}

TEST_F(FileTransferMetadataTest, ClientFactoryFailure) {
    storage_client_factory_fn failing = [](const stage_info&, const storage_client_options&)
        -> result<std::shared_ptr<storage_client>> {
        return unexpected{error{error_code::credential_resolution_failed, "expired"}};
    };
    auto config = upload_config::builder()
                      .with_metadata(file_transfer_metadata::multi_file(local_stage(), {}))
                      .with_input_stream(stream_of("1"))
                      .with_destination_filename("a.csv")
                      .build();
    ASSERT_TRUE(config.has_value());

    auto row = upload_without_connection(config.value(), failing);
    ASSERT_FALSE(row.has_value());
    EXPECT_EQ(row.error().code, error_code::credential_resolution_failed);
}

TEST_F(FileTransferMetadataTest, RegionalUrlOverridesStage) {
    std::vector<stage_info> seen;
    storage_client_factory_fn capturing = [this, &seen](const stage_info& stage,
                                                       const storage_client_options&)
        -> result<std::shared_ptr<storage_client>> {
        seen.push_back(stage);
        return std::static_pointer_cast<storage_client>(client_);
    };
    auto metadata = file_transfer_metadata::multi_file(local_stage(), {});

    auto regional = upload_config::builder()
                        .with_metadata(metadata)
                        .with_input_stream(stream_of("1"))
                        .with_destination_filename("a.csv")
                        .with_use_regional_url(true)
                        .build();
    ASSERT_TRUE(regional.has_value());
    ASSERT_TRUE(upload_without_connection(regional.value(), capturing).has_value());

    auto unset = upload_config::builder()
                     .with_metadata(metadata)
                     .with_input_stream(stream_of("2"))
                     .with_destination_filename("b.csv")
                     .build();
    ASSERT_TRUE(unset.has_value());
    ASSERT_TRUE(upload_without_connection(unset.value(), capturing).has_value());

    ASSERT_EQ(seen.size(), 2u);
    EXPECT_TRUE(seen[0].use_regional_url);
    EXPECT_FALSE(seen[1].use_regional_url);
    EXPECT_FALSE(metadata.stage().use_regional_url);
}

}  // namespace kcenon::stage_transfer::test
