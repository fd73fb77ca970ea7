/**
 * @file test_credential_resolver.cpp
 * @brief Unit tests for stage descriptor parsing and credential resolution
 */

#include <gtest/gtest.h>

#include <kcenon/stage_transfer/cloud/credential_resolver.h>
#include <kcenon/stage_transfer/core/error_codes.h>

#include <chrono>
#include <memory>
#include <string>
#include <vector>

namespace kcenon::stage_transfer::test {

namespace {

const std::string key_16 = "AAAAAAAAAAAAAAAAAAAAAA==";
const std::string key_32 = "AAAAAAAAAAAAAAAAAAAAAAAAAAAAAAAAAAAAAAAAAAA=";

class scripted_session : public stage_session {
public:
    explicit scripted_session(result<std::string> reply) : reply_(std::move(reply)) {}

    auto describe_stage(const stage_request& request) -> result<std::string> override {
        requests.push_back(request);
        return reply_;
    }

    std::vector<stage_request> requests;

private:
    result<std::string> reply_;
};

auto s3_descriptor(const std::string& extra = "") -> std::string {
    return R"({"locationType":"S3","location":"bucket/stages/abc","region":"us-west-2",)"
           R"("creds":{"AWS_KEY_ID":"AKIA","AWS_SECRET_KEY":"secret","AWS_TOKEN":"tok"})" +
           extra + "}";
}

auto future_epoch() -> std::string {
    const auto later = std::chrono::system_clock::now() + std::chrono::hours(1);
    return std::to_string(
        std::chrono::duration_cast<std::chrono::seconds>(later.time_since_epoch()).count());
}

}  // namespace

// ============================================================================
// Descriptor Parsing
// ============================================================================

class StageDescriptorTest : public ::testing::Test {
protected:
    void SetUp() override {}
    void TearDown() override {}
};

TEST_F(StageDescriptorTest, S3TemporaryKeys) {
    auto stage = credential_resolver::parse_descriptor(s3_descriptor());
    ASSERT_TRUE(stage.has_value());

    const auto& info = stage.value();
    EXPECT_EQ(info.kind, provider_kind::s3);
    EXPECT_EQ(info.bucket, "bucket");
    EXPECT_EQ(info.prefix, "stages/abc/");
    EXPECT_EQ(info.region, "us-west-2");
    ASSERT_TRUE(std::holds_alternative<temporary_keys>(info.credentials));
    EXPECT_EQ(std::get<temporary_keys>(info.credentials).session_token, "tok");
    EXPECT_FALSE(info.is_encrypted());
    EXPECT_FALSE(info.is_presigned());
}

TEST_F(StageDescriptorTest, AzureSasToken) {
    auto stage = credential_resolver::parse_descriptor(
        R"({"locationType":"AZURE","location":"container/p/","storageAccount":"acct",)"
        R"("creds":{"AZURE_SAS_TOKEN":"sv=2021&sig=abc"}})");
    ASSERT_TRUE(stage.has_value());
    EXPECT_EQ(stage.value().kind, provider_kind::azure);
    EXPECT_EQ(stage.value().bucket, "container");
    EXPECT_EQ(stage.value().prefix, "p/");
    ASSERT_TRUE(std::holds_alternative<sas_token>(stage.value().credentials));
}

TEST_F(StageDescriptorTest, AzureNeedsStorageAccount) {
    auto stage = credential_resolver::parse_descriptor(
        R"({"locationType":"AZURE","location":"container/","creds":{"AZURE_SAS_TOKEN":"sv=1"}})");
    ASSERT_FALSE(stage.has_value());
    EXPECT_EQ(stage.error().code, error_code::invalid_stage_descriptor);
}

TEST_F(StageDescriptorTest, GcsPresignedUrlWinsOverToken) {
    auto stage = credential_resolver::parse_descriptor(
        R"({"locationType":"GCS","location":"b/p","presignedUrl":"https://storage.googleapis.com/b/p/a.csv?X-Goog-Signature=1",)"
        R"("creds":{"GCS_ACCESS_TOKEN":"ya29"},"srcLocations":["a.csv","b.csv"]})");
    ASSERT_TRUE(stage.has_value());
    EXPECT_TRUE(stage.value().is_presigned());
    ASSERT_EQ(stage.value().source_locations.size(), 2u);
    EXPECT_EQ(stage.value().source_locations[1], "b.csv");
}

TEST_F(StageDescriptorTest, GcsDownscopedToken) {
    auto stage = credential_resolver::parse_descriptor(
        R"({"locationType":"GCS","location":"b","presignedUrl":null,"creds":{"GCS_ACCESS_TOKEN":"ya29"}})");
    ASSERT_TRUE(stage.has_value());
    EXPECT_TRUE(std::holds_alternative<downscoped_token>(stage.value().credentials));
    EXPECT_TRUE(stage.value().prefix.empty());
}

TEST_F(StageDescriptorTest, LocalStageKeepsDirectory) {
    auto stage = credential_resolver::parse_descriptor(
        R"({"locationType":"LOCAL_FS","location":"/var/stage/"})");
    ASSERT_TRUE(stage.has_value());
    EXPECT_EQ(stage.value().kind, provider_kind::local_fs);
    EXPECT_EQ(stage.value().bucket, "/var/stage");
    EXPECT_TRUE(stage.value().prefix.empty());
}

TEST_F(StageDescriptorTest, MissingCredentials) {
    auto stage = credential_resolver::parse_descriptor(
        R"({"locationType":"S3","location":"bucket/","creds":{"AWS_KEY_ID":"AKIA"}})");
    ASSERT_FALSE(stage.has_value());
    EXPECT_EQ(stage.error().code, error_code::credential_resolution_failed);
}

TEST_F(StageDescriptorTest, UnknownOrMissingLocationType) {
    auto unknown = credential_resolver::parse_descriptor(
        R"({"locationType":"FTP","location":"x"})");
    ASSERT_FALSE(unknown.has_value());
    EXPECT_EQ(unknown.error().code, error_code::invalid_stage_descriptor);

    auto missing = credential_resolver::parse_descriptor(R"({"location":"x"})");
    ASSERT_FALSE(missing.has_value());
    EXPECT_EQ(missing.error().code, error_code::invalid_stage_descriptor);
}

TEST_F(StageDescriptorTest, EncryptionMaterial) {
    auto stage = credential_resolver::parse_descriptor(s3_descriptor(
        R"(,"encryptionMaterial":{"queryStageMasterKey":")" + key_32 +
        R"(","queryId":"q-1","smkId":42})"));
    ASSERT_TRUE(stage.has_value());
    ASSERT_TRUE(stage.value().is_encrypted());
    EXPECT_EQ(stage.value().encryption->query_id, "q-1");
    EXPECT_EQ(stage.value().encryption->smk_id, 42);
}

TEST_F(StageDescriptorTest, MasterKeyLength) {
    EXPECT_TRUE(credential_resolver::decode_master_key(key_16).has_value());
    EXPECT_TRUE(credential_resolver::decode_master_key(key_32).has_value());

    auto short_key = credential_resolver::decode_master_key("AAAAAAAAAAA=");
    ASSERT_FALSE(short_key.has_value());
    EXPECT_EQ(short_key.error().code, error_code::credential_resolution_failed);

    auto not_base64 = credential_resolver::decode_master_key("not*base64");
    ASSERT_FALSE(not_base64.has_value());
}

TEST_F(StageDescriptorTest, ExpiredCredentials) {
    auto expired = credential_resolver::parse_descriptor(s3_descriptor(R"(,"expiresAt":1000)"));
    ASSERT_FALSE(expired.has_value());
    EXPECT_EQ(expired.error().code, error_code::session_expired);

    auto valid = credential_resolver::parse_descriptor(
        s3_descriptor(",\"expiresAt\":" + future_epoch()));
    ASSERT_TRUE(valid.has_value());
    EXPECT_TRUE(valid.value().expires_at.has_value());
    EXPECT_FALSE(valid.value().is_expired());
}

TEST_F(StageDescriptorTest, SplitLocation) {
    std::string bucket;
    std::string prefix;
    credential_resolver::split_location("bucket", bucket, prefix);
    EXPECT_EQ(bucket, "bucket");
    EXPECT_TRUE(prefix.empty());

    credential_resolver::split_location("bucket/a/b", bucket, prefix);
    EXPECT_EQ(prefix, "a/b/");
}

// ============================================================================
// Resolution
// ============================================================================

TEST(CredentialResolverTest, AppendsStagePathToPrefix) {
    auto session = std::make_shared<scripted_session>(s3_descriptor());
    credential_resolver resolver(session);

    stage_request request;
    request.stage_name = "my_stage";
    request.stage_path = "daily/2025";
    request.direction = transfer_direction::download;

    auto stage = resolver.resolve(request);
    ASSERT_TRUE(stage.has_value());
    EXPECT_EQ(stage.value().prefix, "stages/abc/daily/2025/");
    EXPECT_EQ(stage.value().object_key("a.csv"), "stages/abc/daily/2025/a.csv");

    ASSERT_EQ(session->requests.size(), 1u);
    EXPECT_EQ(session->requests[0].direction, transfer_direction::download);
}

TEST(CredentialResolverTest, SessionFailureIsCredentialError) {
    auto session = std::make_shared<scripted_session>(
        unexpected{error{error_code::transient_network, "connection reset"}});
    credential_resolver resolver(session);

    auto stage = resolver.resolve(stage_request{});
    ASSERT_FALSE(stage.has_value());
    EXPECT_EQ(stage.error().code, error_code::credential_resolution_failed);
    EXPECT_TRUE(is_command_level_error(stage.error().code));
}

TEST(CredentialResolverTest, SessionCredentialErrorsPassThrough) {
    auto session = std::make_shared<scripted_session>(
        unexpected{error{error_code::stage_not_found, "no such stage"}});
    credential_resolver resolver(session);

    auto stage = resolver.resolve(stage_request{});
    ASSERT_FALSE(stage.has_value());
    EXPECT_EQ(stage.error().code, error_code::stage_not_found);
}

TEST(CredentialResolverTest, NoSession) {
    credential_resolver resolver(nullptr);
    auto stage = resolver.resolve(stage_request{});
    ASSERT_FALSE(stage.has_value());
    EXPECT_EQ(stage.error().code, error_code::credential_resolution_failed);
}

}  // namespace kcenon::stage_transfer::test
