/**
 * @file test_logging.cpp
 * @brief Unit tests for structured logging and credential masking
 */

#include <gtest/gtest.h>

#include <kcenon/stage_transfer/core/logging.h>

#include <mutex>
#include <string>
#include <vector>

namespace kcenon::stage_transfer::test {

// =============================================================================
// Masking Config Tests
// =============================================================================

TEST(MaskingConfigTest, DefaultMasksCredentialsOnly) {
    masking_config config;

    EXPECT_TRUE(config.mask_credentials);
    EXPECT_FALSE(config.mask_paths);
    EXPECT_FALSE(config.mask_ips);
    EXPECT_EQ(config.mask_char, "*");
    EXPECT_EQ(config.visible_chars, 4u);
}

TEST(MaskingConfigTest, AllMaskedConfig) {
    auto config = masking_config::all_masked();

    EXPECT_TRUE(config.mask_credentials);
    EXPECT_TRUE(config.mask_paths);
    EXPECT_TRUE(config.mask_ips);
}

// =============================================================================
// Sensitive Info Masker Tests
// =============================================================================

class SensitiveInfoMaskerTest : public ::testing::Test {
protected:
    sensitive_info_masker masker_;
};

TEST_F(SensitiveInfoMaskerTest, MasksAwsSecretInDescriptor) {
    const std::string input =
        R"({"creds":{"AWS_KEY_ID":"AKIAEXAMPLE","AWS_SECRET_KEY":"wJalrXUtnFEMIK7MDENG"}})";
    const auto masked = masker_.mask(input);

    EXPECT_EQ(masked.find("wJalrXUtnFEMIK7MDENG"), std::string::npos);
    EXPECT_NE(masked.find("AWS_SECRET_KEY"), std::string::npos);
}

TEST_F(SensitiveInfoMaskerTest, MasksSessionToken) {
    const auto masked = masker_.mask("AWS_TOKEN=FQoGZXIvYXdzEJr");
    EXPECT_EQ(masked.find("FQoGZXIvYXdzEJr"), std::string::npos);
}

TEST_F(SensitiveInfoMaskerTest, MasksBearerToken) {
    const auto masked = masker_.mask("Authorization: Bearer ya29.a0AfH6SMBx");
    EXPECT_EQ(masked.find("ya29.a0AfH6SMBx"), std::string::npos);
}

TEST_F(SensitiveInfoMaskerTest, MasksSasSignature) {
    const auto masked = masker_.mask(
        "https://acct.blob.core.windows.net/c/blob?sv=2021-08-06&sig=abcDEF123%2Bxyz&se=2030");
    EXPECT_EQ(masked.find("abcDEF123%2Bxyz"), std::string::npos);
    EXPECT_NE(masked.find("sv=2021-08-06"), std::string::npos);
}

TEST_F(SensitiveInfoMaskerTest, MasksPresignedSignatures) {
    const auto amz = masker_.mask(
        "https://b.s3.amazonaws.com/k?X-Amz-Credential=AKIA&X-Amz-Signature=deadbeefcafe");
    EXPECT_EQ(amz.find("deadbeefcafe"), std::string::npos);

    const auto goog = masker_.mask(
        "https://storage.googleapis.com/b/k?X-Goog-Date=20250101&X-Goog-Signature=0123abcd9876");
    EXPECT_EQ(goog.find("0123abcd9876"), std::string::npos);
}

TEST_F(SensitiveInfoMaskerTest, MasksSigV4Signature) {
    const auto masked = masker_.mask(
        "AWS4-HMAC-SHA256 Credential=AKIA/20250101/us-east-1/s3/aws4_request, "
        "SignedHeaders=host, Signature=fe5f80f77d5fa3beca038a248ff027");
    EXPECT_EQ(masked.find("fe5f80f77d5fa3beca038a248ff027"), std::string::npos);
}

TEST_F(SensitiveInfoMaskerTest, LeavesOrdinaryTextAlone) {
    const std::string input = "Uploaded data.csv as data.csv.lz4 (single_shot, 120 bytes)";
    EXPECT_EQ(masker_.mask(input), input);
}

TEST_F(SensitiveInfoMaskerTest, PathMaskingIsOptional) {
    const std::string input = "writing /home/user/data.csv";
    EXPECT_EQ(masker_.mask(input), input);

    sensitive_info_masker all(masking_config::all_masked());
    const auto masked = all.mask(input);
    EXPECT_EQ(masked.find("/home/user"), std::string::npos);
    EXPECT_NE(masked.find("data.csv"), std::string::npos);
}

TEST_F(SensitiveInfoMaskerTest, IpMaskingKeepsLastOctet) {
    sensitive_info_masker all(masking_config::all_masked());
    EXPECT_EQ(all.mask_ip("192.168.1.100"), "*********.100");
}

TEST_F(SensitiveInfoMaskerTest, MaskSecretKeepsPrefix) {
    EXPECT_EQ(masker_.mask_secret("abcdefgh"), "abcd****");
    EXPECT_EQ(masker_.mask_secret("abc"), "***");
}

// =============================================================================
// Structured Entries
// =============================================================================

TEST(LogEntryBuilderTest, BuildsJsonWithContext) {
    auto json = log_entry_builder()
                    .with_level(log_level::info)
                    .with_category(log_category::agent)
                    .with_message("Uploaded data.csv")
                    .with_command_id("cmd-1")
                    .with_filename("data.csv")
                    .with_provider("S3")
                    .with_file_size(1024)
                    .with_part(2, 4)
                    .build_json();

    EXPECT_NE(json.find("\"category\":\"stage_transfer.agent\""), std::string::npos);
    EXPECT_NE(json.find("\"command_id\":\"cmd-1\""), std::string::npos);
    EXPECT_NE(json.find("\"filename\":\"data.csv\""), std::string::npos);
    EXPECT_NE(json.find("\"size\":1024"), std::string::npos);
}

TEST(LogEntryBuilderTest, EscapesJsonStrings) {
    EXPECT_EQ(detail::escape_json_string("a\"b\\c\n"), "a\\\"b\\\\c\\n");
}

// =============================================================================
// Logger Tests
// =============================================================================

class StageTransferLoggerTest : public ::testing::Test {
protected:
    void SetUp() override {
        auto& logger = get_logger();
        previous_level_ = logger.get_level();
        logger.set_console_output(false);
        logger.set_level(log_level::trace);
        logger.set_callback([this](log_level level, std::string_view category,
                                   std::string_view message, const transfer_log_context*) {
            std::lock_guard lock(mutex_);
            entries_.push_back({level, std::string(category), std::string(message)});
        });
    }

    void TearDown() override {
        auto& logger = get_logger();
        logger.set_callback(nullptr);
        logger.set_level(previous_level_);
        logger.set_console_output(true);
    }

    struct captured {
        log_level level;
        std::string category;
        std::string message;
    };

    auto entries() -> std::vector<captured> {
        std::lock_guard lock(mutex_);
        return entries_;
    }

    log_level previous_level_ = log_level::info;
    std::mutex mutex_;
    std::vector<captured> entries_;
};

TEST_F(StageTransferLoggerTest, MacrosReachCallback) {
    ST_LOG_INFO(log_category::storage, "listing stage");

    auto logged = entries();
    ASSERT_EQ(logged.size(), 1u);
    EXPECT_EQ(logged[0].level, log_level::info);
    EXPECT_EQ(logged[0].category, log_category::storage);
    EXPECT_EQ(logged[0].message, "listing stage");
}

TEST_F(StageTransferLoggerTest, LevelFiltersEntries) {
    get_logger().set_level(log_level::warn);

    ST_LOG_DEBUG(log_category::retry, "retry 1/25");
    ST_LOG_WARN(log_category::retry, "retries exhausted");

    auto logged = entries();
    ASSERT_EQ(logged.size(), 1u);
    EXPECT_EQ(logged[0].level, log_level::warn);
}

TEST_F(StageTransferLoggerTest, CallbackReceivesMaskedMessage) {
    ST_LOG_ERROR(log_category::credential, "request failed: Bearer secret-token-value");

    auto logged = entries();
    ASSERT_EQ(logged.size(), 1u);
    EXPECT_EQ(logged[0].message.find("secret-token-value"), std::string::npos);
}

TEST_F(StageTransferLoggerTest, ContextMacroPassesContext) {
    transfer_log_context ctx;
    ctx.command_id = "cmd-7";
    ctx.filename = "a.csv";

    const transfer_log_context* seen = nullptr;
    get_logger().set_callback([&seen](log_level, std::string_view, std::string_view,
                                      const transfer_log_context* context) { seen = context; });

    ST_LOG_INFO_CTX(log_category::agent, "uploaded", ctx);
    EXPECT_EQ(seen, &ctx);
}

}  // namespace kcenon::stage_transfer::test
