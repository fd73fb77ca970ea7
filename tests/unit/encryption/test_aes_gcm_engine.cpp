/**
 * @file test_aes_gcm_engine.cpp
 * @brief Unit tests for the AES-GCM engine
 */

#ifdef STAGE_TRANS_ENABLE_ENCRYPTION

#include <gtest/gtest.h>

#include <kcenon/stage_transfer/encryption/aes_gcm_engine.h>

#include <atomic>
#include <string>
#include <thread>
#include <vector>

namespace kcenon::stage_transfer::test {

namespace {

auto from_hex(const std::string& hex) -> byte_buffer {
    byte_buffer out;
    for (std::size_t i = 0; i + 1 < hex.size(); i += 2) {
        out.push_back(static_cast<std::byte>(std::stoi(hex.substr(i, 2), nullptr, 16)));
    }
    return out;
}

}  // namespace

// ============================================================================
// Test Fixtures
// ============================================================================

class AesGcmEngineTest : public ::testing::Test {
protected:
    void SetUp() override {
        auto key = aes_gcm_engine::random_bytes(32);
        ASSERT_TRUE(key.has_value());
        auto engine = aes_gcm_engine::create(key.value());
        ASSERT_TRUE(engine.has_value());
        engine_ = std::move(engine.value());
    }

    void TearDown() override {}

    std::unique_ptr<aes_gcm_engine> engine_;
};

TEST_F(AesGcmEngineTest, IsAvailable) {
    EXPECT_TRUE(aes_gcm_engine::is_available());
    EXPECT_EQ(engine_->key_size(), 32u);
}

TEST_F(AesGcmEngineTest, EncryptDecrypt) {
    auto sealed = engine_->encrypt(as_bytes("stage payload"));
    ASSERT_TRUE(sealed.has_value());
    EXPECT_EQ(sealed.value().iv.size(), gcm_iv_size);
    EXPECT_EQ(sealed.value().ciphertext.size(), 13 + gcm_tag_size);

    auto plain = engine_->decrypt(sealed.value().iv, sealed.value().ciphertext);
    ASSERT_TRUE(plain.has_value());
    EXPECT_EQ(to_string(plain.value()), "stage payload");
}

TEST_F(AesGcmEngineTest, EmptyPlaintext) {
    auto sealed = engine_->encrypt({});
    ASSERT_TRUE(sealed.has_value());
    EXPECT_EQ(sealed.value().ciphertext.size(), gcm_tag_size);

    auto plain = engine_->decrypt(sealed.value().iv, sealed.value().ciphertext);
    ASSERT_TRUE(plain.has_value());
    EXPECT_TRUE(plain.value().empty());
}

TEST_F(AesGcmEngineTest, FreshIvPerCall) {
    auto first = engine_->encrypt(as_bytes("same"));
    auto second = engine_->encrypt(as_bytes("same"));
    ASSERT_TRUE(first.has_value());
    ASSERT_TRUE(second.has_value());
    EXPECT_NE(first.value().iv, second.value().iv);
    EXPECT_NE(first.value().ciphertext, second.value().ciphertext);
}

TEST_F(AesGcmEngineTest, TamperedCiphertextFails) {
    auto sealed = engine_->encrypt(as_bytes("integrity"));
    ASSERT_TRUE(sealed.has_value());
    auto tampered = sealed.value().ciphertext;
    tampered[0] ^= std::byte{0x01};

    auto plain = engine_->decrypt(sealed.value().iv, tampered);
    ASSERT_FALSE(plain.has_value());
    EXPECT_EQ(plain.error().code, error_code::decryption_failed);
}

TEST_F(AesGcmEngineTest, WrongKeyFails) {
    auto sealed = engine_->encrypt(as_bytes("secret"));
    ASSERT_TRUE(sealed.has_value());

    auto other_key = aes_gcm_engine::random_bytes(32);
    ASSERT_TRUE(other_key.has_value());
    auto other = aes_gcm_engine::create(other_key.value());
    ASSERT_TRUE(other.has_value());

    auto plain = other.value()->decrypt(sealed.value().iv, sealed.value().ciphertext);
    ASSERT_FALSE(plain.has_value());
    EXPECT_EQ(plain.error().code, error_code::decryption_failed);
}

TEST_F(AesGcmEngineTest, TruncatedInputFails) {
    auto plain = engine_->decrypt(byte_buffer(gcm_iv_size), byte_buffer(4));
    ASSERT_FALSE(plain.has_value());
    EXPECT_EQ(plain.error().code, error_code::decryption_failed);

    auto bad_iv = engine_->decrypt(byte_buffer(4), byte_buffer(gcm_tag_size));
    ASSERT_FALSE(bad_iv.has_value());
    EXPECT_EQ(bad_iv.error().code, error_code::decryption_failed);
}

TEST_F(AesGcmEngineTest, Statistics) {
    auto sealed = engine_->encrypt(as_bytes("12345678"));
    ASSERT_TRUE(sealed.has_value());
    ASSERT_TRUE(engine_->decrypt(sealed.value().iv, sealed.value().ciphertext).has_value());

    const auto stats = engine_->get_statistics();
    EXPECT_EQ(stats.encryption_ops, 1u);
    EXPECT_EQ(stats.decryption_ops, 1u);
    EXPECT_EQ(stats.bytes_encrypted, 8u);
    EXPECT_EQ(stats.bytes_decrypted, 8u);
}

TEST_F(AesGcmEngineTest, ConcurrentUse) {
    std::vector<std::thread> threads;
    std::atomic<int> failures{0};
    for (int t = 0; t < 4; ++t) {
        threads.emplace_back([&, t] {
            const auto text = "thread-" + std::to_string(t);
            for (int i = 0; i < 50; ++i) {
                auto sealed = engine_->encrypt(as_bytes(text));
                if (!sealed) {
                    ++failures;
                    continue;
                }
                auto plain = engine_->decrypt(sealed.value().iv, sealed.value().ciphertext);
                if (!plain || to_string(plain.value()) != text) {
                    ++failures;
                }
            }
        });
    }
    for (auto& thread : threads) {
        thread.join();
    }
    EXPECT_EQ(failures.load(), 0);
}

// ============================================================================
// Key Handling
// ============================================================================

TEST(AesGcmKeyTest, RejectsOtherKeyLengths) {
    for (std::size_t size : {0u, 15u, 24u, 33u}) {
        auto engine = aes_gcm_engine::create(byte_buffer(size));
        ASSERT_FALSE(engine.has_value()) << size;
        EXPECT_EQ(engine.error().code, error_code::invalid_parameter);
    }
}

// NIST GCM test vectors, cases 2 and 14
TEST(AesGcmKeyTest, KnownAnswers) {
    const byte_buffer iv(gcm_iv_size);

    auto aes128 = aes_gcm_engine::create(byte_buffer(16));
    ASSERT_TRUE(aes128.has_value());
    EXPECT_EQ(aes128.value()->key_size(), 16u);
    auto plain128 = aes128.value()->decrypt(
        iv, from_hex("0388dace60b6a392f328c2b971b2fe78ab6e47d42cec13bdf53a67b21257bddf"));
    ASSERT_TRUE(plain128.has_value());
    EXPECT_EQ(plain128.value(), byte_buffer(16));

    auto aes256 = aes_gcm_engine::create(byte_buffer(32));
    ASSERT_TRUE(aes256.has_value());
    auto plain256 = aes256.value()->decrypt(
        iv, from_hex("cea7403d4d606b6e074ec5d3baf39d18d0d1c8a799996bf0265b98b5d48ab919"));
    ASSERT_TRUE(plain256.has_value());
    EXPECT_EQ(plain256.value(), byte_buffer(16));
}

TEST(AesGcmKeyTest, RandomBytes) {
    auto first = aes_gcm_engine::random_bytes(32);
    auto second = aes_gcm_engine::random_bytes(32);
    ASSERT_TRUE(first.has_value());
    ASSERT_TRUE(second.has_value());
    EXPECT_EQ(first.value().size(), 32u);
    EXPECT_NE(first.value(), second.value());
}

}  // namespace kcenon::stage_transfer::test

#endif  // STAGE_TRANS_ENABLE_ENCRYPTION
