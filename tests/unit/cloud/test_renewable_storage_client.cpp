/**
 * @file test_renewable_storage_client.cpp
 * @brief Unit tests for the storage client that swaps credentials in place
 */

#include <gtest/gtest.h>

#include <kcenon/stage_transfer/cloud/renewable_storage_client.h>

#include "../mocks/memory_storage_client.h"

#include <memory>

namespace kcenon::stage_transfer::test {

TEST(RenewableStorageClientTest, ForwardsToInitialClient) {
    auto inner = std::make_shared<memory_storage_client>(provider_kind::gcs);
    renewable_storage_client client(inner);

    auto data = to_buffer("alpha");
    auto written = client.upload("a.csv", data, {});
    ASSERT_TRUE(written.has_value());
    EXPECT_EQ(written.value(), 5u);
    EXPECT_TRUE(inner->has_object("a.csv"));
    EXPECT_EQ(client.provider(), provider_kind::gcs);
    EXPECT_EQ(client.generation(), 0u);
}

TEST(RenewableStorageClientTest, RenewedClientServesLaterCalls) {
    auto expired = std::make_shared<memory_storage_client>();
    auto renewed = std::make_shared<memory_storage_client>();
    renewed->put_object("a.csv", to_buffer("bravo"));
    renewable_storage_client client(expired);

    client.renew(renewed);
    EXPECT_EQ(client.generation(), 1u);
    EXPECT_EQ(client.current(), renewed);

    auto downloaded = client.download("a.csv");
    ASSERT_TRUE(downloaded.has_value());
    EXPECT_EQ(to_string(downloaded.value()), "bravo");
    EXPECT_EQ(expired->calls("download"), 0u);
    EXPECT_EQ(renewed->calls("download"), 1u);
}

}  // namespace kcenon::stage_transfer::test
