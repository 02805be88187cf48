#include <gtest/gtest.h>
#include "sync/Inventory.hpp"
#include "storage/errors.hpp"
#include "FakeClient.hpp"
#include "TempDir.hpp"

using namespace zs;
using namespace zs::sync;

class InventoryTest : public ::testing::Test {
protected:
    test::TempDir dir;
    test::FakeClient client;
};

TEST_F(InventoryTest, LocalWalkKeysFilesUnderBase) {
    dir.write("index.html", "<html/>");
    dir.write("css/site.css", "body{}");
    dir.write("a/b/c/deep.bin", "0123456789");
    std::filesystem::create_directories(dir.path() / "empty");

    const auto inv = Inventory::buildLocal(dir.path(), "zone/v1/");

    ASSERT_EQ(inv.size(), 3u);
    EXPECT_TRUE(inv.contains("zone/v1/index.html"));
    EXPECT_TRUE(inv.contains("zone/v1/css/site.css"));
    ASSERT_TRUE(inv.contains("zone/v1/a/b/c/deep.bin"));

    const auto& deep = inv.at("zone/v1/a/b/c/deep.bin");
    EXPECT_EQ(deep.size_bytes, 10u);
    EXPECT_EQ(deep.absolute_path, dir.path() / "a/b/c/deep.bin");
}

TEST_F(InventoryTest, MissingLocalRootIsFatal) {
    try {
        Inventory::buildLocal(dir.path() / "nope", "zone/");
        FAIL() << "expected LocalIOError";
    } catch (const storage::StorageError& e) {
        EXPECT_EQ(e.kind(), storage::ErrorKind::LocalIO);
    }
}

TEST_F(InventoryTest, RemoteListingIsFlattenedWithoutDirectories) {
    client.put("zone/index.html", "x");
    client.put("zone/css/site.css", "xx");
    client.put("zone/a/b/c/deep.bin", "xxx");

    const auto inv = Inventory::buildRemote(client, "zone/");

    ASSERT_EQ(inv.size(), 3u);
    EXPECT_EQ(inv.at("zone/a/b/c/deep.bin").size_bytes, 3u);
    EXPECT_TRUE(inv.at("zone/index.html").checksum.has_value());
    for (const auto& [key, e] : inv) {
        EXPECT_FALSE(e.is_directory);
        EXPECT_NE(key.back(), '/');
    }

    // One listing per directory: zone/, zone/css/, zone/a/, zone/a/b/, zone/a/b/c/
    EXPECT_EQ(client.callsOf("LIST").size(), 5u);
}

TEST_F(InventoryTest, RemoteListingHonoursBasePrefix) {
    client.put("zone/v1/keep.txt", "x");
    client.put("zone/v2/other.txt", "x");

    const auto inv = Inventory::buildRemote(client, "zone/v1");
    ASSERT_EQ(inv.size(), 1u);
    EXPECT_TRUE(inv.contains("zone/v1/keep.txt"));
}

TEST_F(InventoryTest, MissingChecksumsStayAbsent) {
    client.publishChecksums = false;
    client.put("zone/a.txt", "x");
    const auto inv = Inventory::buildRemote(client, "zone/");
    EXPECT_FALSE(inv.at("zone/a.txt").checksum.has_value());
}

TEST_F(InventoryTest, NestedListingFailureIsFatal) {
    client.put("zone/a.txt", "x");
    client.put("zone/sub/b.txt", "x");
    client.failLists.insert("zone/sub/");

    EXPECT_THROW(Inventory::buildRemote(client, "zone/"), storage::StorageError);
}

TEST_F(InventoryTest, ListingWithDotSegmentsIsRejected) {
    client.put("zone/ok.txt", "x");
    client.put("zone/../../escape.txt", "x");

    try {
        (void)Inventory::buildRemote(client, "zone/");
        FAIL() << "expected StorageError";
    } catch (const storage::StorageError& e) {
        EXPECT_EQ(e.kind(), storage::ErrorKind::Unknown);
    }
}
