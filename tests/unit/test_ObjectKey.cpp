#include <gtest/gtest.h>
#include "util/objectKey.hpp"
#include "util/hash.hpp"
#include "TempDir.hpp"

using namespace zs::util;

TEST(ObjectKeyTest, NormalizeStripsLeadingAndDoubledSlashes) {
    EXPECT_EQ(normalizeKey("/zone//sub///file.txt"), "zone/sub/file.txt");
    EXPECT_EQ(normalizeKey("  zone/a.txt  "), "zone/a.txt");
}

TEST(ObjectKeyTest, NormalizeConvertsBackslashes) {
    EXPECT_EQ(normalizeKey("zone\\assets\\app.js"), "zone/assets/app.js");
}

TEST(ObjectKeyTest, DirectoryKeysEndWithExactlyOneSlash) {
    EXPECT_EQ(normalizeKey("zone/sub", true), "zone/sub/");
    EXPECT_EQ(normalizeKey("zone/sub///", true), "zone/sub/");
}

TEST(ObjectKeyTest, FileKeyRejectsTrailingSlash) {
    EXPECT_THROW((void)normalizeKey("zone/sub/", false), std::invalid_argument);
    EXPECT_NO_THROW((void)normalizeKey("zone/sub/file", false));
}

TEST(ObjectKeyTest, DotSegmentsAreRejected) {
    EXPECT_THROW((void)normalizeKey("zone/../escape.txt"), std::invalid_argument);
    EXPECT_THROW((void)normalizeKey("zone/./a.txt", false), std::invalid_argument);
    EXPECT_THROW((void)normalizeKey("zone/..", true), std::invalid_argument);
    EXPECT_THROW((void)remoteBasePath("zone", "../other"), std::invalid_argument);
    EXPECT_EQ(normalizeKey("zone/..hidden/.env"), "zone/..hidden/.env");
    EXPECT_EQ(normalizeKey("zone/.../a"), "zone/.../a");
}

TEST(ObjectKeyTest, RemoteBasePath) {
    EXPECT_EQ(remoteBasePath("zone"), "zone/");
    EXPECT_EQ(remoteBasePath("zone", "/v1.2.3/"), "zone/v1.2.3/");
    EXPECT_EQ(remoteBasePath("zone", "releases\\v1"), "zone/releases/v1/");
    EXPECT_THROW((void)remoteBasePath(""), std::invalid_argument);
}

TEST(ObjectKeyTest, KeyForJoinsBaseAndRelativePath) {
    EXPECT_EQ(keyFor("zone/", "css/site.css"), "zone/css/site.css");
    EXPECT_EQ(keyFor("zone/v1", "index.html"), "zone/v1/index.html");
}

TEST(ObjectKeyTest, RelativeTo) {
    EXPECT_EQ(relativeTo("zone/v1/", "zone/v1/a/b.txt"), "a/b.txt");
    EXPECT_FALSE(relativeTo("zone/v1/", "zone/v2/a.txt").has_value());
    EXPECT_FALSE(relativeTo("zone/v1/", "zone/v1/").has_value());
}

TEST(ObjectKeyTest, FileName) {
    EXPECT_EQ(fileName("zone/a/b/manifest.json"), "manifest.json");
    EXPECT_EQ(fileName("top.txt"), "top.txt");
    EXPECT_EQ(fileName("zone/dir/"), "dir");
}

TEST(ObjectKeyTest, CaseInsensitiveHelpers) {
    EXPECT_TRUE(iequals("Manifest.JSON", "manifest.json"));
    EXPECT_FALSE(iequals("manifest.json", "manifest.jso"));
    EXPECT_TRUE(iendsWith("zone/INDEX.HTML", ".html"));
    EXPECT_FALSE(iendsWith("ml", ".html"));
}

TEST(HashTest, Sha256IsUpperCaseHex) {
    EXPECT_EQ(sha256Hex("abc"), "BA7816BF8F01CFEA414140DE5DAE2223B00361A396177A9CB410FF61F20015AD");
    EXPECT_EQ(sha256Hex(""), "E3B0C44298FC1C149AFBF4C8996FB92427AE41E4649B934CA495991B7852B855");
}

TEST(HashTest, Sha256FileThrowsForMissingFile) {
    EXPECT_THROW((void)sha256File("/nonexistent/zonesync/file"), std::runtime_error);
}

TEST(HashTest, Sha256FileStreamsLargeFilesInChunks) {
    const zs::test::TempDir dir;
    const std::string content(200 * 1024 + 17, 'z');
    const auto p = dir.write("big.bin", content);
    EXPECT_EQ(sha256File(p), sha256Hex(content));
}
