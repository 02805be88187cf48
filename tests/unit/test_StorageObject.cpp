#include <gtest/gtest.h>
#include "storage/HttpClient.hpp"
#include "storage/errors.hpp"
#include "storage/model/Object.hpp"
#include "util/curlWrappers.hpp"

#include <nlohmann/json.hpp>

using namespace zs;
using namespace zs::storage;

namespace {
const std::string LISTING = R"([
  {
    "Guid": "0e1a3c1c-2b1f-4b8a-9a53-2d1d7a0b6f11",
    "StorageZoneName": "zone",
    "Path": "/zone/assets/",
    "ObjectName": "app.js",
    "Length": 1234,
    "LastChanged": "2025-03-01T10:00:00.000",
    "IsDirectory": false,
    "Checksum": "9F86D081884C7D659A2FEAA0C55AD015A3BF4F1B2B0B822CD15D6C15B0F00A08"
  },
  {
    "Path": "/zone/assets/",
    "ObjectName": "img",
    "Length": 0,
    "LastChanged": "2025-03-01T10:00:00.000",
    "IsDirectory": true,
    "Checksum": null
  }
])";

util::HttpResponse response(const long http, std::string body = {}, const CURLcode curl = CURLE_OK) {
    util::HttpResponse r;
    r.curl = curl;
    r.http = http;
    r.body = std::move(body);
    return r;
}

template <class Fn>
ErrorKind kindOf(Fn&& fn) {
    try {
        fn();
    } catch (const StorageError& e) {
        return e.kind();
    }
    ADD_FAILURE() << "no StorageError thrown";
    return ErrorKind::Unknown;
}
}

TEST(StorageObjectTest, ParsesListingPayload) {
    const auto objects = model::parseListing(LISTING);
    ASSERT_EQ(objects.size(), 2u);

    EXPECT_EQ(objects[0].fullPath(), "/zone/assets/app.js");
    EXPECT_EQ(objects[0].length, 1234u);
    EXPECT_FALSE(objects[0].is_directory);
    ASSERT_TRUE(objects[0].checksum.has_value());
    EXPECT_EQ(objects[0].checksum->size(), 64u);

    EXPECT_TRUE(objects[1].is_directory);
    EXPECT_FALSE(objects[1].checksum.has_value());
    EXPECT_EQ(objects[1].fullPath(), "/zone/assets/img");
}

TEST(StorageObjectTest, EmptyChecksumMeansAbsent) {
    const auto objects = model::parseListing(R"([{"Path":"/zone/","ObjectName":"a","Length":1,"IsDirectory":false,"Checksum":""}])");
    ASSERT_EQ(objects.size(), 1u);
    EXPECT_FALSE(objects[0].checksum.has_value());
}

TEST(StorageObjectTest, BlankPayloadIsEmptyListing) {
    EXPECT_TRUE(model::parseListing("").empty());
    EXPECT_TRUE(model::parseListing("  \n").empty());
    EXPECT_TRUE(model::parseListing("[]").empty());
}

TEST(StorageObjectTest, NonArrayPayloadIsRejected) {
    EXPECT_THROW(model::parseListing(R"({"HttpCode":401,"Message":"Unauthorized"})"), std::runtime_error);
    EXPECT_THROW(model::parseListing("not json"), std::exception);
}

TEST(StorageObjectTest, RoundTripsThroughJson) {
    const model::Object o{.path = "/zone/", .object_name = "a.txt", .length = 3, .checksum = "ABC"};
    const nlohmann::json j = o;
    EXPECT_EQ(j.at("ObjectName"), "a.txt");
    EXPECT_EQ(j.get<model::Object>().checksum, "ABC");
}

TEST(HttpStatusTest, MapsStatusCodesToErrorKinds) {
    EXPECT_NO_THROW(HttpClient::raiseForStatus(response(200), "zone", "zone/a"));
    EXPECT_NO_THROW(HttpClient::raiseForStatus(response(201), "zone", "zone/a"));

    EXPECT_EQ(kindOf([] { HttpClient::raiseForStatus(response(404), "zone", "zone/a"); }), ErrorKind::NotFound);
    EXPECT_EQ(kindOf([] { HttpClient::raiseForStatus(response(401), "zone", "zone/a"); }), ErrorKind::AuthFailure);
    EXPECT_EQ(kindOf([] { HttpClient::raiseForStatus(response(400), "zone", "zone/a", std::string("ABC")); }),
              ErrorKind::ChecksumMismatch);
    EXPECT_EQ(kindOf([] { HttpClient::raiseForStatus(response(400), "zone", "zone/a"); }), ErrorKind::Unknown);
    EXPECT_EQ(kindOf([] { HttpClient::raiseForStatus(response(500, "boom"), "zone", "zone/a"); }), ErrorKind::Unknown);
    EXPECT_EQ(kindOf([] { HttpClient::raiseForStatus(response(0, {}, CURLE_COULDNT_CONNECT), "zone", "zone/a"); }),
              ErrorKind::Unknown);
}

TEST(HttpStatusTest, AuthFailureNamesTheZone) {
    try {
        HttpClient::raiseForStatus(response(401), "my-zone", "my-zone/a");
        FAIL();
    } catch (const AuthFailureError& e) {
        EXPECT_EQ(e.key(), "my-zone");
        EXPECT_NE(std::string(e.what()).find("my-zone"), std::string::npos);
    }
}

TEST(HttpClientTest, BaseUrlFollowsRegion) {
    config::StorageConfig cfg;
    cfg.zone = "zone";
    EXPECT_EQ(HttpClient::baseUrlFor(cfg), "https://storage.bunnycdn.com/");

    cfg.region = "DE";
    EXPECT_EQ(HttpClient::baseUrlFor(cfg), "https://storage.bunnycdn.com/");

    cfg.region = "ny";
    EXPECT_EQ(HttpClient::baseUrlFor(cfg), "https://ny.storage.bunnycdn.com/");

    cfg.endpoint = "http://127.0.0.1:8080";
    EXPECT_EQ(HttpClient::baseUrlFor(cfg), "http://127.0.0.1:8080/");
}

TEST(HttpClientTest, UrlEscapesEachSegment) {
    config::StorageConfig cfg;
    cfg.zone = "zone";
    const HttpClient client(cfg);
    EXPECT_EQ(client.urlFor("zone/a b/c.txt"), "https://storage.bunnycdn.com/zone/a%20b/c.txt");
    EXPECT_EQ(client.urlFor("zone/dir/"), "https://storage.bunnycdn.com/zone/dir/");
}

TEST(HttpClientTest, KeysOutsideTheZoneAreRejectedWithoutARequest) {
    config::StorageConfig cfg;
    cfg.zone = "zone";
    HttpClient client(cfg);
    EXPECT_EQ(kindOf([&] { client.remove("other/a.txt"); }), ErrorKind::Unknown);
    EXPECT_EQ(kindOf([&] { (void)client.list("zonex/"); }), ErrorKind::Unknown);
}
