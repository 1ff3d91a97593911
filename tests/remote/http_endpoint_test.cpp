#include "ddsync/remote/http_service.hpp"

#include <gtest/gtest.h>

#include <optional>
#include <string>

using namespace ddsync;
using ddsync::remote::error_from_status;
using ddsync::remote::parse_endpoint;

TEST(ParseEndpoint, HttpsDefaultsToPort443) {
    auto endpoint = parse_endpoint("https://sync.example.org/api/v1/");
    ASSERT_TRUE(endpoint.is_ok()) << endpoint.error().describe();

    EXPECT_EQ(endpoint.value().scheme, "https");
    EXPECT_EQ(endpoint.value().host, "sync.example.org");
    EXPECT_EQ(endpoint.value().port, "443");
    EXPECT_EQ(endpoint.value().base_path, "/api/v1");
    EXPECT_TRUE(endpoint.value().tls());
}

TEST(ParseEndpoint, HttpWithExplicitPort) {
    auto endpoint = parse_endpoint("HTTP://localhost:8080");
    ASSERT_TRUE(endpoint.is_ok());

    EXPECT_EQ(endpoint.value().scheme, "http");
    EXPECT_EQ(endpoint.value().host, "localhost");
    EXPECT_EQ(endpoint.value().port, "8080");
    EXPECT_TRUE(endpoint.value().base_path.empty());
    EXPECT_FALSE(endpoint.value().tls());
}

TEST(ParseEndpoint, RejectsMalformedUrls) {
    for (const char* url : {"sync.example.org", "ftp://host", "https://", "http://host:", "http://host:80a"}) {
        auto endpoint = parse_endpoint(url);
        ASSERT_TRUE(endpoint.is_error()) << url;
        EXPECT_EQ(endpoint.error().kind, ErrorKind::Validation) << url;
    }
}

TEST(ErrorFromStatus, MapsAuthAndNotFound) {
    EXPECT_EQ(error_from_status(401, "").kind, ErrorKind::Auth);
    EXPECT_EQ(error_from_status(403, R"({"error":"forbidden"})").kind, ErrorKind::Auth);

    auto missing = error_from_status(404, R"({"message":"no such file"})");
    EXPECT_EQ(missing.kind, ErrorKind::NotFound);
    EXPECT_EQ(missing.message, "no such file");
}

TEST(ErrorFromStatus, IntegrityReasonBecomesIntegrity) {
    auto error = error_from_status(409, R"({"reason":"integrity","message":"md5 differs"})");
    EXPECT_EQ(error.kind, ErrorKind::Integrity);
    EXPECT_EQ(error.message, "md5 differs");

    EXPECT_EQ(error_from_status(400, "checksum mismatch on chunk 2").kind, ErrorKind::Integrity);
}

TEST(ErrorFromStatus, OtherStatusesKeepTheCode) {
    auto conflict = error_from_status(409, R"({"message":"name taken"})");
    EXPECT_EQ(conflict.kind, ErrorKind::Service);
    EXPECT_EQ(conflict.status, 409);

    auto unavailable = error_from_status(503, "");
    EXPECT_EQ(unavailable.kind, ErrorKind::Service);
    EXPECT_EQ(unavailable.status, 503);
    EXPECT_EQ(unavailable.message, "HTTP 503");
}

TEST(HttpRemoteService, CreateRequiresCredentials) {
    Config config;
    config.url = "https://sync.example.org";
    config.auth.clear();

    auto service = remote::HttpRemoteService::create(config);

    ASSERT_TRUE(service.is_error());
    EXPECT_EQ(service.error().kind, ErrorKind::Auth);
}

TEST(HttpRemoteService, CreateRejectsBadUrl) {
    Config config;
    config.url = "not a url";
    config.auth = "token";

    auto service = remote::HttpRemoteService::create(config);

    ASSERT_TRUE(service.is_error());
    EXPECT_EQ(service.error().kind, ErrorKind::Validation);
}

TEST(HttpRemoteService, CreateWithValidSettings) {
    Config config;
    config.url = "http://127.0.0.1:9";
    config.auth = "token";

    auto service = remote::HttpRemoteService::create(config);

    ASSERT_TRUE(service.is_ok());
    EXPECT_NE(service.value(), nullptr);
}

TEST(DecodeProjectLookup, FindsProjectByName) {
    auto found = remote::decode_project_lookup(
        R"({"results":[{"name":"other","id":"p-7"},{"name":"demo","id":"p-9"}]})", "demo");
    ASSERT_TRUE(found.is_ok()) << found.error().describe();
    EXPECT_EQ(found.value(), std::optional<std::string>("p-9"));

    auto missing = remote::decode_project_lookup(R"({"results":[]})", "demo");
    ASSERT_TRUE(missing.is_ok());
    EXPECT_FALSE(missing.value().has_value());
}

TEST(DecodeProjectLookup, MalformedBodiesAreServiceErrors) {
    for (const char* body : {"not json", R"({"projects":[]})", R"({"results":[{"name":"demo","id":42}]})"}) {
        auto found = remote::decode_project_lookup(body, "demo");
        ASSERT_TRUE(found.is_error()) << body;
        EXPECT_EQ(found.error().kind, ErrorKind::Service) << body;
    }
}

TEST(DecodeTreeListing, ReadsFoldersAndFiles) {
    auto entries = remote::decode_tree_listing(R"({"results":[
        {"id":"d-1","parent_id":"p-1","kind":"folder","name":"docs"},
        {"id":"f-1","parent_id":"d-1","kind":"file","name":"a.txt","size":1,
         "hash":{"algorithm":"md5","value":"9dd4e461268c8034f5c8564e155c67a6"}}
    ]})");
    ASSERT_TRUE(entries.is_ok()) << entries.error().describe();
    ASSERT_EQ(entries.value().size(), 2u);

    const auto& folder = entries.value()[0];
    EXPECT_EQ(folder.kind, content::NodeKind::Folder);
    EXPECT_EQ(folder.parent_id, "p-1");
    EXPECT_FALSE(folder.fingerprint.has_value());

    const auto& file = entries.value()[1];
    EXPECT_EQ(file.kind, content::NodeKind::File);
    EXPECT_EQ(file.size, 1u);
    ASSERT_TRUE(file.fingerprint.has_value());
    EXPECT_EQ(file.fingerprint->algorithm, "md5");
    EXPECT_EQ(file.fingerprint->value, "9dd4e461268c8034f5c8564e155c67a6");
}

TEST(DecodeTreeListing, FileWithoutHashHasNoFingerprint) {
    auto entries = remote::decode_tree_listing(R"({"results":[
        {"id":"f-1","parent_id":"p-1","kind":"file","name":"raw.dat","size":3},
        {"id":"f-2","parent_id":"p-1","kind":"file","name":"null.dat","size":0,"hash":null}
    ]})");
    ASSERT_TRUE(entries.is_ok()) << entries.error().describe();
    ASSERT_EQ(entries.value().size(), 2u);
    EXPECT_FALSE(entries.value()[0].fingerprint.has_value());
    EXPECT_EQ(entries.value()[0].size, 3u);
    EXPECT_FALSE(entries.value()[1].fingerprint.has_value());
}

TEST(DecodeTreeListing, RejectsUnexpectedShapes) {
    const char* bodies[] = {
        "{",
        R"({"entries":[]})",
        R"({"results":[{"id":"x-1","parent_id":"p-1","kind":"symlink","name":"l"}]})",
        R"({"results":[{"id":"f-1","parent_id":"p-1","kind":"file","name":7}]})",
        R"({"results":[{"id":"f-1","parent_id":"p-1","kind":"file","name":"a","size":"big"}]})",
        R"({"results":[{"id":"f-1","parent_id":"p-1","kind":"file","name":"a","hash":"abc"}]})",
        R"({"results":[{"id":"f-1","parent_id":"p-1","kind":"file","name":"a","hash":{"value":"abc"}}]})",
        R"({"results":[{"parent_id":"p-1","kind":"folder","name":"docs"}]})",
    };
    for (const char* body : bodies) {
        auto entries = remote::decode_tree_listing(body);
        ASSERT_TRUE(entries.is_error()) << body;
        EXPECT_EQ(entries.error().kind, ErrorKind::Service) << body;
    }
}
