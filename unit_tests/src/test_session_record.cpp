#include <catch2/catch.hpp>

#include "s3_multipart/exceptions.hpp"
#include "s3_multipart/session_record.hpp"

using namespace s3_multipart;
using json = nlohmann::json;

TEST_CASE("strip_etag_quotes", "[session_record]")
{
    CHECK(strip_etag_quotes("\"abc123\"") == "abc123");
    CHECK(strip_etag_quotes("abc123") == "abc123");
    CHECK(strip_etag_quotes("\"\"") == "");
    CHECK(strip_etag_quotes("") == "");
}

TEST_CASE("upsert_part", "[session_record]")
{
    upload_session s;

    s.upsert_part(2, "b");
    s.upsert_part(1, "a");
    REQUIRE(s.parts.size() == 2);
    CHECK(s.parts[0].part_number == 2);
    CHECK(s.parts[1].part_number == 1);

    SECTION("replacing keeps position")
    {
        s.upsert_part(2, "b2");
        REQUIRE(s.parts.size() == 2);
        CHECK(s.parts[0].part_number == 2);
        CHECK(s.parts[0].etag == "b2");
    }

    SECTION("duplicates from older records collapse")
    {
        s.parts.push_back(completed_part{2, "stale"});
        s.upsert_part(2, "fresh");
        REQUIRE(s.parts.size() == 2);
        CHECK(s.parts[0].etag == "fresh");
        CHECK(s.has_part(1));
        CHECK_FALSE(s.has_part(3));
    }
}

TEST_CASE("session_from_json", "[session_record]")
{
    SECTION("record without Parts")
    {
        const auto s = session_from_json(json{{"Bucket", "b"}, {"Key", "k"}, {"UploadId", "U"}});
        CHECK(s.bucket == "b");
        CHECK(s.key == "k");
        CHECK(s.upload_id == "U");
        CHECK(s.parts.empty());
        CHECK(s.extra.empty());
    }

    SECTION("unknown fields are kept")
    {
        const json doc{{"Bucket", "b"}, {"Key", "k"}, {"UploadId", "U"},
                       {"ServerSideEncryption", "AES256"},
                       {"ResponseMetadata", {{"HTTPStatusCode", 200}}},
                       {"Parts", json::array({{{"ETag", "e1"}, {"PartNumber", 1}}})}};

        const auto s = session_from_json(doc);
        REQUIRE(s.parts.size() == 1);
        CHECK(s.parts[0].etag == "e1");
        CHECK(s.extra["ServerSideEncryption"] == "AES256");
        CHECK(s.extra["ResponseMetadata"]["HTTPStatusCode"] == 200);

        CHECK(session_to_json(s) == doc);
    }

    SECTION("malformed records")
    {
        CHECK_THROWS_AS(session_from_json(json::array()), corrupt_state_error);
        CHECK_THROWS_AS(session_from_json(json{{"Bucket", "b"}, {"Key", "k"}}), corrupt_state_error);
        CHECK_THROWS_AS(session_from_json(json{{"Bucket", "b"}, {"Key", "k"}, {"UploadId", ""}}), corrupt_state_error);
        CHECK_THROWS_AS(session_from_json(json{{"Bucket", 1}, {"Key", "k"}, {"UploadId", "U"}}), corrupt_state_error);
        CHECK_THROWS_AS(session_from_json(json{{"Bucket", "b"}, {"Key", "k"}, {"UploadId", "U"}, {"Parts", "x"}}),
                        corrupt_state_error);
        CHECK_THROWS_AS(session_from_json(json{{"Bucket", "b"}, {"Key", "k"}, {"UploadId", "U"},
                                               {"Parts", json::array({{{"ETag", "e"}, {"PartNumber", "1"}}})}}),
                        corrupt_state_error);
    }
}

TEST_CASE("session_to_json always writes Parts", "[session_record]")
{
    upload_session s;
    s.bucket = "b";
    s.key = "k";
    s.upload_id = "U";

    const auto doc = session_to_json(s);
    REQUIRE(doc.contains("Parts"));
    CHECK(doc["Parts"].is_array());
    CHECK(doc["Parts"].empty());
}

TEST_CASE("session_from_create_response ignores Parts", "[session_record]")
{
    const auto s = session_from_create_response(json{{"Bucket", "b"}, {"Key", "k"}, {"UploadId", "U"},
                                                     {"Parts", json::array({{{"ETag", "e"}, {"PartNumber", 1}}})}});
    CHECK(s.parts.empty());
    CHECK_THROWS_AS(session_from_create_response(json{{"Bucket", "b"}, {"Key", "k"}}), corrupt_state_error);
}
