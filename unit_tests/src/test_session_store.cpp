#include <catch2/catch.hpp>

#include "s3_multipart/exceptions.hpp"
#include "s3_multipart/session_store.hpp"

#include "temporary_directory.hpp"

#include <boost/filesystem.hpp>

#include <fstream>
#include <sstream>
#include <string>

using namespace s3_multipart;

namespace
{
    auto make_session() -> upload_session
    {
        upload_session s;
        s.bucket = "bucket1";
        s.key = "obj.bin";
        s.upload_id = "U1";
        s.extra["ServerSideEncryption"] = "AES256";
        s.upsert_part(1, "e1");
        s.upsert_part(2, "e2");
        return s;
    }

    auto read_file(const boost::filesystem::path& _p) -> std::string
    {
        std::ifstream ifs{_p.string(), std::ios::binary};
        std::ostringstream ss;
        ss << ifs.rdbuf();
        return ss.str();
    }
} // anonymous namespace

TEST_CASE("serialize_session is stable", "[session_store]")
{
    const auto first = serialize_session(make_session());
    const auto second = serialize_session(parse_session(first));
    CHECK(first == second);
}

TEST_CASE("parse_session rejects text that is not a record", "[session_store]")
{
    CHECK_THROWS_AS(parse_session(""), corrupt_state_error);
    CHECK_THROWS_AS(parse_session("{\"Bucket\": \"b\""), corrupt_state_error);
    CHECK_THROWS_AS(parse_session("[]"), corrupt_state_error);
    CHECK_THROWS_AS(parse_session("{\"Bucket\": \"b\", \"Key\": \"k\"}"), corrupt_state_error);
}

TEST_CASE("file_session_store", "[session_store]")
{
    temporary_directory dir;
    file_session_store store{dir.path() / "multipart.json"};

    SECTION("empty store")
    {
        CHECK_FALSE(store.exists());
        CHECK_FALSE(store.raw());
        CHECK_THROWS_AS(store.load(), precondition_error);
        CHECK_THROWS_WITH(store.load(), "No active multipart upload in progress!");

        // removing nothing is not an error
        CHECK_NOTHROW(store.remove());
    }

    SECTION("save then load")
    {
        const auto s = make_session();
        store.save(s);

        REQUIRE(store.exists());
        CHECK_FALSE(boost::filesystem::exists(dir.path() / "multipart.json.tmp"));

        const auto loaded = store.load();
        CHECK(loaded.bucket == "bucket1");
        CHECK(loaded.key == "obj.bin");
        CHECK(loaded.upload_id == "U1");
        REQUIRE(loaded.parts.size() == 2);
        CHECK(loaded.parts[1].etag == "e2");
        CHECK(loaded.extra["ServerSideEncryption"] == "AES256");

        CHECK(*store.raw() == read_file(store.path()));
    }

    SECTION("saving the loaded record leaves the bytes unchanged")
    {
        store.save(make_session());
        const auto before = read_file(store.path());

        store.save(store.load());

        CHECK(read_file(store.path()) == before);
    }

    SECTION("record written by another tool")
    {
        std::ofstream{store.path().string()}
            << R"({"Bucket": "b", "Key": "k", "UploadId": "U", "ResponseMetadata": {"RequestId": "R"}})";

        auto s = store.load();
        CHECK(s.parts.empty());

        s.upsert_part(1, "e1");
        store.save(s);

        const auto doc = nlohmann::json::parse(read_file(store.path()));
        CHECK(doc["ResponseMetadata"]["RequestId"] == "R");
        CHECK(doc["Parts"].size() == 1);
    }

    SECTION("corrupt record")
    {
        std::ofstream{store.path().string()} << "not json";
        CHECK(store.exists());
        CHECK_THROWS_AS(store.load(), corrupt_state_error);
    }

    SECTION("remove")
    {
        store.save(make_session());
        store.remove();
        CHECK_FALSE(store.exists());
    }

    SECTION("a failed write leaves no temporary file")
    {
        if (!boost::filesystem::exists("/dev/full")) {
            WARN("/dev/full is not available, skipping");
            return;
        }

        const auto tmp_path = dir.path() / "multipart.json.tmp";
        boost::filesystem::create_symlink("/dev/full", tmp_path);

        try {
            store.save(make_session());
            FAIL("save should have thrown");
        }
        catch (const multipart_error& e) {
            CHECK(e.code() == error_codes::STATE_WRITE_ERROR);
        }

        CHECK_FALSE(boost::filesystem::exists(boost::filesystem::symlink_status(tmp_path)));
        CHECK_FALSE(store.exists());
    }

    SECTION("unwritable location")
    {
        file_session_store bad{dir.path() / "missing" / "multipart.json"};
        try {
            bad.save(make_session());
            FAIL("save should have thrown");
        }
        catch (const multipart_error& e) {
            CHECK(e.code() == error_codes::STATE_WRITE_ERROR);
        }
    }
}

TEST_CASE("memory_session_store", "[session_store]")
{
    memory_session_store store;

    CHECK_FALSE(store.exists());
    CHECK_THROWS_AS(store.load(), precondition_error);

    store.save(make_session());
    CHECK(store.exists());
    CHECK(store.save_count() == 1);
    CHECK(store.load().upload_id == "U1");

    store.set_raw(std::string{"{"});
    CHECK_THROWS_AS(store.load(), corrupt_state_error);

    store.remove();
    CHECK_FALSE(store.exists());
}
