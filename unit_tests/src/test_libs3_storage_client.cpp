#include <catch2/catch.hpp>

#include "s3_multipart/config.hpp"
#include "s3_multipart/exceptions.hpp"
#include "s3_multipart/libs3_storage_client.hpp"
#include "s3_multipart/libs3_util.hpp"
#include "s3_multipart/multipart_upload.hpp"
#include "s3_multipart/session_store.hpp"

#include "temporary_directory.hpp"

#include <fmt/format.h>

#include <chrono>
#include <cstdint>
#include <cstdlib>
#include <string>

// to run the live test, the aws command line utility needs to be available in the path and
// "aws configure" needs to be run with the keys in the keyfile
//
//     s3_multipart_unit_tests "[live]" --hostname <host> --keyfile <file>

std::string keyfile = "/etc/s3_multipart/test.keypair";
std::string hostname = "s3.amazonaws.com";

using namespace s3_multipart;

TEST_CASE("make_complete_multipart_xml", "[libs3]")
{
    const auto xml = make_complete_multipart_xml({{2, "e2"}, {1, "e1"}});

    CHECK(xml == "<CompleteMultipartUpload>\n"
                 "<Part><PartNumber>2</PartNumber><ETag>e2</ETag></Part>\n"
                 "<Part><PartNumber>1</PartNumber><ETag>e1</ETag></Part>\n"
                 "</CompleteMultipartUpload>\n");

    CHECK(make_complete_multipart_xml({}) == "<CompleteMultipartUpload>\n</CompleteMultipartUpload>\n");
}

TEST_CASE("upload_part refuses part numbers libs3 cannot carry", "[libs3]")
{
    temporary_directory dir;
    const auto part = dir.write("f.1", "x");

    config cfg;
    libs3_storage_client client{cfg};

    for (const std::int64_t part_number : {std::int64_t{0}, std::int64_t{10001}, std::int64_t{4294967297}}) {
        try {
            client.upload_part("bucket1", "obj.bin", "U1", part_number, part);
            FAIL("upload_part should have thrown for part " << part_number);
        }
        catch (const input_error& e) {
            CHECK(e.code() == error_codes::INVALID_PART_NUMBER);
        }
    }
}

TEST_CASE("status classification", "[libs3]")
{
    CHECK(status_is_retryable(S3StatusConnectionFailed));
    CHECK_FALSE(status_is_retryable(S3StatusErrorAccessDenied));

    CHECK(service_responded(S3StatusErrorNoSuchUpload));
    CHECK(service_responded(S3StatusErrorInvalidPart));
    CHECK_FALSE(service_responded(S3StatusConnectionFailed));
    CHECK_FALSE(service_responded(S3StatusFailedToConnect));
}

TEST_CASE("next_retry_wait", "[libs3]")
{
    config cfg;
    cfg.max_retry_wait_seconds = 10;

    CHECK(next_retry_wait(3, cfg) == 6);
    CHECK(next_retry_wait(6, cfg) == 10);
    CHECK(next_retry_wait(10, cfg) == 10);
}

TEST_CASE("upload and finalize against a live endpoint", "[.][live]")
{
    using namespace std::chrono;
    const auto ms = duration_cast<milliseconds>(system_clock::now().time_since_epoch()).count();
    const auto bucket_name = fmt::format("s3-multipart-unit-test-{}", ms);

    REQUIRE(std::system(fmt::format("aws --endpoint-url http://{} s3 mb s3://{}", hostname, bucket_name).c_str()) == 0);

    temporary_directory parts_dir;
    // every part but the last must be at least 5 MiB
    parts_dir.write("object.01", std::string(5 * 1024 * 1024, 'a'));
    parts_dir.write("object.02", "tail");

    temporary_directory work_dir;

    config cfg;
    cfg.hostname = hostname;
    cfg.s3_protocol_str = "http";
    read_keys(keyfile, cfg.access_key, cfg.secret_access_key);

    {
        file_session_store store{work_dir.path() / "multipart.json"};
        libs3_storage_client client{cfg};
        multipart_upload upload{store, client};

        upload.init(bucket_name, "object");
        const auto summary = upload.commit_upload(upload.plan_upload(parts_dir.path()));
        CHECK(summary.uploaded == 2);

        const auto response = upload.finalize();
        CHECK(response.confirmed);
        CHECK_FALSE(store.exists());
    }

    const auto downloaded = work_dir.path() / "downloaded";
    CHECK(std::system(fmt::format("aws --endpoint-url http://{} s3 cp s3://{}/object {}",
                                  hostname, bucket_name, downloaded.string()).c_str()) == 0);
    CHECK(boost::filesystem::file_size(downloaded) == 5 * 1024 * 1024 + 4);

    CHECK(std::system(fmt::format("aws --endpoint-url http://{} s3 rb --force s3://{}", hostname, bucket_name).c_str()) == 0);
}
