#include <catch2/catch.hpp>

#include "s3_multipart/config.hpp"
#include "s3_multipart/exceptions.hpp"

#include "temporary_directory.hpp"

#include <map>
#include <string>

using namespace s3_multipart;

namespace
{
    auto lookup_in(const std::map<std::string, std::string>& _vars) -> environment_lookup
    {
        return [_vars](const std::string& _name) -> std::optional<std::string> {
            if (const auto it = _vars.find(_name); it != _vars.end()) {
                return it->second;
            }
            return std::nullopt;
        };
    }
} // anonymous namespace

TEST_CASE("config defaults", "[config]")
{
    config cfg;
    apply_environment(cfg, lookup_in({}));

    CHECK(cfg.hostname == "s3.amazonaws.com");
    CHECK(cfg.region_name == "us-east-1");
    CHECK(cfg.retry_count_limit == 3);
    CHECK(cfg.retry_wait_seconds == 3);
    CHECK(cfg.max_retry_wait_seconds == 30);
    CHECK(cfg.non_data_transfer_timeout_seconds == 300);
    CHECK(cfg.server_encrypt_flag);
    CHECK(cfg.state_file == "multipart.json");

    CHECK(get_protocol(cfg) == S3ProtocolHTTPS);
    CHECK(get_uri_request_style(cfg) == S3UriStylePath);
    CHECK(get_sts_date(cfg) == S3STSAmzOnly);
}

TEST_CASE("apply_environment", "[config]")
{
    config cfg;

    SECTION("values are taken from the environment")
    {
        apply_environment(cfg, lookup_in({{"S3_DEFAULT_HOSTNAME", "minio:9000"},
                                          {"S3_REGIONNAME", "eu-west-1"},
                                          {"S3_PROTO", "HTTP"},
                                          {"S3_URI_REQUEST_STYLE", "virtual"},
                                          {"S3_STSDATE", "both"},
                                          {"S3_RETRY_COUNT", " 5 "},
                                          {"S3_WAIT_TIME_SECONDS", "1"},
                                          {"S3_MAX_WAIT_TIME_SECONDS", "8"},
                                          {"S3_SERVER_ENCRYPT", "false"},
                                          {"S3_AUTH_FILE", "/tmp/keys"}}));

        CHECK(cfg.hostname == "minio:9000");
        CHECK(cfg.region_name == "eu-west-1");
        CHECK(cfg.retry_count_limit == 5);
        CHECK(cfg.retry_wait_seconds == 1);
        CHECK(cfg.max_retry_wait_seconds == 8);
        CHECK_FALSE(cfg.server_encrypt_flag);
        CHECK(cfg.keyfile == "/tmp/keys");

        CHECK(get_protocol(cfg) == S3ProtocolHTTP);
        CHECK(get_uri_request_style(cfg) == S3UriStyleVirtualHost);
        CHECK(get_sts_date(cfg) == S3STSAmzAndDate);
    }

    SECTION("max wait is raised to the wait time")
    {
        apply_environment(cfg, lookup_in({{"S3_WAIT_TIME_SECONDS", "10"}, {"S3_MAX_WAIT_TIME_SECONDS", "2"}}));
        CHECK(cfg.max_retry_wait_seconds == 10);
    }

    SECTION("malformed values")
    {
        CHECK_THROWS_AS(apply_environment(cfg, lookup_in({{"S3_RETRY_COUNT", "three"}})), configuration_error);
        CHECK_THROWS_AS(apply_environment(cfg, lookup_in({{"S3_SERVER_ENCRYPT", "maybe"}})), configuration_error);
    }
}

TEST_CASE("resolve_credentials", "[config]")
{
    temporary_directory dir;
    config cfg;

    SECTION("environment first")
    {
        cfg.keyfile = (dir.path() / "does-not-exist").string();
        resolve_credentials(cfg, lookup_in({{"S3_ACCESS_KEY_ID", "AK"}, {"S3_SECRET_ACCESS_KEY", "SK"}}));
        CHECK(cfg.access_key == "AK");
        CHECK(cfg.secret_access_key == "SK");
    }

    SECTION("key id without secret")
    {
        CHECK_THROWS_AS(resolve_credentials(cfg, lookup_in({{"S3_ACCESS_KEY_ID", "AK"}})), configuration_error);
    }

    SECTION("keyfile")
    {
        cfg.keyfile = dir.write("keys", "AK  \nSK\r\n").string();
        resolve_credentials(cfg, lookup_in({}));
        CHECK(cfg.access_key == "AK");
        CHECK(cfg.secret_access_key == "SK");
    }

    SECTION("keyfile with one line")
    {
        cfg.keyfile = dir.write("keys", "AK\n").string();
        CHECK_THROWS_AS(resolve_credentials(cfg, lookup_in({})), configuration_error);
    }

    SECTION("missing keyfile")
    {
        cfg.keyfile = (dir.path() / "missing").string();
        CHECK_THROWS_AS(resolve_credentials(cfg, lookup_in({})), configuration_error);
    }

    SECTION("nothing configured")
    {
        CHECK_THROWS_AS(resolve_credentials(cfg, lookup_in({})), configuration_error);
    }
}
