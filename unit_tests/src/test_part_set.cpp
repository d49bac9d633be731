#include <catch2/catch.hpp>

#include "s3_multipart/exceptions.hpp"
#include "s3_multipart/part_set.hpp"

#include "temporary_directory.hpp"

#include <algorithm>
#include <functional>
#include <iterator>
#include <string>
#include <vector>

using namespace s3_multipart;

namespace
{
    auto filenames(const std::vector<part_file>& _parts) -> std::vector<std::string>
    {
        std::vector<std::string> names;
        std::transform(_parts.cbegin(), _parts.cend(), std::back_inserter(names),
                       [](const part_file& _p) { return _p.filename; });
        return names;
    }

    auto code_of(const std::function<void()>& _fn) -> error_codes
    {
        try {
            _fn();
        }
        catch (const multipart_error& e) {
            return e.code();
        }
        return error_codes::SUCCESS;
    }
} // anonymous namespace

TEST_CASE("parse_part_number", "[part_set]")
{
    CHECK(parse_part_number("a.1") == 1);
    CHECK(parse_part_number("a.001") == 1);
    CHECK(parse_part_number("big.tar.gz.0042") == 42);
    CHECK(parse_part_number("part.10000") == 10000);

    CHECK_FALSE(parse_part_number("a"));
    CHECK_FALSE(parse_part_number("a."));
    CHECK_FALSE(parse_part_number("a.txt"));
    CHECK_FALSE(parse_part_number("a.1b"));
    CHECK_FALSE(parse_part_number("a.-1"));
    CHECK_FALSE(parse_part_number(".123"));
    CHECK_FALSE(parse_part_number("a.99999999999999999999999"));
}

TEST_CASE("resolve_part_set sorts by filename and skips non-parts", "[part_set]")
{
    temporary_directory dir;
    dir.write("part.02", "bb");
    dir.write("part.01", "a");
    dir.write("part.03", "ccc");
    dir.write("README.txt", "not a part");
    dir.write("notes", "no extension");
    boost::filesystem::create_directory(dir.path() / "sub.04");

    const auto parts = resolve_part_set(dir.path());

    REQUIRE(filenames(parts) == std::vector<std::string>{"part.01", "part.02", "part.03"});
    CHECK(parts[0].part_number == 1);
    CHECK(parts[1].part_number == 2);
    CHECK(parts[2].part_number == 3);
    CHECK(parts[0].size == 1);
    CHECK(parts[2].size == 3);
    CHECK(parts[1].path == dir.path() / "part.02");
}

TEST_CASE("resolve_part_set orders lexicographically, not numerically", "[part_set]")
{
    temporary_directory dir;
    dir.write("f.1", "x");
    dir.write("f.2", "x");
    dir.write("f.10", "x");

    const auto parts = resolve_part_set(dir.path());

    CHECK(filenames(parts) == std::vector<std::string>{"f.1", "f.10", "f.2"});
}

TEST_CASE("resolve_part_set rejects part numbers S3 does not accept", "[part_set]")
{
    temporary_directory dir;
    dir.write("f.01", "x");

    SECTION("zero")
    {
        dir.write("f.0", "x");
        CHECK(code_of([&] { resolve_part_set(dir.path()); }) == error_codes::INVALID_PART_NUMBER);
    }

    SECTION("above the S3 maximum")
    {
        dir.write("f.10001", "x");
        CHECK(code_of([&] { resolve_part_set(dir.path()); }) == error_codes::INVALID_PART_NUMBER);
    }

    SECTION("wraps to part 1 when narrowed to int")
    {
        dir.write("f.4294967297", "x");
        CHECK_THROWS_AS(resolve_part_set(dir.path()), input_error);
        CHECK(code_of([&] { resolve_part_set(dir.path()); }) == error_codes::INVALID_PART_NUMBER);
        CHECK_THROWS_WITH(resolve_part_set(dir.path()), Catch::Contains("4294967297"));
    }

    SECTION("too large for int64")
    {
        dir.write("f.99999999999999999999999", "x");
        CHECK(code_of([&] { resolve_part_set(dir.path()); }) == error_codes::INVALID_PART_NUMBER);
    }

    SECTION("the limits themselves are accepted")
    {
        dir.write("f.10000", "x");
        const auto parts = resolve_part_set(dir.path());
        REQUIRE(parts.size() == 2);
        CHECK(parts[0].part_number == 1);
        CHECK(parts[1].part_number == 10000);
    }
}

TEST_CASE("resolve_part_set input errors", "[part_set]")
{
    temporary_directory dir;

    SECTION("missing path")
    {
        CHECK(code_of([&] { resolve_part_set(dir.path() / "nope"); }) == error_codes::NOT_A_DIRECTORY);
    }

    SECTION("regular file")
    {
        const auto file = dir.write("data.1", "x");
        CHECK(code_of([&] { resolve_part_set(file); }) == error_codes::NOT_A_DIRECTORY);
        CHECK_THROWS_WITH(resolve_part_set(file), Catch::Contains("Please pass in a folder containing the file parts"));
    }

    SECTION("no numeric extensions")
    {
        dir.write("a.txt", "x");
        dir.write("b", "x");
        CHECK(code_of([&] { resolve_part_set(dir.path()); }) == error_codes::NO_PARTS_FOUND);
        CHECK_THROWS_AS(resolve_part_set(dir.path()), input_error);
        CHECK_THROWS_WITH(resolve_part_set(dir.path()), Catch::Contains("Unable to find file parts in"));
    }

    SECTION("empty directory")
    {
        CHECK(code_of([&] { resolve_part_set(dir.path()); }) == error_codes::NO_PARTS_FOUND);
    }
}
