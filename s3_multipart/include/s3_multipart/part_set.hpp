#ifndef S3_MULTIPART_PART_SET_HPP
#define S3_MULTIPART_PART_SET_HPP

#include <boost/filesystem/path.hpp>

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace s3_multipart
{
    // One pre-split chunk of the object on local disk.
    struct part_file
    {
        boost::filesystem::path path;
        std::string             filename;
        std::int64_t            part_number;
        std::uintmax_t          size;
    };

    // Returns the part number encoded in a filename ending in ".<digits>", leading zeros allowed.
    // Returns std::nullopt when the extension is missing or not purely numeric.
    auto parse_part_number(const std::string& _filename) -> std::optional<std::int64_t>;

    // Lists every regular file in _directory whose extension is numeric, sorted by filename.
    // The sort is lexicographic, not numeric, so zero padding must be consistent across
    // the part files for the result to follow part number order.
    //
    // Throws input_error with NOT_A_DIRECTORY when _directory is missing or not a directory,
    // with INVALID_PART_NUMBER when a part number is outside 1..MAXIMUM_PART_NUMBER, and with
    // NO_PARTS_FOUND when nothing matches.
    auto resolve_part_set(const boost::filesystem::path& _directory) -> std::vector<part_file>;

} // namespace s3_multipart

#endif // S3_MULTIPART_PART_SET_HPP
