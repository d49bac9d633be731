#include "s3_multipart/part_set.hpp"
#include "s3_multipart/exceptions.hpp"
#include "s3_multipart/logging_category.hpp"

#include <boost/algorithm/string/classification.hpp>
#include <boost/algorithm/string/predicate.hpp>
#include <boost/filesystem.hpp>
#include <boost/lexical_cast.hpp>

#include <fmt/format.h>

#include <algorithm>
#include <utility>

namespace fs = boost::filesystem;

namespace s3_multipart
{
    namespace
    {
        // The digits after the last dot, or std::nullopt when the extension is not numeric.
        auto numeric_extension(const std::string& _filename) -> std::optional<std::string>
        {
            const auto dot = _filename.find_last_of('.');

            // a leading dot marks a hidden file, not an extension
            if (dot == std::string::npos || dot == 0 || dot + 1 == _filename.size()) {
                return std::nullopt;
            }

            auto digits = _filename.substr(dot + 1);
            if (!boost::algorithm::all(digits, boost::algorithm::is_digit())) {
                return std::nullopt;
            }

            return digits;
        }
    } // anonymous namespace

    auto parse_part_number(const std::string& _filename) -> std::optional<std::int64_t>
    {
        const auto digits = numeric_extension(_filename);
        if (!digits) {
            return std::nullopt;
        }

        try {
            return boost::lexical_cast<std::int64_t>(*digits);
        }
        catch (const boost::bad_lexical_cast&) {
            logger::warn("{}:{} ({}) numeric extension out of range [filename={}]",
                         __FILE__, __LINE__, __func__, _filename);
            return std::nullopt;
        }
    } // end parse_part_number

    auto resolve_part_set(const fs::path& _directory) -> std::vector<part_file>
    {
        boost::system::error_code ec;

        if (!fs::is_directory(_directory, ec)) {
            throw input_error{error_codes::NOT_A_DIRECTORY,
                fmt::format("Please pass in a folder containing the file parts [{}]", _directory.string())};
        }

        std::vector<part_file> parts;

        for (fs::directory_iterator it{_directory, ec}, end; !ec && it != end; it.increment(ec)) {
            const auto& entry = *it;

            if (!fs::is_regular_file(entry.status())) {
                continue;
            }

            auto filename = entry.path().filename().string();
            if (!numeric_extension(filename)) {
                logger::trace("{}:{} ({}) skipping [{}]", __FILE__, __LINE__, __func__, filename);
                continue;
            }

            // a numeric extension too large for int64 is out of range as well
            const auto part_number = parse_part_number(filename);
            if (!part_number || *part_number < 1 || *part_number > MAXIMUM_PART_NUMBER) {
                throw input_error{error_codes::INVALID_PART_NUMBER,
                    fmt::format("Part file [{}] has part number {}, S3 accepts 1 through {}",
                                entry.path().string(), filename.substr(filename.find_last_of('.') + 1),
                                MAXIMUM_PART_NUMBER)};
            }

            boost::system::error_code size_ec;
            const auto size = fs::file_size(entry.path(), size_ec);
            if (size_ec) {
                throw input_error{error_codes::PART_FILE_READ_ERROR,
                    fmt::format("Failed to stat part file [{}]: {}", entry.path().string(), size_ec.message())};
            }

            parts.push_back(part_file{entry.path(), std::move(filename), *part_number, size});
        }

        if (ec) {
            throw input_error{error_codes::NOT_A_DIRECTORY,
                fmt::format("Failed to list [{}]: {}", _directory.string(), ec.message())};
        }

        if (parts.empty()) {
            throw input_error{error_codes::NO_PARTS_FOUND,
                fmt::format("Unable to find file parts in {}!", _directory.string())};
        }

        std::sort(parts.begin(), parts.end(), [](const part_file& _lhs, const part_file& _rhs) {
            return _lhs.filename < _rhs.filename;
        });

        logger::debug("{}:{} ({}) found {} parts in [{}]", __FILE__, __LINE__, __func__, parts.size(), _directory.string());

        return parts;
    } // end resolve_part_set

} // namespace s3_multipart
