#ifndef S3_MULTIPART_TYPES_HPP
#define S3_MULTIPART_TYPES_HPP

#include <nlohmann/json.hpp>

#include <cstdint>
#include <string>
#include <string_view>

namespace s3_multipart
{
    enum class error_codes
    {
        SUCCESS,
        NO_ACTIVE_SESSION,
        SESSION_ALREADY_EXISTS,
        NOT_A_DIRECTORY,
        NO_PARTS_FOUND,
        PART_FILE_READ_ERROR,
        INVALID_PART_NUMBER,
        CORRUPT_STATE,
        STATE_WRITE_ERROR,
        REMOTE_ERROR,
        REMOTE_REJECTED,
        CONFIGURATION_ERROR
    };

    auto to_string(error_codes _code) -> std::string_view;

    enum class upload_state { NONE, ACTIVE, FINALIZED, ABORTED };

    auto to_string(upload_state _state) -> std::string_view;

    // S3 limits a multipart upload to part numbers 1 through 10000
    constexpr std::int64_t MAXIMUM_PART_NUMBER{10000};

    // result of a complete or abort call that reached the storage service
    struct remote_response
    {
        bool           confirmed{false};
        std::string    status_name;
        nlohmann::json payload = nlohmann::json::object();
    };

} // namespace s3_multipart

#endif // S3_MULTIPART_TYPES_HPP
