#include "s3_multipart/types.hpp"

namespace s3_multipart
{
    auto to_string(error_codes _code) -> std::string_view
    {
        switch (_code) {
            case error_codes::SUCCESS:                return "SUCCESS";
            case error_codes::NO_ACTIVE_SESSION:      return "NO_ACTIVE_SESSION";
            case error_codes::SESSION_ALREADY_EXISTS: return "SESSION_ALREADY_EXISTS";
            case error_codes::NOT_A_DIRECTORY:        return "NOT_A_DIRECTORY";
            case error_codes::NO_PARTS_FOUND:         return "NO_PARTS_FOUND";
            case error_codes::PART_FILE_READ_ERROR:   return "PART_FILE_READ_ERROR";
            case error_codes::INVALID_PART_NUMBER:    return "INVALID_PART_NUMBER";
            case error_codes::CORRUPT_STATE:          return "CORRUPT_STATE";
            case error_codes::STATE_WRITE_ERROR:      return "STATE_WRITE_ERROR";
            case error_codes::REMOTE_ERROR:           return "REMOTE_ERROR";
            case error_codes::REMOTE_REJECTED:        return "REMOTE_REJECTED";
            case error_codes::CONFIGURATION_ERROR:    return "CONFIGURATION_ERROR";
        }
        return "UNKNOWN";
    }

    auto to_string(upload_state _state) -> std::string_view
    {
        switch (_state) {
            case upload_state::NONE:      return "NONE";
            case upload_state::ACTIVE:    return "ACTIVE";
            case upload_state::FINALIZED: return "FINALIZED";
            case upload_state::ABORTED:   return "ABORTED";
        }
        return "UNKNOWN";
    }

} // namespace s3_multipart
