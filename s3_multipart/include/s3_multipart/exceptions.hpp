#ifndef S3_MULTIPART_EXCEPTIONS_HPP
#define S3_MULTIPART_EXCEPTIONS_HPP

#include "s3_multipart/types.hpp"

#include <nlohmann/json.hpp>

#include <stdexcept>
#include <string>
#include <utility>

namespace s3_multipart
{
    class multipart_error : public std::runtime_error
    {
    public:
        multipart_error(error_codes _code, const std::string& _msg)
            : std::runtime_error{_msg}
            , code_{_code}
        {
        }

        auto code() const noexcept -> error_codes { return code_; }

    private:
        error_codes code_;
    }; // class multipart_error

    // An active session is required but missing, or one exists where none is expected.
    class precondition_error : public multipart_error
    {
    public:
        using multipart_error::multipart_error;
    };

    // Bad local input: not a directory, no part files, an unreadable part file or a part
    // number S3 does not accept.
    class input_error : public multipart_error
    {
    public:
        using multipart_error::multipart_error;
    };

    class corrupt_state_error : public multipart_error
    {
    public:
        explicit corrupt_state_error(const std::string& _msg)
            : multipart_error{error_codes::CORRUPT_STATE, _msg}
        {
        }
    };

    class configuration_error : public multipart_error
    {
    public:
        explicit configuration_error(const std::string& _msg)
            : multipart_error{error_codes::CONFIGURATION_ERROR, _msg}
        {
        }
    };

    // The storage service could not be reached or the call failed before a response arrived.
    class remote_error : public multipart_error
    {
    public:
        remote_error(const std::string& _msg, std::string _status_name)
            : multipart_error{error_codes::REMOTE_ERROR, _msg}
            , status_name_{std::move(_status_name)}
        {
        }

        auto status_name() const -> const std::string& { return status_name_; }

    private:
        std::string status_name_;
    };

    // The storage service answered with a non-success status. The raw response is kept
    // so the operator can inspect it.
    class remote_rejected_error : public multipart_error
    {
    public:
        remote_rejected_error(const std::string& _msg, nlohmann::json _payload)
            : multipart_error{error_codes::REMOTE_REJECTED, _msg}
            , payload_{std::move(_payload)}
        {
        }

        auto payload() const -> const nlohmann::json& { return payload_; }

    private:
        nlohmann::json payload_;
    };

} // namespace s3_multipart

#endif // S3_MULTIPART_EXCEPTIONS_HPP
