#ifndef S3_MULTIPART_UNIT_TESTS_FAKE_STORAGE_CLIENT_HPP
#define S3_MULTIPART_UNIT_TESTS_FAKE_STORAGE_CLIENT_HPP

#include "s3_multipart/exceptions.hpp"
#include "s3_multipart/storage_client.hpp"

#include <fmt/format.h>

#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <vector>

// In-memory stand-in for the storage service. Records every call and can be told to fail.
class fake_storage_client : public s3_multipart::storage_client
{
public:
    struct uploaded_part
    {
        std::int64_t part_number;
        std::string  filename;
    };

    std::string upload_id{"U1"};

    // upload_part throws remote_error once this many parts have gone through
    std::optional<std::size_t> fail_after_parts;

    bool create_returns_no_upload_id{false};
    bool confirm_complete{true};
    bool confirm_abort{true};

    int create_calls{0};
    int complete_calls{0};
    int abort_calls{0};

    std::vector<uploaded_part>                uploads;
    std::vector<s3_multipart::completed_part> completed_with;

    auto create_multipart_upload(const std::string& _bucket,
                                 const std::string& _key,
                                 bool _server_side_encryption) -> nlohmann::json override
    {
        ++create_calls;

        nlohmann::json response{{"Bucket", _bucket}, {"Key", _key}};
        if (!create_returns_no_upload_id) {
            response["UploadId"] = upload_id;
        }
        if (_server_side_encryption) {
            response["ServerSideEncryption"] = "AES256";
        }
        return response;
    }

    auto upload_part(const std::string& _bucket,
                     const std::string& _key,
                     const std::string& _upload_id,
                     std::int64_t _part_number,
                     const boost::filesystem::path& _part_path) -> std::string override
    {
        if (fail_after_parts && uploads.size() >= *fail_after_parts) {
            throw s3_multipart::remote_error{"connection reset", "ErrorFailedConnect"};
        }

        uploads.push_back(uploaded_part{_part_number, _part_path.filename().string()});
        return fmt::format("\"etag-{}-{}\"", _part_number, uploads.size());
    }

    auto complete_multipart_upload(const std::string& _bucket,
                                   const std::string& _key,
                                   const std::string& _upload_id,
                                   const std::vector<s3_multipart::completed_part>& _parts) -> s3_multipart::remote_response override
    {
        ++complete_calls;
        completed_with = _parts;
        return respond(confirm_complete, "InvalidPart");
    }

    auto abort_multipart_upload(const std::string& _bucket,
                                const std::string& _key,
                                const std::string& _upload_id) -> s3_multipart::remote_response override
    {
        ++abort_calls;
        return respond(confirm_abort, "NoSuchUpload");
    }

private:
    static auto respond(bool _confirmed, const std::string& _error) -> s3_multipart::remote_response
    {
        s3_multipart::remote_response response;
        response.confirmed = _confirmed;
        response.status_name = _confirmed ? "OK" : _error;
        response.payload = {{"Status", response.status_name}};
        return response;
    }
}; // class fake_storage_client

#endif // S3_MULTIPART_UNIT_TESTS_FAKE_STORAGE_CLIENT_HPP
