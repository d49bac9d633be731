#ifndef S3_MULTIPART_SESSION_RECORD_HPP
#define S3_MULTIPART_SESSION_RECORD_HPP

#include <nlohmann/json.hpp>

#include <cstdint>
#include <string>
#include <vector>

namespace s3_multipart
{
    struct completed_part
    {
        std::int64_t part_number;
        std::string  etag;
    };

    // The persisted record of an in-progress upload.
    //
    // bucket, key and upload_id never change after init. parts holds one entry per part
    // number in the order the parts first completed. Every other field found in the record
    // (for example the rest of the storage service's creation response) is kept in extra
    // and written back unchanged.
    struct upload_session
    {
        std::string                 bucket;
        std::string                 key;
        std::string                 upload_id;
        std::vector<completed_part> parts;
        nlohmann::json              extra = nlohmann::json::object();

        // Records _part_number as completed. An existing entry for the same part number is
        // replaced in place, otherwise the entry is appended.
        void upsert_part(std::int64_t _part_number, const std::string& _etag);

        auto has_part(std::int64_t _part_number) const -> bool;
    }; // struct upload_session

    // Field names of the persisted record.
    namespace record_keys
    {
        inline const std::string bucket{"Bucket"};
        inline const std::string key{"Key"};
        inline const std::string upload_id{"UploadId"};
        inline const std::string parts{"Parts"};
        inline const std::string etag{"ETag"};
        inline const std::string part_number{"PartNumber"};
    } // namespace record_keys

    // Throws corrupt_state_error when a required field is missing or has the wrong type.
    auto session_from_json(const nlohmann::json& _doc) -> upload_session;

    auto session_to_json(const upload_session& _session) -> nlohmann::json;

    // Builds a session from the storage service's creation response. The whole response is
    // retained in the record.
    auto session_from_create_response(const nlohmann::json& _response) -> upload_session;

    // Removes the quote characters S3 wraps around ETag values.
    auto strip_etag_quotes(const std::string& _etag) -> std::string;

} // namespace s3_multipart

#endif // S3_MULTIPART_SESSION_RECORD_HPP
