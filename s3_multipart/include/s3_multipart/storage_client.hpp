#ifndef S3_MULTIPART_STORAGE_CLIENT_HPP
#define S3_MULTIPART_STORAGE_CLIENT_HPP

#include "s3_multipart/session_record.hpp"
#include "s3_multipart/types.hpp"

#include <boost/filesystem/path.hpp>

#include <nlohmann/json.hpp>

#include <cstdint>
#include <string>
#include <vector>

namespace s3_multipart
{
    // The four remote operations of a multipart upload.
    //
    // create_multipart_upload and upload_part throw remote_error when the service cannot be
    // reached and remote_rejected_error when it answers with an error. complete and abort
    // report a service-side refusal through remote_response::confirmed instead, so the
    // caller can decide what to do with the local record.
    class storage_client
    {
    public:
        virtual ~storage_client() = default;

        // Returns the creation response. It holds at least "Bucket", "Key" and "UploadId".
        virtual auto create_multipart_upload(const std::string& _bucket,
                                             const std::string& _key,
                                             bool _server_side_encryption) -> nlohmann::json = 0;

        // Sends the contents of _part_path as part _part_number. Returns the ETag exactly as
        // the service sent it.
        virtual auto upload_part(const std::string& _bucket,
                                 const std::string& _key,
                                 const std::string& _upload_id,
                                 std::int64_t _part_number,
                                 const boost::filesystem::path& _part_path) -> std::string = 0;

        virtual auto complete_multipart_upload(const std::string& _bucket,
                                               const std::string& _key,
                                               const std::string& _upload_id,
                                               const std::vector<completed_part>& _parts) -> remote_response = 0;

        virtual auto abort_multipart_upload(const std::string& _bucket,
                                            const std::string& _key,
                                            const std::string& _upload_id) -> remote_response = 0;
    }; // class storage_client

} // namespace s3_multipart

#endif // S3_MULTIPART_STORAGE_CLIENT_HPP
