#ifndef S3_MULTIPART_LIBS3_STORAGE_CLIENT_HPP
#define S3_MULTIPART_LIBS3_STORAGE_CLIENT_HPP

#include "s3_multipart/config.hpp"
#include "s3_multipart/storage_client.hpp"

namespace s3_multipart
{
    // storage_client backed by libs3.
    //
    // The library is initialized on construction and deinitialized on destruction, so only
    // one instance may exist at a time. Retryable libs3 statuses are retried with backoff up
    // to config::retry_count_limit times.
    class libs3_storage_client : public storage_client
    {
    public:
        explicit libs3_storage_client(config _cfg);
        ~libs3_storage_client() override;

        libs3_storage_client(const libs3_storage_client&) = delete;
        libs3_storage_client& operator=(const libs3_storage_client&) = delete;

        auto create_multipart_upload(const std::string& _bucket,
                                     const std::string& _key,
                                     bool _server_side_encryption) -> nlohmann::json override;

        auto upload_part(const std::string& _bucket,
                         const std::string& _key,
                         const std::string& _upload_id,
                         std::int64_t _part_number,
                         const boost::filesystem::path& _part_path) -> std::string override;

        auto complete_multipart_upload(const std::string& _bucket,
                                       const std::string& _key,
                                       const std::string& _upload_id,
                                       const std::vector<completed_part>& _parts) -> remote_response override;

        auto abort_multipart_upload(const std::string& _bucket,
                                    const std::string& _key,
                                    const std::string& _upload_id) -> remote_response override;

    private:
        auto timeout_ms() const -> int;

        config config_;
    }; // class libs3_storage_client

    // Builds the CompleteMultipartUpload request body for _parts, in the order given.
    auto make_complete_multipart_xml(const std::vector<completed_part>& _parts) -> std::string;

} // namespace s3_multipart

#endif // S3_MULTIPART_LIBS3_STORAGE_CLIENT_HPP
