#ifndef S3_MULTIPART_DEFERRED_STORAGE_CLIENT_HPP
#define S3_MULTIPART_DEFERRED_STORAGE_CLIENT_HPP

#include "s3_multipart/storage_client.hpp"

#include <functional>
#include <memory>

namespace s3_multipart
{
    // Forwards to a storage_client that is created on first use.
    //
    // Lets a command validate its local input before credentials are resolved or the
    // storage library is initialized. A factory that throws is retried on the next call.
    class deferred_storage_client : public storage_client
    {
    public:
        using factory_type = std::function<std::unique_ptr<storage_client>()>;

        explicit deferred_storage_client(factory_type _factory);

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

        auto created() const noexcept -> bool { return static_cast<bool>(client_); }

    private:
        auto get() -> storage_client&;

        factory_type                    factory_;
        std::unique_ptr<storage_client> client_;
    }; // class deferred_storage_client

} // namespace s3_multipart

#endif // S3_MULTIPART_DEFERRED_STORAGE_CLIENT_HPP
