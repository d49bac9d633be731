#include "s3_multipart/deferred_storage_client.hpp"
#include "s3_multipart/exceptions.hpp"
#include "s3_multipart/logging_category.hpp"

#include <utility>

namespace s3_multipart
{
    deferred_storage_client::deferred_storage_client(factory_type _factory)
        : factory_{std::move(_factory)}
    {
    }

    auto deferred_storage_client::get() -> storage_client&
    {
        if (!client_) {
            logger::debug("{}:{} ({}) creating storage client", __FILE__, __LINE__, __func__);

            client_ = factory_();
            if (!client_) {
                throw configuration_error{"No storage client available"};
            }
        }

        return *client_;
    }

    auto deferred_storage_client::create_multipart_upload(const std::string& _bucket,
                                                          const std::string& _key,
                                                          bool _server_side_encryption) -> nlohmann::json
    {
        return get().create_multipart_upload(_bucket, _key, _server_side_encryption);
    }

    auto deferred_storage_client::upload_part(const std::string& _bucket,
                                              const std::string& _key,
                                              const std::string& _upload_id,
                                              std::int64_t _part_number,
                                              const boost::filesystem::path& _part_path) -> std::string
    {
        return get().upload_part(_bucket, _key, _upload_id, _part_number, _part_path);
    }

    auto deferred_storage_client::complete_multipart_upload(const std::string& _bucket,
                                                            const std::string& _key,
                                                            const std::string& _upload_id,
                                                            const std::vector<completed_part>& _parts) -> remote_response
    {
        return get().complete_multipart_upload(_bucket, _key, _upload_id, _parts);
    }

    auto deferred_storage_client::abort_multipart_upload(const std::string& _bucket,
                                                         const std::string& _key,
                                                         const std::string& _upload_id) -> remote_response
    {
        return get().abort_multipart_upload(_bucket, _key, _upload_id);
    }

} // namespace s3_multipart
