#include "s3_multipart/libs3_storage_client.hpp"
#include "s3_multipart/exceptions.hpp"
#include "s3_multipart/libs3_callbacks.hpp"
#include "s3_multipart/logging_category.hpp"

#include <boost/filesystem.hpp>

#include <fmt/format.h>

#include <climits>
#include <utility>

namespace s3_multipart
{
    namespace
    {
        // Throws the exception matching a failed request. Rejections carry the error detail
        // libs3 parsed out of the response.
        [[noreturn]] void throw_for_status(const std::string& _what,
                                           libs3_types::status _status,
                                           const nlohmann::json& _error_details)
        {
            auto msg = fmt::format("{} - \"{}\"", _what, S3_get_status_name(_status));

            if (service_responded(_status)) {
                throw remote_rejected_error{msg, _error_details};
            }

            throw remote_error{msg, S3_get_status_name(_status)};
        }
    } // anonymous namespace

    auto make_complete_multipart_xml(const std::vector<completed_part>& _parts) -> std::string
    {
        auto xml = fmt::format("<CompleteMultipartUpload>\n");
        for (const auto& part : _parts) {
            xml += fmt::format("<Part><PartNumber>{}</PartNumber><ETag>{}</ETag></Part>\n", part.part_number, part.etag);
        }
        xml += fmt::format("</CompleteMultipartUpload>\n");
        return xml;
    }

    libs3_storage_client::libs3_storage_client(config _cfg)
        : config_{std::move(_cfg)}
    {
        const auto status = S3_initialize("s3", S3_INIT_ALL, config_.hostname.c_str());
        if (status != libs3_types::status_ok) {
            throw remote_error{fmt::format("Error initializing the S3 library [hostname={}] - \"{}\"",
                                           config_.hostname, S3_get_status_name(status)),
                               S3_get_status_name(status)};
        }

        logger::debug("{}:{} ({}) libs3 initialized [hostname={}][region={}][protocol={}][uri_style={}]",
                      __FILE__, __LINE__, __func__, config_.hostname, config_.region_name,
                      get_protocol(config_), get_uri_request_style(config_));
    }

    libs3_storage_client::~libs3_storage_client()
    {
        S3_deinitialize();
    }

    auto libs3_storage_client::timeout_ms() const -> int
    {
        return static_cast<int>(config_.non_data_transfer_timeout_seconds * 1000);
    }

    auto libs3_storage_client::create_multipart_upload(const std::string& _bucket,
                                                       const std::string& _key,
                                                       bool _server_side_encryption) -> nlohmann::json
    {
        auto bucket_context = make_bucket_context(config_, _bucket);
        print_bucket_context(bucket_context);

        S3PutProperties put_props{};
        put_props.useServerSideEncryption = _server_side_encryption;
        put_props.md5 = nullptr;
        put_props.expires = -1;

        upload_manager manager{bucket_context};

        S3MultipartInitialHandler mpu_initial_handler
            = { { initialization_callback::on_response_properties,
                  initialization_callback::on_response_complete },
                initialization_callback::on_response };

        unsigned int retry_cnt = 0;
        int retry_wait_seconds = config_.retry_wait_seconds;

        do {
            manager.upload_id.clear();
            manager.error_details = nlohmann::json::object();

            logger::debug("{}:{} ({}) call S3_initiate_multipart [bucket={}][key={}]",
                          __FILE__, __LINE__, __func__, _bucket, _key);

            S3_initiate_multipart(&bucket_context, _key.c_str(), &put_props, &mpu_initial_handler,
                                  nullptr, timeout_ms(), &manager);

            if (manager.status != libs3_types::status_ok && status_is_retryable(manager.status) &&
                    retry_cnt < config_.retry_count_limit) {
                logger::warn("{}:{} ({}) S3_initiate_multipart returned error [status={}][attempt={}][retry_count_limit={}].  "
                             "Sleeping for {} seconds", __FILE__, __LINE__, __func__,
                             S3_get_status_name(manager.status), retry_cnt + 1, config_.retry_count_limit, retry_wait_seconds);
                s3_sleep(retry_wait_seconds);
                retry_wait_seconds = next_retry_wait(retry_wait_seconds, config_);
            }

        } while (manager.status != libs3_types::status_ok &&
                 status_is_retryable(manager.status) &&
                 ++retry_cnt <= config_.retry_count_limit);

        if (manager.status != libs3_types::status_ok) {
            throw_for_status(fmt::format("Error initiating multipart upload of s3://{}/{}", _bucket, _key),
                             manager.status, manager.error_details);
        }

        if (manager.upload_id.empty()) {
            throw remote_error{fmt::format("S3_initiate_multipart returned no upload id for s3://{}/{}", _bucket, _key),
                               S3_get_status_name(manager.status)};
        }

        logger::info("{}:{} ({}) S3_initiate_multipart returned.  Upload ID = {}",
                     __FILE__, __LINE__, __func__, manager.upload_id);

        nlohmann::json response{
            {"Bucket", _bucket},
            {"Key", _key},
            {"UploadId", manager.upload_id}
        };
        if (_server_side_encryption) {
            response["ServerSideEncryption"] = "AES256";
        }

        return response;
    } // end create_multipart_upload

    auto libs3_storage_client::upload_part(const std::string& _bucket,
                                           const std::string& _key,
                                           const std::string& _upload_id,
                                           std::int64_t _part_number,
                                           const boost::filesystem::path& _part_path) -> std::string
    {
        // libs3 takes the part number as an int
        if (_part_number < 1 || _part_number > MAXIMUM_PART_NUMBER) {
            throw input_error{error_codes::INVALID_PART_NUMBER,
                fmt::format("Part number {} of [{}] is outside 1..{}", _part_number, _part_path.string(), MAXIMUM_PART_NUMBER)};
        }

        boost::system::error_code ec;
        const auto file_size = boost::filesystem::file_size(_part_path, ec);
        if (ec) {
            throw input_error{error_codes::PART_FILE_READ_ERROR,
                fmt::format("Failed to stat part file [{}]: {}", _part_path.string(), ec.message())};
        }

        // libs3 takes the part length as an int
        if (file_size > static_cast<std::uintmax_t>(INT_MAX)) {
            throw input_error{error_codes::PART_FILE_READ_ERROR,
                fmt::format("Part file [{}] is {} bytes, larger than the {} bytes a single part request supports",
                            _part_path.string(), file_size, INT_MAX)};
        }

        auto bucket_context = make_bucket_context(config_, _bucket);

        S3PutProperties put_props{};
        put_props.md5 = nullptr;
        put_props.expires = -1;

        data_for_part_upload data{bucket_context};
        data.content_length = static_cast<std::int64_t>(file_size);

        S3PutObjectHandler put_object_handler
            = { { upload_part_callback::on_response_properties,
                  upload_part_callback::on_response_complete },
                upload_part_callback::on_data_request };

        unsigned int retry_cnt = 0;
        int retry_wait_seconds = config_.retry_wait_seconds;

        do {
            // every attempt restarts from the beginning of the part
            if (data.part_stream.is_open()) {
                data.part_stream.close();
            }
            data.part_stream.open(_part_path.string(), std::ios::in | std::ios::binary);
            if (!data.part_stream) {
                throw input_error{error_codes::PART_FILE_READ_ERROR,
                    fmt::format("Failed to open part file [{}]", _part_path.string())};
            }
            data.bytes_written = 0;
            data.etag.clear();
            data.error_details = nlohmann::json::object();

            logger::debug("{}:{} ({}) S3_upload_part (ctx, {}, props, handler, {}, {}, {}, 0, ...)",
                          __FILE__, __LINE__, __func__, _key, _part_number, _upload_id, data.content_length);

            S3_upload_part(&bucket_context, _key.c_str(), &put_props, &put_object_handler,
                           static_cast<int>(_part_number), _upload_id.c_str(),
                           static_cast<int>(data.content_length), nullptr, 0, &data);

            logger::debug("{}:{} ({}) S3_upload_part returned [part={}][status={}]",
                          __FILE__, __LINE__, __func__, _part_number, S3_get_status_name(data.status));

            if (data.status != libs3_types::status_ok && status_is_retryable(data.status) &&
                    retry_cnt < config_.retry_count_limit) {
                logger::warn("{}:{} ({}) S3_upload_part returned error [status={}][part={}][attempt={}][retry_count_limit={}].  "
                             "Sleeping for {} seconds", __FILE__, __LINE__, __func__,
                             S3_get_status_name(data.status), _part_number, retry_cnt + 1, config_.retry_count_limit,
                             retry_wait_seconds);
                s3_sleep(retry_wait_seconds);
                retry_wait_seconds = next_retry_wait(retry_wait_seconds, config_);
            }

        } while (data.status != libs3_types::status_ok &&
                 status_is_retryable(data.status) &&
                 ++retry_cnt <= config_.retry_count_limit);

        if (data.status != libs3_types::status_ok) {
            throw_for_status(fmt::format("Error uploading part {} [{}] of s3://{}/{}",
                                         _part_number, _part_path.string(), _bucket, _key),
                             data.status, data.error_details);
        }

        if (data.bytes_written != data.content_length) {
            throw remote_error{fmt::format("Uploaded {} of {} bytes for part {} [{}]",
                                           data.bytes_written, data.content_length, _part_number, _part_path.string()),
                               S3_get_status_name(data.status)};
        }

        if (data.etag.empty()) {
            throw remote_error{fmt::format("No ETag returned for part {} of s3://{}/{}", _part_number, _bucket, _key),
                               S3_get_status_name(data.status)};
        }

        return data.etag;
    } // end upload_part

    auto libs3_storage_client::complete_multipart_upload(const std::string& _bucket,
                                                         const std::string& _key,
                                                         const std::string& _upload_id,
                                                         const std::vector<completed_part>& _parts) -> remote_response
    {
        auto bucket_context = make_bucket_context(config_, _bucket);

        const auto xml = make_complete_multipart_xml(_parts);

        logger::debug("{}:{} ({}) Multipart:  Completing key \"{}\" Upload ID \"{}\"", __FILE__, __LINE__, __func__, _key, _upload_id);
        logger::trace("{}:{} ({}) [key={}] Request: {}", __FILE__, __LINE__, __func__, _key, xml);

        upload_manager manager{bucket_context};

        S3MultipartCommitHandler commit_handler
            = { { commit_callback::on_response_properties,
                  commit_callback::on_response_completion },
                commit_callback::on_response,
                commit_callback::on_commit_response };

        unsigned int retry_cnt = 0;
        int retry_wait_seconds = config_.retry_wait_seconds;

        do {
            // On partial error, need to restart XML send from the beginning
            manager.xml = xml;
            manager.remaining = static_cast<std::int64_t>(xml.size());
            manager.offset = 0;
            manager.error_details = nlohmann::json::object();

            S3_complete_multipart_upload(&bucket_context, _key.c_str(), &commit_handler, _upload_id.c_str(),
                                         static_cast<int>(manager.remaining), nullptr, timeout_ms(), &manager);

            logger::debug("{}:{} ({}) [key={}][manager.status={}]", __FILE__, __LINE__, __func__, _key,
                          S3_get_status_name(manager.status));

            if (manager.status != libs3_types::status_ok && status_is_retryable(manager.status) &&
                    retry_cnt < config_.retry_count_limit) {
                logger::warn("{}:{} ({}) S3_complete_multipart_upload returned error [status={}][key={}][attempt={}][retry_count_limit={}].  "
                             "Sleeping for {} seconds", __FILE__, __LINE__, __func__,
                             S3_get_status_name(manager.status), _key, retry_cnt + 1, config_.retry_count_limit,
                             retry_wait_seconds);
                s3_sleep(retry_wait_seconds);
                retry_wait_seconds = next_retry_wait(retry_wait_seconds, config_);
            }

        } while (manager.status != libs3_types::status_ok &&
                 status_is_retryable(manager.status) &&
                 ++retry_cnt <= config_.retry_count_limit);

        if (manager.status != libs3_types::status_ok && !service_responded(manager.status)) {
            throw_for_status(fmt::format("Error completing multipart upload of s3://{}/{}", _bucket, _key),
                             manager.status, manager.error_details);
        }

        remote_response response;
        response.confirmed = manager.status == libs3_types::status_ok;
        response.status_name = S3_get_status_name(manager.status);

        if (response.confirmed) {
            response.payload = {
                {"Bucket", _bucket},
                {"Key", _key},
                {"Location", manager.location},
                {"ETag", manager.etag}
            };
        }
        else {
            response.payload = manager.error_details;
            response.payload["Bucket"] = _bucket;
            response.payload["Key"] = _key;
            response.payload["UploadId"] = _upload_id;
        }

        return response;
    } // end complete_multipart_upload

    auto libs3_storage_client::abort_multipart_upload(const std::string& _bucket,
                                                      const std::string& _key,
                                                      const std::string& _upload_id) -> remote_response
    {
        auto bucket_context = make_bucket_context(config_, _bucket);

        S3AbortMultipartUploadHandler abort_handler
            = { { cancel_callback::on_response_properties,
                  cancel_callback::on_response_completion } };

        logger::info("{}:{} ({}) Cancelling multipart upload: key=\"{}\", upload_id=\"{}\"",
                     __FILE__, __LINE__, __func__, _key, _upload_id);

        unsigned int retry_cnt = 0;
        int retry_wait_seconds = config_.retry_wait_seconds;
        libs3_types::status status;

        do {
            cancel_callback::g_response_completion_status = libs3_types::status_ok;
            cancel_callback::g_response_completion_saved_bucket_context = &bucket_context;
            cancel_callback::g_response_completion_error_details = nlohmann::json::object();

            S3_abort_multipart_upload(&bucket_context, _key.c_str(), _upload_id.c_str(), timeout_ms(), &abort_handler);
            status = cancel_callback::g_response_completion_status;

            if (status != libs3_types::status_ok && status_is_retryable(status) &&
                    retry_cnt < config_.retry_count_limit) {
                logger::warn("{}:{} ({}) S3_abort_multipart_upload returned error [status={}][key={}][attempt={}][retry_count_limit={}].  "
                             "Sleeping for {} seconds", __FILE__, __LINE__, __func__,
                             S3_get_status_name(status), _key, retry_cnt + 1, config_.retry_count_limit, retry_wait_seconds);
                s3_sleep(retry_wait_seconds);
                retry_wait_seconds = next_retry_wait(retry_wait_seconds, config_);
            }

        } while (status != libs3_types::status_ok &&
                 status_is_retryable(status) &&
                 ++retry_cnt <= config_.retry_count_limit);

        cancel_callback::g_response_completion_saved_bucket_context = nullptr;

        if (status != libs3_types::status_ok && !service_responded(status)) {
            throw_for_status(fmt::format("Error cancelling the multipart upload of s3://{}/{}", _bucket, _key),
                             status, cancel_callback::g_response_completion_error_details);
        }

        remote_response response;
        response.confirmed = status == libs3_types::status_ok;
        response.status_name = S3_get_status_name(status);
        response.payload = cancel_callback::g_response_completion_error_details;
        response.payload["Bucket"] = _bucket;
        response.payload["Key"] = _key;
        response.payload["UploadId"] = _upload_id;

        return response;
    } // end abort_multipart_upload

} // namespace s3_multipart
