#include "s3_multipart/libs3_callbacks.hpp"
#include "s3_multipart/logging_category.hpp"

#include <cstring>

namespace s3_multipart
{
    namespace initialization_callback
    {
        libs3_types::status on_response(const libs3_types::char_type* upload_id,
                                        void* callback_data)
        {
            upload_manager* manager = static_cast<upload_manager*>(callback_data);
            manager->upload_id = upload_id ? upload_id : "";
            return libs3_types::status_ok;
        } // end on_response

        libs3_types::status on_response_properties(const libs3_types::response_properties* properties,
                                                   void* callback_data)
        {
            return libs3_types::status_ok;
        } // end on_response_properties

        void on_response_complete(libs3_types::status status,
                                  const libs3_types::error_details* error,
                                  void* callback_data)
        {
            upload_manager* data = static_cast<upload_manager*>(callback_data);
            store_and_log_status(status, error, "initialization_callback::on_response_complete",
                                 data->saved_bucket_context, data->status, &data->error_details);
        } // end on_response_complete

    } // end namespace initialization_callback

    namespace upload_part_callback
    {
        int on_data_request(int buffer_size,
                            libs3_types::buffer_type buffer,
                            void* callback_data)
        {
            data_for_part_upload* data = static_cast<data_for_part_upload*>(callback_data);

            // returning 0 completes the request
            if (data->content_length <= data->bytes_written) {
                return 0;
            }

            std::int64_t length_to_read = data->content_length - data->bytes_written > static_cast<std::int64_t>(buffer_size)
                ? static_cast<std::int64_t>(buffer_size)
                : data->content_length - data->bytes_written;

            data->part_stream.read(buffer, length_to_read);
            auto bytes_read = static_cast<std::int64_t>(data->part_stream.gcount());

            if (bytes_read <= 0) {
                logger::error("{}:{} ({}) short read from part file [bytes_written={}][content_length={}]",
                              __FILE__, __LINE__, __func__, data->bytes_written, data->content_length);
                return -1;
            }

            data->bytes_written += bytes_read;

            return static_cast<int>(bytes_read);
        } // end on_data_request

        libs3_types::status on_response_properties(const libs3_types::response_properties* properties,
                                                   void* callback_data)
        {
            data_for_part_upload* data = static_cast<data_for_part_upload*>(callback_data);
            data->etag = properties->eTag ? properties->eTag : "";
            return libs3_types::status_ok;
        } // end on_response_properties

        void on_response_complete(libs3_types::status status,
                                  const libs3_types::error_details* error,
                                  void* callback_data)
        {
            data_for_part_upload* data = static_cast<data_for_part_upload*>(callback_data);
            store_and_log_status(status, error, "upload_part_callback::on_response_complete",
                                 data->saved_bucket_context, data->status, &data->error_details);
        } // end on_response_complete

    } // end namespace upload_part_callback

    namespace commit_callback
    {
        int on_response(int buffer_size,
                        libs3_types::buffer_type buffer,
                        void* callback_data)
        {
            upload_manager* manager = static_cast<upload_manager*>(callback_data);
            std::int64_t ret = 0;
            if (manager->remaining) {
                int to_read_count = ((manager->remaining > static_cast<std::int64_t>(buffer_size)) ?
                                     buffer_size : static_cast<int>(manager->remaining));
                std::memcpy(buffer, manager->xml.c_str() + manager->offset, to_read_count);
                ret = to_read_count;
            }
            manager->remaining -= ret;
            manager->offset += ret;

            return static_cast<int>(ret);
        } // end on_response

        libs3_types::status on_commit_response(const char* location,
                                               const char* etag,
                                               void* callback_data)
        {
            upload_manager* manager = static_cast<upload_manager*>(callback_data);
            manager->location = location ? location : "";
            manager->etag = etag ? etag : "";
            return libs3_types::status_ok;
        } // end on_commit_response

        libs3_types::status on_response_properties(const libs3_types::response_properties* properties,
                                                   void* callback_data)
        {
            return libs3_types::status_ok;
        } // end on_response_properties

        void on_response_completion(libs3_types::status status,
                                    const libs3_types::error_details* error,
                                    void* callback_data)
        {
            upload_manager* data = static_cast<upload_manager*>(callback_data);
            store_and_log_status(status, error, "commit_callback::on_response_completion",
                                 data->saved_bucket_context, data->status, &data->error_details);
        } // end on_response_completion

    } // end namespace commit_callback

    namespace cancel_callback
    {
        libs3_types::status g_response_completion_status = libs3_types::status_ok;
        libs3_types::bucket_context* g_response_completion_saved_bucket_context = nullptr;
        nlohmann::json g_response_completion_error_details = nlohmann::json::object();

        libs3_types::status on_response_properties(const libs3_types::response_properties* properties,
                                                   void* callback_data)
        {
            return libs3_types::status_ok;
        } // end on_response_properties

        void on_response_completion(libs3_types::status status,
                                    const libs3_types::error_details* error,
                                    void* callback_data)
        {
            store_and_log_status(status, error, "cancel_callback::on_response_completion",
                                 *g_response_completion_saved_bucket_context, g_response_completion_status,
                                 &g_response_completion_error_details);
        } // end on_response_completion

    } // end namespace cancel_callback

} // namespace s3_multipart
