#ifndef S3_MULTIPART_LIBS3_CALLBACKS_HPP
#define S3_MULTIPART_LIBS3_CALLBACKS_HPP

#include "s3_multipart/libs3_util.hpp"

#include <nlohmann/json.hpp>

#include <cstdint>
#include <fstream>
#include <string>

namespace s3_multipart
{
    // callback data for the initiate, complete and abort requests
    struct upload_manager
    {
        explicit upload_manager(libs3_types::bucket_context& _saved_bucket_context)
            : saved_bucket_context{_saved_bucket_context}
            , xml{""}
            , remaining{0}
            , offset{0}
            , status{libs3_types::status_ok}
            , error_details{nlohmann::json::object()}
        {
        }

        libs3_types::bucket_context& saved_bucket_context;             /* To enable more detailed error messages */

        /* Below used for the upload completion command, need to send in XML */
        std::string              xml;

        std::int64_t             remaining;
        std::int64_t             offset;
        libs3_types::status      status;            /* status returned by libs3 */

        std::string              upload_id;         /* returned by S3_initiate_multipart */
        std::string              location;          /* returned by S3_complete_multipart_upload */
        std::string              etag;              /* returned by S3_complete_multipart_upload */
        nlohmann::json           error_details;
    }; // struct upload_manager

    // callback data for a single S3_upload_part request, streaming the part from disk
    struct data_for_part_upload
    {
        explicit data_for_part_upload(libs3_types::bucket_context& _saved_bucket_context)
            : saved_bucket_context{_saved_bucket_context}
            , content_length{0}
            , bytes_written{0}
            , status{libs3_types::status_ok}
            , error_details{nlohmann::json::object()}
        {
        }

        libs3_types::bucket_context& saved_bucket_context;
        std::ifstream                part_stream;
        std::int64_t                 content_length;
        std::int64_t                 bytes_written;
        libs3_types::status          status;
        std::string                  etag;
        nlohmann::json               error_details;
    }; // struct data_for_part_upload

    namespace initialization_callback
    {
        libs3_types::status on_response(const libs3_types::char_type* upload_id,
                                        void* callback_data);

        libs3_types::status on_response_properties(const libs3_types::response_properties* properties,
                                                   void* callback_data);

        void on_response_complete(libs3_types::status status,
                                  const libs3_types::error_details* error,
                                  void* callback_data);
    } // end namespace initialization_callback

    namespace upload_part_callback
    {
        int on_data_request(int buffer_size,
                            libs3_types::buffer_type buffer,
                            void* callback_data);

        libs3_types::status on_response_properties(const libs3_types::response_properties* properties,
                                                   void* callback_data);

        void on_response_complete(libs3_types::status status,
                                  const libs3_types::error_details* error,
                                  void* callback_data);
    } // end namespace upload_part_callback

    /* Uploading the multipart completion XML from our buffer */
    namespace commit_callback
    {
        int on_response(int buffer_size,
                        libs3_types::buffer_type buffer,
                        void* callback_data);

        libs3_types::status on_commit_response(const char* location,
                                               const char* etag,
                                               void* callback_data);

        libs3_types::status on_response_properties(const libs3_types::response_properties* properties,
                                                   void* callback_data);

        void on_response_completion(libs3_types::status status,
                                    const libs3_types::error_details* error,
                                    void* callback_data);
    } // end namespace commit_callback

    namespace cancel_callback
    {
        libs3_types::status on_response_properties(const libs3_types::response_properties* properties,
                                                   void* callback_data);

        // S3_abort_multipart_upload() does not allow a callback_data parameter, so pass the
        // final operation status using these globals.

        extern libs3_types::status g_response_completion_status;
        extern libs3_types::bucket_context* g_response_completion_saved_bucket_context;
        extern nlohmann::json g_response_completion_error_details;

        void on_response_completion(libs3_types::status status,
                                    const libs3_types::error_details* error,
                                    void* callback_data);
    } // end namespace cancel_callback

} // namespace s3_multipart

#endif // S3_MULTIPART_LIBS3_CALLBACKS_HPP
