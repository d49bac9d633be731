#ifndef S3_MULTIPART_LIBS3_UTIL_HPP
#define S3_MULTIPART_LIBS3_UTIL_HPP

#include "s3_multipart/config.hpp"

#include <libs3.h>
#include <nlohmann/json.hpp>

#include <cstdint>
#include <string>

namespace s3_multipart
{
    struct libs3_types
    {
        using status = S3Status;
        static constexpr status status_ok = status::S3StatusOK;
        static constexpr status status_error_unknown = status::S3StatusErrorUnknown;
        using bucket_context = S3BucketContext;
        using char_type   = char;
        using buffer_type = char_type*;
        using error_details = S3ErrorDetails;
        using response_properties = S3ResponseProperties;
    };

    // Stores _status in _saved_status and logs it along with whatever detail libs3 gave.
    // When _details is not null the error detail is also recorded there as JSON, so it can
    // be shown to the operator verbatim.
    void store_and_log_status(libs3_types::status _status,
                              const libs3_types::error_details* _error,
                              const std::string& _function,
                              const libs3_types::bucket_context& _saved_bucket_context,
                              libs3_types::status& _saved_status,
                              nlohmann::json* _details = nullptr);

    // Sleep between _s / 2 and _s seconds.
    // The random addition ensures that retries from several invocations don't all cluster
    // up at the same time (dogpile effect)
    void s3_sleep(int _s);

    auto status_is_retryable(libs3_types::status _status) -> bool;

    // True when the status came back from the storage service itself (an S3 error code or an
    // HTTP error) rather than from a local or network failure.
    auto service_responded(libs3_types::status _status) -> bool;

    // Next backoff interval, doubling _current_wait up to the configured maximum.
    auto next_retry_wait(int _current_wait, const config& _cfg) -> int;

    // Builds the bucket context for _bucket. The context points into _cfg and _bucket, both of
    // which must outlive it.
    auto make_bucket_context(const config& _cfg, const std::string& _bucket) -> libs3_types::bucket_context;

    void print_bucket_context(const libs3_types::bucket_context& _bucket_context);

} // namespace s3_multipart

#endif // S3_MULTIPART_LIBS3_UTIL_HPP
