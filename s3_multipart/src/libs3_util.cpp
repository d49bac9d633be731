#include "s3_multipart/libs3_util.hpp"
#include "s3_multipart/logging_category.hpp"

#include <fmt/format.h>

#include <algorithm>
#include <chrono>
#include <cstdlib>
#include <random>
#include <thread>

namespace s3_multipart
{
    void store_and_log_status(libs3_types::status _status,
                              const libs3_types::error_details* _error,
                              const std::string& _function,
                              const libs3_types::bucket_context& _saved_bucket_context,
                              libs3_types::status& _saved_status,
                              nlohmann::json* _details)
    {
        _saved_status = _status;

        const bool failed = _status != libs3_types::status_ok;

        auto log = [failed](const std::string& _msg) {
            if (failed) {
                logger::error("{}", _msg);
            }
            else {
                logger::debug("{}", _msg);
            }
        };

        log(fmt::format("{}:{} [{}]  libs3_types::status: [{}] - {}",
                        __FILE__, __LINE__, __func__, S3_get_status_name(_status), _status));
        if (_saved_bucket_context.hostName) {
            log(fmt::format("{}:{} [{}]  S3Host: {}", __FILE__, __LINE__, __func__, _saved_bucket_context.hostName));
        }
        log(fmt::format("{}:{} [{}]  Function: {}", __FILE__, __LINE__, __func__, _function));

        if (_details) {
            (*_details)["Status"] = S3_get_status_name(_status);
        }

        if (!_error) {
            return;
        }

        if (_error->message) {
            log(fmt::format("{}:{} [{}]  Message: {}", __FILE__, __LINE__, __func__, _error->message));
            if (_details) {
                (*_details)["Message"] = _error->message;
            }
        }
        if (_error->resource) {
            log(fmt::format("{}:{} [{}]  Resource: {}", __FILE__, __LINE__, __func__, _error->resource));
            if (_details) {
                (*_details)["Resource"] = _error->resource;
            }
        }
        if (_error->furtherDetails) {
            log(fmt::format("{}:{} [{}]  Further Details: {}", __FILE__, __LINE__, __func__, _error->furtherDetails));
            if (_details) {
                (*_details)["FurtherDetails"] = _error->furtherDetails;
            }
        }
        if (_error->extraDetailsCount) {
            log(fmt::format("{}:{} [{}]  Extra Details:", __FILE__, __LINE__, __func__));

            for (int i = 0; i < _error->extraDetailsCount; i++) {
                log(fmt::format("{}:{} [{}]    {}: {}", __FILE__, __LINE__, __func__,
                                _error->extraDetails[i].name, _error->extraDetails[i].value));
                if (_details) {
                    (*_details)["ExtraDetails"][_error->extraDetails[i].name] = _error->extraDetails[i].value;
                }
            }
        }
    } // end store_and_log_status

    void s3_sleep(int _s)
    {
        if (_s <= 0) {
            return;
        }

        std::random_device r;
        std::default_random_engine e1(r());
        std::uniform_int_distribution<int> uniform_dist(0, RAND_MAX);
        int random = uniform_dist(e1);
        int sleep_time = (int)((((double)random / (double)RAND_MAX) + 1) * .5 * _s); // sleep between _s/2 and _s
        std::this_thread::sleep_for(std::chrono::seconds(sleep_time));
    }

    auto status_is_retryable(libs3_types::status _status) -> bool
    {
        return ::S3_status_is_retryable(_status) || libs3_types::status_error_unknown == _status;
    }

    auto service_responded(libs3_types::status _status) -> bool
    {
        // libs3 lists the service error codes, then the bare HTTP errors, after every local status
        return _status >= S3StatusErrorAccessDenied;
    }

    auto next_retry_wait(int _current_wait, const config& _cfg) -> int
    {
        return std::min(_current_wait * 2, _cfg.max_retry_wait_seconds);
    }

    auto make_bucket_context(const config& _cfg, const std::string& _bucket) -> libs3_types::bucket_context
    {
        libs3_types::bucket_context bucket_context{};

        bucket_context.hostName        = _cfg.hostname.c_str();
        bucket_context.bucketName      = _bucket.c_str();
        bucket_context.protocol        = get_protocol(_cfg);
        bucket_context.uriStyle        = get_uri_request_style(_cfg);
        bucket_context.accessKeyId     = _cfg.access_key.c_str();
        bucket_context.secretAccessKey = _cfg.secret_access_key.c_str();
        bucket_context.securityToken   = nullptr;
        bucket_context.stsDate         = get_sts_date(_cfg);
        bucket_context.authRegion      = _cfg.region_name.c_str();

        return bucket_context;
    }

    void print_bucket_context(const libs3_types::bucket_context& _bucket_context)
    {
        logger::debug("BucketContext: [hostName={}] [bucketName={}][protocol={}]"
                      "[uriStyle={}][accessKeyId={}][stsDate={}][region={}]",
                      _bucket_context.hostName == nullptr ? "" : _bucket_context.hostName,
                      _bucket_context.bucketName == nullptr ? "" : _bucket_context.bucketName,
                      _bucket_context.protocol,
                      _bucket_context.uriStyle,
                      _bucket_context.accessKeyId == nullptr ? "" : _bucket_context.accessKeyId,
                      _bucket_context.stsDate,
                      _bucket_context.authRegion == nullptr ? "" : _bucket_context.authRegion);
    }

} // namespace s3_multipart
