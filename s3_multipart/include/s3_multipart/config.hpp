#ifndef S3_MULTIPART_CONFIG_HPP
#define S3_MULTIPART_CONFIG_HPP

#include <libs3.h>

#include <functional>
#include <optional>
#include <string>

namespace s3_multipart
{
    // property names, shared with the S3 resource plugin so existing environments carry over
    extern const std::string s3_default_hostname;
    extern const std::string s3_region_name;
    extern const std::string s3_proto;
    extern const std::string s3_stsdate;
    extern const std::string s3_uri_request_style;
    extern const std::string s3_retry_count;
    extern const std::string s3_wait_time_seconds;
    extern const std::string s3_max_wait_time_seconds;
    extern const std::string s3_non_data_transfer_timeout_seconds;
    extern const std::string s3_server_encrypt;
    extern const std::string s3_auth_file;
    extern const std::string s3_key_id;
    extern const std::string s3_access_key;

    extern const unsigned int S3_DEFAULT_RETRY_COUNT;
    extern const int          S3_DEFAULT_RETRY_WAIT_SECONDS;
    extern const int          S3_DEFAULT_MAX_RETRY_WAIT_SECONDS;
    extern const unsigned int S3_DEFAULT_NON_DATA_TRANSFER_TIMEOUT_SECONDS;
    extern const std::string  DEFAULT_STATE_FILE;

    struct config
    {
        config()
            : hostname{"s3.amazonaws.com"}
            , region_name{"us-east-1"}
            , access_key{""}
            , secret_access_key{""}
            , keyfile{""}
            , s3_protocol_str{"https"}
            , s3_sts_date_str{"amz"}
            , s3_uri_request_style{"path"}
            , retry_count_limit{S3_DEFAULT_RETRY_COUNT}
            , retry_wait_seconds{S3_DEFAULT_RETRY_WAIT_SECONDS}
            , max_retry_wait_seconds{S3_DEFAULT_MAX_RETRY_WAIT_SECONDS}
            , non_data_transfer_timeout_seconds{S3_DEFAULT_NON_DATA_TRANSFER_TIMEOUT_SECONDS}
            , server_encrypt_flag{true}
            , state_file{DEFAULT_STATE_FILE}
        {}

        std::string  hostname;
        std::string  region_name;
        std::string  access_key;
        std::string  secret_access_key;
        std::string  keyfile;
        std::string  s3_protocol_str;
        std::string  s3_sts_date_str;
        std::string  s3_uri_request_style;
        unsigned int retry_count_limit;
        int          retry_wait_seconds;
        int          max_retry_wait_seconds;
        unsigned int non_data_transfer_timeout_seconds;
        bool         server_encrypt_flag;
        std::string  state_file;
    }; // struct config

    // Returns the value of a variable or std::nullopt when it is unset.
    using environment_lookup = std::function<std::optional<std::string>(const std::string&)>;

    auto process_environment() -> environment_lookup;

    // Overlays the environment on top of _cfg. Throws configuration_error on malformed values.
    void apply_environment(config& _cfg, const environment_lookup& _env);

    // Fills in access_key and secret_access_key, from the environment first and the keyfile
    // second. Throws configuration_error when neither yields credentials.
    void resolve_credentials(config& _cfg, const environment_lookup& _env);

    // Reads a two line keyfile: access key id, then secret access key.
    void read_keys(const std::string& _keyfile, std::string& _access_key, std::string& _secret_access_key);

    auto get_protocol(const config& _cfg) -> S3Protocol;
    auto get_uri_request_style(const config& _cfg) -> S3UriStyle;
    auto get_sts_date(const config& _cfg) -> S3STSDate;

} // namespace s3_multipart

#endif // S3_MULTIPART_CONFIG_HPP
