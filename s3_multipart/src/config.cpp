#include "s3_multipart/config.hpp"
#include "s3_multipart/exceptions.hpp"
#include "s3_multipart/logging_category.hpp"

#include <boost/algorithm/string/predicate.hpp>
#include <boost/algorithm/string/trim.hpp>
#include <boost/lexical_cast.hpp>

#include <fmt/format.h>

#include <cstdlib>
#include <fstream>

namespace s3_multipart
{
    const std::string  s3_default_hostname{"S3_DEFAULT_HOSTNAME"};
    const std::string  s3_region_name{"S3_REGIONNAME"};
    const std::string  s3_proto{"S3_PROTO"};
    const std::string  s3_stsdate{"S3_STSDATE"};
    const std::string  s3_uri_request_style{"S3_URI_REQUEST_STYLE"};        //  either "path" or "virtual_hosted" - default "path"
    const std::string  s3_retry_count{"S3_RETRY_COUNT"};
    const std::string  s3_wait_time_seconds{"S3_WAIT_TIME_SECONDS"};
    const std::string  s3_max_wait_time_seconds{"S3_MAX_WAIT_TIME_SECONDS"};
    const std::string  s3_non_data_transfer_timeout_seconds{"S3_NON_DATA_TRANSFER_TIMEOUT_SECONDS"};
    const std::string  s3_server_encrypt{"S3_SERVER_ENCRYPT"};
    const std::string  s3_auth_file{"S3_AUTH_FILE"};
    const std::string  s3_key_id{"S3_ACCESS_KEY_ID"};
    const std::string  s3_access_key{"S3_SECRET_ACCESS_KEY"};

    const unsigned int S3_DEFAULT_RETRY_COUNT = 3;
    const int          S3_DEFAULT_RETRY_WAIT_SECONDS = 3;
    const int          S3_DEFAULT_MAX_RETRY_WAIT_SECONDS = 30;
    const unsigned int S3_DEFAULT_NON_DATA_TRANSFER_TIMEOUT_SECONDS = 300;
    const std::string  DEFAULT_STATE_FILE{"multipart.json"};

    namespace
    {
        template <typename T>
        T parse_number(const std::string& _name, const std::string& _value)
        {
            try {
                return boost::lexical_cast<T>(boost::algorithm::trim_copy(_value));
            }
            catch (const boost::bad_lexical_cast&) {
                throw configuration_error{fmt::format("Invalid value for {}: \"{}\"", _name, _value)};
            }
        }

        bool parse_flag(const std::string& _name, const std::string& _value)
        {
            const auto v = boost::algorithm::trim_copy(_value);
            if (v == "1" || boost::iequals(v, "true") || boost::iequals(v, "yes")) {
                return true;
            }
            if (v == "0" || boost::iequals(v, "false") || boost::iequals(v, "no")) {
                return false;
            }
            throw configuration_error{fmt::format("Invalid value for {}: \"{}\"", _name, _value)};
        }
    } // anonymous namespace

    auto process_environment() -> environment_lookup
    {
        return [](const std::string& _name) -> std::optional<std::string> {
            if (const char* value = std::getenv(_name.c_str())) {
                return std::string{value};
            }
            return std::nullopt;
        };
    }

    void apply_environment(config& _cfg, const environment_lookup& _env)
    {
        if (auto v = _env(s3_default_hostname)) {
            _cfg.hostname = *v;
        }
        if (auto v = _env(s3_region_name)) {
            _cfg.region_name = *v;
        }
        if (auto v = _env(s3_proto)) {
            _cfg.s3_protocol_str = *v;
        }
        if (auto v = _env(s3_stsdate)) {
            _cfg.s3_sts_date_str = *v;
        }
        if (auto v = _env(s3_uri_request_style)) {
            _cfg.s3_uri_request_style = *v;
        }
        if (auto v = _env(s3_retry_count)) {
            _cfg.retry_count_limit = parse_number<unsigned int>(s3_retry_count, *v);
        }
        if (auto v = _env(s3_wait_time_seconds)) {
            _cfg.retry_wait_seconds = parse_number<int>(s3_wait_time_seconds, *v);
        }
        if (auto v = _env(s3_max_wait_time_seconds)) {
            _cfg.max_retry_wait_seconds = parse_number<int>(s3_max_wait_time_seconds, *v);
        }
        if (auto v = _env(s3_non_data_transfer_timeout_seconds)) {
            _cfg.non_data_transfer_timeout_seconds = parse_number<unsigned int>(s3_non_data_transfer_timeout_seconds, *v);
        }
        if (auto v = _env(s3_server_encrypt)) {
            _cfg.server_encrypt_flag = parse_flag(s3_server_encrypt, *v);
        }
        if (auto v = _env(s3_auth_file)) {
            _cfg.keyfile = *v;
        }

        if (_cfg.max_retry_wait_seconds < _cfg.retry_wait_seconds) {
            logger::warn("{} ({}) is less than {} ({}), using {}",
                         s3_max_wait_time_seconds, _cfg.max_retry_wait_seconds,
                         s3_wait_time_seconds, _cfg.retry_wait_seconds, _cfg.retry_wait_seconds);
            _cfg.max_retry_wait_seconds = _cfg.retry_wait_seconds;
        }
    } // end apply_environment

    void read_keys(const std::string& _keyfile, std::string& _access_key, std::string& _secret_access_key)
    {
        // open and read keyfile
        std::ifstream key_ifs;

        key_ifs.open(_keyfile.c_str());
        if (!key_ifs.good()) {
            throw configuration_error{fmt::format("Failed to open S3 auth file: \"{}\"", _keyfile)};
        }

        if (!std::getline(key_ifs, _access_key)) {
            throw configuration_error{fmt::format("Could not read access key from \"{}\"", _keyfile)};
        }
        if (!std::getline(key_ifs, _secret_access_key)) {
            throw configuration_error{fmt::format("Could not read secret key from \"{}\"", _keyfile)};
        }

        boost::algorithm::trim(_access_key);
        boost::algorithm::trim(_secret_access_key);

        if (_access_key.empty() || _secret_access_key.empty()) {
            throw configuration_error{fmt::format("Read an empty key from \"{}\". Expected 2 lines.", _keyfile)};
        }
    } // end read_keys

    void resolve_credentials(config& _cfg, const environment_lookup& _env)
    {
        if (auto key_id = _env(s3_key_id)) {
            _cfg.access_key = *key_id;
            if (auto secret = _env(s3_access_key)) {
                _cfg.secret_access_key = *secret;
            }
            if (_cfg.secret_access_key.empty()) {
                throw configuration_error{fmt::format("{} is set but {} is not", s3_key_id, s3_access_key)};
            }
            logger::debug("{}:{} ({}) using credentials from the environment", __FILE__, __LINE__, __func__);
            return;
        }

        if (_cfg.keyfile.empty()) {
            throw configuration_error{fmt::format("No S3 credentials found. Set {} and {} or provide a keyfile.",
                                                  s3_key_id, s3_access_key)};
        }

        read_keys(_cfg.keyfile, _cfg.access_key, _cfg.secret_access_key);
        logger::debug("{}:{} ({}) using credentials from [{}]", __FILE__, __LINE__, __func__, _cfg.keyfile);
    } // end resolve_credentials

    auto get_protocol(const config& _cfg) -> S3Protocol
    {
        if (boost::iequals(_cfg.s3_protocol_str, "http")) {
            return S3ProtocolHTTP;
        }
        return S3ProtocolHTTPS;
    }

    auto get_uri_request_style(const config& _cfg) -> S3UriStyle
    {
        if (boost::iequals(_cfg.s3_uri_request_style, "virtual") ||
                boost::iequals(_cfg.s3_uri_request_style, "host") ||
                boost::iequals(_cfg.s3_uri_request_style, "virtualhost")) {
            return S3UriStyleVirtualHost;
        }
        return S3UriStylePath;
    }

    auto get_sts_date(const config& _cfg) -> S3STSDate
    {
        if (boost::iequals(_cfg.s3_sts_date_str, "date")) {
            return S3STSDateOnly;
        }
        if (boost::iequals(_cfg.s3_sts_date_str, "both")) {
            return S3STSAmzAndDate;
        }
        return S3STSAmzOnly;
    }

} // namespace s3_multipart
