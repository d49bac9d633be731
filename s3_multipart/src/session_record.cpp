#include "s3_multipart/session_record.hpp"
#include "s3_multipart/exceptions.hpp"

#include <fmt/format.h>

#include <algorithm>
#include <iterator>
#include <utility>

namespace s3_multipart
{
    void upload_session::upsert_part(std::int64_t _part_number, const std::string& _etag)
    {
        auto same_number = [_part_number](const completed_part& _p) { return _p.part_number == _part_number; };

        auto it = std::find_if(parts.begin(), parts.end(), same_number);
        if (it == parts.end()) {
            parts.push_back(completed_part{_part_number, _etag});
            return;
        }

        it->etag = _etag;

        // older records may hold several entries for one part number, keep only the first
        parts.erase(std::remove_if(std::next(it), parts.end(), same_number), parts.end());
    } // end upsert_part

    auto upload_session::has_part(std::int64_t _part_number) const -> bool
    {
        return std::any_of(parts.cbegin(), parts.cend(),
                           [_part_number](const completed_part& _p) { return _p.part_number == _part_number; });
    }

    namespace
    {
        auto required_string(const nlohmann::json& _doc, const std::string& _key) -> std::string
        {
            const auto it = _doc.find(_key);
            if (it == _doc.end()) {
                throw corrupt_state_error{fmt::format("Session record is missing \"{}\"", _key)};
            }
            if (!it->is_string()) {
                throw corrupt_state_error{fmt::format("Session record field \"{}\" is not a string", _key)};
            }
            return it->get<std::string>();
        }
    } // anonymous namespace

    auto session_from_json(const nlohmann::json& _doc) -> upload_session
    {
        if (!_doc.is_object()) {
            throw corrupt_state_error{"Session record is not a JSON object"};
        }

        upload_session session;
        session.bucket    = required_string(_doc, record_keys::bucket);
        session.key       = required_string(_doc, record_keys::key);
        session.upload_id = required_string(_doc, record_keys::upload_id);

        if (session.upload_id.empty()) {
            throw corrupt_state_error{"Session record has an empty \"UploadId\""};
        }

        // "Parts" is absent until the first part completes in records written by older tools
        if (const auto parts = _doc.find(record_keys::parts); parts != _doc.end() && !parts->is_null()) {
            if (!parts->is_array()) {
                throw corrupt_state_error{"Session record field \"Parts\" is not an array"};
            }

            for (const auto& entry : *parts) {
                const auto number = entry.find(record_keys::part_number);
                const auto etag   = entry.find(record_keys::etag);

                if (!entry.is_object() || number == entry.end() || etag == entry.end() ||
                        !number->is_number_integer() || !etag->is_string()) {
                    throw corrupt_state_error{fmt::format("Malformed part entry in session record: {}", entry.dump())};
                }

                session.parts.push_back(completed_part{number->get<std::int64_t>(), etag->get<std::string>()});
            }
        }

        session.extra = _doc;
        for (const auto& key : {record_keys::bucket, record_keys::key, record_keys::upload_id, record_keys::parts}) {
            session.extra.erase(key);
        }

        return session;
    } // end session_from_json

    auto session_to_json(const upload_session& _session) -> nlohmann::json
    {
        nlohmann::json doc = _session.extra.is_object() ? _session.extra : nlohmann::json::object();

        doc[record_keys::bucket]    = _session.bucket;
        doc[record_keys::key]       = _session.key;
        doc[record_keys::upload_id] = _session.upload_id;

        auto parts = nlohmann::json::array();
        for (const auto& part : _session.parts) {
            parts.push_back({{record_keys::etag, part.etag}, {record_keys::part_number, part.part_number}});
        }
        doc[record_keys::parts] = std::move(parts);

        return doc;
    } // end session_to_json

    auto session_from_create_response(const nlohmann::json& _response) -> upload_session
    {
        auto session = session_from_json(_response);

        // a fresh session never carries completed parts
        session.parts.clear();

        return session;
    }

    auto strip_etag_quotes(const std::string& _etag) -> std::string
    {
        auto begin = _etag.find_first_not_of('"');
        if (begin == std::string::npos) {
            return {};
        }
        auto end = _etag.find_last_not_of('"');
        return _etag.substr(begin, end - begin + 1);
    }

} // namespace s3_multipart
