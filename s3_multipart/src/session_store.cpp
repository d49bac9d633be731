#include "s3_multipart/session_store.hpp"
#include "s3_multipart/exceptions.hpp"
#include "s3_multipart/logging_category.hpp"

#include <boost/filesystem.hpp>

#include <fmt/format.h>
#include <nlohmann/json.hpp>

#include <fstream>
#include <sstream>
#include <utility>

namespace fs = boost::filesystem;

namespace s3_multipart
{
    auto serialize_session(const upload_session& _session) -> std::string
    {
        return session_to_json(_session).dump(4);
    }

    auto parse_session(const std::string& _document) -> upload_session
    {
        try {
            return session_from_json(nlohmann::json::parse(_document));
        }
        catch (const nlohmann::json::exception& e) {
            throw corrupt_state_error{fmt::format("Failed to parse session record: {}", e.what())};
        }
    }

    file_session_store::file_session_store(fs::path _path)
        : path_{std::move(_path)}
    {
    }

    auto file_session_store::exists() const -> bool
    {
        boost::system::error_code ec;
        return fs::exists(path_, ec);
    }

    auto file_session_store::raw() const -> std::optional<std::string>
    {
        if (!exists()) {
            return std::nullopt;
        }

        std::ifstream ifs{path_.string(), std::ios::in | std::ios::binary};
        if (!ifs) {
            throw corrupt_state_error{fmt::format("Failed to open session record [{}]", path_.string())};
        }

        std::ostringstream ss;
        ss << ifs.rdbuf();
        return ss.str();
    } // end raw

    auto file_session_store::load() const -> upload_session
    {
        auto document = raw();
        if (!document) {
            throw precondition_error{error_codes::NO_ACTIVE_SESSION, "No active multipart upload in progress!"};
        }

        logger::trace("{}:{} ({}) loaded [{}] ({} bytes)", __FILE__, __LINE__, __func__, path_.string(), document->size());

        return parse_session(*document);
    }

    void file_session_store::save(const upload_session& _session)
    {
        const auto document = serialize_session(_session);

        auto tmp_path = path_;
        tmp_path += ".tmp";

        {
            std::ofstream ofs{tmp_path.string(), std::ios::out | std::ios::binary | std::ios::trunc};
            ofs << document;
            ofs.flush();
            if (!ofs) {
                ofs.close();
                boost::system::error_code ec;
                fs::remove(tmp_path, ec);
                throw multipart_error{error_codes::STATE_WRITE_ERROR,
                    fmt::format("Failed to write session record [{}]", tmp_path.string())};
            }
        }

        boost::system::error_code ec;
        fs::rename(tmp_path, path_, ec);
        if (ec) {
            fs::remove(tmp_path, ec);
            throw multipart_error{error_codes::STATE_WRITE_ERROR,
                fmt::format("Failed to replace session record [{}]", path_.string())};
        }

        logger::debug("{}:{} ({}) saved [{}] [upload_id={}][parts={}]",
                      __FILE__, __LINE__, __func__, path_.string(), _session.upload_id, _session.parts.size());
    } // end save

    void file_session_store::remove()
    {
        boost::system::error_code ec;
        fs::remove(path_, ec);
        if (ec) {
            throw multipart_error{error_codes::STATE_WRITE_ERROR,
                fmt::format("Failed to remove session record [{}]: {}", path_.string(), ec.message())};
        }
    }

    auto memory_session_store::exists() const -> bool
    {
        return document_.has_value();
    }

    auto memory_session_store::load() const -> upload_session
    {
        if (!document_) {
            throw precondition_error{error_codes::NO_ACTIVE_SESSION, "No active multipart upload in progress!"};
        }
        return parse_session(*document_);
    }

    void memory_session_store::save(const upload_session& _session)
    {
        document_ = serialize_session(_session);
        ++save_count_;
    }

    void memory_session_store::remove()
    {
        document_.reset();
    }

    auto memory_session_store::raw() const -> std::optional<std::string>
    {
        return document_;
    }

    void memory_session_store::set_raw(std::optional<std::string> _document)
    {
        document_ = std::move(_document);
    }

} // namespace s3_multipart
