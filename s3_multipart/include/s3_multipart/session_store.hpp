#ifndef S3_MULTIPART_SESSION_STORE_HPP
#define S3_MULTIPART_SESSION_STORE_HPP

#include "s3_multipart/session_record.hpp"

#include <boost/filesystem/path.hpp>

#include <optional>
#include <string>

namespace s3_multipart
{
    // Durable home of at most one upload_session record.
    //
    // There is no locking. Running two commands against the same store at once is not
    // supported and the result is undefined.
    class session_store
    {
    public:
        virtual ~session_store() = default;

        virtual auto exists() const -> bool = 0;

        // Throws precondition_error (NO_ACTIVE_SESSION) when no record exists and
        // corrupt_state_error when the record cannot be parsed.
        virtual auto load() const -> upload_session = 0;

        // Replaces the record. A reader never sees a partially written record.
        virtual void save(const upload_session& _session) = 0;

        // Deletes the record. Does nothing when there is none.
        virtual void remove() = 0;

        // The serialized record exactly as stored, or std::nullopt when there is none.
        virtual auto raw() const -> std::optional<std::string> = 0;
    }; // class session_store

    // Stores the record as JSON in a single file, normally multipart.json in the current
    // working directory. Saves write a sibling temporary file and rename it into place.
    class file_session_store : public session_store
    {
    public:
        explicit file_session_store(boost::filesystem::path _path);

        auto exists() const -> bool override;
        auto load() const -> upload_session override;
        void save(const upload_session& _session) override;
        void remove() override;
        auto raw() const -> std::optional<std::string> override;

        auto path() const -> const boost::filesystem::path& { return path_; }

    private:
        boost::filesystem::path path_;
    }; // class file_session_store

    // Keeps the serialized record in memory.
    class memory_session_store : public session_store
    {
    public:
        memory_session_store() = default;

        auto exists() const -> bool override;
        auto load() const -> upload_session override;
        void save(const upload_session& _session) override;
        void remove() override;
        auto raw() const -> std::optional<std::string> override;

        // Replaces the stored text directly, bypassing serialization.
        void set_raw(std::optional<std::string> _document);

        auto save_count() const -> int { return save_count_; }

    private:
        std::optional<std::string> document_;
        int                        save_count_{0};
    }; // class memory_session_store

    // Serialization shared by the stores. Output is deterministic for a given session.
    auto serialize_session(const upload_session& _session) -> std::string;
    auto parse_session(const std::string& _document) -> upload_session;

} // namespace s3_multipart

#endif // S3_MULTIPART_SESSION_STORE_HPP
