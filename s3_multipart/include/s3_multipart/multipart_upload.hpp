#ifndef S3_MULTIPART_MULTIPART_UPLOAD_HPP
#define S3_MULTIPART_MULTIPART_UPLOAD_HPP

#include "s3_multipart/part_set.hpp"
#include "s3_multipart/session_record.hpp"
#include "s3_multipart/session_store.hpp"
#include "s3_multipart/storage_client.hpp"
#include "s3_multipart/types.hpp"

#include <boost/filesystem/path.hpp>

#include <cstddef>
#include <functional>
#include <optional>
#include <string>
#include <vector>

namespace s3_multipart
{
    struct planned_part
    {
        part_file part;
        bool      already_completed;
    };

    // What an upload would transfer, computed without touching the network.
    struct upload_plan
    {
        boost::filesystem::path   source_folder;
        upload_session            session;
        std::vector<planned_part> parts;

        auto pending_count(bool _reupload) const -> std::size_t;
    };

    struct upload_options
    {
        // transfer parts that are already recorded as completed instead of skipping them
        bool reupload{false};
    };

    enum class part_outcome { STARTING, UPLOADED, SKIPPED };

    // Called before and after each part of commit_upload. _index counts from 1.
    using progress_callback = std::function<void(const planned_part& _part,
                                                 std::size_t _index,
                                                 std::size_t _total,
                                                 part_outcome _outcome)>;

    struct upload_summary
    {
        std::size_t uploaded{0};
        std::size_t skipped{0};
        std::size_t recorded{0};
    };

    // Drives one multipart upload session: init, then any number of uploads, then either
    // finalize or abort.
    //
    // Each operation checks its precondition before anything else and throws
    // precondition_error when the session is not in the required state. The record in
    // _store is the only state that survives between invocations.
    class multipart_upload
    {
    public:
        multipart_upload(session_store& _store, storage_client& _client);

        multipart_upload(const multipart_upload&) = delete;
        multipart_upload& operator=(const multipart_upload&) = delete;

        auto state() const noexcept -> upload_state { return state_; }

        // The active session, or std::nullopt when there is none.
        auto current() const -> std::optional<upload_session>;

        // Opens a remote session with server side encryption and records it. Nothing is
        // written locally unless the service returns an upload id.
        auto init(const std::string& _bucket, const std::string& _key, bool _server_side_encryption = true)
            -> upload_session;

        // Resolves the part files in _source_folder against the active session. Fails before
        // any network call when the folder is unusable.
        auto plan_upload(const boost::filesystem::path& _source_folder) const -> upload_plan;

        // Transfers the planned parts in order. Each completed part is recorded durably before
        // the next one starts. The first failure stops the run and propagates, leaving the
        // parts recorded so far in place.
        auto commit_upload(const upload_plan& _plan,
                           const upload_options& _options = {},
                           const progress_callback& _progress = {}) -> upload_summary;

        // Asks the service to assemble the recorded parts, in recorded order. The record is
        // removed only once the service confirms.
        auto finalize() -> remote_response;

        // Asks the service to discard the session. The record is removed only once the
        // service confirms.
        auto abort() -> remote_response;

    private:
        // Loads the record or throws precondition_error when there is none.
        auto require_active() const -> upload_session;

        session_store&  store_;
        storage_client& client_;
        upload_state    state_;
    }; // class multipart_upload

} // namespace s3_multipart

#endif // S3_MULTIPART_MULTIPART_UPLOAD_HPP
