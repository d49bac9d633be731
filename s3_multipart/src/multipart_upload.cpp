#include "s3_multipart/multipart_upload.hpp"
#include "s3_multipart/exceptions.hpp"
#include "s3_multipart/logging_category.hpp"

#include <fmt/format.h>

#include <algorithm>
#include <utility>

namespace s3_multipart
{
    auto upload_plan::pending_count(bool _reupload) const -> std::size_t
    {
        if (_reupload) {
            return parts.size();
        }
        return static_cast<std::size_t>(std::count_if(parts.cbegin(), parts.cend(),
                                                      [](const planned_part& _p) { return !_p.already_completed; }));
    }

    multipart_upload::multipart_upload(session_store& _store, storage_client& _client)
        : store_{_store}
        , client_{_client}
        , state_{_store.exists() ? upload_state::ACTIVE : upload_state::NONE}
    {
    }

    auto multipart_upload::current() const -> std::optional<upload_session>
    {
        if (!store_.exists()) {
            return std::nullopt;
        }
        return store_.load();
    }

    auto multipart_upload::require_active() const -> upload_session
    {
        if (!store_.exists()) {
            throw precondition_error{error_codes::NO_ACTIVE_SESSION, "No active multipart upload in progress!"};
        }
        return store_.load();
    }

    auto multipart_upload::init(const std::string& _bucket, const std::string& _key, bool _server_side_encryption)
        -> upload_session
    {
        if (store_.exists()) {
            state_ = upload_state::ACTIVE;

            std::string description{"A multipart upload"};
            try {
                auto existing = store_.load();
                description = fmt::format("A multipart upload for s3://{}/{} [upload_id={}]",
                                          existing.bucket, existing.key, existing.upload_id);
            }
            catch (const corrupt_state_error& e) {
                logger::warn("{}:{} ({}) existing session record is unreadable: {}", __FILE__, __LINE__, __func__, e.what());
            }

            throw precondition_error{error_codes::SESSION_ALREADY_EXISTS,
                fmt::format("{} is already in progress. Finalize or abort it first.", description)};
        }

        const auto response = client_.create_multipart_upload(_bucket, _key, _server_side_encryption);

        upload_session session;
        try {
            session = session_from_create_response(response);
        }
        catch (const corrupt_state_error& e) {
            throw remote_error{fmt::format("Unusable response creating multipart upload of s3://{}/{}: {}",
                                           _bucket, _key, e.what()), "InvalidResponse"};
        }

        store_.save(session);
        state_ = upload_state::ACTIVE;

        logger::info("{}:{} ({}) started multipart upload [bucket={}][key={}][upload_id={}]",
                     __FILE__, __LINE__, __func__, session.bucket, session.key, session.upload_id);

        return session;
    } // end init

    auto multipart_upload::plan_upload(const boost::filesystem::path& _source_folder) const -> upload_plan
    {
        auto session = require_active();

        upload_plan plan;
        plan.source_folder = _source_folder;

        for (auto& part : resolve_part_set(_source_folder)) {
            const bool done = session.has_part(part.part_number);
            plan.parts.push_back(planned_part{std::move(part), done});
        }

        plan.session = std::move(session);

        return plan;
    } // end plan_upload

    auto multipart_upload::commit_upload(const upload_plan& _plan,
                                         const upload_options& _options,
                                         const progress_callback& _progress) -> upload_summary
    {
        const auto session = require_active();

        if (session.upload_id != _plan.session.upload_id) {
            throw precondition_error{error_codes::NO_ACTIVE_SESSION,
                fmt::format("The active upload changed since the plan was made [planned={}][active={}]",
                            _plan.session.upload_id, session.upload_id)};
        }

        upload_summary summary;
        const auto total = _plan.parts.size();
        std::size_t index = 0;

        auto report = [&_progress, total](const planned_part& _p, std::size_t _i, part_outcome _o) {
            if (_progress) {
                _progress(_p, _i, total, _o);
            }
        };

        for (const auto& planned : _plan.parts) {
            ++index;

            // the record is authoritative, the plan may be older than the last run
            if (!_options.reupload && session.has_part(planned.part.part_number)) {
                logger::debug("{}:{} ({}) part {} [{}] already recorded, skipping",
                              __FILE__, __LINE__, __func__, planned.part.part_number, planned.part.filename);
                ++summary.skipped;
                report(planned, index, part_outcome::SKIPPED);
                continue;
            }

            report(planned, index, part_outcome::STARTING);

            const auto etag = client_.upload_part(session.bucket, session.key, session.upload_id,
                                                  planned.part.part_number, planned.part.path);

            // re-read so that the record on disk is the one being extended
            auto latest = store_.load();
            latest.upsert_part(planned.part.part_number, strip_etag_quotes(etag));
            store_.save(latest);

            summary.recorded = latest.parts.size();
            ++summary.uploaded;

            logger::info("{}:{} ({}) uploaded part {} [{}] [{} bytes][etag={}]",
                         __FILE__, __LINE__, __func__, planned.part.part_number, planned.part.filename,
                         planned.part.size, etag);

            report(planned, index, part_outcome::UPLOADED);
        }

        if (summary.uploaded == 0) {
            summary.recorded = session.parts.size();
        }

        return summary;
    } // end commit_upload

    auto multipart_upload::finalize() -> remote_response
    {
        const auto session = require_active();

        logger::debug("{}:{} ({}) completing [bucket={}][key={}][upload_id={}][parts={}]",
                      __FILE__, __LINE__, __func__, session.bucket, session.key, session.upload_id, session.parts.size());

        auto response = client_.complete_multipart_upload(session.bucket, session.key, session.upload_id, session.parts);

        if (!response.confirmed) {
            throw remote_rejected_error{
                fmt::format("Bad HTTP response completing s3://{}/{} [{}]", session.bucket, session.key, response.status_name),
                response.payload};
        }

        store_.remove();
        state_ = upload_state::FINALIZED;

        logger::info("{}:{} ({}) finalized multipart upload [bucket={}][key={}][upload_id={}]",
                     __FILE__, __LINE__, __func__, session.bucket, session.key, session.upload_id);

        return response;
    } // end finalize

    auto multipart_upload::abort() -> remote_response
    {
        const auto session = require_active();

        auto response = client_.abort_multipart_upload(session.bucket, session.key, session.upload_id);

        if (!response.confirmed) {
            throw remote_rejected_error{
                fmt::format("Bad HTTP response aborting s3://{}/{} [{}]", session.bucket, session.key, response.status_name),
                response.payload};
        }

        store_.remove();
        state_ = upload_state::ABORTED;

        logger::info("{}:{} ({}) aborted multipart upload [bucket={}][key={}][upload_id={}]",
                     __FILE__, __LINE__, __func__, session.bucket, session.key, session.upload_id);

        return response;
    } // end abort

} // namespace s3_multipart
