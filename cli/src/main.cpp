#include "s3_multipart/config.hpp"
#include "s3_multipart/deferred_storage_client.hpp"
#include "s3_multipart/exceptions.hpp"
#include "s3_multipart/libs3_storage_client.hpp"
#include "s3_multipart/logging_category.hpp"
#include "s3_multipart/multipart_upload.hpp"
#include "s3_multipart/session_store.hpp"

#include <irods/irods_logger.hpp>

#include <boost/algorithm/string/predicate.hpp>
#include <boost/algorithm/string/trim.hpp>
#include <boost/program_options.hpp>

#include <fmt/color.h>
#include <fmt/format.h>

#include <cstdio>
#include <cstdlib>
#include <iostream>
#include <memory>
#include <string>
#include <vector>

namespace po = boost::program_options;

namespace
{
    using namespace s3_multipart;

    const char* const usage_text =
        "Usage: s3multipart [OPTIONS] COMMAND [ARGS]...\n"
        "\n"
        "Commands:\n"
        "  init BUCKET KEY         start a multipart upload of s3://BUCKET/KEY\n"
        "  upload SOURCE_FOLDER    upload the part files in SOURCE_FOLDER\n"
        "  finalize                assemble the uploaded parts into the object\n"
        "  abort                   discard the multipart upload\n"
        "  status                  show the multipart upload in progress\n";

    void print_usage(const po::options_description& _desc)
    {
        std::cout << usage_text << '\n' << _desc << '\n';
    }

    void require_arguments(const std::string& _command,
                           const std::vector<std::string>& _args,
                           std::size_t _count,
                           const char* _names)
    {
        if (_args.size() != _count) {
            throw po::error{fmt::format("'{}' expects {} argument(s): {}", _command, _count, _names)};
        }
    }

    bool confirm(const std::string& _question)
    {
        fmt::print("{} [y/N]: ", _question);
        std::fflush(stdout);

        std::string answer;
        if (!std::getline(std::cin, answer)) {
            return false;
        }

        boost::algorithm::trim(answer);
        return boost::iequals(answer, "y") || boost::iequals(answer, "yes");
    }

    int do_init(multipart_upload& _upload, const config& _cfg, const std::string& _bucket, const std::string& _key)
    {
        const auto session = _upload.init(_bucket, _key, _cfg.server_encrypt_flag);
        fmt::print(fg(fmt::color::green), "Started multipart upload for s3://{}/{}\n", session.bucket, session.key);
        logger::debug("{}:{} ({}) upload_id={}", __FILE__, __LINE__, __func__, session.upload_id);
        return 0;
    }

    int do_upload(multipart_upload& _upload, const std::string& _source_folder, bool _assume_yes, bool _reupload)
    {
        // local input is checked here, before any credentials are needed
        const auto plan = _upload.plan_upload(_source_folder);

        fmt::print(fg(fmt::color::green), "Found the following file parts in {}:\n", _source_folder);
        for (const auto& planned : plan.parts) {
            fmt::print(fg(fmt::color::blue), "{}", planned.part.filename);
            if (planned.already_completed) {
                fmt::print(" ({})", _reupload ? "will be uploaded again" : "already uploaded");
            }
            fmt::print("\n");
        }

        const auto pending = plan.pending_count(_reupload);
        if (pending == 0) {
            fmt::print(fg(fmt::color::green), "All parts are already uploaded to s3://{}/{}\n",
                       plan.session.bucket, plan.session.key);
            return 0;
        }

        if (!_assume_yes && !confirm("Proceed?")) {
            return 0;
        }

        upload_options options;
        options.reupload = _reupload;

        auto progress = [](const planned_part& _p, std::size_t _index, std::size_t _total, part_outcome _outcome) {
            switch (_outcome) {
                case part_outcome::STARTING:
                    fmt::print("[{}/{}] Uploading {} as part {} ... ", _index, _total, _p.part.filename, _p.part.part_number);
                    std::fflush(stdout);
                    break;
                case part_outcome::UPLOADED:
                    fmt::print(fg(fmt::color::green), "done\n");
                    break;
                case part_outcome::SKIPPED:
                    fmt::print(fg(fmt::color::yellow), "[{}/{}] Skipping {}, part {} already uploaded\n",
                               _index, _total, _p.part.filename, _p.part.part_number);
                    break;
            }
        };

        const auto summary = _upload.commit_upload(plan, options, progress);

        fmt::print(fg(fmt::color::green), "Uploaded {} part(s), skipped {}, {} part(s) recorded for s3://{}/{}\n",
                   summary.uploaded, summary.skipped, summary.recorded, plan.session.bucket, plan.session.key);
        return 0;
    }

    int do_finalize(multipart_upload& _upload)
    {
        const auto session = _upload.current();
        _upload.finalize();
        fmt::print(fg(fmt::color::green), "Finalized multipart upload for s3://{}/{}\n", session->bucket, session->key);
        return 0;
    }

    int do_abort(multipart_upload& _upload)
    {
        const auto session = _upload.current();
        _upload.abort();
        fmt::print(fg(fmt::color::yellow), "Aborted multipart upload for s3://{}/{}\n", session->bucket, session->key);
        return 0;
    }

    int do_status(const multipart_upload& _upload, const file_session_store& _store)
    {
        const auto session = _upload.current();
        if (!session) {
            fmt::print("No active multipart upload in progress!\n");
            return 0;
        }

        fmt::print("Multipart upload in progress for s3://{}/{}\n", session->bucket, session->key);
        fmt::print("  upload id:  {}\n", session->upload_id);
        fmt::print("  state file: {}\n", _store.path().string());
        fmt::print("  parts:      {}\n", session->parts.size());
        for (const auto& part : session->parts) {
            fmt::print("    {:>5}  {}\n", part.part_number, part.etag);
        }
        return 0;
    }

} // anonymous namespace

int main(int argc, char* argv[])
{
    po::options_description desc{"Options"};
    desc.add_options()
        ("help,h", "show this message and exit")
        ("host", po::value<std::string>(), "S3 endpoint host name [env: S3_DEFAULT_HOSTNAME]")
        ("region", po::value<std::string>(), "S3 region [env: S3_REGIONNAME]")
        ("protocol", po::value<std::string>(), "http or https [env: S3_PROTO]")
        ("uri-style", po::value<std::string>(), "path or virtual [env: S3_URI_REQUEST_STYLE]")
        ("sts-date", po::value<std::string>(), "amz, date or both [env: S3_STSDATE]")
        ("retries", po::value<unsigned int>(), "retry limit for each request [env: S3_RETRY_COUNT]")
        ("keyfile", po::value<std::string>(), "file holding the access key id and secret key [env: S3_AUTH_FILE]")
        ("state-file", po::value<std::string>(), "where the upload session is recorded (default: multipart.json)")
        ("yes,y", po::bool_switch(), "upload without asking for confirmation")
        ("reupload", po::bool_switch(), "upload parts again even if already recorded")
        ("verbose,v", po::bool_switch(), "log at debug level instead of warnings only");

    po::options_description hidden;
    hidden.add_options()
        ("command", po::value<std::string>())
        ("args", po::value<std::vector<std::string>>()->default_value(std::vector<std::string>{}, ""));

    po::options_description all;
    all.add(desc).add(hidden);

    po::positional_options_description positional;
    positional.add("command", 1);
    positional.add("args", -1);

    try {
        po::variables_map vm;
        po::store(po::command_line_parser(argc, argv).options(all).positional(positional).run(), vm);
        po::notify(vm);

        if (vm.count("help") || !vm.count("command")) {
            print_usage(desc);
            return vm.count("help") ? 0 : 1;
        }

        const bool verbose = vm["verbose"].as<bool>();
        // warnings reach the terminal, --verbose adds the debug trail
        irods::experimental::log::init(true, false);
        logger::set_level(verbose ? irods::experimental::log::level::debug : irods::experimental::log::level::warn);

        const auto env = process_environment();

        config cfg;
        apply_environment(cfg, env);

        if (vm.count("host"))       { cfg.hostname = vm["host"].as<std::string>(); }
        if (vm.count("region"))     { cfg.region_name = vm["region"].as<std::string>(); }
        if (vm.count("protocol"))   { cfg.s3_protocol_str = vm["protocol"].as<std::string>(); }
        if (vm.count("uri-style"))  { cfg.s3_uri_request_style = vm["uri-style"].as<std::string>(); }
        if (vm.count("sts-date"))   { cfg.s3_sts_date_str = vm["sts-date"].as<std::string>(); }
        if (vm.count("retries"))    { cfg.retry_count_limit = vm["retries"].as<unsigned int>(); }
        if (vm.count("keyfile"))    { cfg.keyfile = vm["keyfile"].as<std::string>(); }
        if (vm.count("state-file")) { cfg.state_file = vm["state-file"].as<std::string>(); }

        const auto command = vm["command"].as<std::string>();
        const auto args = vm["args"].as<std::vector<std::string>>();

        file_session_store store{cfg.state_file};

        deferred_storage_client client{[&cfg, &env]() -> std::unique_ptr<storage_client> {
            auto resolved = cfg;
            resolve_credentials(resolved, env);
            return std::make_unique<libs3_storage_client>(std::move(resolved));
        }};

        multipart_upload upload{store, client};

        try {
            if (command == "init") {
                require_arguments(command, args, 2, "BUCKET KEY");
                return do_init(upload, cfg, args[0], args[1]);
            }
            if (command == "upload") {
                require_arguments(command, args, 1, "SOURCE_FOLDER");
                return do_upload(upload, args[0], vm["yes"].as<bool>(), vm["reupload"].as<bool>());
            }
            if (command == "finalize") {
                require_arguments(command, args, 0, "none");
                return do_finalize(upload);
            }
            if (command == "abort") {
                require_arguments(command, args, 0, "none");
                return do_abort(upload);
            }
            if (command == "status") {
                require_arguments(command, args, 0, "none");
                return do_status(upload, store);
            }
        }
        catch (const remote_rejected_error& e) {
            logger::error("{}:{} ({}) {}", __FILE__, __LINE__, __func__, e.what());
            fmt::print(fg(fmt::color::red), "Bad HTTP response\n");
            fmt::print(fg(fmt::color::red), "{}\n", e.payload().dump(2));
            return 1;
        }
        catch (const multipart_error& e) {
            logger::debug("{}:{} ({}) [{}] {}", __FILE__, __LINE__, __func__, to_string(e.code()), e.what());
            fmt::print(fg(fmt::color::red), "{}\n", e.what());
            return 1;
        }

        throw po::error{fmt::format("unknown command '{}'", command)};
    }
    catch (const po::error& e) {
        fmt::print(stderr, fg(fmt::color::red), "Error: {}\n\n", e.what());
        print_usage(desc);
        return 1;
    }
    catch (const configuration_error& e) {
        fmt::print(stderr, fg(fmt::color::red), "{}\n", e.what());
        return 1;
    }
    catch (const std::exception& e) {
        fmt::print(stderr, fg(fmt::color::red), "Unexpected error: {}\n", e.what());
        return 1;
    }
}
