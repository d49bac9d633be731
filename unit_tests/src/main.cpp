#define CATCH_CONFIG_RUNNER
#include <catch2/catch.hpp>

#include <irods/irods_logger.hpp>

#include <string>

extern std::string keyfile;
extern std::string hostname;

int main(int argc, char* argv[])
{
    Catch::Session session;

    // options used by the [live] tests
    using namespace Catch::clara;
    auto cli
        = session.cli()
        | Opt(hostname, "hostname")
            ["--hostname"]
            ("the S3 host (default: s3.amazonaws.com)")
        | Opt(keyfile, "keyfile")
            ["--keyfile"]
            ("the file holding the access key and secret access key");

    session.cli(cli);

    int return_code = session.applyCommandLine(argc, argv);
    if (return_code != 0) {
        return return_code;
    }

    irods::experimental::log::init(false, false);

    return session.run();
}
