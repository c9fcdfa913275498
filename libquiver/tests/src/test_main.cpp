#include <catch2/catch_session.hpp>

#include "quiver/core/logging.hpp"

int
main(int argc, char* argv[])
{
    Catch::Session session;

    // Tests are written to run in declaration order
    session.configData().runOrder = Catch::TestRunOrder::Declared;

    int returnCode = session.applyCommandLine(argc, argv);
    if (returnCode != 0)
    {
        return returnCode;
    }

    // Debug records of absorbed cache anomalies help diagnose failures
    quiver::logging::set_log_level(quiver::log_level::debug);

    return session.run();
}
