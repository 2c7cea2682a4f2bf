#define CATCH_CONFIG_RUNNER
#include <catch2/catch.hpp>

#include "util/logger.hpp"

#include <spdlog/spdlog.h>

using namespace Catch::clara;

int main(int argc, char* argv[])
{
    Catch::Session session;

    std::string log_level = "warn";

    auto cli = session.cli()
        | Opt(log_level, "level")["--log-level"](
                   "log level to apply to the test run (one of trace, debug, info, warn, error, critical or off)");

    session.cli(cli);

    if (int rc = session.applyCommandLine(argc, argv); rc != 0)
        return rc;

    devhttps::util::LogConfig log_config;
    log_config.level = devhttps::util::Logger::parse_level(log_level).value_or(devhttps::util::LogLevel::Warn);
    log_config.enable_colors = false;
    devhttps::util::Logger::init(log_config);

    int result = session.run();

    devhttps::util::Logger::instance().flush();
    return result;
}
