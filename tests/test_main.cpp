#define CATCH_CONFIG_RUNNER
#include <catch2/catch.hpp>

#include "common/Logging.h"

int main(int argc, char* argv[]) {
    // keep test output readable; failures are reported by Catch
    deskrelay::common::Logging::init(deskrelay::common::LogLevel::Error);
    return Catch::Session().run(argc, argv);
}
