// tests/test_main.cpp
//
// The only translation unit that defines DOCTEST_CONFIG_IMPLEMENT.
// Other test files include doctest without it.
#define DOCTEST_CONFIG_IMPLEMENT
#include <doctest/doctest.h>
#undef DOCTEST_CONFIG_IMPLEMENT

#include "mapstitch/core/Log.hpp"

#include <cstdlib>
#include <cstring>

namespace {

bool env_truthy(const char* v) {
    return v != nullptr && v[0] != '\0' && std::strcmp(v, "0") != 0;
}

} // namespace

int main(int argc, char** argv) {
    // combiner log lines would drown the test report; MAPSTITCH_TEST_LOG=1 brings them back
    mapstitch::setLogLevel(env_truthy(std::getenv("MAPSTITCH_TEST_LOG"))
                               ? mapstitch::LogLevel::Debug
                               : mapstitch::LogLevel::Off);

    doctest::Context context;
    context.setOption("order-by", "name");
    context.setOption("duration", true);

    if (env_truthy(std::getenv("CI"))) {
        context.setOption("no-breaks", true);
        context.setOption("no-colors", true);
    }

    context.applyCommandLine(argc, argv);
    return context.run();
}
