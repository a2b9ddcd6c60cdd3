#define DOCTEST_CONFIG_IMPLEMENT
#include <doctest/doctest.h>
#include <pathbind/log/TaggedLogger.hpp>

#include <cstdlib>
#include <string_view>

// Binding and state cases provoke warnings on purpose. Diagnostics stay off
// unless PATHBIND_LOG is set to something other than "0".
int main(int argc, char** argv) {
    char const* env     = std::getenv("PATHBIND_LOG");
    bool const  verbose = env && std::string_view(env) != "0";

    PB::set_thread_name("TestMain");
    PB::set_logging_enabled(verbose);
    PB::logger().setWarningsEnabled(verbose);

    doctest::Context context;
    context.applyCommandLine(argc, argv);
    return context.run();
}
