#define DOCTEST_CONFIG_IMPLEMENT
#include <doctest/doctest.h>

#include <glibmm.h>

int main(int argc, char** argv) {
    Glib::init();

    doctest::Context context;
    context.applyCommandLine(argc, argv);
    return context.run();
}
