#include "pagewright/cli/app.hpp"

auto main(int argc, char** argv) -> int {
    pagewright::cli::App app;
    return app.run(argc, argv);
}
