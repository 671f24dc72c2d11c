#include "mcpevals/cli/app.hpp"

int main(int argc, char** argv) {
    mcpevals::cli::App app;
    return app.run(argc, argv);
}
