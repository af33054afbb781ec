#include "buildprobe/cli/app.hpp"

int main(int argc, char** argv) {
    buildprobe::cli::App app;
    return app.run(argc, argv);
}
