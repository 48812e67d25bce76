#include "clewdr/cli/app.hpp"

int main(int argc, char** argv) {
    clewdr::cli::App app;
    return app.run(argc, argv);
}
