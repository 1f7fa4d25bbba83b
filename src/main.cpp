#include "glsurface/Config.h"
#include "glsurface/TriangleView.h"

#include <cstdlib>
#include <iostream>
#include <stdexcept>

int main(int argc, char** argv) {
    SurfaceConfig config;
    try {
        config = parseArgs(argc, argv);
    } catch (const std::invalid_argument& e) {
        std::cerr << "Error: " << e.what() << '\n' << usage(argv[0]);
        return 2;
    }

    if (config.showHelp) {
        std::cout << usage(argv[0]);
        return EXIT_SUCCESS;
    }

    try {
        TriangleView view(config);
        return view.run();
    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << std::endl;
        return EXIT_FAILURE;
    }
}
