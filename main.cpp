#include "app/DeepResearchApp.hpp"
#include <exception>
#include <iostream>

int main(int argc, char** argv) {
    try {
        deepresearch::app::DeepResearchApp app;
        return app.Run(argc, argv);
    } catch (const std::exception& e) {
        std::cerr << "[main] Fatal: " << e.what() << std::endl;
        return 1;
    }
}
