#include <iostream>

#include "app/app_bootstrapper.h"

int main(int argc, char* argv[]) {
    std::cout << "Cobalt Tester (GTK4)" << std::endl;

    try {
        AppBootstrapper app;
        return app.run(argc, argv);
    } catch (const std::exception& e) {
        std::cerr << "💥 FATAL ERROR: " << e.what() << std::endl;
        return 1;
    }
}
