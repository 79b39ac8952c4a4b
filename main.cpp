#include "app/SmartCookApp.hpp"

int main(int argc, char** argv) {
    smartcook::app::SmartCookApp app;
    return app.Run(argc, argv);
}
