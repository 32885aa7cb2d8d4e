#include "app/PioneerApp.hpp"

int main(int argc, char** argv) {
    pioneer::app::PioneerApp app;
    return app.Run(argc, argv);
}
