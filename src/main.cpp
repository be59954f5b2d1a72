#include "AppController.hpp"

int main(int argc, char** argv) {
    AppController app;
    return app.run(argc, argv);
}
