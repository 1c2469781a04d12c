#include "arbor/app.h"

int main(int argc, char** argv) {
    arbor::App app;
    return app.run(argc, argv);
}
