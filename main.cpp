#include "peq/app.hpp"

int main(int argc, char** argv) {
    peq::App app;
    return app.run(argc, argv);
}
