#include "app/SourceProofApp.hpp"

int main(int argc, char** argv) {
    sourceproof::app::SourceProofApp app;
    return app.Run(argc, argv);
}
