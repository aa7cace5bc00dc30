#include "app/FolderMapperApp.hpp"

int main(int argc, char** argv) {
    foldermapper::app::FolderMapperApp app;
    return app.Run(argc, argv);
}
