#include "cli/CliMain.hpp"

int main(int argc, char** argv) { return gridatlas::GridAtlasCliMain(argc, argv); }
