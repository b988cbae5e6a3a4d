#pragma once

// Entry point of the gridatlas command line tool, kept separate from main()
// so tests can drive the whole pipeline in-process.
//
// Implementation: src/cli/GridAtlasCli.cpp

namespace gridatlas {

// Exit codes: 0 success, 1 runtime failure, 2 usage or configuration error.
int GridAtlasCliMain(int argc, char** argv);

} // namespace gridatlas
