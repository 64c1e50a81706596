#pragma once
#include "CommonTypes.hpp"

// domhunt <input_file> [--config=PATH|--config PATH] [--workers=N]
//         [--timeout=SECONDS] [--strict] [--logfile=PATH] [debug]
bool parseArgs(int argc, char* argv[], Args& args);

void printUsage(const char* argv0);
