#include "CommandLine.hpp"
#include "WhoisClient.hpp"

#include <cerrno>
#include <climits>
#include <cstdio>
#include <cstdlib>
#include <string>

static bool parseLong(const std::string& s, long& out) {
    if (s.empty()) return false;
    char* end = nullptr;
    errno = 0;
    long v = std::strtol(s.c_str(), &end, 10);
    if (errno != 0 || *end != '\0') return false;
    out = v;
    return true;
}

bool parseArgs(int argc, char* argv[], Args& args) {
    bool haveInput = false;
    for (int i = 1; i < argc; ++i) {
        std::string s(argv[i]);
        long v = 0;
        if (s == "debug") {
            args.debug = true;
        } else if (s == "--strict") {
            args.strict = true;
        } else if (s == "--config") {
            if (i + 1 >= argc) {
                std::fprintf(stderr, "--config requires a path\n");
                return false;
            }
            args.config = argv[++i];
        } else if (s.rfind("--config=", 0) == 0) {
            args.config = s.substr(9);
        } else if (s.rfind("--workers=", 0) == 0) {
            if (!parseLong(s.substr(10), v) || v <= 0 || v > INT_MAX) {
                std::fprintf(stderr, "Invalid --workers value: %s\n", s.c_str() + 10);
                return false;
            }
            args.workers = int(v);
        } else if (s.rfind("--timeout=", 0) == 0) {
            if (!parseLong(s.substr(10), v) || v < 0 || v > WhoisClient::kMaxTimeoutSeconds) {
                std::fprintf(stderr, "Invalid --timeout value: %s\n", s.c_str() + 10);
                return false;
            }
            args.timeout = v;
        } else if (s.rfind("--logfile=", 0) == 0) {
            args.logfile = s.substr(10);
        } else if (s.rfind("--", 0) == 0) {
            std::fprintf(stderr, "Unknown argument: %s\n", s.c_str());
            return false;
        } else if (!haveInput) {
            args.input = s;
            haveInput = true;
        } else {
            std::fprintf(stderr, "Unexpected argument: %s\n", s.c_str());
            return false;
        }
    }
    if (!haveInput) {
        std::fprintf(stderr, "Required argument: input_file\n");
        return false;
    }
    return true;
}

void printUsage(const char* argv0) {
    std::fprintf(stderr,
        "Usage: %s input_file [--config=config.yaml] [--workers=N] [--timeout=SECONDS] "
        "[--strict] [--logfile=...] [debug]\n"
        "  --timeout  budget for one domain lookup (referral and query, connect and\n"
        "             transfer), 0..%ld seconds, 0 = unlimited\n",
        argv0, WhoisClient::kMaxTimeoutSeconds);
}
