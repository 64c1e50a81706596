// CommonTypes.hpp
#pragma once

#include <cstddef>
#include <string>
#include <vector>

struct Candidate {
    std::string domain;
    std::string base;
};

inline bool operator==(const Candidate& a, const Candidate& b) {
    return a.domain == b.domain && a.base == b.base;
}

enum class Verdict { Registered, Available, QueryFailed };

struct ProbeResult {
    Verdict     verdict = Verdict::Registered;
    std::string reason; // заполняется только для QueryFailed
};

struct UnverifiedDomain {
    std::string domain;
    std::string reason;
};

struct ScanReport {
    std::vector<std::string>      available;
    std::vector<UnverifiedDomain> unverified; // только в strict-режиме
    size_t checked    = 0;
    size_t registered = 0;
    size_t failed     = 0;
};

struct Args {
    std::string input;
    std::string config = "config.yaml";
    std::string logfile;
    int  workers = 0;   // 0 = взять из конфига
    long timeout = -1;  // -1 = взять из конфига
    bool strict  = false;
    bool debug   = false;
};
