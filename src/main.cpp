#include "App.hpp"
#include "AvailabilityProbe.hpp"
#include "CommandLine.hpp"
#include "CommonTypes.hpp"
#include "ConfigLoader.hpp"
#include "CurlShare.hpp"
#include "Logger.hpp"
#include "WhoisClient.hpp"

#include <cstdio>
#include <iostream>
#include <string>
#include <yaml-cpp/yaml.h>

static void closeLog(FILE*& fp) {
    if (!fp) return;
    Logger::setFile(nullptr);
    std::fclose(fp);
    fp = nullptr;
}

int main(int argc, char* argv[]) {
    Args args;

    if (!parseArgs(argc, argv, args)) {
        printUsage(argv[0]);
        return 1;
    }

    Logger::init(args.debug ? Logger::Level::Debug : Logger::Level::Info);

    FILE* logfp = nullptr;
    if (!args.logfile.empty()) {
        logfp = std::fopen(args.logfile.c_str(), "w");
        if (!logfp) {
            std::fprintf(stderr, "Cannot open logfile: %s\n", args.logfile.c_str());
            return 1;
        }
        Logger::setFile(logfp);
    }

    // 1) конфиг: отсутствие файла не ошибка, битый документ фатален
    ScanConfig cfg;
    try {
        cfg = ConfigLoader::load(args.config);
    } catch (const YAML::Exception& e) {
        Logger::error("Malformed config %s: %s", args.config.c_str(), e.what());
        closeLog(logfp);
        return 1;
    } catch (const ConfigError& e) {
        Logger::error("Invalid config %s: %s", args.config.c_str(), e.what());
        closeLog(logfp);
        return 1;
    }
    applyOverrides(cfg, args);

    // 2) libcurl + общий DNS-кеш на всё время скана
    int rc = 0;
    {
        CurlGlobal curl;
        if (!curl.ok()) {
            closeLog(logfp);
            return 1;
        }

        WhoisClient client(cfg.whois);
        WhoisProbe  probe(client);

        // 3) скан; ошибки запросов уже свёрнуты в вердикты
        try {
            runScan(args, cfg, probe, std::cout);
        } catch (const std::exception& e) {
            Logger::error("Scan aborted: %s", e.what());
            rc = 1;
        }
    }

    closeLog(logfp);
    return rc;
}
