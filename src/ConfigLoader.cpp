#include "ConfigLoader.hpp"
#include "Logger.hpp"

#include <fstream>
#include <yaml-cpp/yaml.h>

namespace {

std::vector<std::string> readStringList(const YAML::Node& node, const char* key) {
    if (!node.IsSequence())
        throw ConfigError(std::string("'") + key + "' must be a list");
    std::vector<std::string> out;
    out.reserve(node.size());
    for (const auto& item : node) {
        if (!item.IsScalar())
            throw ConfigError(std::string("'") + key + "' entries must be strings");
        out.push_back(item.as<std::string>());
    }
    return out;
}

void readWhois(const YAML::Node& node, WhoisOptions& opts) {
    if (!node.IsMap())
        throw ConfigError("'whois' must be a map");
    if (node["timeout_seconds"])
        opts.timeoutSeconds = node["timeout_seconds"].as<long>();
    if (node["port"])
        opts.port = node["port"].as<long>();
    if (node["root_server"])
        opts.rootServer = node["root_server"].as<std::string>();
    if (const YAML::Node servers = node["servers"]) {
        if (!servers.IsMap())
            throw ConfigError("'whois.servers' must be a map of tld: server");
        for (const auto& kv : servers)
            opts.servers[kv.first.as<std::string>()] = kv.second.as<std::string>();
    }
    if (opts.timeoutSeconds < 0 || opts.timeoutSeconds > WhoisClient::kMaxTimeoutSeconds)
        throw ConfigError("'whois.timeout_seconds' must be between 0 and " +
                          std::to_string(WhoisClient::kMaxTimeoutSeconds));
    if (opts.port < 1 || opts.port > 65535)
        throw ConfigError("'whois.port' must be between 1 and 65535");
}

void readScan(const YAML::Node& node, ScanConfig& cfg) {
    if (!node.IsMap())
        throw ConfigError("'scan' must be a map");
    if (node["workers"]) {
        int workers = node["workers"].as<int>();
        if (workers < 1)
            throw ConfigError("'scan.workers' must be at least 1");
        cfg.workers = static_cast<size_t>(workers);
    }
    if (node["strict"])
        cfg.strict = node["strict"].as<bool>();
}

ScanConfig fromNode(const YAML::Node& root) {
    ScanConfig cfg;
    // Пустой документ
    if (!root || root.IsNull())
        return cfg;
    if (!root.IsMap())
        throw ConfigError("configuration root must be a map");

    if (const YAML::Node tlds = root["top_level_domains"])
        cfg.tlds = readStringList(tlds, "top_level_domains");
    if (const YAML::Node whois = root["whois"])
        readWhois(whois, cfg.whois);
    if (const YAML::Node scan = root["scan"])
        readScan(scan, cfg);
    return cfg;
}

} // namespace

ScanConfig ConfigLoader::parse(const std::string& yaml) {
    return fromNode(YAML::Load(yaml));
}

ScanConfig ConfigLoader::load(const std::string& path) {
    std::ifstream in(path);
    if (!in) {
        Logger::debug("ConfigLoader: %s not found, using defaults", path.c_str());
        return ScanConfig();
    }
    ScanConfig cfg = fromNode(YAML::Load(in));
    Logger::debug("ConfigLoader: %zu TLDs from %s", cfg.tlds.size(), path.c_str());
    return cfg;
}
