#pragma once

#include <stdexcept>
#include <string>
#include <vector>
#include "WhoisClient.hpp"

struct ScanConfig {
    std::vector<std::string> tlds;
    WhoisOptions whois;
    size_t workers = 1;
    bool   strict  = false;
};

// Документ есть, но его форма не та (корень не map, список не список ...)
class ConfigError : public std::runtime_error {
public:
    explicit ConfigError(const std::string& what) : std::runtime_error(what) {}
};

class ConfigLoader {
public:
    // Нет файла -> значения по умолчанию и пустой список TLD.
    // Битый YAML -> YAML::Exception, неверная структура -> ConfigError.
    static ScanConfig load(const std::string& path);

    static ScanConfig parse(const std::string& yaml);
};
