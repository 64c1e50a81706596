#include "BaseListLoader.hpp"
#include "Logger.hpp"

#include <fstream>
#include <cctype>

BaseListLoader::BaseListLoader(const std::string& filename)
    : filename_(filename)
{}

std::string trimCopy(const std::string& s) {
    size_t b = 0, e = s.size();
    while (b < e && std::isspace(static_cast<unsigned char>(s[b]))) ++b;
    while (e > b && std::isspace(static_cast<unsigned char>(s[e - 1]))) --e;
    return s.substr(b, e - b);
}

bool BaseListLoader::load() {
    bases_.clear();
    std::ifstream infile(filename_);
    if (!infile) {
        Logger::debug("BaseListLoader: cannot open %s, treating as empty", filename_.c_str());
        return false;
    }
    std::string line;
    while (std::getline(infile, line)) {
        // Обрезаем пробелы и \r по краям, внутренние символы не трогаем
        std::string base = trimCopy(line);
        if (!base.empty()) {
            bases_.push_back(base);
        }
    }
    Logger::debug("BaseListLoader: %zu bases from %s", bases_.size(), filename_.c_str());
    return true;
}
