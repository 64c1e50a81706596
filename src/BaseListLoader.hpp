#pragma once
#include <string>
#include <vector>

// Читает базовые строки: одна на строку, пустые строки пропускаются
class BaseListLoader {
public:
    explicit BaseListLoader(const std::string& filename);

    // false, если файл не открылся (список остаётся пустым)
    bool load();
    const std::vector<std::string>& getBases() const { return bases_; }

private:
    std::string filename_;
    std::vector<std::string> bases_;
};

std::string trimCopy(const std::string& s);
