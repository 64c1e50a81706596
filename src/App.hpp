#pragma once

#include <ostream>
#include "CommonTypes.hpp"
#include "ConfigLoader.hpp"

class DomainProbe;

// Флаги командной строки перекрывают значения из конфига
void applyOverrides(ScanConfig& cfg, const Args& args);

// Загрузка баз, генерация, скан с прогрессом, печать результата в out
ScanReport runScan(const Args& args, const ScanConfig& cfg, DomainProbe& probe, std::ostream& out);
