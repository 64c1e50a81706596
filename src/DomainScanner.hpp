#pragma once

#include <string>
#include <vector>
#include "CommonTypes.hpp"
#include "ScanWorker.hpp"

class DomainProbe;

// Что делать с QueryFailed
enum class FailurePolicy {
    TreatAsAvailable, // совместимый режим: любая ошибка запроса = свободен
    ReportUnverified  // strict: отдельный список «не удалось проверить»
};

struct ScanOptions {
    size_t        workers  = 1;
    FailurePolicy failures = FailurePolicy::TreatAsAvailable;
};

// Прогоняет probe по всем кандидатам и собирает свободные домены
// в порядке генерации. Блокирующий, без досрочной остановки.
// Исключение из sink (или неожиданное из probe) прерывает скан
// и пробрасывается вызывающему.
class DomainScanner {
public:
    static constexpr size_t kMaxWorkers = 32;

    explicit DomainScanner(DomainProbe& probe, ScanOptions opts = ScanOptions());

    ScanReport scan(const std::vector<Candidate>& candidates,
                    const ProgressSink& sink = ProgressSink()) const;

    std::vector<std::string> findAvailable(const std::vector<Candidate>& candidates,
                                           const ProgressSink& sink = ProgressSink()) const;

    // Фактическое число потоков для данного числа кандидатов
    size_t workerCount(size_t candidates) const;

private:
    DomainProbe& probe_;
    ScanOptions  opts_;
};
