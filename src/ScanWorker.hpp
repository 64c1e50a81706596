#pragma once

#include <atomic>
#include <exception>
#include <functional>
#include <mutex>
#include <string>
#include <vector>
#include "CommonTypes.hpp"

class DomainProbe;

using ProgressSink = std::function<void(const std::string& domain)>;

// Берёт следующий индекс из общего счётчика, пока кандидаты не кончатся.
// Вердикт пишется в results[idx], так что порядок восстанавливается по индексу.
class ScanWorker {
public:
    ScanWorker(const std::vector<Candidate>& candidates,
               std::atomic<size_t>& nextIndex,
               std::vector<ProbeResult>& results,
               DomainProbe& probe,
               const ProgressSink* sink,
               std::mutex* sinkMutex,
               std::atomic<bool>* abort,
               std::exception_ptr* error,
               std::mutex* errorMutex);

    // Entry point для std::thread (или прямой вызов в последовательном режиме)
    void operator()();

private:
    const std::vector<Candidate>& candidates_;
    std::atomic<size_t>&          nextIndex_;
    std::vector<ProbeResult>&     results_;
    DomainProbe&                  probe_;

    const ProgressSink* sink_;
    std::mutex*         sinkMutex_;

    // Первая ошибка останавливает весь пул
    std::atomic<bool>*  abort_;
    std::exception_ptr* error_;
    std::mutex*         errorMutex_;
};
