#include "DomainScanner.hpp"
#include "AvailabilityProbe.hpp"
#include "Logger.hpp"

#include <algorithm>
#include <atomic>
#include <exception>
#include <functional>
#include <mutex>
#include <thread>

DomainScanner::DomainScanner(DomainProbe& probe, ScanOptions opts)
    : probe_(probe)
    , opts_(opts)
{}

size_t DomainScanner::workerCount(size_t candidates) const {
    size_t n = std::min(std::max<size_t>(opts_.workers, 1), kMaxWorkers);
    return std::max<size_t>(std::min(n, candidates), 1);
}

ScanReport DomainScanner::scan(const std::vector<Candidate>& candidates,
                               const ProgressSink& sink) const {
    std::vector<ProbeResult> results(candidates.size());
    std::atomic<size_t> nextIndex{0};
    std::atomic<bool>   abort{false};
    std::mutex          sinkMutex, errorMutex;
    std::exception_ptr  error;
    const ProgressSink* sinkPtr = sink ? &sink : nullptr;

    const size_t n = workerCount(candidates.size());
    std::vector<ScanWorker> workers;
    workers.reserve(n);
    for (size_t i = 0; i < n; ++i) {
        workers.emplace_back(candidates, nextIndex, results, probe_,
                             sinkPtr, &sinkMutex, &abort, &error, &errorMutex);
    }

    if (n == 1) {
        // Последовательный режим: в вызывающем потоке, строго по порядку
        workers.front()();
    } else {
        Logger::debug("DomainScanner: %zu candidates on %zu workers", candidates.size(), n);
        std::vector<std::thread> threads;
        threads.reserve(n);
        try {
            for (auto& w : workers)
                threads.emplace_back(std::ref(w));
        } catch (...) {
            abort.store(true);
            for (auto& t : threads) t.join();
            throw;
        }
        for (auto& t : threads)
            t.join();
    }

    if (error)
        std::rethrow_exception(error);

    // Собираем по индексу, а не по порядку завершения
    ScanReport report;
    report.checked = candidates.size();
    for (size_t i = 0; i < candidates.size(); ++i) {
        const ProbeResult& r = results[i];
        switch (r.verdict) {
            case Verdict::Registered:
                ++report.registered;
                break;
            case Verdict::Available:
                report.available.push_back(candidates[i].domain);
                break;
            case Verdict::QueryFailed:
                ++report.failed;
                if (opts_.failures == FailurePolicy::ReportUnverified)
                    report.unverified.push_back(UnverifiedDomain{candidates[i].domain, r.reason});
                else
                    report.available.push_back(candidates[i].domain);
                break;
        }
    }
    return report;
}

std::vector<std::string> DomainScanner::findAvailable(const std::vector<Candidate>& candidates,
                                                      const ProgressSink& sink) const {
    return scan(candidates, sink).available;
}
