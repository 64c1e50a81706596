#include "ScanWorker.hpp"
#include "AvailabilityProbe.hpp"
#include "Logger.hpp"

ScanWorker::ScanWorker(const std::vector<Candidate>& candidates,
                       std::atomic<size_t>& nextIndex,
                       std::vector<ProbeResult>& results,
                       DomainProbe& probe,
                       const ProgressSink* sink,
                       std::mutex* sinkMutex,
                       std::atomic<bool>* abort,
                       std::exception_ptr* error,
                       std::mutex* errorMutex)
  : candidates_(candidates)
  , nextIndex_(nextIndex)
  , results_(results)
  , probe_(probe)
  , sink_(sink)
  , sinkMutex_(sinkMutex)
  , abort_(abort)
  , error_(error)
  , errorMutex_(errorMutex)
{}

void ScanWorker::operator()() {
    try {
        while (!abort_->load()) {
            size_t idx = nextIndex_++;
            if (idx >= candidates_.size())
                break;

            const Candidate& c = candidates_[idx];

            // Уведомление строго до запроса
            if (sink_) {
                std::lock_guard<std::mutex> lock(*sinkMutex_);
                (*sink_)(c.domain);
            }

            results_[idx] = probe_.probe(c.domain);

            Logger::debug("DONE: [%zu] %s (verdict=%d)", idx, c.domain.c_str(),
                          int(results_[idx].verdict));
        }
    } catch (...) {
        // Ошибка уходит в DomainScanner::scan и пробрасывается после join
        std::lock_guard<std::mutex> lock(*errorMutex_);
        if (!*error_)
            *error_ = std::current_exception();
        abort_->store(true);
    }
}
