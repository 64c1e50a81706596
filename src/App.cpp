#include "App.hpp"
#include "AvailabilityProbe.hpp"
#include "BaseListLoader.hpp"
#include "CombinationGenerator.hpp"
#include "DomainScanner.hpp"
#include "Logger.hpp"
#include "ResultPrinter.hpp"

void applyOverrides(ScanConfig& cfg, const Args& args) {
    if (args.workers > 0)
        cfg.workers = size_t(args.workers);
    if (args.timeout >= 0)
        cfg.whois.timeoutSeconds = args.timeout;
    if (args.strict)
        cfg.strict = true;
}

ScanReport runScan(const Args& args, const ScanConfig& cfg, DomainProbe& probe, std::ostream& out) {
    BaseListLoader loader(args.input);
    loader.load();
    const auto& bases = loader.getBases();

    auto candidates = generateCandidates(bases, cfg.tlds);
    Logger::info("Checking %zu domains (%zu bases x %zu TLDs)",
                 candidates.size(), bases.size(), cfg.tlds.size());

    ScanOptions opts;
    opts.workers  = cfg.workers;
    opts.failures = cfg.strict ? FailurePolicy::ReportUnverified
                               : FailurePolicy::TreatAsAvailable;
    DomainScanner scanner(probe, opts);

    ResultPrinter printer(out);
    ScanReport report = scanner.scan(candidates, [&printer](const std::string& domain) {
        printer.printStatus(domain);
    });

    printer.printResults(report.available);
    printer.printUnverified(report.unverified);

    Logger::info("Done: checked=%zu available=%zu registered=%zu failed=%zu",
                 report.checked, report.available.size(), report.registered, report.failed);
    return report;
}
