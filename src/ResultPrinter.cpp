#include "ResultPrinter.hpp"

ResultPrinter::ResultPrinter(std::ostream& out)
    : out_(out)
{}

void ResultPrinter::printStatus(const std::string& domain) {
    // flush: строка прогресса должна появиться до блокирующего запроса
    out_ << "Checking: " << domain << std::endl;
}

void ResultPrinter::printResults(const std::vector<std::string>& available) {
    if (available.empty()) {
        out_ << "No available domains found.\n";
        return;
    }
    out_ << "Available domains:\n";
    for (const auto& d : available)
        out_ << d << '\n';
}

void ResultPrinter::printUnverified(const std::vector<UnverifiedDomain>& unverified) {
    if (unverified.empty())
        return;
    out_ << "Unverified domains (query failed):\n";
    for (const auto& u : unverified)
        out_ << u.domain << " (" << u.reason << ")\n";
}
