#pragma once

#include <ostream>
#include <string>
#include <vector>
#include "CommonTypes.hpp"

class ResultPrinter {
public:
    explicit ResultPrinter(std::ostream& out);

    void printStatus(const std::string& domain);
    void printResults(const std::vector<std::string>& available);
    void printUnverified(const std::vector<UnverifiedDomain>& unverified);

private:
    std::ostream& out_;
};
