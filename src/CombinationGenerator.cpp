#include "CombinationGenerator.hpp"

std::vector<Candidate> generateCandidates(const std::vector<std::string>& bases,
                                          const std::vector<std::string>& tlds) {
    std::vector<Candidate> candidates;
    candidates.reserve(bases.size() * tlds.size());
    for (const auto& base : bases) {
        for (const auto& tld : tlds) {
            candidates.push_back(Candidate{base + "." + tld, base});
        }
    }
    return candidates;
}
