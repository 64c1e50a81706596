#pragma once
#include "CommonTypes.hpp"

#include <string>
#include <vector>

// Все пары base x tld, порядок base-major: для base1 все TLD, затем base2 ...
std::vector<Candidate> generateCandidates(const std::vector<std::string>& bases,
                                          const std::vector<std::string>& tlds);
