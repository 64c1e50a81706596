#include "AvailabilityProbe.hpp"
#include "WhoisClient.hpp"
#include "Logger.hpp"

#include <exception>

WhoisProbe::WhoisProbe(WhoisClient& client)
    : client_(client)
{}

ProbeResult WhoisProbe::probe(const std::string& domain) {
    ProbeResult result;
    try {
        client_.lookup(domain);
        result.verdict = Verdict::Registered;
    } catch (const WhoisError& e) {
        if (e.kind() == WhoisError::Kind::NoRecord) {
            result.verdict = Verdict::Available;
        } else {
            result.verdict = Verdict::QueryFailed;
            result.reason  = std::string(whoisErrorKindName(e.kind())) + ": " + e.what();
        }
        Logger::debug("WhoisProbe: %s -> %s (%s)", domain.c_str(),
                      whoisErrorKindName(e.kind()), e.what());
    } catch (const std::exception& e) {
        result.verdict = Verdict::QueryFailed;
        result.reason  = e.what();
        Logger::debug("WhoisProbe: %s -> failed (%s)", domain.c_str(), e.what());
    }
    return result;
}
