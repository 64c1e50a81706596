#include "WhoisClient.hpp"
#include "CurlShare.hpp"
#include "Logger.hpp"

#include <poll.h>
#include <algorithm>
#include <cctype>
#include <cerrno>
#include <climits>
#include <cstring>
#include <memory>
#include <sstream>
#include <utility>

namespace {

std::string toLower(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return s;
}

bool startsWith(const std::string& s, const char* prefix) {
    return s.rfind(prefix, 0) == 0;
}

// Строки-маркеры «записи нет» у распространённых регистратур
const char* const kNoRecordMarkers[] = {
    "no match for",
    "not found",
    "no entries found",
    "no data found",
    "domain not found",
    "no object found",
    "object does not exist",
    "status: free",
    "status: available",
};

} // namespace

const char* whoisErrorKindName(WhoisError::Kind kind) {
    switch (kind) {
        case WhoisError::Kind::Network:        return "network";
        case WhoisError::Kind::Timeout:        return "timeout";
        case WhoisError::Kind::Protocol:       return "protocol";
        case WhoisError::Kind::UnsupportedTld: return "unsupported-tld";
        case WhoisError::Kind::NoRecord:       return "no-record";
    }
    return "unknown";
}

WhoisClient::WhoisClient(WhoisOptions opts)
    : opts_(std::move(opts))
{
    // Ключи override приводим к нижнему регистру, как и TLD при поиске
    std::map<std::string, std::string> servers;
    for (const auto& kv : opts_.servers)
        servers[toLower(kv.first)] = kv.second;
    opts_.servers.swap(servers);

    // ConfigLoader и parseArgs уже отсекают большее, здесь страховка от переполнения deadline
    if (opts_.timeoutSeconds < 0)
        opts_.timeoutSeconds = 0;
    if (opts_.timeoutSeconds > kMaxTimeoutSeconds)
        opts_.timeoutSeconds = kMaxTimeoutSeconds;
}

WhoisClient::Deadline WhoisClient::startDeadline() const {
    Deadline d;
    if (opts_.timeoutSeconds > 0) {
        d.set = true;
        d.at  = Clock::now() + std::chrono::seconds(opts_.timeoutSeconds);
    }
    return d;
}

std::string WhoisClient::tldOf(const std::string& domain) {
    std::string d = domain;
    while (!d.empty() && d.back() == '.') d.pop_back();
    auto p = d.rfind('.');
    if (p == std::string::npos || p + 1 >= d.size())
        return "";
    return toLower(d.substr(p + 1));
}

std::string WhoisClient::parseReferral(const std::string& response) {
    std::istringstream in(response);
    std::string line;
    std::string whoisLine;
    while (std::getline(in, line)) {
        size_t b = line.find_first_not_of(" \t");
        if (b == std::string::npos) continue;
        std::string lower = toLower(line.substr(b));
        const char* key = nullptr;
        if (startsWith(lower, "refer:"))      key = "refer:";
        else if (startsWith(lower, "whois:")) key = "whois:";
        else continue;

        std::string value = line.substr(b + std::strlen(key));
        value.erase(0, value.find_first_not_of(" \t"));
        value.erase(value.find_last_not_of(" \t\r") + 1);
        if (value.empty()) continue;
        // refer: у IANA приоритетнее whois:
        if (std::strcmp(key, "refer:") == 0)
            return value;
        if (whoisLine.empty())
            whoisLine = value;
    }
    return whoisLine;
}

bool WhoisClient::looksUnregistered(const std::string& response) {
    std::istringstream in(response);
    std::string line;
    while (std::getline(in, line)) {
        size_t b = line.find_first_not_of(" \t%#");
        if (b == std::string::npos) continue;
        std::string lower = toLower(line.substr(b));
        for (const char* marker : kNoRecordMarkers) {
            if (startsWith(lower, marker))
                return true;
        }
    }
    return false;
}

std::string WhoisClient::serverFor(const std::string& tld) {
    return serverFor(tld, startDeadline());
}

std::string WhoisClient::serverFor(const std::string& tld, const Deadline& deadline) {
    const std::string key = toLower(tld);

    auto it = opts_.servers.find(key);
    if (it != opts_.servers.end())
        return it->second;

    {
        std::lock_guard<std::mutex> lock(cacheMutex_);
        auto c = serverCache_.find(key);
        if (c != serverCache_.end())
            return c->second;
    }

    // Запрос к IANA вне мьютекса: параллельные воркеры не ждут друг друга
    std::string referral = parseReferral(query(opts_.rootServer, key + "\r\n", deadline));
    if (referral.empty()) {
        throw WhoisError(WhoisError::Kind::UnsupportedTld,
                         "no whois server known for ." + key);
    }
    Logger::debug("WhoisClient: .%s -> %s", key.c_str(), referral.c_str());

    std::lock_guard<std::mutex> lock(cacheMutex_);
    serverCache_.emplace(key, referral);
    return referral;
}

std::string WhoisClient::lookup(const std::string& domain) {
    const std::string tld = tldOf(domain);
    if (tld.empty()) {
        throw WhoisError(WhoisError::Kind::UnsupportedTld,
                         "no TLD in '" + domain + "'");
    }
    const Deadline deadline = startDeadline();
    const std::string server = serverFor(tld, deadline);
    std::string response = query(server, domain + "\r\n", deadline);
    if (looksUnregistered(response)) {
        throw WhoisError(WhoisError::Kind::NoRecord,
                         "no record for " + domain + " at " + server);
    }
    return response;
}

void WhoisClient::waitOnSocket(curl_socket_t s, bool forRead, const Deadline& deadline,
                               const std::string& server) {
    int timeoutMs = -1;
    if (deadline.set) {
        auto left = std::chrono::duration_cast<std::chrono::milliseconds>(deadline.at - Clock::now());
        if (left.count() <= 0)
            throw WhoisError(WhoisError::Kind::Timeout, server + ": timed out");
        timeoutMs = left.count() > INT_MAX ? INT_MAX : static_cast<int>(left.count());
    }

    struct pollfd pfd;
    pfd.fd      = s;
    pfd.events  = forRead ? POLLIN : POLLOUT;
    pfd.revents = 0;
    int rc = poll(&pfd, 1, timeoutMs);
    if (rc < 0) {
        if (errno == EINTR) return; // повторим вызов send/recv
        throw WhoisError(WhoisError::Kind::Network,
                         server + ": poll failed: " + std::strerror(errno));
    }
    if (rc == 0)
        throw WhoisError(WhoisError::Kind::Timeout, server + ": timed out");
}

std::string WhoisClient::query(const std::string& server, const std::string& request) {
    return query(server, request, startDeadline());
}

std::string WhoisClient::query(const std::string& server, const std::string& request,
                               const Deadline& deadline) {
    std::unique_ptr<CURL, void (*)(CURL*)> easy(curl_easy_init(), curl_easy_cleanup);
    if (!easy)
        throw WhoisError(WhoisError::Kind::Network, "curl_easy_init failed");

    // Схема нужна только для разбора URL: CONNECT_ONLY даёт голый TCP.
    // Прокси из окружения (http_proxy, all_proxy) отключаем: WHOIS идёт напрямую
    const std::string url = "http://" + server + ":" + std::to_string(opts_.port);
    curl_easy_setopt(easy.get(), CURLOPT_URL,          url.c_str());
    curl_easy_setopt(easy.get(), CURLOPT_PROXY,        "");
    curl_easy_setopt(easy.get(), CURLOPT_CONNECT_ONLY, 1L);
    curl_easy_setopt(easy.get(), CURLOPT_NOSIGNAL,     1L);
    if (deadline.set) {
        auto left = std::chrono::duration_cast<std::chrono::milliseconds>(deadline.at - Clock::now());
        if (left.count() <= 0)
            throw WhoisError(WhoisError::Kind::Timeout, server + ": timed out");
        curl_easy_setopt(easy.get(), CURLOPT_CONNECTTIMEOUT_MS, static_cast<long>(left.count()));
    }
    if (g_shareHandle) // общий DNS
        curl_easy_setopt(easy.get(), CURLOPT_SHARE, g_shareHandle);

    CURLcode rc = curl_easy_perform(easy.get());
    if (rc != CURLE_OK) {
        auto kind = rc == CURLE_OPERATION_TIMEDOUT ? WhoisError::Kind::Timeout
                                                   : WhoisError::Kind::Network;
        throw WhoisError(kind, server + ": " + curl_easy_strerror(rc));
    }

    curl_socket_t sockfd = CURL_SOCKET_BAD;
    rc = curl_easy_getinfo(easy.get(), CURLINFO_ACTIVESOCKET, &sockfd);
    if (rc != CURLE_OK || sockfd == CURL_SOCKET_BAD)
        throw WhoisError(WhoisError::Kind::Network, server + ": no active socket");

    size_t sent = 0;
    while (sent < request.size()) {
        size_t n = 0;
        rc = curl_easy_send(easy.get(), request.data() + sent, request.size() - sent, &n);
        if (rc == CURLE_AGAIN) {
            waitOnSocket(sockfd, false, deadline, server);
            continue;
        }
        if (rc != CURLE_OK)
            throw WhoisError(WhoisError::Kind::Network, server + ": send: " + curl_easy_strerror(rc));
        sent += n;
    }

    // Читаем до закрытия соединения сервером
    std::string response;
    char buf[4096];
    for (;;) {
        size_t n = 0;
        rc = curl_easy_recv(easy.get(), buf, sizeof(buf), &n);
        if (rc == CURLE_AGAIN) {
            waitOnSocket(sockfd, true, deadline, server);
            continue;
        }
        if (rc != CURLE_OK)
            throw WhoisError(WhoisError::Kind::Network, server + ": recv: " + curl_easy_strerror(rc));
        if (n == 0)
            break;
        response.append(buf, n);
        if (response.size() > kMaxResponseBytes)
            throw WhoisError(WhoisError::Kind::Protocol, server + ": response too large");
    }

    Logger::debug("WhoisClient: %s answered %zu bytes", server.c_str(), response.size());
    return response;
}
