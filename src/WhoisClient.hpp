// src/WhoisClient.hpp
#ifndef WHOISCLIENT_HPP
#define WHOISCLIENT_HPP

#include <chrono>
#include <map>
#include <mutex>
#include <stdexcept>
#include <string>
#include <curl/curl.h>

struct WhoisOptions {
    // Один бюджет на весь lookup: referral + запрос, connect + обмен. 0 = без ограничения
    long        timeoutSeconds = 30;
    long        port           = 43;
    std::string rootServer     = "whois.iana.org"; // откуда берём referral для TLD
    std::map<std::string, std::string> servers;    // tld -> whois-сервер, в обход IANA
};

class WhoisError : public std::runtime_error {
public:
    enum class Kind { Network, Timeout, Protocol, UnsupportedTld, NoRecord };

    WhoisError(Kind kind, const std::string& what)
        : std::runtime_error(what), kind_(kind) {}

    Kind kind() const { return kind_; }

private:
    Kind kind_;
};

const char* whoisErrorKindName(WhoisError::Kind kind);

// Клиент RFC 3912: одно TCP-соединение на порт 43 на каждый запрос.
// Потокобезопасен: кеш серверов под мьютексом, easy-handle на каждый запрос.
class WhoisClient {
public:
    explicit WhoisClient(WhoisOptions opts);
    virtual ~WhoisClient() = default;

    WhoisClient(const WhoisClient&) = delete;
    WhoisClient& operator=(const WhoisClient&) = delete;

    // Ответ сервера для домена. Бросает WhoisError, в т.ч. NoRecord,
    // если сервер явно сообщил, что записи нет.
    virtual std::string lookup(const std::string& domain);

    // whois-сервер для TLD: override из конфига, иначе referral от rootServer
    std::string serverFor(const std::string& tld);

    // Один обмен запрос/ответ с server:port
    std::string query(const std::string& server, const std::string& request);

    static std::string tldOf(const std::string& domain);
    static std::string parseReferral(const std::string& response);
    static bool        looksUnregistered(const std::string& response);

    static constexpr long   kMaxTimeoutSeconds = 86400;
    static constexpr size_t kMaxResponseBytes  = 1024 * 1024;

private:
    using Clock = std::chrono::steady_clock;

    struct Deadline {
        bool              set = false;
        Clock::time_point at;
    };

    Deadline    startDeadline() const;
    std::string serverFor(const std::string& tld, const Deadline& deadline);
    std::string query(const std::string& server, const std::string& request,
                      const Deadline& deadline);
    void waitOnSocket(curl_socket_t s, bool forRead, const Deadline& deadline,
                      const std::string& server);

    WhoisOptions opts_;
    std::mutex   cacheMutex_;
    std::map<std::string, std::string> serverCache_;
};

#endif // WHOISCLIENT_HPP
