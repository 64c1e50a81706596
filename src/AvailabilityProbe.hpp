#pragma once
#include "CommonTypes.hpp"

#include <string>

class WhoisClient;

// Один запрос на домен, вердикт по исходу запроса.
// Реализации должны допускать вызов из нескольких потоков.
class DomainProbe {
public:
    virtual ~DomainProbe() = default;
    virtual ProbeResult probe(const std::string& domain) = 0;
};

// Ответ получен -> Registered, содержимое не разбирается (пустой или кривой
// ответ тоже считается регистрацией). Явное «записи нет» -> Available.
// Любая другая ошибка -> QueryFailed с причиной.
// Ограничение: зарегистрированный домен без WHOIS-записи выглядит свободным.
class WhoisProbe : public DomainProbe {
public:
    explicit WhoisProbe(WhoisClient& client);
    ProbeResult probe(const std::string& domain) override;

private:
    WhoisClient& client_;
};
