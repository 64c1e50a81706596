#pragma once
#include <curl/curl.h>

// Общий DNS-кеш libcurl для всех WHOIS-соединений процесса
extern CURLSH* g_shareHandle;

void initCurlShare();
void cleanupCurlShare();

// curl_global_init / curl_global_cleanup на время жизни объекта
class CurlGlobal {
public:
    CurlGlobal();
    ~CurlGlobal();
    CurlGlobal(const CurlGlobal&) = delete;
    CurlGlobal& operator=(const CurlGlobal&) = delete;

    bool ok() const { return ok_; }

private:
    bool ok_ = false;
};
