#include "CurlShare.hpp"
#include "Logger.hpp"

#include <mutex>

CURLSH* g_shareHandle = nullptr;

namespace {

// По мьютексу на каждый тип данных share-хендла
std::mutex g_shareLocks[CURL_LOCK_DATA_LAST];
std::once_flag g_shareInitOnce;
std::once_flag g_shareCleanupOnce;

void lockCb(CURL*, curl_lock_data data, curl_lock_access, void*) {
    g_shareLocks[data].lock();
}

void unlockCb(CURL*, curl_lock_data data, void*) {
    g_shareLocks[data].unlock();
}

} // namespace

void initCurlShare() {
    std::call_once(g_shareInitOnce, [] {
        g_shareHandle = curl_share_init();
        if (!g_shareHandle) {
            Logger::warn("CurlShare: curl_share_init failed");
            return;
        }
        curl_share_setopt(g_shareHandle, CURLSHOPT_LOCKFUNC,   lockCb);
        curl_share_setopt(g_shareHandle, CURLSHOPT_UNLOCKFUNC, unlockCb);
        curl_share_setopt(g_shareHandle, CURLSHOPT_SHARE,      CURL_LOCK_DATA_DNS);
    });
}

void cleanupCurlShare() {
    std::call_once(g_shareCleanupOnce, [] {
        if (g_shareHandle) {
            curl_share_cleanup(g_shareHandle);
            g_shareHandle = nullptr;
        }
    });
}

CurlGlobal::CurlGlobal() {
    CURLcode rc = curl_global_init(CURL_GLOBAL_ALL);
    if (rc != CURLE_OK) {
        Logger::error("curl_global_init failed: %s", curl_easy_strerror(rc));
        return;
    }
    ok_ = true;
    initCurlShare();
}

CurlGlobal::~CurlGlobal() {
    if (!ok_) return;
    cleanupCurlShare();
    curl_global_cleanup();
}
