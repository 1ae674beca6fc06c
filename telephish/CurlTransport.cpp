#include "CurlTransport.h"

#include <curl/curl.h>

#include "Errors.h"

static size_t WriteCallback(void* contents, size_t size, size_t nmemb, void* userp) {
    size_t total = size * nmemb;
    std::string* s = static_cast<std::string*>(userp);
    s->append(static_cast<char*>(contents), total);
    return total;
}

CurlTransport::CurlTransport(long connectTimeoutSec, long requestTimeoutSec)
    : connectTimeout(connectTimeoutSec),
      requestTimeout(requestTimeoutSec) {
    curl_global_init(CURL_GLOBAL_DEFAULT);
}

CurlTransport::~CurlTransport() {
    curl_global_cleanup();
}

HttpResponse CurlTransport::get(const std::string& url) {
    CURL* curl = curl_easy_init();
    if (!curl) throw NetworkError("curl_easy_init() failed");

    HttpResponse out;
    char errbuf[CURL_ERROR_SIZE] = {0};

    curl_easy_setopt(curl, CURLOPT_URL, url.c_str());

    // "HTTP2 framing layer" на некоторых сетях -> форсим HTTP/1.1
    curl_easy_setopt(curl, CURLOPT_HTTP_VERSION, CURL_HTTP_VERSION_1_1);

#ifdef CURLOPT_SSL_ENABLE_ALPN
    curl_easy_setopt(curl, CURLOPT_SSL_ENABLE_ALPN, 0L);
#endif

    curl_easy_setopt(curl, CURLOPT_NOSIGNAL, 1L);
    curl_easy_setopt(curl, CURLOPT_WRITEFUNCTION, WriteCallback);
    curl_easy_setopt(curl, CURLOPT_WRITEDATA, &out.body);
    curl_easy_setopt(curl, CURLOPT_ERRORBUFFER, errbuf);
    curl_easy_setopt(curl, CURLOPT_CONNECTTIMEOUT, connectTimeout);
    curl_easy_setopt(curl, CURLOPT_TIMEOUT, requestTimeout);

    CURLcode res = curl_easy_perform(curl);
    if (res == CURLE_OK) {
        curl_easy_getinfo(curl, CURLINFO_RESPONSE_CODE, &out.status);
    }
    curl_easy_cleanup(curl);

    if (res != CURLE_OK) {
        std::string msg = curl_easy_strerror(res);
        if (errbuf[0] != '\0') msg += std::string(" (") + errbuf + ")";
        throw NetworkError(msg);
    }
    return out;
}
