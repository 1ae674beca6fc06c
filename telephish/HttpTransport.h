#pragma once

#include <string>

struct HttpResponse {
    long status{0};
    std::string body;
};

// Синхронный HTTP GET. Транспортные ошибки -> NetworkError.
class HttpTransport {
public:
    virtual ~HttpTransport() = default;

    virtual HttpResponse get(const std::string& url) = 0;
};
