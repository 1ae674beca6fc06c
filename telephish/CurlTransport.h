#pragma once

#include "HttpTransport.h"

class CurlTransport : public HttpTransport {
public:
    CurlTransport(long connectTimeoutSec, long requestTimeoutSec);
    ~CurlTransport() override;

    CurlTransport(const CurlTransport&) = delete;
    CurlTransport& operator=(const CurlTransport&) = delete;

    HttpResponse get(const std::string& url) override;

private:
    long connectTimeout;
    long requestTimeout;
};
