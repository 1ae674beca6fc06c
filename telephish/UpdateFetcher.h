#pragma once

#include <string>
#include <vector>

#include "HttpTransport.h"
#include "Update.h"

class UpdateFetcher {
public:
    UpdateFetcher(HttpTransport& transport, const std::string& apiBase);

    // Один GET <apiBase>/bot<token>/getUpdates.
    // Бросает NetworkError / DecodeError / ApiError. Порядок апдейтов сохраняется.
    std::vector<Update> fetchUpdates(const std::string& token);

private:
    HttpTransport& transport;
    std::string apiBase;
};

// Разбор конверта {"ok": bool, "result": [...]} вне зависимости от HTTP-статуса.
std::vector<Update> decodeUpdates(const HttpResponse& response);

// URL для логов: токен заменён на <redacted>
std::string redactToken(const std::string& url, const std::string& token);
