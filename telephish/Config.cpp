#include "Config.h"

#include <cstdlib>
#include <stdexcept>

static std::string getenv_or(const char* key, const std::string& def) {
    if (const char* v = std::getenv(key)) return std::string(v);
    return def;
}

static int getenv_int(const char* key, int def) {
    if (const char* v = std::getenv(key)) {
        // "10abc" и пустая строка -> значение по умолчанию
        const std::string s(v);
        try {
            size_t pos = 0;
            int value = std::stoi(s, &pos);
            return pos == s.size() ? value : def;
        } catch (const std::exception&) {
            return def;
        }
    }
    return def;
}

Config Config::fromEnv() {
    Config cfg;

    // пустой токен допустим: getUpdates просто вернёт ошибку
    cfg.token = getenv_or("TELEGRAM_BOT_TOKEN", "");

    cfg.apiBase = getenv_or("TELEGRAM_API_BASE", cfg.apiBase);
    while (!cfg.apiBase.empty() && cfg.apiBase.back() == '/') cfg.apiBase.pop_back();

    cfg.connectTimeoutSec = getenv_int("TELEPHISH_CONNECT_TIMEOUT", static_cast<int>(cfg.connectTimeoutSec));
    cfg.requestTimeoutSec = getenv_int("TELEPHISH_HTTP_TIMEOUT", static_cast<int>(cfg.requestTimeoutSec));
    cfg.appName = getenv_or("TELEPHISH_APP_NAME", cfg.appName);

    cfg.actionWaitSec = getenv_int("TELEPHISH_ACTION_WAIT", cfg.actionWaitSec);
    if (cfg.actionWaitSec < 0) cfg.actionWaitSec = 0;

    return cfg;
}
