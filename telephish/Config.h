#pragma once

#include <string>

// Вся конфигурация процесса. Читается один раз в main и дальше передаётся явно.
struct Config {
    std::string token;                                  // TELEGRAM_BOT_TOKEN
    std::string apiBase{"https://api.telegram.org"};    // TELEGRAM_API_BASE
    long connectTimeoutSec{10};                         // TELEPHISH_CONNECT_TIMEOUT
    long requestTimeoutSec{20};                         // TELEPHISH_HTTP_TIMEOUT
    std::string appName{"telephish"};                   // TELEPHISH_APP_NAME
    int actionWaitSec{30};                              // TELEPHISH_ACTION_WAIT, 0 = не ждать клика

    static Config fromEnv();
};
