#pragma once

#include <string>

#include "Notifier.h"
#include "UpdateFetcher.h"

// Коды выхода процесса
constexpr int kExitOk = 0;
constexpr int kExitFetchFailed = 1;
constexpr int kExitNotifyFailed = 2;

// Один проход: getUpdates -> последний апдейт -> ссылка -> уведомление.
// "Нет апдейтов / нет сообщения / нет ссылки" — нормальное завершение, не ошибка.
class PollRunner {
public:
    PollRunner(const std::string& token, UpdateFetcher& fetcher, Notifier& notifier);

    int runOnce();

private:
    std::string token;
    UpdateFetcher& fetcher;
    Notifier& notifier;
};

NotificationRequest makeNotificationRequest(const Message& message, const std::string& url);
