#pragma once

#include <string>
#include <vector>

#include "NotificationPlatform.h"

struct NotificationRequest {
    std::string title;
    std::string body;
    std::string url;
};

class Notifier {
public:
    Notifier(NotificationPlatform& platform, const std::string& appName, int actionWaitSec);

    // Бросает InitializationError или RenderError (с указанием шага).
    // Без повторов: каждый вызов показывает ещё одно уведомление.
    void showNotification(const std::string& title, const std::string& body, const std::string& url);

    void showNotification(const NotificationRequest& request) {
        showNotification(request.title, request.body, request.url);
    }

private:
    NotificationPlatform& platform;
    std::string appName;
    int actionWaitSec;
};

// Две строки: текст сообщения и ссылка. Разметка только если сервер её понимает.
// Невалидный UTF-8 -> RenderError(BuildContent).
NotificationContent buildContent(const std::string& title,
                                 const std::string& body,
                                 const std::string& url,
                                 const std::vector<std::string>& caps);

std::string escapeMarkup(const std::string& text);
bool isValidUtf8(const std::string& text);
