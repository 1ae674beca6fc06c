#pragma once

#include <string>
#include <vector>

struct ServerInfo {
    std::string name;
    std::string vendor;
    std::string version;
    std::string specVersion;
};

// То, что реально уходит демону уведомлений
struct NotificationContent {
    std::string summary;
    std::string body;
    std::string icon;
    std::string category;
};

// Нативный API уведомлений. Каждый шаг может упасть отдельно и возвращает текст ошибки.
// initialize/uninitialize и createNotification/release должны быть строго парными.
class NotificationPlatform {
public:
    using Handle = void*;

    virtual ~NotificationPlatform() = default;

    virtual bool initialize(const std::string& appName, std::string& error) = 0;
    virtual void uninitialize() = 0;

    virtual bool queryServer(ServerInfo& info, std::string& error) = 0;
    virtual bool queryCapabilities(std::vector<std::string>& caps, std::string& error) = 0;

    virtual Handle createNotification(std::string& error) = 0;
    virtual void release(Handle notification) = 0;

    virtual bool setContent(Handle notification, const NotificationContent& content, std::string& error) = 0;
    virtual bool addAction(Handle notification,
                           const std::string& actionId,
                           const std::string& label,
                           const std::string& url,
                           std::string& error) = 0;
    virtual bool show(Handle notification, std::string& error) = 0;

    // Блокирует до клика по действию, закрытия уведомления или истечения timeoutSec
    virtual void waitForAction(Handle notification, int timeoutSec) = 0;
};
