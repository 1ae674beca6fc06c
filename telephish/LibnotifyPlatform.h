#pragma once

#include "NotificationPlatform.h"

// freedesktop-уведомления через libnotify, открытие ссылки через GIO
class LibnotifyPlatform : public NotificationPlatform {
public:
    bool initialize(const std::string& appName, std::string& error) override;
    void uninitialize() override;

    bool queryServer(ServerInfo& info, std::string& error) override;
    bool queryCapabilities(std::vector<std::string>& caps, std::string& error) override;

    Handle createNotification(std::string& error) override;
    void release(Handle notification) override;

    bool setContent(Handle notification, const NotificationContent& content, std::string& error) override;
    bool addAction(Handle notification,
                   const std::string& actionId,
                   const std::string& label,
                   const std::string& url,
                   std::string& error) override;
    bool show(Handle notification, std::string& error) override;

    void waitForAction(Handle notification, int timeoutSec) override;
};
