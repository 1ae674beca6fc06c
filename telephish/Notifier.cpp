#include "Notifier.h"

#include <algorithm>
#include <iostream>

#include <glib.h>

#include "Errors.h"

static const char* kOpenActionId = "open";
static const char* kOpenActionLabel = "Open browser";

static bool has_cap(const std::vector<std::string>& caps, const std::string& cap) {
    return std::find(caps.begin(), caps.end(), cap) != caps.end();
}

// notify_init / notify_uninit
class PlatformSession {
public:
    PlatformSession(NotificationPlatform& platform, const std::string& appName)
        : platform(platform) {
        std::string err;
        if (!platform.initialize(appName, err)) {
            throw InitializationError("cannot initialize notification subsystem: " + err);
        }
    }

    ~PlatformSession() { platform.uninitialize(); }

    PlatformSession(const PlatformSession&) = delete;
    PlatformSession& operator=(const PlatformSession&) = delete;

private:
    NotificationPlatform& platform;
};

class NotificationHandle {
public:
    explicit NotificationHandle(NotificationPlatform& platform)
        : platform(platform) {
        std::string err;
        handle = platform.createNotification(err);
        if (!handle) throw RenderError(RenderStep::CreateNotification, err);
    }

    ~NotificationHandle() { platform.release(handle); }

    NotificationHandle(const NotificationHandle&) = delete;
    NotificationHandle& operator=(const NotificationHandle&) = delete;

    NotificationPlatform::Handle get() const { return handle; }

private:
    NotificationPlatform& platform;
    NotificationPlatform::Handle handle{nullptr};
};

bool isValidUtf8(const std::string& text) {
    return g_utf8_validate(text.data(), static_cast<gssize>(text.size()), nullptr);
}

std::string escapeMarkup(const std::string& text) {
    gchar* escaped = g_markup_escape_text(text.data(), static_cast<gssize>(text.size()));
    std::string out = escaped ? escaped : "";
    g_free(escaped);
    return out;
}

NotificationContent buildContent(const std::string& title,
                                 const std::string& body,
                                 const std::string& url,
                                 const std::vector<std::string>& caps) {
    if (!isValidUtf8(title)) throw RenderError(RenderStep::BuildContent, "title is not valid UTF-8");
    if (!isValidUtf8(body)) throw RenderError(RenderStep::BuildContent, "body is not valid UTF-8");
    if (!isValidUtf8(url)) throw RenderError(RenderStep::BuildContent, "url is not valid UTF-8");

    const bool markup = has_cap(caps, "body-markup");
    const bool hyperlinks = markup && has_cap(caps, "body-hyperlinks");

    NotificationContent content;
    content.summary = title;
    content.icon = "mail-message-new";
    content.category = "im.received";

    if (!markup) {
        content.body = body + "\n" + url;
    } else if (hyperlinks) {
        const std::string href = escapeMarkup(url);
        content.body = escapeMarkup(body) + "\n<a href=\"" + href + "\">" + href + "</a>";
    } else {
        content.body = escapeMarkup(body) + "\n" + escapeMarkup(url);
    }
    return content;
}

Notifier::Notifier(NotificationPlatform& platform, const std::string& appName, int actionWaitSec)
    : platform(platform),
      appName(appName),
      actionWaitSec(actionWaitSec) {}

void Notifier::showNotification(const std::string& title, const std::string& body, const std::string& url) {
    PlatformSession session(platform, appName);
    std::string err;

    ServerInfo server;
    if (!platform.queryServer(server, err)) throw RenderError(RenderStep::QueryServer, err);
    std::cout << "[telephish] notification server: " << server.name << " " << server.version
              << " (spec " << server.specVersion << ")" << std::endl;

    std::vector<std::string> caps;
    if (!platform.queryCapabilities(caps, err)) throw RenderError(RenderStep::QueryCapabilities, err);

    NotificationHandle notification(platform);

    NotificationContent content = buildContent(title, body, url, caps);
    if (!platform.setContent(notification.get(), content, err)) {
        throw RenderError(RenderStep::SetContent, err);
    }

    const bool actions = has_cap(caps, "actions");
    if (actions) {
        if (!platform.addAction(notification.get(), kOpenActionId, kOpenActionLabel, url, err)) {
            throw RenderError(RenderStep::AddAction, err);
        }
    } else {
        std::cerr << "[notify WARN] server does not support actions, '" << kOpenActionLabel
                  << "' button skipped" << std::endl;
    }

    if (!platform.show(notification.get(), err)) throw RenderError(RenderStep::Show, err);
    std::cout << "[telephish] notification shown" << std::endl;

    if (actions && actionWaitSec > 0) {
        platform.waitForAction(notification.get(), actionWaitSec);
    }
}
