#include "LibnotifyPlatform.h"

#include <iostream>

#include <gio/gio.h>
#include <libnotify/notify.h>

static const char* kWaitStateKey = "telephish-wait-state";

struct WaitState {
    GMainLoop* loop{nullptr};
    guint timer{0};
};

static NotifyNotification* as_notification(NotificationPlatform::Handle h) {
    return static_cast<NotifyNotification*>(h);
}

static std::string take_error(GError*& err, const std::string& fallback) {
    std::string msg = (err && err->message) ? err->message : fallback;
    g_clear_error(&err);
    return msg;
}

static void on_open_action(NotifyNotification* n, char* action, gpointer user_data) {
    const char* url = static_cast<const char*>(user_data);
    std::cout << "[telephish] action '" << action << "' -> " << url << std::endl;

    GError* err = nullptr;
    if (!g_app_info_launch_default_for_uri(url, nullptr, &err)) {
        std::cerr << "[notify ERROR] cannot open link: " << take_error(err, "unknown error") << std::endl;
    }

    auto* state = static_cast<WaitState*>(g_object_get_data(G_OBJECT(n), kWaitStateKey));
    if (state) g_main_loop_quit(state->loop);
}

static void on_closed(NotifyNotification*, gpointer user_data) {
    auto* state = static_cast<WaitState*>(user_data);
    g_main_loop_quit(state->loop);
}

static gboolean on_wait_timeout(gpointer user_data) {
    auto* state = static_cast<WaitState*>(user_data);
    state->timer = 0;
    g_main_loop_quit(state->loop);
    return G_SOURCE_REMOVE;
}

bool LibnotifyPlatform::initialize(const std::string& appName, std::string& error) {
    if (!notify_init(appName.c_str())) {
        error = "notify_init(\"" + appName + "\") failed";
        return false;
    }
    return true;
}

void LibnotifyPlatform::uninitialize() {
    notify_uninit();
}

bool LibnotifyPlatform::queryServer(ServerInfo& info, std::string& error) {
    char* name = nullptr;
    char* vendor = nullptr;
    char* version = nullptr;
    char* spec = nullptr;

    if (!notify_get_server_info(&name, &vendor, &version, &spec)) {
        error = "no notification server on the session bus";
        return false;
    }

    info.name = name ? name : "";
    info.vendor = vendor ? vendor : "";
    info.version = version ? version : "";
    info.specVersion = spec ? spec : "";

    g_free(name);
    g_free(vendor);
    g_free(version);
    g_free(spec);
    return true;
}

bool LibnotifyPlatform::queryCapabilities(std::vector<std::string>& caps, std::string& error) {
    GList* list = notify_get_server_caps();
    if (!list) {
        error = "notification server returned no capabilities";
        return false;
    }

    for (GList* it = list; it != nullptr; it = it->next) {
        caps.emplace_back(static_cast<const char*>(it->data));
    }
    g_list_free_full(list, g_free);
    return true;
}

NotificationPlatform::Handle LibnotifyPlatform::createNotification(std::string& error) {
    NotifyNotification* n = notify_notification_new("", nullptr, nullptr);
    if (!n) error = "notify_notification_new() returned NULL";
    return n;
}

void LibnotifyPlatform::release(Handle notification) {
    if (notification) g_object_unref(G_OBJECT(as_notification(notification)));
}

bool LibnotifyPlatform::setContent(Handle notification, const NotificationContent& content, std::string& error) {
    NotifyNotification* n = as_notification(notification);

    const char* icon = content.icon.empty() ? nullptr : content.icon.c_str();
    if (!notify_notification_update(n, content.summary.c_str(), content.body.c_str(), icon)) {
        error = "notify_notification_update() rejected the content";
        return false;
    }

    if (!content.category.empty()) notify_notification_set_category(n, content.category.c_str());
    notify_notification_set_urgency(n, NOTIFY_URGENCY_NORMAL);
    return true;
}

bool LibnotifyPlatform::addAction(Handle notification,
                                  const std::string& actionId,
                                  const std::string& label,
                                  const std::string& url,
                                  std::string& error) {
    if (actionId.empty()) {
        error = "empty action id";
        return false;
    }

    // url живёт вместе с уведомлением, libnotify освободит его через g_free
    notify_notification_add_action(as_notification(notification),
                                   actionId.c_str(),
                                   label.c_str(),
                                   on_open_action,
                                   g_strdup(url.c_str()),
                                   g_free);
    return true;
}

bool LibnotifyPlatform::show(Handle notification, std::string& error) {
    GError* err = nullptr;
    if (!notify_notification_show(as_notification(notification), &err)) {
        error = take_error(err, "notify_notification_show() failed");
        return false;
    }
    return true;
}

void LibnotifyPlatform::waitForAction(Handle notification, int timeoutSec) {
    NotifyNotification* n = as_notification(notification);

    WaitState state;
    state.loop = g_main_loop_new(nullptr, FALSE);
    state.timer = g_timeout_add_seconds(static_cast<guint>(timeoutSec), on_wait_timeout, &state);

    g_object_set_data(G_OBJECT(n), kWaitStateKey, &state);
    gulong closedHandler = g_signal_connect(n, "closed", G_CALLBACK(on_closed), &state);

    g_main_loop_run(state.loop);

    g_signal_handler_disconnect(n, closedHandler);
    g_object_set_data(G_OBJECT(n), kWaitStateKey, nullptr);
    if (state.timer) g_source_remove(state.timer);
    g_main_loop_unref(state.loop);
}
