#include "PollRunner.h"

#include <iostream>
#include <vector>

#include "Errors.h"
#include "UrlExtractor.h"

NotificationRequest makeNotificationRequest(const Message& message, const std::string& url) {
    NotificationRequest req;
    req.title = "New Message";
    req.body = "You received a new message: " + message.text;
    req.url = url;
    return req;
}

PollRunner::PollRunner(const std::string& token, UpdateFetcher& fetcher, Notifier& notifier)
    : token(token),
      fetcher(fetcher),
      notifier(notifier) {}

int PollRunner::runOnce() {
    std::vector<Update> updates;
    try {
        updates = fetcher.fetchUpdates(token);
    } catch (const FetchError& e) {
        std::cerr << "[fetch ERROR] Error fetching updates: " << e.what() << std::endl;
        return kExitFetchFailed;
    }

    if (updates.empty()) {
        std::cout << "[telephish] No new messages." << std::endl;
        return kExitOk;
    }

    // Считаем, что Bot API отдаёт апдейты по возрастанию update_id; берём последний по позиции
    const Update& last = updates.back();
    if (!last.message) {
        std::cout << "[telephish] No message in the last update." << std::endl;
        return kExitOk;
    }

    const std::string url = extractUrl(*last.message);
    if (url.empty()) {
        std::cout << "[telephish] No URL found in the last message." << std::endl;
        return kExitOk;
    }

    try {
        notifier.showNotification(makeNotificationRequest(*last.message, url));
    } catch (const NotifyError& e) {
        std::cerr << "[notify ERROR] Error showing notification: " << e.what() << std::endl;
        return kExitNotifyFailed;
    }
    return kExitOk;
}
