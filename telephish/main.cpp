#include <exception>
#include <iostream>

#include "Config.h"
#include "CurlTransport.h"
#include "LibnotifyPlatform.h"
#include "Notifier.h"
#include "PollRunner.h"
#include "UpdateFetcher.h"

int main() {
    const Config cfg = Config::fromEnv();
    if (cfg.token.empty()) {
        std::cerr << "[telephish] TELEGRAM_BOT_TOKEN not set, getUpdates will most likely be rejected\n";
    }

    try {
        CurlTransport transport(cfg.connectTimeoutSec, cfg.requestTimeoutSec);
        UpdateFetcher fetcher(transport, cfg.apiBase);

        LibnotifyPlatform platform;
        Notifier notifier(platform, cfg.appName, cfg.actionWaitSec);

        PollRunner runner(cfg.token, fetcher, notifier);
        return runner.runOnce();
    } catch (const std::exception& e) {
        std::cerr << "[telephish ERROR] " << e.what() << std::endl;
        return kExitFetchFailed;
    }
}
