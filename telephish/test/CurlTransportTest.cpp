#include <cassert>
#include <iostream>
#include <string>
#include <thread>

#include <httplib.h>
#include <nlohmann/json.hpp>

#include "CurlTransport.h"
#include "Errors.h"
#include "UpdateFetcher.h"

using json = nlohmann::json;

static void reply_json(httplib::Response& res, int status, const json& body) {
    res.status = status;
    res.set_content(body.dump(), "application/json");
}

int main() {
    std::cout << "[Test] CurlTransport against mock Bot API..." << std::endl;

    httplib::Server app;

    app.set_logger([](const httplib::Request& req, const httplib::Response& res) {
        std::cout << "[BOT_API_MOCK] " << req.method << " " << req.path
                  << " status=" << res.status << std::endl;
    });

    app.Get(R"(/bot([^/]+)/getUpdates)", [](const httplib::Request& req, httplib::Response& res) {
        const std::string token = req.matches[1];

        if (token == "GOOD") {
            json msg = {
                {"message_id", 11},
                {"text", "read https://mock.test/page"},
                {"entities", json::array({
                    {{"type", "url"}, {"offset", 5}, {"length", 22}, {"url", "https://mock.test/page"}}
                })}
            };
            reply_json(res, 200, json{{"ok", true}, {"result", json::array({
                {{"update_id", 100}},
                {{"update_id", 101}, {"message", msg}}
            })}});
            return;
        }

        if (token == "BROKEN") {
            res.status = 502;
            res.set_content("<html><body>Bad Gateway</body></html>", "text/html");
            return;
        }

        reply_json(res, 401, json{{"ok", false}, {"error_code", 401}, {"description", "Unauthorized"}});
    });

    const int port = app.bind_to_any_port("127.0.0.1");
    assert(port > 0);
    std::thread server([&app]() { app.listen_after_bind(); });
    app.wait_until_ready();

    const std::string base = "http://127.0.0.1:" + std::to_string(port);

    CurlTransport transport(5, 10);
    UpdateFetcher fetcher(transport, base);

    {
        auto updates = fetcher.fetchUpdates("GOOD");
        assert(updates.size() == 2);
        assert(!updates[0].message);
        assert(updates[1].update_id == 101);
        assert(updates[1].message->text == "read https://mock.test/page");

        const auto& link = std::get<UrlEntity>(updates[1].message->entities.at(0));
        assert(link.url == "https://mock.test/page");
    }

    {
        bool thrown = false;
        try {
            fetcher.fetchUpdates("WRONG");
        } catch (const ApiError& e) {
            thrown = true;
            assert(e.errorCode() == 401);
        }
        assert(thrown);
    }

    {
        HttpResponse raw = transport.get(base + "/botBROKEN/getUpdates");
        assert(raw.status == 502);

        bool thrown = false;
        try {
            fetcher.fetchUpdates("BROKEN");
        } catch (const ApiError&) {
            assert(false && "HTML body is a decode failure, not an API rejection");
        } catch (const DecodeError& e) {
            thrown = true;
            assert(std::string(e.what()).find("502") != std::string::npos);
        }
        assert(thrown);
    }

    app.stop();
    server.join();

    {
        // порт закрыт -> ошибка транспорта
        bool thrown = false;
        try {
            fetcher.fetchUpdates("GOOD");
        } catch (const NetworkError&) {
            thrown = true;
        }
        assert(thrown);
    }

    std::cout << "[Test] CurlTransport passed." << std::endl;
    return 0;
}
