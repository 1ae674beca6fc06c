#include "UpdateFetcher.h"

#include <iostream>

#include <nlohmann/json.hpp>

#include "Errors.h"

using json = nlohmann::json;

// null и отсутствие поля трактуем одинаково
template <typename T>
static T field_or(const json& j, const char* key, T def) {
    auto it = j.find(key);
    if (it == j.end() || it->is_null()) return def;
    return it->template get<T>();
}

static Entity decode_entity(const json& e) {
    if (!e.is_object()) throw DecodeError("entity is not an object");

    std::string type = field_or<std::string>(e, "type", "");
    int offset = field_or<int>(e, "offset", 0);
    int length = field_or<int>(e, "length", 0);

    if (type == "url") {
        // нет поля url -> пустая строка, из текста ссылку не достаём
        return UrlEntity{offset, length, field_or<std::string>(e, "url", "")};
    }

    return OtherEntity{type, offset, length};
}

static Message decode_message(const json& m) {
    if (!m.is_object()) throw DecodeError("message is not an object");

    Message msg;
    msg.message_id = field_or<long long>(m, "message_id", 0LL);
    msg.text = field_or<std::string>(m, "text", "");

    if (m.contains("entities") && !m["entities"].is_null()) {
        const auto& arr = m["entities"];
        if (!arr.is_array()) throw DecodeError("message.entities is not an array");
        for (const auto& e : arr) {
            msg.entities.push_back(decode_entity(e));
        }
    }
    return msg;
}

std::vector<Update> decodeUpdates(const HttpResponse& response) {
    const std::string where = " (HTTP " + std::to_string(response.status) + ")";

    try {
        json j = json::parse(response.body);
        if (!j.is_object()) throw DecodeError("response is not a JSON object" + where);

        if (!j.contains("ok") || !j["ok"].is_boolean()) {
            throw DecodeError("response has no boolean 'ok'" + where);
        }

        if (!j["ok"].get<bool>()) {
            // error_code/description необязательны: их тип не влияет на вид ошибки
            int code = 0;
            if (j.contains("error_code") && j["error_code"].is_number_integer()) {
                code = j["error_code"].get<int>();
            }
            std::string description;
            if (j.contains("description") && j["description"].is_string()) {
                description = j["description"].get<std::string>();
            }
            throw ApiError(code, description);
        }

        if (!j.contains("result") || !j["result"].is_array()) {
            throw DecodeError("response has no 'result' array" + where);
        }

        std::vector<Update> out;
        for (const auto& u : j["result"]) {
            if (!u.is_object()) throw DecodeError("update is not an object" + where);

            Update upd;
            upd.update_id = field_or<long long>(u, "update_id", 0LL);
            if (u.contains("message") && !u["message"].is_null()) {
                upd.message = decode_message(u["message"]);
            }
            out.push_back(std::move(upd));
        }
        return out;
    } catch (const json::exception& e) {
        throw DecodeError(std::string("malformed getUpdates response") + where + ": " + e.what());
    }
}

std::string redactToken(const std::string& url, const std::string& token) {
    if (token.empty()) return url;

    std::string out = url;
    const std::string marker = "<redacted>";
    size_t pos = 0;
    while ((pos = out.find(token, pos)) != std::string::npos) {
        out.replace(pos, token.size(), marker);
        pos += marker.size();
    }
    return out;
}

UpdateFetcher::UpdateFetcher(HttpTransport& transport, const std::string& apiBase)
    : transport(transport),
      apiBase(apiBase) {}

std::vector<Update> UpdateFetcher::fetchUpdates(const std::string& token) {
    const std::string url = apiBase + "/bot" + token + "/getUpdates";
    std::cout << "[telephish] GET " << redactToken(url, token) << std::endl;

    HttpResponse response;
    try {
        response = transport.get(url);
    } catch (const NetworkError& e) {
        throw NetworkError(redactToken(e.what(), token));
    }

    auto updates = decodeUpdates(response);

    std::cout << "[telephish] received " << updates.size() << " update(s)" << std::endl;
    return updates;
}
