#pragma once

#include <optional>
#include <string>
#include <variant>
#include <vector>

// Сущность типа "url". Ссылка есть только у неё.
struct UrlEntity {
    int offset{0};
    int length{0};
    std::string url;
};

// Все остальные типы разметки: bold, mention, text_link, ...
struct OtherEntity {
    std::string type;
    int offset{0};
    int length{0};
};

using Entity = std::variant<UrlEntity, OtherEntity>;

struct Message {
    long long message_id{0};
    std::string text;
    std::vector<Entity> entities;
};

struct Update {
    long long update_id{0};
    std::optional<Message> message;
};
