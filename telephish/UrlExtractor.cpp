#include "UrlExtractor.h"

std::string extractUrl(const Message& message) {
    for (const auto& entity : message.entities) {
        if (const auto* link = std::get_if<UrlEntity>(&entity)) {
            return link->url;
        }
    }
    return "";
}
