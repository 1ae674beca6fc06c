#pragma once

#include <string>

#include "Update.h"

// Возвращает url первой сущности типа "url" (по порядку), либо "" если таких нет.
// Пустая строка — это не ошибка, а обычный случай "ссылки нет".
std::string extractUrl(const Message& message);
