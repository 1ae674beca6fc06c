#pragma once

#include <stdexcept>
#include <string>

// Ошибки получения апдейтов (UpdateFetcher)

class FetchError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

// curl не смог выполнить запрос (DNS, TLS, таймаут и т.п.)
class NetworkError : public FetchError {
public:
    using FetchError::FetchError;
};

// тело ответа не JSON или не той формы
class DecodeError : public FetchError {
public:
    using FetchError::FetchError;
};

// сервер ответил {"ok": false, ...}
class ApiError : public FetchError {
public:
    ApiError(int errorCode, const std::string& description);

    int errorCode() const { return code; }
    const std::string& description() const { return desc; }

private:
    int code;
    std::string desc;
};

// Ошибки показа уведомления (Notifier)

class NotifyError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

class InitializationError : public NotifyError {
public:
    using NotifyError::NotifyError;
};

enum class RenderStep {
    QueryServer,
    QueryCapabilities,
    CreateNotification,
    BuildContent,
    SetContent,
    AddAction,
    Show
};

const char* renderStepName(RenderStep step);

class RenderError : public NotifyError {
public:
    RenderError(RenderStep step, const std::string& detail);

    RenderStep step() const { return failedStep; }

private:
    RenderStep failedStep;
};
