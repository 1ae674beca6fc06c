#include "Errors.h"

static std::string api_error_message(int errorCode, const std::string& description) {
    std::string msg = "Bot API rejected getUpdates";
    if (errorCode != 0) msg += " (" + std::to_string(errorCode) + ")";
    if (!description.empty()) msg += ": " + description;
    return msg;
}

ApiError::ApiError(int errorCode, const std::string& description)
    : FetchError(api_error_message(errorCode, description)),
      code(errorCode),
      desc(description) {}

const char* renderStepName(RenderStep step) {
    switch (step) {
        case RenderStep::QueryServer: return "query-server";
        case RenderStep::QueryCapabilities: return "query-capabilities";
        case RenderStep::CreateNotification: return "create-notification";
        case RenderStep::BuildContent: return "build-content";
        case RenderStep::SetContent: return "set-content";
        case RenderStep::AddAction: return "add-action";
        case RenderStep::Show: return "show";
    }
    return "unknown";
}

RenderError::RenderError(RenderStep step, const std::string& detail)
    : NotifyError(std::string("failed at ") + renderStepName(step) + ": " + detail),
      failedStep(step) {}
