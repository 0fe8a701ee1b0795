#pragma once

#include "shared/ReactBlessedErrors.h"

#include <functional>
#include <string>

namespace reactblessed {

enum class LogLevel {
  Warning,
  Error,
};

using LogSink = std::function<void(LogLevel, const std::string&)>;

void logWarning(const std::string& message);
void logError(const std::string& message);
void logCallbackFailure(const CallbackFailure& failure);

// Replaces the destination of all diagnostics. Passing an empty sink restores
// the default (std::cerr). Returns the previous sink.
LogSink setLogSink(LogSink sink);

} // namespace reactblessed
