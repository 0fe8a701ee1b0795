#include "shared/ReactBlessedErrorLogger.h"

#include <iostream>
#include <utility>

namespace reactblessed {

namespace {

LogSink& currentSink() {
  static LogSink sink;
  return sink;
}

void emit(LogLevel level, const std::string& message) {
  auto& sink = currentSink();
  if (sink) {
    sink(level, message);
    return;
  }
  const char* prefix = level == LogLevel::Warning ? "Warning: " : "Error: ";
  std::cerr << "ReactBlessed " << prefix << message << std::endl;
}

} // namespace

void logWarning(const std::string& message) {
  emit(LogLevel::Warning, message);
}

void logError(const std::string& message) {
  emit(LogLevel::Error, message);
}

void logCallbackFailure(const CallbackFailure& failure) {
  emit(
    LogLevel::Error,
    "mount-ready callback #" + std::to_string(failure.index) + " threw: " + failure.message);
}

LogSink setLogSink(LogSink sink) {
  auto previous = std::move(currentSink());
  currentSink() = std::move(sink);
  return previous;
}

} // namespace reactblessed
