#include "blessed/WidgetLibrary.h"

#include "blessed/BlessedScreen.h"
#include "blessed/BlessedWidgetKind.h"
#include "shared/ReactBlessedErrors.h"

#include <stdexcept>
#include <utility>

namespace reactblessed {

namespace {

void requireHandle(const WidgetHandle& handle, const char* operation) {
  if (!handle) {
    throw std::invalid_argument(std::string(operation) + ": widget handle is null");
  }
}

} // namespace

BlessedWidgetLibrary::BlessedWidgetLibrary(std::shared_ptr<Screen> screen)
  : screen_(std::move(screen)) {
  if (!screen_) {
    throw std::invalid_argument("BlessedWidgetLibrary requires a screen");
  }
}

bool BlessedWidgetLibrary::hasWidgetType(const std::string& type) const {
  return widgetKindFromType(type).has_value();
}

WidgetHandle BlessedWidgetLibrary::createWidget(const std::string& type, const WidgetOptions& options) {
  const auto kind = widgetKindFromType(type);
  if (!kind) {
    throw UnknownWidgetTypeError(type);
  }
  return std::make_shared<BlessedNode>(*kind, options);
}

void BlessedWidgetLibrary::attach(const WidgetHandle& parent, const WidgetHandle& child) {
  requireHandle(parent, "attach");
  requireHandle(child, "attach");
  parent->append(child);
  if (child->options().focused.value_or(false) && !child->focused()) {
    child->focus();
  }
}

void BlessedWidgetLibrary::insertAt(const WidgetHandle& parent, const WidgetHandle& child, std::size_t index) {
  requireHandle(parent, "insertAt");
  requireHandle(child, "insertAt");
  parent->insert(child, index);
}

void BlessedWidgetLibrary::detach(const WidgetHandle& parent, const WidgetHandle& child) {
  requireHandle(parent, "detach");
  requireHandle(child, "detach");
  parent->remove(child);
}

void BlessedWidgetLibrary::applyOptions(const WidgetHandle& handle, const WidgetOptions& options) {
  requireHandle(handle, "applyOptions");
  handle->applyOptions(options);
}

void BlessedWidgetLibrary::onAnyEvent(const WidgetHandle& handle, AnyEventListener dispatcher) {
  requireHandle(handle, "onAnyEvent");
  handle->onAny(std::move(dispatcher));
}

void BlessedWidgetLibrary::offAllEvents(const WidgetHandle& handle) {
  requireHandle(handle, "offAllEvents");
  handle->offAny();
}

void BlessedWidgetLibrary::requestDebouncedRedraw() {
  screen_->debouncedRender();
}

WidgetHandle BlessedWidgetLibrary::rootSurface() const {
  return screen_;
}

} // namespace reactblessed
