#pragma once

#include "blessed/BlessedNode.h"
#include "blessed/BlessedWidgetKind.h"
#include "react-blessed/ReactBlessedElement.h"

#include <array>
#include <cstddef>
#include <memory>

namespace reactblessed {

// Handler slots of one mounted widget, one per event type its kind can emit.
class EventHandlerTable {
public:
  void set(WidgetEventType type, std::shared_ptr<jsi::Function> handler);
  const std::shared_ptr<jsi::Function>& get(WidgetEventType type) const;

  [[nodiscard]] bool has(WidgetEventType type) const {
    return get(type) != nullptr;
  }

  // Number of filled slots.
  std::size_t size() const;

private:
  std::array<std::shared_ptr<jsi::Function>, kWidgetEventTypeCount> slots_{};
};

// Reads `on<Event>` function props for every event `kind` supports. Props
// naming events the kind never emits are ignored.
EventHandlerTable resolveEventHandlers(
  jsi::Runtime& runtime,
  const VirtualElement& element,
  WidgetKind kind);

// Invokes the slot matching `event` with its arguments. Returns false when the
// event is unknown or has no handler.
bool dispatchWidgetEvent(
  jsi::Runtime& runtime,
  const EventHandlerTable& handlers,
  const WidgetEvent& event);

jsi::Value toJsiValue(jsi::Runtime& runtime, const EventValue& value);

} // namespace reactblessed
