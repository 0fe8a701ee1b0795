#include "react-blessed/ReactBlessedEvents.h"

#include <utility>
#include <vector>

namespace reactblessed {

void EventHandlerTable::set(WidgetEventType type, std::shared_ptr<jsi::Function> handler) {
  slots_[static_cast<std::size_t>(type)] = std::move(handler);
}

const std::shared_ptr<jsi::Function>& EventHandlerTable::get(WidgetEventType type) const {
  return slots_[static_cast<std::size_t>(type)];
}

std::size_t EventHandlerTable::size() const {
  std::size_t count = 0;
  for (const auto& slot : slots_) {
    if (slot) {
      ++count;
    }
  }
  return count;
}

EventHandlerTable resolveEventHandlers(
  jsi::Runtime& runtime,
  const VirtualElement& element,
  WidgetKind kind) {
  EventHandlerTable table;
  const WidgetEventSet events = supportedEvents(kind);
  for (std::size_t index = 0; index < kWidgetEventTypeCount; ++index) {
    if (!events.test(index)) {
      continue;
    }
    const auto type = static_cast<WidgetEventType>(index);
    const auto* prop = element.findProp(eventHandlerPropName(type));
    if (prop == nullptr || !prop->isObject()) {
      continue;
    }
    auto object = prop->getObject(runtime);
    if (!object.isFunction(runtime)) {
      continue;
    }
    table.set(type, std::make_shared<jsi::Function>(object.getFunction(runtime)));
  }
  return table;
}

jsi::Value toJsiValue(jsi::Runtime& runtime, const EventValue& value) {
  if (const auto* flag = std::get_if<bool>(&value)) {
    return jsi::Value(*flag);
  }
  if (const auto* number = std::get_if<double>(&value)) {
    return jsi::Value(*number);
  }
  if (const auto* text = std::get_if<std::string>(&value)) {
    return jsi::String::createFromUtf8(runtime, *text);
  }
  return jsi::Value::undefined();
}

bool dispatchWidgetEvent(
  jsi::Runtime& runtime,
  const EventHandlerTable& handlers,
  const WidgetEvent& event) {
  const auto type = parseWidgetEventType(event.type);
  if (!type) {
    return false;
  }
  const auto& handler = handlers.get(*type);
  if (!handler) {
    return false;
  }

  std::vector<jsi::Value> args;
  args.reserve(event.args.size());
  for (const auto& arg : event.args) {
    args.push_back(toJsiValue(runtime, arg));
  }
  handler->call(runtime, static_cast<const jsi::Value*>(args.data()), args.size());
  return true;
}

} // namespace reactblessed
