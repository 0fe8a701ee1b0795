#pragma once

#include <bitset>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>

namespace reactblessed {

enum class WidgetKind : uint8_t {
  Screen,
  Element,
  Box,
  Text,
  Line,
  ScrollableBox,
  ScrollableText,
  List,
  ListBar,
  Form,
  Textarea,
  Textbox,
  Button,
  Checkbox,
  RadioSet,
  RadioButton,
  ProgressBar,
  Log,
  Table,
  ListTable,
  Message,
  Loading,
  Prompt,
  Question,
};

// Resolves an element type ("box", "List") to a creatable widget kind. The
// screen itself is never creatable from an element.
std::optional<WidgetKind> widgetKindFromType(const std::string& type);
const char* widgetKindName(WidgetKind kind);

enum class WidgetEventType : uint8_t {
  Click,
  MouseDown,
  MouseUp,
  MouseOver,
  MouseOut,
  MouseMove,
  WheelDown,
  WheelUp,
  Keypress,
  Focus,
  Blur,
  Resize,
  Show,
  Hide,
  Attach,
  Detach,
  Move,
  Scroll,
  Select,
  SelectItem,
  Action,
  Cancel,
  Submit,
  Press,
  Check,
  Uncheck,
  SetContent,
  Complete,
  Count,
};

inline constexpr std::size_t kWidgetEventTypeCount =
  static_cast<std::size_t>(WidgetEventType::Count);

using WidgetEventSet = std::bitset<kWidgetEventTypeCount>;

// Accepts the blessed spelling ("select item") as well as joined or
// camel-cased variants ("selectItem", "SELECT-ITEM").
std::optional<WidgetEventType> parseWidgetEventType(const std::string& name);

// Name the widget emits, e.g. "select item".
const char* widgetEventName(WidgetEventType type);

// Prop carrying the handler, e.g. "onSelectItem".
std::string eventHandlerPropName(WidgetEventType type);

// Events a widget of this kind can emit.
WidgetEventSet supportedEvents(WidgetKind kind);

bool isListKind(WidgetKind kind);
bool isScrollableKind(WidgetKind kind);
bool isInputKind(WidgetKind kind);

} // namespace reactblessed
