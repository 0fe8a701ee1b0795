#include "blessed/BlessedWidgetKind.h"

#include "shared/ReactBlessedFeatureFlags.h"

#include <array>
#include <cctype>
#include <initializer_list>
#include <utility>

namespace reactblessed {

namespace {

struct KindEntry {
  const char* name;
  WidgetKind kind;
};

constexpr std::array<KindEntry, 24> kKinds{{
  {"screen", WidgetKind::Screen},
  {"element", WidgetKind::Element},
  {"box", WidgetKind::Box},
  {"text", WidgetKind::Text},
  {"line", WidgetKind::Line},
  {"scrollablebox", WidgetKind::ScrollableBox},
  {"scrollabletext", WidgetKind::ScrollableText},
  {"list", WidgetKind::List},
  {"listbar", WidgetKind::ListBar},
  {"form", WidgetKind::Form},
  {"textarea", WidgetKind::Textarea},
  {"textbox", WidgetKind::Textbox},
  {"button", WidgetKind::Button},
  {"checkbox", WidgetKind::Checkbox},
  {"radioset", WidgetKind::RadioSet},
  {"radiobutton", WidgetKind::RadioButton},
  {"progressbar", WidgetKind::ProgressBar},
  {"log", WidgetKind::Log},
  {"table", WidgetKind::Table},
  {"listtable", WidgetKind::ListTable},
  {"message", WidgetKind::Message},
  {"loading", WidgetKind::Loading},
  {"prompt", WidgetKind::Prompt},
  {"question", WidgetKind::Question},
}};

constexpr std::array<const char*, kWidgetEventTypeCount> kEventNames{{
  "click",
  "mousedown",
  "mouseup",
  "mouseover",
  "mouseout",
  "mousemove",
  "wheeldown",
  "wheelup",
  "keypress",
  "focus",
  "blur",
  "resize",
  "show",
  "hide",
  "attach",
  "detach",
  "move",
  "scroll",
  "select",
  "select item",
  "action",
  "cancel",
  "submit",
  "press",
  "check",
  "uncheck",
  "set content",
  "complete",
}};

std::string toLower(const std::string& value) {
  std::string lowered;
  lowered.reserve(value.size());
  for (unsigned char c : value) {
    lowered.push_back(static_cast<char>(std::tolower(c)));
  }
  return lowered;
}

std::string normalizeEventName(const std::string& name) {
  std::string normalized;
  normalized.reserve(name.size());
  for (unsigned char c : name) {
    if (c == ' ' || c == '-' || c == '_') {
      continue;
    }
    normalized.push_back(static_cast<char>(std::tolower(c)));
  }
  return normalized;
}

WidgetEventSet makeSet(std::initializer_list<WidgetEventType> types) {
  WidgetEventSet set;
  for (auto type : types) {
    set.set(static_cast<std::size_t>(type));
  }
  return set;
}

const WidgetEventSet& baseElementEvents() {
  static const WidgetEventSet events = makeSet({
    WidgetEventType::Click,
    WidgetEventType::MouseDown,
    WidgetEventType::MouseUp,
    WidgetEventType::MouseOver,
    WidgetEventType::MouseOut,
    WidgetEventType::MouseMove,
    WidgetEventType::WheelDown,
    WidgetEventType::WheelUp,
    WidgetEventType::Keypress,
    WidgetEventType::Focus,
    WidgetEventType::Blur,
    WidgetEventType::Resize,
    WidgetEventType::Show,
    WidgetEventType::Hide,
    WidgetEventType::Attach,
    WidgetEventType::Detach,
    WidgetEventType::Move,
    WidgetEventType::SetContent,
  });
  return events;
}

} // namespace

std::optional<WidgetKind> widgetKindFromType(const std::string& type) {
  const std::string lowered = toLower(type);
  for (const auto& entry : kKinds) {
    if (lowered == entry.name) {
      if (entry.kind == WidgetKind::Screen) {
        return std::nullopt;
      }
      return entry.kind;
    }
  }
  return std::nullopt;
}

const char* widgetKindName(WidgetKind kind) {
  for (const auto& entry : kKinds) {
    if (entry.kind == kind) {
      return entry.name;
    }
  }
  return "element";
}

std::optional<WidgetEventType> parseWidgetEventType(const std::string& name) {
  const std::string normalized = normalizeEventName(name);
  if (normalized.empty()) {
    return std::nullopt;
  }
  for (std::size_t index = 0; index < kEventNames.size(); ++index) {
    if (normalizeEventName(kEventNames[index]) == normalized) {
      return static_cast<WidgetEventType>(index);
    }
  }
  return std::nullopt;
}

const char* widgetEventName(WidgetEventType type) {
  const auto index = static_cast<std::size_t>(type);
  if (index >= kEventNames.size()) {
    return "";
  }
  return kEventNames[index];
}

std::string eventHandlerPropName(WidgetEventType type) {
  std::string propName = kEventHandlerPrefix;
  bool capitalizeNext = true;
  for (const char* cursor = widgetEventName(type); *cursor != '\0'; ++cursor) {
    const unsigned char c = static_cast<unsigned char>(*cursor);
    if (c == ' ') {
      capitalizeNext = true;
      continue;
    }
    propName.push_back(static_cast<char>(capitalizeNext ? std::toupper(c) : c));
    capitalizeNext = false;
  }
  return propName;
}

WidgetEventSet supportedEvents(WidgetKind kind) {
  WidgetEventSet events = baseElementEvents();
  if (isScrollableKind(kind)) {
    events |= makeSet({WidgetEventType::Scroll});
  }

  switch (kind) {
    case WidgetKind::List:
    case WidgetKind::ListTable:
      events |= makeSet({
        WidgetEventType::Select,
        WidgetEventType::SelectItem,
        WidgetEventType::Action,
        WidgetEventType::Cancel,
      });
      break;
    case WidgetKind::ListBar:
      events |= makeSet({WidgetEventType::Select, WidgetEventType::SelectItem});
      break;
    case WidgetKind::Form:
      events |= makeSet({WidgetEventType::Submit, WidgetEventType::Cancel});
      break;
    case WidgetKind::Textarea:
    case WidgetKind::Textbox:
    case WidgetKind::Prompt:
    case WidgetKind::Question:
      events |= makeSet({
        WidgetEventType::Submit,
        WidgetEventType::Cancel,
        WidgetEventType::Action,
      });
      break;
    case WidgetKind::Button:
      events |= makeSet({WidgetEventType::Press});
      break;
    case WidgetKind::Checkbox:
    case WidgetKind::RadioButton:
      events |= makeSet({WidgetEventType::Check, WidgetEventType::Uncheck});
      break;
    case WidgetKind::ProgressBar:
      events |= makeSet({WidgetEventType::Complete});
      break;
    default:
      break;
  }
  return events;
}

bool isListKind(WidgetKind kind) {
  return kind == WidgetKind::List || kind == WidgetKind::ListBar || kind == WidgetKind::ListTable;
}

bool isScrollableKind(WidgetKind kind) {
  switch (kind) {
    case WidgetKind::Box:
    case WidgetKind::ScrollableBox:
    case WidgetKind::ScrollableText:
    case WidgetKind::List:
    case WidgetKind::ListTable:
    case WidgetKind::Log:
    case WidgetKind::Textarea:
    case WidgetKind::Table:
      return true;
    default:
      return false;
  }
}

bool isInputKind(WidgetKind kind) {
  switch (kind) {
    case WidgetKind::Textarea:
    case WidgetKind::Textbox:
    case WidgetKind::Button:
    case WidgetKind::Checkbox:
    case WidgetKind::RadioButton:
      return true;
    default:
      return false;
  }
}

} // namespace reactblessed
