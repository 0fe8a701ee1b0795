#include "react-blessed/ReactBlessedAttributes.h"

#include "shared/ReactBlessedFeatureFlags.h"

#include <algorithm>
#include <array>
#include <cmath>
#include <cstring>
#include <sstream>
#include <stdexcept>

namespace reactblessed {

namespace {

std::invalid_argument unsupported(const std::string& name) {
  return std::invalid_argument("Unsupported value for prop \"" + name + "\"");
}

// Whole numbers print without a fraction up to 2^53; beyond that they are
// formatted in shortest form.
constexpr double kExactIntegerLimit = 9007199254740992.0;

std::string numberToText(const std::string& name, double number) {
  if (!std::isfinite(number)) {
    throw unsupported(name);
  }
  if (std::abs(number) <= kExactIntegerLimit) {
    const auto integral = static_cast<long long>(number);
    if (static_cast<double>(integral) == number) {
      return std::to_string(integral);
    }
    return std::to_string(number);
  }
  std::ostringstream out;
  out << number;
  return out.str();
}

int toCells(const std::string& name, double number) {
  if (!std::isfinite(number)) {
    throw unsupported(name);
  }
  const double limit = static_cast<double>(kMaxCells);
  return static_cast<int>(std::min(std::max(number, -limit), limit));
}

std::string readString(jsi::Runtime& runtime, const std::string& name, const jsi::Value& value) {
  if (value.isString()) {
    return value.getString(runtime).utf8(runtime);
  }
  if (value.isNumber()) {
    return numberToText(name, value.getNumber());
  }
  throw unsupported(name);
}

bool readBool(const std::string& name, const jsi::Value& value) {
  if (value.isBool()) {
    return value.getBool();
  }
  if (value.isNumber()) {
    return value.getNumber() != 0;
  }
  throw unsupported(name);
}

int readInt(const std::string& name, const jsi::Value& value) {
  if (!value.isNumber()) {
    throw unsupported(name);
  }
  return toCells(name, value.getNumber());
}

Dimension readDimension(jsi::Runtime& runtime, const std::string& name, const jsi::Value& value) {
  if (value.isNumber()) {
    return toCells(name, value.getNumber());
  }
  if (value.isString()) {
    return value.getString(runtime).utf8(runtime);
  }
  throw unsupported(name);
}

template <typename Fn>
void forEachProperty(jsi::Runtime& runtime, const jsi::Object& object, Fn&& fn) {
  auto names = object.getPropertyNames(runtime);
  const auto count = names.size(runtime);
  for (std::size_t index = 0; index < count; ++index) {
    auto nameValue = names.getValueAtIndex(runtime, index);
    if (!nameValue.isString()) {
      continue;
    }
    const auto name = nameValue.getString(runtime).utf8(runtime);
    auto value = object.getProperty(runtime, name.c_str());
    fn(name, value);
  }
}

bool applyCellStyleKey(jsi::Runtime& runtime, CellStyle& style, const std::string& key, const jsi::Value& value) {
  if (value.isNull() || value.isUndefined()) {
    return true;
  }
  if (key == "fg") {
    style.fg = readString(runtime, key, value);
  } else if (key == "bg") {
    style.bg = readString(runtime, key, value);
  } else if (key == "bold") {
    style.bold = readBool(key, value);
  } else if (key == "underline") {
    style.underline = readBool(key, value);
  } else if (key == "blink") {
    style.blink = readBool(key, value);
  } else if (key == "inverse") {
    style.inverse = readBool(key, value);
  } else if (key == "invisible") {
    style.invisible = readBool(key, value);
  } else {
    return false;
  }
  return true;
}

void readCellStyle(jsi::Runtime& runtime, const std::string& name, const jsi::Value& value, CellStyle& style) {
  if (!value.isObject()) {
    throw unsupported(name);
  }
  forEachProperty(runtime, value.getObject(runtime), [&](const std::string& key, const jsi::Value& entry) {
    applyCellStyleKey(runtime, style, key, entry);
  });
}

StyleOptions readStyle(jsi::Runtime& runtime, const jsi::Value& value) {
  if (!value.isObject()) {
    throw unsupported("style");
  }
  StyleOptions style;
  forEachProperty(runtime, value.getObject(runtime), [&](const std::string& key, const jsi::Value& entry) {
    if (applyCellStyleKey(runtime, style.base, key, entry)) {
      return;
    }
    if (entry.isNull() || entry.isUndefined()) {
      return;
    }
    const std::string path = "style." + key;
    if (key == "border") {
      readCellStyle(runtime, path, entry, style.border);
    } else if (key == "label") {
      readCellStyle(runtime, path, entry, style.label);
    } else if (key == "focus") {
      readCellStyle(runtime, path, entry, style.focus);
    } else if (key == "hover") {
      readCellStyle(runtime, path, entry, style.hover);
    } else if (key == "selected") {
      readCellStyle(runtime, path, entry, style.selected);
    } else if (key == "item") {
      readCellStyle(runtime, path, entry, style.item);
    } else if (key == "bar") {
      readCellStyle(runtime, path, entry, style.bar);
    }
  });
  return style;
}

BorderType readBorderType(const std::string& type) {
  if (type == "line") {
    return BorderType::Line;
  }
  if (type == "bg") {
    return BorderType::Bg;
  }
  throw unsupported("border");
}

BorderOptions readBorder(jsi::Runtime& runtime, const jsi::Value& value) {
  BorderOptions border;
  if (value.isString()) {
    border.type = readBorderType(value.getString(runtime).utf8(runtime));
    return border;
  }
  if (value.isBool()) {
    return border;
  }
  if (!value.isObject()) {
    throw unsupported("border");
  }
  forEachProperty(runtime, value.getObject(runtime), [&](const std::string& key, const jsi::Value& entry) {
    if (entry.isNull() || entry.isUndefined()) {
      return;
    }
    if (key == "type") {
      border.type = readBorderType(readString(runtime, "border.type", entry));
    } else if (key == "ch") {
      border.ch = readString(runtime, "border.ch", entry);
    } else {
      applyCellStyleKey(runtime, border.style, key, entry);
    }
  });
  return border;
}

Padding readPadding(jsi::Runtime& runtime, const jsi::Value& value) {
  if (value.isNumber()) {
    const int all = toCells("padding", value.getNumber());
    return Padding{all, all, all, all};
  }
  if (!value.isObject()) {
    throw unsupported("padding");
  }
  Padding padding;
  forEachProperty(runtime, value.getObject(runtime), [&](const std::string& key, const jsi::Value& entry) {
    if (!entry.isNumber()) {
      return;
    }
    if (key == "left") {
      padding.left = readInt(key, entry);
    } else if (key == "right") {
      padding.right = readInt(key, entry);
    } else if (key == "top") {
      padding.top = readInt(key, entry);
    } else if (key == "bottom") {
      padding.bottom = readInt(key, entry);
    }
  });
  return padding;
}

std::vector<std::string> readItems(jsi::Runtime& runtime, const jsi::Value& value) {
  if (!value.isObject() || !value.getObject(runtime).isArray(runtime)) {
    throw unsupported("items");
  }
  auto array = value.getObject(runtime).getArray(runtime);
  std::vector<std::string> items;
  const auto count = array.size(runtime);
  items.reserve(count);
  for (std::size_t index = 0; index < count; ++index) {
    items.push_back(readString(runtime, "items", array.getValueAtIndex(runtime, index)));
  }
  return items;
}

Dimension* dimensionField(WidgetOptions& options, const std::string& name) {
  if (name == "top") {
    return &options.top;
  }
  if (name == "left") {
    return &options.left;
  }
  if (name == "right") {
    return &options.right;
  }
  if (name == "bottom") {
    return &options.bottom;
  }
  if (name == "width") {
    return &options.width;
  }
  if (name == "height") {
    return &options.height;
  }
  return nullptr;
}

std::optional<std::string>* stringField(WidgetOptions& options, const std::string& name) {
  if (name == "content") {
    return &options.content;
  }
  if (name == "label") {
    return &options.label;
  }
  if (name == "name") {
    return &options.name;
  }
  if (name == "align") {
    return &options.align;
  }
  if (name == "valign") {
    return &options.valign;
  }
  if (name == "orientation") {
    return &options.orientation;
  }
  if (name == "value") {
    return &options.value;
  }
  return nullptr;
}

std::optional<bool>* boolField(WidgetOptions& options, const std::string& name) {
  if (name == "hidden") {
    return &options.hidden;
  }
  if (name == "scrollable") {
    return &options.scrollable;
  }
  if (name == "alwaysScroll") {
    return &options.alwaysScroll;
  }
  if (name == "keys") {
    return &options.keys;
  }
  if (name == "vi") {
    return &options.vi;
  }
  if (name == "mouse") {
    return &options.mouse;
  }
  if (name == "tags") {
    return &options.tags;
  }
  if (name == "shrink") {
    return &options.shrink;
  }
  if (name == "focused") {
    return &options.focused;
  }
  if (name == "inputOnFocus") {
    return &options.inputOnFocus;
  }
  if (name == "checked") {
    return &options.checked;
  }
  return nullptr;
}

bool isReservedProp(const std::string& name) {
  static constexpr std::array<const char*, 4> kReserved{{"children", "key", "ref", "class"}};
  for (const char* reserved : kReserved) {
    if (name == reserved) {
      return true;
    }
  }
  return false;
}

bool isFunctionValue(jsi::Runtime& runtime, const jsi::Value& value) {
  return value.isObject() && value.getObject(runtime).isFunction(runtime);
}

void applyClass(jsi::Runtime& runtime, WidgetOptions& options, const jsi::Value& value) {
  if (!value.isObject()) {
    // `false`, `null` and friends are how conditional classes drop out.
    return;
  }
  auto object = value.getObject(runtime);
  if (object.isArray(runtime)) {
    auto array = object.getArray(runtime);
    const auto count = array.size(runtime);
    for (std::size_t index = 0; index < count; ++index) {
      applyClass(runtime, options, array.getValueAtIndex(runtime, index));
    }
    return;
  }
  forEachProperty(runtime, object, [&](const std::string& name, const jsi::Value& entry) {
    applyWidgetProp(runtime, options, name, entry);
  });
}

} // namespace

bool isEventHandlerProp(const std::string& name) {
  const std::size_t prefixLength = std::strlen(kEventHandlerPrefix);
  return name.size() > prefixLength &&
    name.compare(0, prefixLength, kEventHandlerPrefix) == 0 &&
    name[prefixLength] >= 'A' && name[prefixLength] <= 'Z';
}

void applyWidgetProp(
  jsi::Runtime& runtime,
  WidgetOptions& options,
  const std::string& name,
  const jsi::Value& value) {
  if (isReservedProp(name) || value.isNull() || value.isUndefined()) {
    return;
  }
  if (isFunctionValue(runtime, value)) {
    return;
  }
  if (isEventHandlerProp(name)) {
    return;
  }

  if (auto* dimension = dimensionField(options, name)) {
    *dimension = readDimension(runtime, name, value);
    return;
  }
  if (auto* text = stringField(options, name)) {
    *text = readString(runtime, name, value);
    return;
  }
  if (auto* flag = boolField(options, name)) {
    *flag = readBool(name, value);
    return;
  }
  if (name == "border") {
    options.border = readBorder(runtime, value);
    return;
  }
  if (name == "style") {
    options.style.mergeFrom(readStyle(runtime, value));
    return;
  }
  if (name == "padding") {
    options.padding = readPadding(runtime, value);
    return;
  }
  if (name == "items") {
    options.items = readItems(runtime, value);
    return;
  }
  if (name == "filled") {
    if (!value.isNumber() || std::isnan(value.getNumber())) {
      throw unsupported(name);
    }
    options.filled = value.getNumber();
    return;
  }

  if (value.isBool()) {
    options.extra[name] = value.getBool();
  } else if (value.isNumber()) {
    options.extra[name] = value.getNumber();
  } else if (value.isString()) {
    options.extra[name] = value.getString(runtime).utf8(runtime);
  }
}

WidgetOptions resolveWidgetOptions(jsi::Runtime& runtime, const VirtualElement& element) {
  WidgetOptions options;

  if (const auto* classes = element.findProp("class")) {
    applyClass(runtime, options, *classes);
  }

  for (const auto& entry : element.props) {
    applyWidgetProp(runtime, options, entry.first, entry.second);
  }

  if (element.textContent) {
    options.content = *element.textContent;
  }

  return options;
}

} // namespace reactblessed
