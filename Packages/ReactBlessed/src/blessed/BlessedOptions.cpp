#include "blessed/BlessedOptions.h"

namespace reactblessed {

namespace {

template <typename T>
void mergeField(std::optional<T>& target, const std::optional<T>& source) {
  if (source.has_value()) {
    target = source;
  }
}

void mergeDimension(Dimension& target, const Dimension& source) {
  if (isSet(source)) {
    target = source;
  }
}

} // namespace

void CellStyle::mergeFrom(const CellStyle& other) {
  mergeField(fg, other.fg);
  mergeField(bg, other.bg);
  mergeField(bold, other.bold);
  mergeField(underline, other.underline);
  mergeField(blink, other.blink);
  mergeField(inverse, other.inverse);
  mergeField(invisible, other.invisible);
}

bool CellStyle::empty() const {
  return !fg && !bg && !bold && !underline && !blink && !inverse && !invisible;
}

void StyleOptions::mergeFrom(const StyleOptions& other) {
  base.mergeFrom(other.base);
  border.mergeFrom(other.border);
  label.mergeFrom(other.label);
  focus.mergeFrom(other.focus);
  hover.mergeFrom(other.hover);
  selected.mergeFrom(other.selected);
  item.mergeFrom(other.item);
  bar.mergeFrom(other.bar);
}

void WidgetOptions::mergeFrom(const WidgetOptions& other) {
  mergeDimension(top, other.top);
  mergeDimension(left, other.left);
  mergeDimension(right, other.right);
  mergeDimension(bottom, other.bottom);
  mergeDimension(width, other.width);
  mergeDimension(height, other.height);

  mergeField(content, other.content);
  mergeField(label, other.label);
  mergeField(name, other.name);
  mergeField(align, other.align);
  mergeField(valign, other.valign);
  mergeField(orientation, other.orientation);
  mergeField(value, other.value);

  if (other.border) {
    if (!border) {
      border = other.border;
    } else {
      border->type = other.border->type;
      mergeField(border->ch, other.border->ch);
      border->style.mergeFrom(other.border->style);
    }
  }
  style.mergeFrom(other.style);
  mergeField(padding, other.padding);

  mergeField(hidden, other.hidden);
  mergeField(scrollable, other.scrollable);
  mergeField(alwaysScroll, other.alwaysScroll);
  mergeField(keys, other.keys);
  mergeField(vi, other.vi);
  mergeField(mouse, other.mouse);
  mergeField(tags, other.tags);
  mergeField(shrink, other.shrink);
  mergeField(focused, other.focused);
  mergeField(inputOnFocus, other.inputOnFocus);
  mergeField(checked, other.checked);

  mergeField(items, other.items);
  mergeField(filled, other.filled);

  for (const auto& [key, value] : other.extra) {
    extra[key] = value;
  }
}

bool isSet(const Dimension& dimension) {
  return !std::holds_alternative<std::monostate>(dimension);
}

std::string dimensionToString(const Dimension& dimension) {
  if (const auto* cells = std::get_if<int>(&dimension)) {
    return std::to_string(*cells);
  }
  if (const auto* expression = std::get_if<std::string>(&dimension)) {
    return *expression;
  }
  return std::string{};
}

} // namespace reactblessed
