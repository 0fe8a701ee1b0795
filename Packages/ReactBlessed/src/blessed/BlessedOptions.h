#pragma once

#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <variant>
#include <vector>

namespace reactblessed {

// Cell counts and offsets saturate at this magnitude.
constexpr int kMaxCells = 32767;

// Position or size: absolute cells, or an expression such as "50%",
// "50%-2", "center", "half" or "shrink". monostate means unset.
using Dimension = std::variant<std::monostate, int, std::string>;

// Primitive option passed through to the widget untouched.
using OptionValue = std::variant<std::monostate, bool, double, std::string>;

struct CellStyle {
  std::optional<std::string> fg;
  std::optional<std::string> bg;
  std::optional<bool> bold;
  std::optional<bool> underline;
  std::optional<bool> blink;
  std::optional<bool> inverse;
  std::optional<bool> invisible;

  void mergeFrom(const CellStyle& other);
  [[nodiscard]] bool empty() const;
};

struct StyleOptions {
  CellStyle base;
  CellStyle border;
  CellStyle label;
  CellStyle focus;
  CellStyle hover;
  CellStyle selected;
  CellStyle item;
  CellStyle bar;

  void mergeFrom(const StyleOptions& other);
};

enum class BorderType : uint8_t {
  Line,
  Bg,
};

struct BorderOptions {
  BorderType type{BorderType::Line};
  std::optional<std::string> ch;
  CellStyle style;
};

struct Padding {
  int left{0};
  int right{0};
  int top{0};
  int bottom{0};
};

// Construction and update options of a widget. Every field is optional;
// mergeFrom() overwrites only the fields the other side sets.
struct WidgetOptions {
  Dimension top;
  Dimension left;
  Dimension right;
  Dimension bottom;
  Dimension width;
  Dimension height;

  std::optional<std::string> content;
  std::optional<std::string> label;
  std::optional<std::string> name;
  std::optional<std::string> align;
  std::optional<std::string> valign;
  std::optional<std::string> orientation;
  std::optional<std::string> value;

  std::optional<BorderOptions> border;
  StyleOptions style;
  std::optional<Padding> padding;

  std::optional<bool> hidden;
  std::optional<bool> scrollable;
  std::optional<bool> alwaysScroll;
  std::optional<bool> keys;
  std::optional<bool> vi;
  std::optional<bool> mouse;
  std::optional<bool> tags;
  std::optional<bool> shrink;
  std::optional<bool> focused;
  std::optional<bool> inputOnFocus;
  std::optional<bool> checked;

  std::optional<std::vector<std::string>> items;
  std::optional<double> filled;

  std::map<std::string, OptionValue> extra;

  void mergeFrom(const WidgetOptions& other);
};

[[nodiscard]] bool isSet(const Dimension& dimension);
std::string dimensionToString(const Dimension& dimension);

} // namespace reactblessed
