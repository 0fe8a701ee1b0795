#include "blessed/BlessedScreen.h"

#include "shared/ReactBlessedFeatureFlags.h"

#include <algorithm>
#include <cmath>
#include <cstdlib>
#include <ostream>
#include <utility>

namespace reactblessed {

namespace {

const Cell kBlankCell{};

std::vector<std::string> splitGlyphs(const std::string& text) {
  std::vector<std::string> glyphs;
  glyphs.reserve(text.size());
  for (std::size_t i = 0; i < text.size();) {
    const auto lead = static_cast<unsigned char>(text[i]);
    std::size_t length = 1;
    if (lead >= 0xF0) {
      length = 4;
    } else if (lead >= 0xE0) {
      length = 3;
    } else if (lead >= 0xC0) {
      length = 2;
    }
    length = std::min(length, text.size() - i);
    glyphs.push_back(text.substr(i, length));
    i += length;
  }
  return glyphs;
}

int displayWidth(const std::string& text) {
  int width = 0;
  for (unsigned char c : text) {
    if ((c & 0xC0) != 0x80) {
      ++width;
    }
  }
  return width;
}

bool isTagChar(char c) {
  return (c >= 'a' && c <= 'z') || (c >= 'A' && c <= 'Z') || (c >= '0' && c <= '9') ||
    c == '-' || c == '/' || c == '#' || c == '|';
}

// Removes blessed inline tags such as {bold} or {/red-fg}.
std::string stripTags(const std::string& text) {
  std::string out;
  out.reserve(text.size());
  for (std::size_t i = 0; i < text.size(); ++i) {
    if (text[i] == '{') {
      const auto close = text.find('}', i + 1);
      if (close != std::string::npos && close > i + 1 &&
          std::all_of(text.begin() + static_cast<std::ptrdiff_t>(i + 1),
                      text.begin() + static_cast<std::ptrdiff_t>(close),
                      isTagChar)) {
        i = close;
        continue;
      }
    }
    out.push_back(text[i]);
  }
  return out;
}

std::vector<std::string> splitLines(const std::string& text) {
  std::vector<std::string> lines;
  std::size_t start = 0;
  while (start <= text.size()) {
    const auto end = text.find('\n', start);
    if (end == std::string::npos) {
      lines.push_back(text.substr(start));
      break;
    }
    lines.push_back(text.substr(start, end - start));
    start = end + 1;
  }
  if (lines.size() == 1 && lines.front().empty()) {
    lines.clear();
  }
  return lines;
}

LayoutRect intersect(const LayoutRect& a, const LayoutRect& b) {
  const int left = std::max(a.left, b.left);
  const int top = std::max(a.top, b.top);
  const int right = std::min(a.left + a.width, b.left + b.width);
  const int bottom = std::min(a.top + a.height, b.top + b.height);
  return LayoutRect{left, top, std::max(0, right - left), std::max(0, bottom - top)};
}

int clampToInt(double number, int fallback) {
  if (!std::isfinite(number)) {
    return fallback;
  }
  constexpr double limit = static_cast<double>(kMaxCells);
  return static_cast<int>(std::min(std::max(number, -limit), limit));
}

// Evaluates "50%", "50%-2", "half" or a plain number against the parent's
// size. Anything else yields `fallback`.
int resolveExpression(const std::string& expression, int parentSize, int fallback) {
  if (expression == "half") {
    return parentSize / 2;
  }
  const char* begin = expression.c_str();
  char* end = nullptr;
  const double number = std::strtod(begin, &end);
  if (end == begin) {
    return fallback;
  }
  if (*end == '\0') {
    return clampToInt(number, fallback);
  }
  if (*end != '%') {
    return fallback;
  }
  double value = parentSize * number / 100.0;
  ++end;
  if (*end == '+' || *end == '-') {
    char* offsetEnd = nullptr;
    const long offset = std::strtol(end, &offsetEnd, 10);
    if (offsetEnd != end) {
      value = std::trunc(value) + static_cast<double>(offset);
    }
  }
  return clampToInt(value, fallback);
}

int resolveSize(const Dimension& dimension, int parentSize, int shrinkSize) {
  if (const auto* cells = std::get_if<int>(&dimension)) {
    return *cells;
  }
  if (const auto* expression = std::get_if<std::string>(&dimension)) {
    if (*expression == "shrink") {
      return shrinkSize;
    }
    return resolveExpression(*expression, parentSize, shrinkSize);
  }
  return shrinkSize;
}

int resolvePosition(const Dimension& dimension, int parentSize, int selfSize) {
  if (const auto* expression = std::get_if<std::string>(&dimension)) {
    if (*expression == "center") {
      return (parentSize - selfSize) / 2;
    }
  }
  return resolveSize(dimension, parentSize, 0);
}

int borderSize(const WidgetOptions& options) {
  return options.border ? 1 : 0;
}

Padding paddingOf(const WidgetOptions& options) {
  return options.padding.value_or(Padding{});
}

std::string bodyText(const BlessedNode& node) {
  const auto& options = node.options();
  std::string text = node.content();
  if ((node.kind() == WidgetKind::Textbox || node.kind() == WidgetKind::Textarea) && options.value) {
    text = *options.value;
  }
  if (options.tags.value_or(false)) {
    text = stripTags(text);
  }
  return text;
}

int contentWidth(const BlessedNode& node) {
  if (node.kind() == WidgetKind::ListBar) {
    int width = 0;
    for (const auto& item : node.items()) {
      width += displayWidth(item) + 2;
    }
    return std::max(0, width - 2);
  }
  if (isListKind(node.kind())) {
    int width = 0;
    for (const auto& item : node.items()) {
      width = std::max(width, displayWidth(item));
    }
    return width;
  }
  int width = 0;
  for (const auto& line : splitLines(bodyText(node))) {
    width = std::max(width, displayWidth(line));
  }
  if (node.kind() == WidgetKind::Checkbox || node.kind() == WidgetKind::RadioButton) {
    width += 4;
  }
  return width;
}

int contentHeight(const BlessedNode& node) {
  if (node.kind() == WidgetKind::ListBar) {
    return 1;
  }
  if (isListKind(node.kind())) {
    return static_cast<int>(node.items().size());
  }
  const int lines = static_cast<int>(splitLines(bodyText(node)).size());
  if (node.kind() == WidgetKind::Button || node.kind() == WidgetKind::Checkbox ||
      node.kind() == WidgetKind::RadioButton) {
    return std::max(1, lines);
  }
  return lines;
}

bool shrinksByDefault(const BlessedNode& node) {
  if (node.options().shrink.value_or(false)) {
    return true;
  }
  switch (node.kind()) {
    case WidgetKind::Text:
    case WidgetKind::Button:
    case WidgetKind::Checkbox:
    case WidgetKind::RadioButton:
      return true;
    default:
      return false;
  }
}

bool isVerticalLine(const BlessedNode& node) {
  return node.kind() == WidgetKind::Line && node.options().orientation.value_or("horizontal") == "vertical";
}

LayoutRect computeRect(const BlessedNode& node, const LayoutRect& parent) {
  const auto& o = node.options();
  const int border = borderSize(o);
  const Padding padding = paddingOf(o);
  const int shrinkWidth = contentWidth(node) + border * 2 + padding.left + padding.right;
  const int shrinkHeight = contentHeight(node) + border * 2 + padding.top + padding.bottom;
  const bool shrink = shrinksByDefault(node);
  const bool line = node.kind() == WidgetKind::Line;

  int width = 0;
  if (isSet(o.width)) {
    width = resolveSize(o.width, parent.width, shrinkWidth);
  } else if (line && isVerticalLine(node)) {
    width = 1;
  } else if (isSet(o.left) && isSet(o.right)) {
    width = parent.width - resolveSize(o.left, parent.width, 0) - resolveSize(o.right, parent.width, 0);
  } else if (shrink) {
    width = shrinkWidth;
  } else {
    width = parent.width;
    if (isSet(o.left)) {
      width -= resolvePosition(o.left, parent.width, 0);
    }
    if (isSet(o.right)) {
      width -= resolveSize(o.right, parent.width, 0);
    }
  }

  int height = 0;
  if (isSet(o.height)) {
    height = resolveSize(o.height, parent.height, shrinkHeight);
  } else if (line && !isVerticalLine(node)) {
    height = 1;
  } else if (isSet(o.top) && isSet(o.bottom)) {
    height = parent.height - resolveSize(o.top, parent.height, 0) - resolveSize(o.bottom, parent.height, 0);
  } else if (shrink) {
    height = shrinkHeight;
  } else {
    height = parent.height;
    if (isSet(o.top)) {
      height -= resolvePosition(o.top, parent.height, 0);
    }
    if (isSet(o.bottom)) {
      height -= resolveSize(o.bottom, parent.height, 0);
    }
  }

  width = std::max(0, width);
  height = std::max(0, height);

  int left = 0;
  if (isSet(o.left)) {
    left = resolvePosition(o.left, parent.width, width);
  } else if (isSet(o.right)) {
    left = parent.width - resolveSize(o.right, parent.width, 0) - width;
  }

  int top = 0;
  if (isSet(o.top)) {
    top = resolvePosition(o.top, parent.height, height);
  } else if (isSet(o.bottom)) {
    top = parent.height - resolveSize(o.bottom, parent.height, 0) - height;
  }

  return LayoutRect{parent.left + left, parent.top + top, width, height};
}

LayoutRect innerRect(const WidgetOptions& options, const LayoutRect& rect) {
  const int border = borderSize(options);
  const Padding padding = paddingOf(options);
  LayoutRect inner{
    rect.left + border + padding.left,
    rect.top + border + padding.top,
    rect.width - border * 2 - padding.left - padding.right,
    rect.height - border * 2 - padding.top - padding.bottom};
  inner.width = std::max(0, inner.width);
  inner.height = std::max(0, inner.height);
  return inner;
}

CellStyle withDefaultInverse(const CellStyle& base, const CellStyle& overlay) {
  CellStyle style = base;
  if (overlay.empty()) {
    style.inverse = true;
  } else {
    style.mergeFrom(overlay);
  }
  return style;
}

std::string colorCode(const std::string& color, bool background) {
  static const char* kNames[] = {"black", "red", "green", "yellow", "blue", "magenta", "cyan", "white"};
  if (color.empty() || color == "default") {
    return background ? "49" : "39";
  }
  if (color[0] == '#' && color.size() == 7) {
    const long rgb = std::strtol(color.c_str() + 1, nullptr, 16);
    return std::string(background ? "48;2;" : "38;2;") +
      std::to_string((rgb >> 16) & 0xFF) + ";" +
      std::to_string((rgb >> 8) & 0xFF) + ";" +
      std::to_string(rgb & 0xFF);
  }

  std::string name = color;
  bool bright = false;
  for (const char* prefix : {"light", "bright"}) {
    const std::string p(prefix);
    if (name.compare(0, p.size(), p) == 0) {
      name = name.substr(p.size());
      if (!name.empty() && (name[0] == '-' || name[0] == ' ')) {
        name = name.substr(1);
      }
      bright = true;
    }
  }
  if (name == "gray" || name == "grey") {
    name = "black";
    bright = true;
  }
  for (int index = 0; index < 8; ++index) {
    if (name == kNames[index]) {
      const int base = (bright ? 90 : 30) + (background ? 10 : 0);
      return std::to_string(base + index);
    }
  }
  return std::string{};
}

std::string sgrFor(const CellStyle& style) {
  std::vector<std::string> codes;
  if (style.bold.value_or(false)) {
    codes.emplace_back("1");
  }
  if (style.underline.value_or(false)) {
    codes.emplace_back("4");
  }
  if (style.blink.value_or(false)) {
    codes.emplace_back("5");
  }
  if (style.inverse.value_or(false)) {
    codes.emplace_back("7");
  }
  if (style.invisible.value_or(false)) {
    codes.emplace_back("8");
  }
  if (style.fg) {
    auto code = colorCode(*style.fg, false);
    if (!code.empty()) {
      codes.push_back(std::move(code));
    }
  }
  if (style.bg) {
    auto code = colorCode(*style.bg, true);
    if (!code.empty()) {
      codes.push_back(std::move(code));
    }
  }
  if (codes.empty()) {
    return std::string{};
  }
  std::string sgr = "\x1b[";
  for (std::size_t i = 0; i < codes.size(); ++i) {
    if (i > 0) {
      sgr += ';';
    }
    sgr += codes[i];
  }
  sgr += 'm';
  return sgr;
}

} // namespace

Screen::Screen(Scheduler& scheduler, ScreenOptions options)
  : BlessedNode(WidgetKind::Screen, WidgetOptions{}),
    scheduler_(scheduler),
    options_(std::move(options)),
    columns_(std::max(1, options_.columns)),
    rows_(std::max(1, options_.rows)),
    buffer_(static_cast<std::size_t>(columns_ * rows_)) {}

Screen::~Screen() {
  if (pendingRender_) {
    scheduler_.cancelTask(pendingRender_);
  }
}

std::shared_ptr<Screen> Screen::create(Scheduler& scheduler, ScreenOptions options) {
  return std::make_shared<Screen>(scheduler, std::move(options));
}

void Screen::debouncedRender() {
  if (!enableDebouncedRender) {
    render();
    return;
  }
  if (pendingRender_) {
    return;
  }
  pendingRender_ = scheduler_.scheduleTask(SchedulerPriority::NormalPriority, [this]() {
    pendingRender_ = TaskHandle{};
    render();
  });
}

void Screen::render() {
  if (pendingRender_) {
    scheduler_.cancelTask(pendingRender_);
    pendingRender_ = TaskHandle{};
  }

  buffer_.assign(static_cast<std::size_t>(columns_ * rows_), kBlankCell);
  painted_.clear();

  const LayoutRect surface{0, 0, columns_, rows_};
  for (const auto& child : children()) {
    layoutAndPaint(child, surface, surface);
  }

  flush();
  ++renderCount_;
}

void Screen::resize(int columns, int rows) {
  columns_ = std::max(1, columns);
  rows_ = std::max(1, rows);
  buffer_.assign(static_cast<std::size_t>(columns_ * rows_), kBlankCell);
  emit("resize");
  debouncedRender();
}

std::vector<std::string> Screen::lines() const {
  std::vector<std::string> result;
  result.reserve(static_cast<std::size_t>(rows_));
  for (int y = 0; y < rows_; ++y) {
    std::string line;
    for (int x = 0; x < columns_; ++x) {
      line += buffer_[static_cast<std::size_t>(y * columns_ + x)].glyph;
    }
    result.push_back(std::move(line));
  }
  return result;
}

const Cell& Screen::cellAt(int x, int y) const {
  if (x < 0 || y < 0 || x >= columns_ || y >= rows_) {
    return kBlankCell;
  }
  return buffer_[static_cast<std::size_t>(y * columns_ + x)];
}

std::optional<LayoutRect> Screen::layoutOf(const BlessedNode* node) const {
  if (const auto* painted = findPainted(node)) {
    return painted->rect;
  }
  return std::nullopt;
}

bool Screen::dispatchKey(const std::string& ch, const std::string& keyName) {
  auto node = focusedNode();
  if (!node) {
    return false;
  }

  node->emit("keypress", {ch, keyName});

  const auto kind = node->kind();
  if (isListKind(kind) && !node->items().empty()) {
    const auto current = node->selected();
    if ((keyName == "up" || keyName == "k") && current > 0) {
      node->select(current - 1);
    } else if (keyName == "down" || keyName == "j") {
      node->select(current + 1);
    } else if (keyName == "enter") {
      const auto& item = node->items()[node->selected()];
      node->emit("action", {item, static_cast<double>(node->selected())});
      node->emit("select", {item, static_cast<double>(node->selected())});
    } else if (keyName == "escape") {
      node->emit("cancel");
    }
  } else if (kind == WidgetKind::Textbox || kind == WidgetKind::Textarea ||
             kind == WidgetKind::Prompt || kind == WidgetKind::Question) {
    if (keyName == "enter") {
      node->emit("submit", {node->options().value.value_or(node->content())});
    } else if (keyName == "escape") {
      node->emit("cancel");
    }
  } else if (kind == WidgetKind::Button && (keyName == "enter" || keyName == "space")) {
    node->emit("press");
  } else if ((kind == WidgetKind::Checkbox || kind == WidgetKind::RadioButton) &&
             (keyName == "enter" || keyName == "space")) {
    if (node->checked() && kind == WidgetKind::Checkbox) {
      node->uncheck();
    } else {
      node->check();
    }
  }

  debouncedRender();
  return true;
}

std::shared_ptr<BlessedNode> Screen::dispatchClick(int x, int y) {
  for (auto it = painted_.rbegin(); it != painted_.rend(); ++it) {
    if (!it->rect.contains(x, y)) {
      continue;
    }
    auto node = it->node.lock();
    if (!node || node->hidden() || node->rootNode() != this) {
      continue;
    }

    const LayoutRect inner = it->inner;
    node->focus();
    node->emit("click", {static_cast<double>(x), static_cast<double>(y)});

    const auto kind = node->kind();
    if (kind == WidgetKind::Button) {
      node->emit("press");
    } else if (kind == WidgetKind::Checkbox) {
      if (node->checked()) {
        node->uncheck();
      } else {
        node->check();
      }
    } else if (kind == WidgetKind::RadioButton) {
      node->check();
    } else if ((kind == WidgetKind::List || kind == WidgetKind::ListTable) && inner.contains(x, y)) {
      const auto start = node->selected() >= static_cast<std::size_t>(std::max(1, inner.height))
        ? node->selected() - static_cast<std::size_t>(inner.height) + 1
        : 0;
      const auto index = start + static_cast<std::size_t>(y - inner.top);
      if (index < node->items().size()) {
        node->select(index);
        const auto& item = node->items()[index];
        node->emit("action", {item, static_cast<double>(index)});
        node->emit("select", {item, static_cast<double>(index)});
      }
    }

    debouncedRender();
    return node;
  }
  return nullptr;
}

void Screen::focusDescendant(const std::shared_ptr<BlessedNode>& node) {
  auto previous = focused_.lock();
  if (previous == node) {
    return;
  }
  if (previous) {
    previous->focused_ = false;
    previous->emit("blur");
  }
  focused_ = node;
  if (node) {
    node->focused_ = true;
    node->emit("focus");
  }
}

void Screen::layoutAndPaint(
  const std::shared_ptr<BlessedNode>& node,
  const LayoutRect& parentInner,
  const LayoutRect& clip) {
  if (!node || node->hidden()) {
    return;
  }

  const LayoutRect rect = computeRect(*node, parentInner);
  const LayoutRect inner = innerRect(node->options(), rect);
  paintNode(*node, rect, inner, clip);
  painted_.push_back(PaintedNode{node, intersect(rect, clip), inner});

  const LayoutRect childClip = intersect(clip, inner);
  for (const auto& child : node->children()) {
    layoutAndPaint(child, inner, childClip);
  }
}

void Screen::paintNode(
  const BlessedNode& node,
  const LayoutRect& rect,
  const LayoutRect& inner,
  const LayoutRect& clip) {
  const auto& o = node.options();
  const LayoutRect visible = intersect(rect, clip);
  if (visible.width == 0 || visible.height == 0) {
    return;
  }

  CellStyle base = o.style.base;
  if (node.focused()) {
    base.mergeFrom(o.style.focus);
  }

  if (base.bg) {
    for (int y = visible.top; y < visible.top + visible.height; ++y) {
      for (int x = visible.left; x < visible.left + visible.width; ++x) {
        putGlyph(x, y, " ", base, clip);
      }
    }
  }

  if (o.border && rect.width > 0 && rect.height > 0) {
    CellStyle borderStyle = o.border->style;
    borderStyle.mergeFrom(o.style.border);
    const bool unicode = options_.unicodeBorders;
    const int right = rect.left + rect.width - 1;
    const int bottom = rect.top + rect.height - 1;

    if (o.border->type == BorderType::Bg) {
      const std::string ch = o.border->ch.value_or(" ");
      for (int x = rect.left; x <= right; ++x) {
        putGlyph(x, rect.top, ch, borderStyle, clip);
        putGlyph(x, bottom, ch, borderStyle, clip);
      }
      for (int y = rect.top; y <= bottom; ++y) {
        putGlyph(rect.left, y, ch, borderStyle, clip);
        putGlyph(right, y, ch, borderStyle, clip);
      }
    } else {
      const std::string horizontal = unicode ? "─" : "-";
      const std::string vertical = unicode ? "│" : "|";
      for (int x = rect.left + 1; x < right; ++x) {
        putGlyph(x, rect.top, horizontal, borderStyle, clip);
        putGlyph(x, bottom, horizontal, borderStyle, clip);
      }
      for (int y = rect.top + 1; y < bottom; ++y) {
        putGlyph(rect.left, y, vertical, borderStyle, clip);
        putGlyph(right, y, vertical, borderStyle, clip);
      }
      putGlyph(rect.left, rect.top, unicode ? "┌" : "+", borderStyle, clip);
      putGlyph(right, rect.top, unicode ? "┐" : "+", borderStyle, clip);
      putGlyph(rect.left, bottom, unicode ? "└" : "+", borderStyle, clip);
      putGlyph(right, bottom, unicode ? "┘" : "+", borderStyle, clip);
    }
  }

  const std::string label = node.label();
  if (!label.empty()) {
    CellStyle labelStyle = base;
    labelStyle.mergeFrom(o.style.label);
    const LayoutRect labelClip = intersect(clip, LayoutRect{rect.left + 1, rect.top, std::max(0, rect.width - 2), 1});
    putText(rect.left + 2, rect.top, label, labelStyle, labelClip);
  }

  const LayoutRect body = intersect(clip, inner);
  if (body.width == 0 || body.height == 0) {
    return;
  }

  switch (node.kind()) {
    case WidgetKind::List:
    case WidgetKind::ListTable: {
      const auto& items = node.items();
      const auto selected = node.selected();
      const auto start = selected >= static_cast<std::size_t>(inner.height)
        ? selected - static_cast<std::size_t>(inner.height) + 1
        : 0;
      CellStyle itemStyle = base;
      itemStyle.mergeFrom(o.style.item);
      const CellStyle selectedStyle = withDefaultInverse(base, o.style.selected);
      for (int row = 0; row < inner.height; ++row) {
        const auto index = start + static_cast<std::size_t>(row);
        if (index >= items.size()) {
          break;
        }
        const int y = inner.top + row;
        const bool isSelected = index == selected;
        const CellStyle& style = isSelected ? selectedStyle : itemStyle;
        if (isSelected) {
          for (int x = body.left; x < body.left + body.width; ++x) {
            putGlyph(x, y, " ", style, body);
          }
        }
        putText(inner.left, y, items[index], style, body);
      }
      break;
    }
    case WidgetKind::ListBar: {
      const auto& items = node.items();
      CellStyle itemStyle = base;
      itemStyle.mergeFrom(o.style.item);
      const CellStyle selectedStyle = withDefaultInverse(base, o.style.selected);
      int x = inner.left;
      for (std::size_t index = 0; index < items.size(); ++index) {
        putText(x, inner.top, items[index], index == node.selected() ? selectedStyle : itemStyle, body);
        x += displayWidth(items[index]) + 2;
      }
      break;
    }
    case WidgetKind::ProgressBar: {
      CellStyle barStyle = withDefaultInverse(base, o.style.bar);
      const bool vertical = o.orientation.value_or("horizontal") == "vertical";
      const std::string glyph = barStyle.bg ? " " : (options_.unicodeBorders ? "█" : "#");
      LayoutRect bar = inner;
      if (vertical) {
        bar.height = static_cast<int>(inner.height * node.filled() / 100.0);
        bar.top = inner.top + inner.height - bar.height;
      } else {
        bar.width = static_cast<int>(inner.width * node.filled() / 100.0);
      }
      const LayoutRect filled = intersect(bar, body);
      for (int y = filled.top; y < filled.top + filled.height; ++y) {
        for (int x = filled.left; x < filled.left + filled.width; ++x) {
          putGlyph(x, y, glyph, barStyle, body);
        }
      }
      if (!node.content().empty()) {
        putText(inner.left, inner.top, node.content(), base, body);
      }
      break;
    }
    case WidgetKind::Checkbox:
    case WidgetKind::RadioButton: {
      const bool radio = node.kind() == WidgetKind::RadioButton;
      std::string prefix = radio ? (node.checked() ? "(*) " : "( ) ") : (node.checked() ? "[x] " : "[ ] ");
      putText(inner.left, inner.top, prefix + bodyText(node), base, body);
      break;
    }
    case WidgetKind::Line: {
      const bool unicode = options_.unicodeBorders;
      const std::string glyph = o.border && o.border->ch
        ? *o.border->ch
        : (isVerticalLine(node) ? (unicode ? "│" : "|") : (unicode ? "─" : "-"));
      for (int y = body.top; y < body.top + body.height; ++y) {
        for (int x = body.left; x < body.left + body.width; ++x) {
          putGlyph(x, y, glyph, base, body);
        }
      }
      break;
    }
    default: {
      auto lines = splitLines(bodyText(node));
      if (node.kind() == WidgetKind::Log && static_cast<int>(lines.size()) > inner.height) {
        lines.erase(lines.begin(), lines.end() - inner.height);
      }
      const std::string align = o.align.value_or("left");
      const std::string valign = o.valign.value_or("top");
      int y = inner.top;
      const int lineCount = static_cast<int>(lines.size());
      if (valign == "middle" || valign == "center") {
        y += std::max(0, (inner.height - lineCount) / 2);
      } else if (valign == "bottom") {
        y += std::max(0, inner.height - lineCount);
      }
      for (const auto& line : lines) {
        int x = inner.left;
        const int width = displayWidth(line);
        if (align == "center") {
          x += std::max(0, (inner.width - width) / 2);
        } else if (align == "right") {
          x += std::max(0, inner.width - width);
        }
        putText(x, y++, line, base, body);
      }
      break;
    }
  }
}

void Screen::putText(int x, int y, const std::string& text, const CellStyle& style, const LayoutRect& clip) {
  for (const auto& glyph : splitGlyphs(text)) {
    putGlyph(x++, y, glyph, style, clip);
  }
}

void Screen::putGlyph(int x, int y, const std::string& glyph, const CellStyle& style, const LayoutRect& clip) {
  if (!clip.contains(x, y) || x < 0 || y < 0 || x >= columns_ || y >= rows_) {
    return;
  }
  auto& cell = buffer_[static_cast<std::size_t>(y * columns_ + x)];
  cell.glyph = glyph;
  CellStyle merged = cell.style;
  merged.mergeFrom(style);
  cell.style = merged;
}

void Screen::flush() {
  if (options_.output == nullptr) {
    return;
  }
  std::ostream& out = *options_.output;

  if (!titleWritten_ && !options_.title.empty()) {
    out << "\x1b]0;" << options_.title << "\x07";
    titleWritten_ = true;
  }

  for (int y = 0; y < rows_; ++y) {
    out << "\x1b[" << (y + 1) << ";1H";
    std::string current;
    for (int x = 0; x < columns_; ++x) {
      const auto& cell = buffer_[static_cast<std::size_t>(y * columns_ + x)];
      const std::string sgr = sgrFor(cell.style);
      if (sgr != current) {
        out << "\x1b[0m" << sgr;
        current = sgr;
      }
      out << cell.glyph;
    }
    out << "\x1b[0m";
  }
  out.flush();
}

const Screen::PaintedNode* Screen::findPainted(const BlessedNode* node) const {
  for (const auto& painted : painted_) {
    if (painted.node.lock().get() == node) {
      return &painted;
    }
  }
  return nullptr;
}

} // namespace reactblessed
