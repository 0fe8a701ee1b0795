#pragma once

#include "blessed/BlessedNode.h"
#include "scheduler/Scheduler.h"

#include <cstddef>
#include <iosfwd>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace reactblessed {

struct ScreenOptions {
  int columns{80};
  int rows{24};
  // Destination of painted frames; nothing is written when null.
  std::ostream* output{nullptr};
  bool unicodeBorders{true};
  std::string title;
};

struct Cell {
  std::string glyph{" "};
  CellStyle style{};
};

struct LayoutRect {
  int left{0};
  int top{0};
  int width{0};
  int height{0};

  [[nodiscard]] bool contains(int x, int y) const {
    return x >= left && y >= top && x < left + width && y < top + height;
  }
};

// Root display surface. Owns the cell buffer, paints the widget tree into it
// and coalesces render requests onto the next scheduler tick.
class Screen : public BlessedNode {
public:
  Screen(Scheduler& scheduler, ScreenOptions options = {});
  ~Screen() override;

  static std::shared_ptr<Screen> create(Scheduler& scheduler, ScreenOptions options = {});

  // Requests a render on the next tick. Repeated requests before that tick
  // produce a single render.
  void debouncedRender();
  void render();

  [[nodiscard]] std::size_t renderCount() const {
    return renderCount_;
  }

  [[nodiscard]] bool renderPending() const {
    return static_cast<bool>(pendingRender_);
  }

  int columns() const {
    return columns_;
  }

  int rows() const {
    return rows_;
  }

  void resize(int columns, int rows);

  std::vector<std::string> lines() const;
  const Cell& cellAt(int x, int y) const;
  std::optional<LayoutRect> layoutOf(const BlessedNode* node) const;

  std::shared_ptr<BlessedNode> focusedNode() const {
    return focused_.lock();
  }

  // Delivers a keypress to the focused widget. Returns false when nothing has
  // focus.
  bool dispatchKey(const std::string& ch, const std::string& keyName);

  // Hit-tests the last painted frame and delivers a click to the topmost
  // widget under (x, y). Returns that widget, or null.
  std::shared_ptr<BlessedNode> dispatchClick(int x, int y);

protected:
  void focusDescendant(const std::shared_ptr<BlessedNode>& node) override;

private:
  struct PaintedNode {
    std::weak_ptr<BlessedNode> node;
    LayoutRect rect;
    LayoutRect inner;
  };

  void layoutAndPaint(const std::shared_ptr<BlessedNode>& node, const LayoutRect& parentInner, const LayoutRect& clip);
  void paintNode(const BlessedNode& node, const LayoutRect& rect, const LayoutRect& inner, const LayoutRect& clip);
  void putText(int x, int y, const std::string& text, const CellStyle& style, const LayoutRect& clip);
  void putGlyph(int x, int y, const std::string& glyph, const CellStyle& style, const LayoutRect& clip);
  void flush();
  const PaintedNode* findPainted(const BlessedNode* node) const;

  Scheduler& scheduler_;
  ScreenOptions options_;
  int columns_{80};
  int rows_{24};
  std::vector<Cell> buffer_{};
  std::vector<PaintedNode> painted_{};
  TaskHandle pendingRender_{};
  std::size_t renderCount_{0};
  std::weak_ptr<BlessedNode> focused_{};
  bool titleWritten_{false};
};

} // namespace reactblessed
