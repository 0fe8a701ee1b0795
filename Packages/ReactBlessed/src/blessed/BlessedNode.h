#pragma once

#include "blessed/BlessedOptions.h"
#include "blessed/BlessedWidgetKind.h"
#include "jsi/jsi.h"

#include <cstddef>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <variant>
#include <vector>

namespace reactblessed {

class Screen;

using EventValue = std::variant<std::monostate, bool, double, std::string>;

struct WidgetEvent {
  std::string type;
  std::vector<EventValue> args;
};

using AnyEventListener = std::function<void(const WidgetEvent&)>;

// A live terminal widget. Nodes form a mutable tree rooted at a Screen and
// are handed to JS as host objects (refs).
class BlessedNode
  : public facebook::jsi::HostObject,
    public std::enable_shared_from_this<BlessedNode> {
public:
  BlessedNode(WidgetKind kind, WidgetOptions options);
  ~BlessedNode() override = default;

  WidgetKind kind() const {
    return kind_;
  }

  const char* type() const {
    return widgetKindName(kind_);
  }

  const WidgetOptions& options() const {
    return options_;
  }

  // Merges `options` into the live widget. Content, label, items, visibility,
  // check state and progress go through their setters so the usual events
  // fire; everything else is stored as given.
  void applyOptions(const WidgetOptions& options);

  void append(std::shared_ptr<BlessedNode> child);
  void insert(std::shared_ptr<BlessedNode> child, std::size_t index);
  void remove(const std::shared_ptr<BlessedNode>& child);
  std::optional<std::size_t> indexOf(const BlessedNode* child) const;

  std::shared_ptr<BlessedNode> parent() const {
    return parent_.lock();
  }

  const std::vector<std::shared_ptr<BlessedNode>>& children() const {
    return children_;
  }

  // Topmost ancestor, `this` when detached.
  BlessedNode* rootNode();

  void setContent(const std::string& content);
  const std::string& content() const;
  void setLabel(const std::string& label);
  std::string label() const;

  void setItems(std::vector<std::string> items);
  const std::vector<std::string>& items() const;
  void select(std::size_t index);
  std::size_t selected() const {
    return selected_;
  }

  void show();
  void hide();
  bool hidden() const;

  void focus();
  bool focused() const {
    return focused_;
  }

  void check();
  void uncheck();
  bool checked() const;

  void setProgress(double filled);
  double filled() const;

  void onAny(AnyEventListener listener);
  void offAny();
  std::size_t listenerCount() const {
    return listeners_.size();
  }
  void emit(const std::string& type, std::vector<EventValue> args = {});

  facebook::jsi::Value get(facebook::jsi::Runtime&, const facebook::jsi::PropNameID& name) override;
  void set(facebook::jsi::Runtime&, const facebook::jsi::PropNameID& name, const facebook::jsi::Value& value) override;
  std::vector<facebook::jsi::PropNameID> getPropertyNames(facebook::jsi::Runtime& rt) override;

protected:
  // Called on the root when a descendant asks for focus.
  virtual void focusDescendant(const std::shared_ptr<BlessedNode>& node);

private:
  friend class Screen;

  void detachFromParent();

  WidgetKind kind_;
  WidgetOptions options_{};
  std::weak_ptr<BlessedNode> parent_{};
  std::vector<std::shared_ptr<BlessedNode>> children_{};
  std::vector<AnyEventListener> listeners_{};
  std::size_t selected_{0};
  bool focused_{false};
};

using WidgetHandle = std::shared_ptr<BlessedNode>;

} // namespace reactblessed
