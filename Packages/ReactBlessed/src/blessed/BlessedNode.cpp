#include "blessed/BlessedNode.h"

#include <algorithm>
#include <cmath>
#include <sstream>
#include <utility>

namespace jsi = facebook::jsi;

namespace reactblessed {

namespace {

const std::string kEmptyString{};
const std::vector<std::string> kNoItems{};

jsi::Value toJsiValue(jsi::Runtime& rt, const OptionValue& value) {
  if (const auto* flag = std::get_if<bool>(&value)) {
    return jsi::Value(*flag);
  }
  if (const auto* number = std::get_if<double>(&value)) {
    return jsi::Value(*number);
  }
  if (const auto* text = std::get_if<std::string>(&value)) {
    return jsi::String::createFromUtf8(rt, *text);
  }
  return jsi::Value::undefined();
}

std::string coerceText(jsi::Runtime& rt, const jsi::Value& value) {
  if (value.isString()) {
    return value.getString(rt).utf8(rt);
  }
  if (value.isNumber()) {
    const double number = value.getNumber();
    if (!std::isfinite(number)) {
      return std::string{};
    }
    if (std::abs(number) <= 9007199254740992.0) {
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
  return std::string{};
}

} // namespace

BlessedNode::BlessedNode(WidgetKind kind, WidgetOptions options)
  : kind_(kind),
    options_(std::move(options)) {}

void BlessedNode::applyOptions(const WidgetOptions& next) {
  WidgetOptions rest = next;
  rest.content.reset();
  rest.label.reset();
  rest.items.reset();
  rest.hidden.reset();
  rest.checked.reset();
  rest.filled.reset();
  rest.focused.reset();
  options_.mergeFrom(rest);

  if (next.content) {
    setContent(*next.content);
  }
  if (next.label) {
    setLabel(*next.label);
  }
  if (next.items) {
    setItems(*next.items);
  }
  if (next.hidden) {
    if (*next.hidden) {
      hide();
    } else {
      show();
    }
  }
  if (next.checked) {
    if (*next.checked) {
      check();
    } else {
      uncheck();
    }
  }
  if (next.filled) {
    setProgress(*next.filled);
  }
  if (next.focused) {
    options_.focused = next.focused;
    if (*next.focused && !focused_ && parent()) {
      focus();
    }
  }
}

void BlessedNode::append(std::shared_ptr<BlessedNode> child) {
  insert(std::move(child), children_.size());
}

void BlessedNode::insert(std::shared_ptr<BlessedNode> child, std::size_t index) {
  if (!child || child.get() == this) {
    return;
  }

  const bool wasAttachedHere = child->parent().get() == this;
  child->detachFromParent();

  index = std::min(index, children_.size());
  children_.insert(children_.begin() + static_cast<std::ptrdiff_t>(index), child);
  child->parent_ = weak_from_this();

  if (!wasAttachedHere) {
    child->emit("attach");
  }
}

void BlessedNode::remove(const std::shared_ptr<BlessedNode>& child) {
  if (!child || child->parent().get() != this) {
    return;
  }
  child->detachFromParent();
  child->emit("detach");
}

std::optional<std::size_t> BlessedNode::indexOf(const BlessedNode* child) const {
  auto it = std::find_if(children_.begin(), children_.end(), [&](const std::shared_ptr<BlessedNode>& current) {
    return current.get() == child;
  });
  if (it == children_.end()) {
    return std::nullopt;
  }
  return static_cast<std::size_t>(it - children_.begin());
}

BlessedNode* BlessedNode::rootNode() {
  BlessedNode* current = this;
  while (auto next = current->parent()) {
    current = next.get();
  }
  return current;
}

void BlessedNode::setContent(const std::string& content) {
  if (options_.content && *options_.content == content) {
    return;
  }
  options_.content = content;
  emit("set content");
}

const std::string& BlessedNode::content() const {
  return options_.content ? *options_.content : kEmptyString;
}

void BlessedNode::setLabel(const std::string& label) {
  options_.label = label;
}

std::string BlessedNode::label() const {
  return options_.label.value_or(std::string{});
}

void BlessedNode::setItems(std::vector<std::string> items) {
  options_.items = std::move(items);
  if (selected_ >= options_.items->size()) {
    selected_ = options_.items->empty() ? 0 : options_.items->size() - 1;
  }
}

const std::vector<std::string>& BlessedNode::items() const {
  return options_.items ? *options_.items : kNoItems;
}

void BlessedNode::select(std::size_t index) {
  const auto& list = items();
  if (list.empty()) {
    return;
  }
  selected_ = std::min(index, list.size() - 1);
  emit("select item", {list[selected_], static_cast<double>(selected_)});
}

void BlessedNode::show() {
  if (!hidden()) {
    return;
  }
  options_.hidden = false;
  emit("show");
}

void BlessedNode::hide() {
  if (hidden()) {
    return;
  }
  options_.hidden = true;
  emit("hide");
}

bool BlessedNode::hidden() const {
  return options_.hidden.value_or(false);
}

void BlessedNode::focus() {
  if (focused_) {
    return;
  }
  rootNode()->focusDescendant(shared_from_this());
}

void BlessedNode::focusDescendant(const std::shared_ptr<BlessedNode>& node) {
  node->focused_ = true;
  node->emit("focus");
}

void BlessedNode::check() {
  if (checked()) {
    return;
  }
  options_.checked = true;
  emit("check", {true});
}

void BlessedNode::uncheck() {
  if (!checked()) {
    return;
  }
  options_.checked = false;
  emit("uncheck", {false});
}

bool BlessedNode::checked() const {
  return options_.checked.value_or(false);
}

void BlessedNode::setProgress(double filled) {
  const double clamped = std::max(0.0, std::min(100.0, filled));
  const bool wasComplete = this->filled() >= 100.0;
  options_.filled = clamped;
  if (clamped >= 100.0 && !wasComplete) {
    emit("complete");
  }
}

double BlessedNode::filled() const {
  return options_.filled.value_or(0.0);
}

void BlessedNode::onAny(AnyEventListener listener) {
  if (listener) {
    listeners_.push_back(std::move(listener));
  }
}

void BlessedNode::offAny() {
  listeners_.clear();
}

void BlessedNode::emit(const std::string& type, std::vector<EventValue> args) {
  if (listeners_.empty()) {
    return;
  }
  const WidgetEvent event{type, std::move(args)};
  // Listeners may call offAny() while the event is delivered.
  auto listeners = listeners_;
  for (const auto& listener : listeners) {
    listener(event);
  }
}

void BlessedNode::detachFromParent() {
  auto current = parent();
  if (!current) {
    return;
  }
  auto& siblings = current->children_;
  siblings.erase(
    std::remove_if(siblings.begin(), siblings.end(), [&](const std::shared_ptr<BlessedNode>& sibling) {
      return sibling.get() == this;
    }),
    siblings.end());
  parent_.reset();
}

jsi::Value BlessedNode::get(jsi::Runtime& rt, const jsi::PropNameID& name) {
  auto nameStr = name.utf8(rt);
  if (nameStr == "type") {
    return jsi::String::createFromUtf8(rt, type());
  }
  if (nameStr == "content") {
    return jsi::String::createFromUtf8(rt, content());
  }
  if (nameStr == "label") {
    return jsi::String::createFromUtf8(rt, label());
  }
  if (nameStr == "name" && options_.name) {
    return jsi::String::createFromUtf8(rt, *options_.name);
  }
  if (nameStr == "value" && options_.value) {
    return jsi::String::createFromUtf8(rt, *options_.value);
  }
  if (nameStr == "hidden") {
    return jsi::Value(hidden());
  }
  if (nameStr == "focused") {
    return jsi::Value(focused_);
  }
  if (nameStr == "checked") {
    return jsi::Value(checked());
  }
  if (nameStr == "selected") {
    return jsi::Value(static_cast<double>(selected_));
  }
  if (nameStr == "filled") {
    return jsi::Value(filled());
  }
  if (nameStr == "items") {
    const auto& list = items();
    jsi::Array array(rt, list.size());
    for (size_t i = 0; i < list.size(); ++i) {
      array.setValueAtIndex(rt, i, jsi::String::createFromUtf8(rt, list[i]));
    }
    return array;
  }
  if (nameStr == "children") {
    jsi::Array array(rt, children_.size());
    for (size_t i = 0; i < children_.size(); ++i) {
      array.setValueAtIndex(rt, i, jsi::Object::createFromHostObject(rt, children_[i]));
    }
    return array;
  }

  auto extra = options_.extra.find(nameStr);
  if (extra != options_.extra.end()) {
    return toJsiValue(rt, extra->second);
  }
  return jsi::Value::undefined();
}

void BlessedNode::set(
  jsi::Runtime& rt,
  const jsi::PropNameID& name,
  const jsi::Value& value) {
  auto nameStr = name.utf8(rt);
  if (nameStr == "content") {
    setContent(coerceText(rt, value));
    return;
  }
  if (nameStr == "label") {
    setLabel(coerceText(rt, value));
    return;
  }
  if (nameStr == "hidden" && value.isBool()) {
    if (value.getBool()) {
      hide();
    } else {
      show();
    }
    return;
  }
  if (nameStr == "checked" && value.isBool()) {
    if (value.getBool()) {
      check();
    } else {
      uncheck();
    }
    return;
  }
  if (nameStr == "selected" && value.isNumber() && value.getNumber() >= 0) {
    select(static_cast<std::size_t>(value.getNumber()));
    return;
  }
  if (nameStr == "filled" && value.isNumber()) {
    setProgress(value.getNumber());
    return;
  }

  if (value.isBool()) {
    options_.extra[nameStr] = value.getBool();
  } else if (value.isNumber()) {
    options_.extra[nameStr] = value.getNumber();
  } else if (value.isString()) {
    options_.extra[nameStr] = value.getString(rt).utf8(rt);
  }
}

std::vector<jsi::PropNameID> BlessedNode::getPropertyNames(jsi::Runtime& rt) {
  std::vector<jsi::PropNameID> props;
  for (const char* name : {"type", "content", "label", "hidden", "focused", "checked", "selected", "filled", "items", "children"}) {
    props.push_back(jsi::PropNameID::forUtf8(rt, name));
  }
  for (const auto& entry : options_.extra) {
    props.push_back(jsi::PropNameID::forUtf8(rt, entry.first));
  }
  return props;
}

} // namespace reactblessed
