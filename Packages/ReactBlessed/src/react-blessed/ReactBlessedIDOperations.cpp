#include "react-blessed/ReactBlessedIDOperations.h"

#include "shared/ReactBlessedErrors.h"

#include <stdexcept>
#include <utility>

namespace reactblessed {

std::string describeNodeId(NodeId id) {
  if (id.isRoot()) {
    return "root";
  }
  return std::to_string(id.index) + "#" + std::to_string(id.generation);
}

ReactBlessedIDOperations& ReactBlessedIDOperations::shared() {
  static ReactBlessedIDOperations registry;
  return registry;
}

void ReactBlessedIDOperations::setScreen(WidgetHandle screen) {
  if (liveCount_ != 0 && screen != screen_) {
    throw std::logic_error("Cannot rebind the screen while nodes are mounted");
  }
  screen_ = std::move(screen);
}

NodeId ReactBlessedIDOperations::add(WidgetHandle widget, NodeId parent) {
  if (!widget) {
    throw std::invalid_argument("Cannot register a null widget");
  }
  if (!parent.isRoot() && !contains(parent)) {
    throw UnknownNodeError("Unknown parent node " + describeNodeId(parent));
  }

  uint32_t index = 0;
  if (!freeList_.empty()) {
    index = freeList_.back();
    freeList_.pop_back();
  } else {
    index = static_cast<uint32_t>(slots_.size());
    slots_.emplace_back();
  }

  Slot& slot = slots_[index];
  ++slot.generation;
  slot.widget = std::move(widget);
  slot.parent = parent;
  slot.live = true;
  ++liveCount_;

  return NodeId{index, slot.generation};
}

void ReactBlessedIDOperations::drop(NodeId id) {
  slotFor(id);
  Slot& slot = slots_[id.index];
  slot.widget.reset();
  slot.parent = NodeId{};
  slot.live = false;
  freeList_.push_back(id.index);
  --liveCount_;
}

const WidgetHandle& ReactBlessedIDOperations::get(NodeId id) const {
  return slotFor(id).widget;
}

const WidgetHandle& ReactBlessedIDOperations::getParent(NodeId id) const {
  const NodeId parent = slotFor(id).parent;
  if (parent.isRoot()) {
    if (!screen_) {
      throw std::logic_error("No screen is bound to the node registry");
    }
    return screen_;
  }
  return slotFor(parent).widget;
}

NodeId ReactBlessedIDOperations::getParentId(NodeId id) const {
  return slotFor(id).parent;
}

bool ReactBlessedIDOperations::contains(NodeId id) const {
  if (id.isRoot() || id.index >= slots_.size()) {
    return false;
  }
  const Slot& slot = slots_[id.index];
  return slot.live && slot.generation == id.generation;
}

void ReactBlessedIDOperations::reset() {
  for (uint32_t index = 1; index < slots_.size(); ++index) {
    Slot& slot = slots_[index];
    if (slot.live) {
      slot.widget.reset();
      slot.parent = NodeId{};
      slot.live = false;
      freeList_.push_back(index);
    }
  }
  liveCount_ = 0;
  screen_.reset();
}

const ReactBlessedIDOperations::Slot& ReactBlessedIDOperations::slotFor(NodeId id) const {
  if (!contains(id)) {
    throw UnknownNodeError("Unknown node " + describeNodeId(id));
  }
  return slots_[id.index];
}

} // namespace reactblessed
