#pragma once

#include "blessed/BlessedNode.h"

#include <cstddef>
#include <cstdint>
#include <functional>
#include <optional>
#include <string>
#include <vector>

namespace reactblessed {

// Stable identifier of one mounted element. A slot's generation is bumped when
// it is dropped, so stale ids never resolve to a later occupant.
struct NodeId {
  uint32_t index{0};
  uint32_t generation{0};

  // The screen: parent of every top-level node.
  static constexpr NodeId root() {
    return NodeId{0, 0};
  }

  bool isRoot() const {
    return index == 0 && generation == 0;
  }

  explicit operator bool() const {
    return generation != 0;
  }

  bool operator==(const NodeId& other) const {
    return index == other.index && generation == other.generation;
  }

  bool operator!=(const NodeId& other) const {
    return !(*this == other);
  }
};

struct NodeIdHash {
  std::size_t operator()(const NodeId& id) const {
    return std::hash<uint64_t>{}((static_cast<uint64_t>(id.generation) << 32) | id.index);
  }
};

std::string describeNodeId(NodeId id);

// Arena mapping node ids to their widgets and parent ids. Lookups of dropped
// or never-issued ids throw UnknownNodeError.
class ReactBlessedIDOperations {
public:
  ReactBlessedIDOperations() = default;

  ReactBlessedIDOperations(const ReactBlessedIDOperations&) = delete;
  ReactBlessedIDOperations& operator=(const ReactBlessedIDOperations&) = delete;

  // Process-wide registry used when a reconciler is not given its own.
  static ReactBlessedIDOperations& shared();

  // Binds the root surface. Throws std::logic_error while nodes are mounted.
  void setScreen(WidgetHandle screen);
  const WidgetHandle& screen() const {
    return screen_;
  }

  // Records a freshly mounted widget under `parent` and returns its id.
  // `parent` must be NodeId::root() or a live id.
  [[nodiscard]] NodeId add(WidgetHandle widget, NodeId parent);
  void drop(NodeId id);

  const WidgetHandle& get(NodeId id) const;
  // The parent's widget; the screen for top-level nodes.
  const WidgetHandle& getParent(NodeId id) const;
  NodeId getParentId(NodeId id) const;

  [[nodiscard]] bool contains(NodeId id) const;
  [[nodiscard]] std::size_t size() const {
    return liveCount_;
  }

  // Forgets every entry and the screen. Ids issued before stay invalid.
  void reset();

private:
  struct Slot {
    WidgetHandle widget{};
    NodeId parent{};
    uint32_t generation{0};
    bool live{false};
  };

  const Slot& slotFor(NodeId id) const;

  WidgetHandle screen_{};
  // Slot 0 is reserved so that NodeId::root() never names an entry.
  std::vector<Slot> slots_{Slot{}};
  std::vector<uint32_t> freeList_{};
  std::size_t liveCount_{0};
};

} // namespace reactblessed
