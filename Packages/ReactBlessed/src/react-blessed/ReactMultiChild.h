#pragma once

#include "react-blessed/ReactBlessedElement.h"
#include "react-blessed/ReactBlessedIDOperations.h"

#include <cstddef>
#include <string>
#include <vector>

namespace reactblessed {

// Per-parent operations the child reconciler drives. Mounted children are
// appended to the parent; moveChild places one at a final index.
class ChildDelegate {
public:
  virtual ~ChildDelegate() = default;

  virtual NodeId mountChild(const ElementPtr& element) = 0;
  virtual void updateChild(NodeId id, const ElementPtr& prevElement, const ElementPtr& nextElement) = 0;
  virtual void moveChild(NodeId id, std::size_t toIndex) = 0;
  virtual void unmountChild(NodeId id) = 0;
};

struct RenderedChild {
  // "$<key>" for keyed children, ".<index>" otherwise.
  std::string name;
  NodeId id;
  ElementPtr element;
};

using RenderedChildren = std::vector<RenderedChild>;

struct FlatChild {
  std::string name;
  ElementPtr element;
};

// Keyed diffing of child lists.
class ReactMultiChild {
public:
  // Assigns names, turns primitive children into text elements and drops
  // later siblings that repeat a key.
  std::vector<FlatChild> flattenChildren(const std::vector<ElementChild>& children) const;

  // The three operations below edit `rendered` as each delegate call
  // returns, so when a delegate throws it still lists exactly the children
  // that are mounted, in widget order.
  void mountChildren(
    RenderedChildren& rendered,
    const std::vector<ElementChild>& children,
    ChildDelegate& delegate) const;

  // A previous child is kept when the next list has a child with the same
  // name, type and key. Kept children are updated and moved into place,
  // everything else is unmounted or mounted.
  void updateChildren(
    RenderedChildren& rendered,
    const std::vector<ElementChild>& nextChildren,
    ChildDelegate& delegate) const;

  void unmountChildren(RenderedChildren& rendered, ChildDelegate& delegate) const;
};

// Whether an instance rendered from `prev` can be updated to `next` in place.
bool shouldUpdateReactBlessedComponent(const ElementPtr& prev, const ElementPtr& next);

} // namespace reactblessed
