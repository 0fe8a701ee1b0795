#pragma once

#include "blessed/BlessedWidgetKind.h"
#include "blessed/WidgetLibrary.h"
#include "react-blessed/ReactBlessedElement.h"
#include "react-blessed/ReactBlessedEvents.h"
#include "react-blessed/ReactBlessedIDOperations.h"
#include "react-blessed/ReactBlessedTransaction.h"
#include "react-blessed/ReactMultiChild.h"

#include <cstddef>
#include <memory>
#include <unordered_map>

namespace reactblessed {

// State of one mounted element.
class ReactBlessedComponent {
public:
  ReactBlessedComponent(ElementPtr element, WidgetKind kind);

  const ElementPtr& currentElement() const {
    return currentElement_;
  }

  NodeId rootNodeId() const {
    return rootNodeId_;
  }

  WidgetKind kind() const {
    return kind_;
  }

  const RenderedChildren& renderedChildren() const {
    return renderedChildren_;
  }

  const EventHandlerTable& eventHandlers() const {
    return eventHandlers_;
  }

private:
  friend class ReactBlessedReconciler;

  ElementPtr currentElement_;
  WidgetKind kind_;
  NodeId rootNodeId_{};
  RenderedChildren renderedChildren_{};
  EventHandlerTable eventHandlers_{};
  std::shared_ptr<jsi::Function> attachedRef_{};
};

// Mounts, updates and unmounts widgets for element trees. Child lists are
// diffed by the ReactMultiChild it is given; every mutation made inside a
// pass flags that pass for a redraw.
class ReactBlessedReconciler {
public:
  ReactBlessedReconciler(
    jsi::Runtime& runtime,
    WidgetLibrary& library,
    ReactBlessedIDOperations& registry,
    ReactMultiChild& multiChild);

  ReactBlessedReconciler(const ReactBlessedReconciler&) = delete;
  ReactBlessedReconciler& operator=(const ReactBlessedReconciler&) = delete;

  // Creates the widget for `element`, appends it to `parent` (NodeId::root()
  // for the screen) and mounts its children. Throws UnknownWidgetTypeError
  // before anything is created when the type is unknown, and
  // UnknownNodeError when `parent` is not mounted. A descendant that fails
  // to mount takes the widgets mounted so far for `element` down with it.
  NodeId mountComponent(
    const ElementPtr& element,
    NodeId parent,
    ReactBlessedReconcileTransaction& transaction);

  // Applies `nextElement` to the widget behind `id` in place and reconciles
  // its children. Receiving the element that is already current does
  // nothing.
  void receiveComponent(
    NodeId id,
    const ElementPtr& prevElement,
    const ElementPtr& nextElement,
    ReactBlessedReconcileTransaction& transaction);

  // Unmounts children first, then detaches the widget and drops its entry.
  // Does not request a redraw.
  void unmountComponent(NodeId id);

  // Places the widget behind `id` at `toIndex` among its siblings.
  void moveComponent(NodeId id, std::size_t toIndex);

  const WidgetHandle& getPublicInstance(NodeId id) const;

  const ReactBlessedComponent& component(NodeId id) const;

  [[nodiscard]] bool isMounted(NodeId id) const {
    return components_.find(id) != components_.end();
  }

  std::size_t mountedCount() const {
    return components_.size();
  }

  jsi::Runtime& runtime() const {
    return runtime_;
  }

  WidgetLibrary& widgetLibrary() const {
    return library_;
  }

  ReactBlessedIDOperations& registry() const {
    return registry_;
  }

private:
  ReactBlessedComponent& componentFor(NodeId id);
  void dispatchEvent(NodeId id, const WidgetEvent& event);
  void discardPartialMount(NodeId id) noexcept;

  void attachRef(ReactBlessedComponent& component, ReactBlessedReconcileTransaction& transaction);
  void updateRef(ReactBlessedComponent& component, ReactBlessedReconcileTransaction& transaction);
  void detachRef(ReactBlessedComponent& component);
  void invokeRef(const std::shared_ptr<jsi::Function>& ref, NodeId id);

  jsi::Runtime& runtime_;
  WidgetLibrary& library_;
  ReactBlessedIDOperations& registry_;
  ReactMultiChild& multiChild_;
  std::unordered_map<NodeId, std::unique_ptr<ReactBlessedComponent>, NodeIdHash> components_{};
};

} // namespace reactblessed
