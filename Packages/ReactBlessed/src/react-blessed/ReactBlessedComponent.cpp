#include "react-blessed/ReactBlessedComponent.h"

#include "react-blessed/ReactBlessedAttributes.h"
#include "shared/ReactBlessedErrorLogger.h"
#include "shared/ReactBlessedErrors.h"
#include "shared/ReactBlessedFeatureFlags.h"

#include <stdexcept>
#include <utility>

namespace reactblessed {

namespace {

// Child delegate bound to one parent node and the running pass. Unmounting
// needs no pass.
class ChildScope : public ChildDelegate {
public:
  ChildScope(
    ReactBlessedReconciler& reconciler,
    NodeId parent,
    ReactBlessedReconcileTransaction* transaction)
    : reconciler_(reconciler),
      parent_(parent),
      transaction_(transaction) {}

  NodeId mountChild(const ElementPtr& element) override {
    return reconciler_.mountComponent(element, parent_, requireTransaction());
  }

  void updateChild(NodeId id, const ElementPtr& prevElement, const ElementPtr& nextElement) override {
    reconciler_.receiveComponent(id, prevElement, nextElement, requireTransaction());
  }

  void moveChild(NodeId id, std::size_t toIndex) override {
    reconciler_.moveComponent(id, toIndex);
  }

  void unmountChild(NodeId id) override {
    reconciler_.unmountComponent(id);
  }

private:
  ReactBlessedReconcileTransaction& requireTransaction() {
    if (transaction_ == nullptr) {
      throw std::logic_error("Children can only be mounted or updated inside a pass");
    }
    return *transaction_;
  }

  ReactBlessedReconciler& reconciler_;
  NodeId parent_;
  ReactBlessedReconcileTransaction* transaction_;
};

std::shared_ptr<jsi::Function> refFunction(jsi::Runtime& runtime, const VirtualElement& element) {
  if (!element.ref || !element.ref->isObject()) {
    return nullptr;
  }
  auto object = element.ref->getObject(runtime);
  if (!object.isFunction(runtime)) {
    return nullptr;
  }
  return std::make_shared<jsi::Function>(object.getFunction(runtime));
}

} // namespace

ReactBlessedComponent::ReactBlessedComponent(ElementPtr element, WidgetKind kind)
  : currentElement_(std::move(element)),
    kind_(kind) {}

ReactBlessedReconciler::ReactBlessedReconciler(
  jsi::Runtime& runtime,
  WidgetLibrary& library,
  ReactBlessedIDOperations& registry,
  ReactMultiChild& multiChild)
  : runtime_(runtime),
    library_(library),
    registry_(registry),
    multiChild_(multiChild) {
  auto surface = library_.rootSurface();
  if (registry_.screen() != surface) {
    registry_.setScreen(std::move(surface));
  }
}

NodeId ReactBlessedReconciler::mountComponent(
  const ElementPtr& element,
  NodeId parent,
  ReactBlessedReconcileTransaction& transaction) {
  if (!element) {
    throw std::invalid_argument("Cannot mount a null element");
  }
  if (!library_.hasWidgetType(element->type)) {
    throw UnknownWidgetTypeError(element->type);
  }

  const WidgetHandle parentWidget = parent.isRoot() ? library_.rootSurface() : registry_.get(parent);
  const WidgetKind kind = widgetKindFromType(element->type).value_or(WidgetKind::Element);

  const WidgetOptions options = resolveWidgetOptions(runtime_, *element);
  auto component = std::make_unique<ReactBlessedComponent>(element, kind);
  component->eventHandlers_ = resolveEventHandlers(runtime_, *element, kind);

  WidgetHandle widget = library_.createWidget(element->type, options);
  const NodeId id = registry_.add(widget, parent);
  component->rootNodeId_ = id;
  ReactBlessedComponent& instance = *component;
  components_.emplace(id, std::move(component));

  library_.onAnyEvent(widget, [this, id](const WidgetEvent& event) {
    dispatchEvent(id, event);
  });
  library_.attach(parentWidget, widget);
  transaction.markNeedsRedraw();

  ChildScope scope(*this, id, &transaction);
  try {
    multiChild_.mountChildren(instance.renderedChildren_, element->children, scope);
  } catch (...) {
    // The caller never learns this id, so take the partial subtree down.
    discardPartialMount(id);
    throw;
  }

  attachRef(instance, transaction);
  return id;
}

void ReactBlessedReconciler::receiveComponent(
  NodeId id,
  const ElementPtr& /*prevElement*/,
  const ElementPtr& nextElement,
  ReactBlessedReconcileTransaction& transaction) {
  ReactBlessedComponent& component = componentFor(id);
  if (!nextElement) {
    throw std::invalid_argument("Cannot update to a null element");
  }
  if (nextElement == component.currentElement_) {
    return;
  }

  const WidgetHandle widget = registry_.get(id);
  const WidgetOptions options = resolveWidgetOptions(runtime_, *nextElement);
  auto handlers = resolveEventHandlers(runtime_, *nextElement, component.kind_);

  library_.applyOptions(widget, options);
  component.eventHandlers_ = std::move(handlers);
  transaction.markNeedsRedraw();

  ChildScope scope(*this, id, &transaction);
  multiChild_.updateChildren(component.renderedChildren_, nextElement->children, scope);
  // Set last so that a pass aborted by a child can be retried with the same
  // element.
  component.currentElement_ = nextElement;

  updateRef(component, transaction);
}

void ReactBlessedReconciler::unmountComponent(NodeId id) {
  ReactBlessedComponent& component = componentFor(id);

  ChildScope scope(*this, id, nullptr);
  multiChild_.unmountChildren(component.renderedChildren_, scope);

  detachRef(component);

  const WidgetHandle widget = registry_.get(id);
  const WidgetHandle parent = registry_.getParent(id);
  library_.offAllEvents(widget);
  library_.detach(parent, widget);
  registry_.drop(id);
  components_.erase(id);
}

void ReactBlessedReconciler::discardPartialMount(NodeId id) noexcept {
  try {
    unmountComponent(id);
  } catch (const std::exception& error) {
    logError("discarding a partially mounted " + describeNodeId(id) + " failed: " + error.what());
  }
}

void ReactBlessedReconciler::moveComponent(NodeId id, std::size_t toIndex) {
  const WidgetHandle widget = registry_.get(id);
  const WidgetHandle parent = registry_.getParent(id);
  library_.insertAt(parent, widget, toIndex);
}

const WidgetHandle& ReactBlessedReconciler::getPublicInstance(NodeId id) const {
  return registry_.get(id);
}

const ReactBlessedComponent& ReactBlessedReconciler::component(NodeId id) const {
  auto it = components_.find(id);
  if (it == components_.end()) {
    throw UnknownNodeError("Unknown node " + describeNodeId(id));
  }
  return *it->second;
}

ReactBlessedComponent& ReactBlessedReconciler::componentFor(NodeId id) {
  auto it = components_.find(id);
  if (it == components_.end()) {
    throw UnknownNodeError("Unknown node " + describeNodeId(id));
  }
  return *it->second;
}

void ReactBlessedReconciler::dispatchEvent(NodeId id, const WidgetEvent& event) {
  auto it = components_.find(id);
  if (it == components_.end()) {
    return;
  }
  dispatchWidgetEvent(runtime_, it->second->eventHandlers_, event);
}

void ReactBlessedReconciler::attachRef(
  ReactBlessedComponent& component,
  ReactBlessedReconcileTransaction& transaction) {
  auto ref = refFunction(runtime_, *component.currentElement_);
  component.attachedRef_ = ref;
  if (!ref) {
    return;
  }
  const NodeId id = component.rootNodeId_;
  transaction.enqueueCallback([this, ref, id]() {
    invokeRef(ref, id);
  });
}

void ReactBlessedReconciler::updateRef(
  ReactBlessedComponent& component,
  ReactBlessedReconcileTransaction& transaction) {
  auto next = refFunction(runtime_, *component.currentElement_);
  const auto& previous = component.attachedRef_;
  if (!previous && !next) {
    return;
  }
  if (previous && next && jsi::Object::strictEquals(runtime_, *previous, *next)) {
    return;
  }

  if (previous) {
    auto detached = previous;
    transaction.enqueueCallback([this, detached]() {
      detached->call(runtime_, jsi::Value::null());
    });
  }
  attachRef(component, transaction);
}

void ReactBlessedReconciler::detachRef(ReactBlessedComponent& component) {
  auto ref = std::move(component.attachedRef_);
  component.attachedRef_.reset();
  if (!detachRefsOnUnmount || !ref) {
    return;
  }
  try {
    ref->call(runtime_, jsi::Value::null());
  } catch (const std::exception& error) {
    logError(std::string("ref callback threw while detaching: ") + error.what());
  }
}

void ReactBlessedReconciler::invokeRef(const std::shared_ptr<jsi::Function>& ref, NodeId id) {
  if (!isMounted(id)) {
    return;
  }
  auto instance = jsi::Object::createFromHostObject(runtime_, registry_.get(id));
  ref->call(runtime_, jsi::Value(runtime_, instance));
}

} // namespace reactblessed
