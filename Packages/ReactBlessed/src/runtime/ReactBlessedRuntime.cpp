#include "runtime/ReactBlessedRuntime.h"

#include "shared/ReactBlessedErrorLogger.h"

#include <exception>
#include <string>

namespace reactblessed {

ReactBlessedRuntime::ReactBlessedRuntime(
  jsi::Runtime& runtime,
  WidgetLibrary& library,
  ReactBlessedIDOperations& registry)
  : reconciler_(runtime, library, registry, multiChild_),
    updates_(library) {}

ReactBlessedRuntime::~ReactBlessedRuntime() {
  if (!root_) {
    return;
  }
  try {
    unmount();
  } catch (const std::exception& error) {
    logError(std::string("unmounting the root on shutdown failed: ") + error.what());
  }
}

std::vector<CallbackFailure> ReactBlessedRuntime::render(const ElementPtr& element) {
  auto transaction = updates_.beginPass();

  if (root_ && shouldUpdateReactBlessedComponent(rootElement_, element)) {
    reconciler_.receiveComponent(root_, rootElement_, element, transaction);
  } else {
    if (root_) {
      const NodeId previous = root_;
      root_ = NodeId{};
      rootElement_.reset();
      reconciler_.unmountComponent(previous);
      transaction.markNeedsRedraw();
    }
    root_ = reconciler_.mountComponent(element, NodeId::root(), transaction);
  }
  rootElement_ = element;

  return updates_.commit(transaction);
}

void ReactBlessedRuntime::unmount() {
  if (!root_) {
    return;
  }
  auto transaction = updates_.beginPass();
  const NodeId previous = root_;
  root_ = NodeId{};
  rootElement_.reset();
  reconciler_.unmountComponent(previous);
  transaction.markNeedsRedraw();
  updates_.commit(transaction);
}

const WidgetHandle& ReactBlessedRuntime::getPublicInstance(NodeId id) const {
  return reconciler_.getPublicInstance(id);
}

} // namespace reactblessed
