#pragma once

#include "blessed/WidgetLibrary.h"
#include "react-blessed/ReactBlessedComponent.h"
#include "react-blessed/ReactBlessedElement.h"
#include "react-blessed/ReactBlessedIDOperations.h"
#include "react-blessed/ReactBlessedTransaction.h"
#include "react-blessed/ReactMultiChild.h"
#include "shared/ReactBlessedErrors.h"

#include <vector>

namespace reactblessed {

// Renders one element tree into a widget library. Every render() or
// unmount() call is exactly one pass.
class ReactBlessedRuntime {
public:
  ReactBlessedRuntime(
    jsi::Runtime& runtime,
    WidgetLibrary& library,
    ReactBlessedIDOperations& registry = ReactBlessedIDOperations::shared());
  ~ReactBlessedRuntime();

  ReactBlessedRuntime(const ReactBlessedRuntime&) = delete;
  ReactBlessedRuntime& operator=(const ReactBlessedRuntime&) = delete;

  // Updates the mounted root when `element` has the same type and key,
  // otherwise replaces it. Returns the callbacks that threw during commit.
  std::vector<CallbackFailure> render(const ElementPtr& element);

  void unmount();

  [[nodiscard]] bool hasRoot() const {
    return static_cast<bool>(root_);
  }

  NodeId rootNodeId() const {
    return root_;
  }

  const ElementPtr& rootElement() const {
    return rootElement_;
  }

  const WidgetHandle& getPublicInstance(NodeId id) const;

  ReactBlessedReconciler& reconciler() {
    return reconciler_;
  }

  ReactBlessedUpdates& updates() {
    return updates_;
  }

private:
  ReactMultiChild multiChild_{};
  ReactBlessedReconciler reconciler_;
  ReactBlessedUpdates updates_;
  NodeId root_{};
  ElementPtr rootElement_{};
};

} // namespace reactblessed
