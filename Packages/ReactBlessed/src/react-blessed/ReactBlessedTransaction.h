#pragma once

#include "shared/ReactBlessedErrors.h"

#include <cstddef>
#include <cstdint>
#include <functional>
#include <vector>

namespace reactblessed {

class WidgetLibrary;
class ReactBlessedUpdates;

using MountReadyCallback = std::function<void()>;

// FIFO of callbacks deferred until a pass commits.
class CallbackQueue {
public:
  void enqueue(MountReadyCallback callback);

  std::size_t size() const {
    return callbacks_.size();
  }

  bool empty() const {
    return callbacks_.empty();
  }

  // Runs every queued callback in order and empties the queue. A callback
  // that throws is recorded and the rest still run.
  std::vector<CallbackFailure> notifyAll();

  void reset();

private:
  std::vector<MountReadyCallback> callbacks_{};
};

// One reconciliation pass. Every mutation made during the pass receives it;
// ReactBlessedUpdates::commit consumes it. A pass destroyed without a commit
// (a structural error unwound through it) drops its callbacks and still
// requests the redraw if mutations already happened.
class ReactBlessedReconcileTransaction {
public:
  ReactBlessedReconcileTransaction(ReactBlessedReconcileTransaction&& other) noexcept;
  ReactBlessedReconcileTransaction& operator=(ReactBlessedReconcileTransaction&&) = delete;
  ReactBlessedReconcileTransaction(const ReactBlessedReconcileTransaction&) = delete;
  ReactBlessedReconcileTransaction& operator=(const ReactBlessedReconcileTransaction&) = delete;
  ~ReactBlessedReconcileTransaction();

  void enqueueCallback(MountReadyCallback callback);

  // Records that the widget tree changed during this pass.
  void markNeedsRedraw();

  uint64_t id() const {
    return id_;
  }

  [[nodiscard]] bool isCommitted() const {
    return committed_;
  }

private:
  friend class ReactBlessedUpdates;

  ReactBlessedReconcileTransaction(ReactBlessedUpdates& owner, uint64_t id);

  ReactBlessedUpdates* owner_{nullptr};
  CallbackQueue mountReady_{};
  uint64_t id_{0};
  bool committed_{false};
};

// Collapses the mutations of one pass into a single redraw request and one
// ordered flush of deferred callbacks.
class ReactBlessedUpdates {
public:
  explicit ReactBlessedUpdates(WidgetLibrary& library);

  // Starts a pass with an empty queue and a cleared redraw flag.
  [[nodiscard]] ReactBlessedReconcileTransaction beginPass();

  void enqueueCallback(ReactBlessedReconcileTransaction& pass, MountReadyCallback callback);

  // Flushes the pass's callbacks, then requests one debounced redraw if
  // anything changed. Throws std::logic_error for a pass that was already
  // committed or that belongs to another coordinator.
  std::vector<CallbackFailure> commit(ReactBlessedReconcileTransaction& pass);

  [[nodiscard]] bool redrawRequested() const {
    return needsRedraw_;
  }

  std::size_t redrawCount() const {
    return redrawCount_;
  }

  std::size_t passCount() const {
    return passCount_;
  }

private:
  friend class ReactBlessedReconcileTransaction;

  void flushRedraw();
  void abandon(ReactBlessedReconcileTransaction& pass) noexcept;

  WidgetLibrary& library_;
  bool needsRedraw_{false};
  uint64_t nextPassId_{1};
  std::size_t passCount_{0};
  std::size_t redrawCount_{0};
};

} // namespace reactblessed
