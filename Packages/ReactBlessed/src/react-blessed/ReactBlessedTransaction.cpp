#include "react-blessed/ReactBlessedTransaction.h"

#include "blessed/WidgetLibrary.h"
#include "shared/ReactBlessedErrorLogger.h"

#include <exception>
#include <stdexcept>
#include <utility>

namespace reactblessed {

void CallbackQueue::enqueue(MountReadyCallback callback) {
  if (callback) {
    callbacks_.push_back(std::move(callback));
  }
}

std::vector<CallbackFailure> CallbackQueue::notifyAll() {
  // Callbacks may enqueue more work; those run in the next flush.
  auto callbacks = std::move(callbacks_);
  callbacks_.clear();

  std::vector<CallbackFailure> failures;
  for (std::size_t index = 0; index < callbacks.size(); ++index) {
    try {
      callbacks[index]();
    } catch (const std::exception& error) {
      failures.push_back(CallbackFailure{index, error.what()});
    } catch (...) {
      failures.push_back(CallbackFailure{index, "unknown exception"});
    }
  }
  return failures;
}

void CallbackQueue::reset() {
  callbacks_.clear();
}

ReactBlessedReconcileTransaction::ReactBlessedReconcileTransaction(ReactBlessedUpdates& owner, uint64_t id)
  : owner_(&owner),
    id_(id) {}

ReactBlessedReconcileTransaction::ReactBlessedReconcileTransaction(ReactBlessedReconcileTransaction&& other) noexcept
  : owner_(other.owner_),
    mountReady_(std::move(other.mountReady_)),
    id_(other.id_),
    committed_(other.committed_) {
  other.owner_ = nullptr;
  other.committed_ = true;
}

ReactBlessedReconcileTransaction::~ReactBlessedReconcileTransaction() {
  if (owner_ != nullptr && !committed_) {
    owner_->abandon(*this);
  }
}

void ReactBlessedReconcileTransaction::enqueueCallback(MountReadyCallback callback) {
  mountReady_.enqueue(std::move(callback));
}

void ReactBlessedReconcileTransaction::markNeedsRedraw() {
  if (owner_ != nullptr) {
    owner_->needsRedraw_ = true;
  }
}

ReactBlessedUpdates::ReactBlessedUpdates(WidgetLibrary& library)
  : library_(library) {}

ReactBlessedReconcileTransaction ReactBlessedUpdates::beginPass() {
  needsRedraw_ = false;
  ++passCount_;
  return ReactBlessedReconcileTransaction(*this, nextPassId_++);
}

void ReactBlessedUpdates::enqueueCallback(ReactBlessedReconcileTransaction& pass, MountReadyCallback callback) {
  if (pass.owner_ != this) {
    throw std::logic_error("Pass belongs to a different update coordinator");
  }
  pass.enqueueCallback(std::move(callback));
}

std::vector<CallbackFailure> ReactBlessedUpdates::commit(ReactBlessedReconcileTransaction& pass) {
  if (pass.owner_ != this) {
    throw std::logic_error("Pass belongs to a different update coordinator");
  }
  if (pass.committed_) {
    throw std::logic_error("Pass " + std::to_string(pass.id_) + " was already committed");
  }
  pass.committed_ = true;

  auto failures = pass.mountReady_.notifyAll();
  for (const auto& failure : failures) {
    logCallbackFailure(failure);
  }

  flushRedraw();
  return failures;
}

void ReactBlessedUpdates::flushRedraw() {
  if (!needsRedraw_) {
    return;
  }
  needsRedraw_ = false;
  ++redrawCount_;
  library_.requestDebouncedRedraw();
}

void ReactBlessedUpdates::abandon(ReactBlessedReconcileTransaction& pass) noexcept {
  pass.committed_ = true;
  pass.mountReady_.reset();
  try {
    flushRedraw();
  } catch (const std::exception& error) {
    logError(std::string("redraw request of an aborted pass failed: ") + error.what());
  }
}

} // namespace reactblessed
