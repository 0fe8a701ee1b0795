#include "react-blessed/ReactBlessedIDOperations.h"
#include "shared/ReactBlessedErrors.h"

#include <cassert>
#include <memory>
#include <stdexcept>

namespace reactblessed::test {

namespace {

WidgetHandle makeWidget(WidgetKind kind = WidgetKind::Box) {
  return std::make_shared<BlessedNode>(kind, WidgetOptions{});
}

template <typename Fn>
bool throwsUnknownNode(Fn&& fn) {
  try {
    fn();
  } catch (const UnknownNodeError&) {
    return true;
  }
  return false;
}

} // namespace

bool runReactBlessedIDOperationsTests() {
  ReactBlessedIDOperations registry;
  auto screen = makeWidget(WidgetKind::Element);
  registry.setScreen(screen);
  assert(registry.size() == 0);
  assert(!registry.contains(NodeId::root()));

  auto outer = makeWidget();
  auto inner = makeWidget(WidgetKind::Text);
  const NodeId outerId = registry.add(outer, NodeId::root());
  const NodeId innerId = registry.add(inner, outerId);
  assert(outerId);
  assert(innerId);
  assert(outerId != innerId);
  assert(registry.size() == 2);
  assert(registry.get(outerId) == outer);
  assert(registry.get(innerId) == inner);
  assert(registry.getParent(outerId) == screen);
  assert(registry.getParent(innerId) == outer);
  assert(registry.getParentId(innerId) == outerId);
  assert(registry.getParentId(outerId).isRoot());

  // Adding under an id that was never issued fails before anything is stored.
  assert(throwsUnknownNode([&] {
    (void)registry.add(makeWidget(), NodeId{42, 1});
  }));
  assert(registry.size() == 2);

  registry.drop(innerId);
  assert(!registry.contains(innerId));
  assert(registry.size() == 1);
  assert(throwsUnknownNode([&] { registry.get(innerId); }));
  assert(throwsUnknownNode([&] { registry.getParent(innerId); }));
  assert(throwsUnknownNode([&] { registry.drop(innerId); }));

  // The freed slot is reused with a new generation; the stale id stays dead.
  const NodeId reusedId = registry.add(makeWidget(), outerId);
  assert(reusedId.index == innerId.index);
  assert(reusedId.generation != innerId.generation);
  assert(registry.contains(reusedId));
  assert(!registry.contains(innerId));

  bool rebindRejected = false;
  try {
    registry.setScreen(makeWidget(WidgetKind::Element));
  } catch (const std::logic_error&) {
    rebindRejected = true;
  }
  assert(rebindRejected);
  assert(registry.screen() == screen);

  bool nullRejected = false;
  try {
    (void)registry.add(nullptr, NodeId::root());
  } catch (const std::invalid_argument&) {
    nullRejected = true;
  }
  assert(nullRejected);

  registry.reset();
  assert(registry.size() == 0);
  assert(!registry.contains(outerId));
  assert(!registry.contains(reusedId));
  assert(registry.screen() == nullptr);

  auto other = makeWidget(WidgetKind::Element);
  registry.setScreen(other);
  const NodeId fresh = registry.add(makeWidget(), NodeId::root());
  assert(registry.getParent(fresh) == other);
  assert(fresh != outerId);

  assert(describeNodeId(NodeId::root()) == "root");

  return true;
}

} // namespace reactblessed::test
