#include "react-blessed/ReactBlessedComponent.h"
#include "shared/ReactBlessedErrors.h"
#include "TestElements.h"
#include "TestRuntime.h"
#include "TestWidgetLibrary.h"

#include <cassert>
#include <functional>
#include <memory>
#include <string>
#include <vector>

namespace reactblessed::test {

namespace {

namespace jsi = facebook::jsi;

struct ReconcilerHarness {
  TestRuntime runtime;
  RecordingWidgetLibrary library;
  ReactBlessedIDOperations registry;
  ReactMultiChild multiChild;
  ReactBlessedReconciler reconciler{runtime, library, registry, multiChild};
  ReactBlessedUpdates updates{library};

  NodeId mount(const ElementPtr& element) {
    auto pass = updates.beginPass();
    const NodeId id = reconciler.mountComponent(element, NodeId::root(), pass);
    updates.commit(pass);
    return id;
  }

  void update(NodeId id, const ElementPtr& next) {
    auto pass = updates.beginPass();
    reconciler.receiveComponent(id, reconciler.component(id).currentElement(), next, pass);
    updates.commit(pass);
  }

  ElementPtr element(
    const std::string& type,
    PropList list = {},
    std::vector<ElementChild> kids = {}) {
    return createElement(runtime, type, std::move(list), std::move(kids));
  }

  ElementPtr keyed(const std::string& type, const std::string& key, std::vector<ElementChild> kids = {}) {
    return element(type, props(prop("key", runtime.makeString(key))), std::move(kids));
  }

  jsi::Value recorder(std::vector<std::string>& log, const std::string& name) {
    return jsi::Value(runtime, runtime.makeFunction(
      name,
      [&log, name](jsi::Runtime&, const jsi::Value&, const jsi::Value* args, size_t count) {
        log.push_back(count > 0 && args[0].isNull() ? name + ":null" : name);
        return jsi::Value::undefined();
      }));
  }
};

// Registry edges under `id` must match the rendered children, in order, all
// the way down.
void assertIsomorphic(ReconcilerHarness& harness, NodeId id) {
  const auto& widget = harness.registry.get(id);
  const auto& component = harness.reconciler.component(id);
  const auto& rendered = component.renderedChildren();
  assert(widget->children().size() == rendered.size());
  for (std::size_t index = 0; index < rendered.size(); ++index) {
    assert(harness.registry.getParentId(rendered[index].id) == id);
    assert(widget->children()[index] == harness.registry.get(rendered[index].id));
    assert(harness.reconciler.component(rendered[index].id).currentElement() == rendered[index].element);
    assertIsomorphic(harness, rendered[index].id);
  }
}

template <typename Error, typename Fn>
bool throwsError(Fn&& fn) {
  try {
    fn();
  } catch (const Error&) {
    return true;
  }
  return false;
}

void testMountUnmountInverse() {
  ReconcilerHarness h;
  auto tree = h.element("box", {}, children(
    child(h.element("box", {}, children(text("title"), child(h.element("list"))))),
    child(h.element("progressbar"))));

  const NodeId root = h.mount(tree);
  assert(h.registry.size() == 5);
  assert(h.reconciler.mountedCount() == 5);
  assert(h.library.root()->children().size() == 1);
  assert(h.library.root()->children()[0] == h.reconciler.getPublicInstance(root));

  auto pass = h.updates.beginPass();
  h.reconciler.unmountComponent(root);
  // Unmounting alone never asks for a redraw.
  assert(!h.updates.redrawRequested());
  h.updates.commit(pass);

  assert(h.registry.size() == 0);
  assert(h.reconciler.mountedCount() == 0);
  assert(h.library.root()->children().empty());
  assert(h.library.offAllCalls == 5);
  assert(h.library.detachCalls == 5);
  for (const auto& widget : h.library.created) {
    assert(widget->listenerCount() == 0);
  }
  assert(!h.reconciler.isMounted(root));
}

void testUpdateKeepsIdentityAndHandle() {
  ReconcilerHarness h;
  const NodeId id = h.mount(h.element("box", props(prop("width", jsi::Value(10)))));
  const WidgetHandle handle = h.reconciler.getPublicInstance(id);
  assert(h.library.createCalls == 1);
  assert(std::get<int>(handle->options().width) == 10);

  h.update(id, h.element("box", props(prop("width", jsi::Value(20)))));
  h.update(id, h.element("box", props(prop("width", jsi::Value(30)), prop("label", h.runtime.makeString("Stats")))));

  assert(h.reconciler.isMounted(id));
  assert(h.reconciler.getPublicInstance(id) == handle);
  assert(h.library.createCalls == 1);
  assert(h.library.applyCalls == 2);
  for (const auto& applied : h.library.applied) {
    assert(applied == handle);
  }
  assert(std::get<int>(handle->options().width) == 30);
  assert(handle->label() == "Stats");

  // Props missing from the next element keep their previous value.
  h.update(id, h.element("box"));
  assert(handle->label() == "Stats");
}

void testStructuralIsomorphismAcrossPasses() {
  ReconcilerHarness h;
  const NodeId root = h.mount(h.element("box", {}, children(
    child(h.keyed("box", "a", children(text("1")))),
    child(h.keyed("box", "b")),
    text("tail"))));
  assertIsomorphic(h, root);

  h.update(root, h.element("box", {}, children(
    child(h.keyed("box", "b", children(text("2"), text("3")))),
    child(h.keyed("list", "c")),
    child(h.keyed("box", "a")))));
  assertIsomorphic(h, root);

  h.update(root, h.element("box", {}, children(child(h.keyed("box", "a", children(text("only")))))));
  assertIsomorphic(h, root);
  assert(h.registry.size() == 3);
}

void testSingleRedrawPerPass() {
  ReconcilerHarness h;
  const NodeId root = h.mount(h.element("box", {}, children(
    child(h.element("box")),
    child(h.element("box")),
    child(h.element("box", {}, children(text("deep")))))));
  assert(h.library.createCalls == 5);
  assert(h.library.redrawRequests == 1);

  h.update(root, h.element("box", {}, children(child(h.element("box")))));
  assert(h.library.redrawRequests == 2);
}

void testCallbacksFireChildrenFirst() {
  ReconcilerHarness h;
  std::vector<std::string> order;
  auto childA = h.element("box", props(prop("ref", h.recorder(order, "childA"))));
  auto childB = h.element("box", props(prop("ref", h.recorder(order, "childB"))));
  auto root = h.element("box", props(prop("ref", h.recorder(order, "root"))), children(child(childA), child(childB)));

  auto pass = h.updates.beginPass();
  const NodeId id = h.reconciler.mountComponent(root, NodeId::root(), pass);
  assert(order.empty());
  h.updates.commit(pass);
  assert((order == std::vector<std::string>{"childA", "childB", "root"}));

  order.clear();
  auto pass2 = h.updates.beginPass();
  h.reconciler.unmountComponent(id);
  h.updates.commit(pass2);
  assert((order == std::vector<std::string>{"childA:null", "childB:null", "root:null"}));
}

void testRefReceivesWidgetAndIsReplaced() {
  ReconcilerHarness h;
  WidgetHandle received;
  auto capture = jsi::Value(h.runtime, h.runtime.makeFunction(
    "capture",
    [&received](jsi::Runtime& rt, const jsi::Value&, const jsi::Value* args, size_t count) {
      if (count > 0 && args[0].isObject()) {
        received = std::dynamic_pointer_cast<BlessedNode>(args[0].getObject(rt).getHostObject(rt));
      }
      return jsi::Value::undefined();
    }));
  const NodeId id = h.mount(h.element("box", props(prop("ref", std::move(capture)))));
  assert(received != nullptr);
  assert(received == h.reconciler.getPublicInstance(id));

  std::vector<std::string> log;
  h.update(id, h.element("box", props(prop("ref", h.recorder(log, "second")))));
  assert((log == std::vector<std::string>{"second"}));

  // Same ref function again: not re-attached.
  auto same = h.reconciler.component(id).currentElement();
  const jsi::Value* sameRef = &*same->ref;
  h.update(id, h.element("box", props(prop("ref", jsi::Value(h.runtime, *sameRef)))));
  assert(log.size() == 1);
}

void testUnknownWidgetTypeLeavesNothingBehind() {
  ReconcilerHarness h;
  {
    auto pass = h.updates.beginPass();
    assert(throwsError<UnknownWidgetTypeError>([&] {
      h.reconciler.mountComponent(h.element("NoSuchWidget"), NodeId::root(), pass);
    }));
  }
  assert(h.registry.size() == 0);
  assert(h.library.createCalls == 0);
  assert(h.library.attachCalls == 0);
  assert(h.library.redrawRequests == 0);

  try {
    auto pass = h.updates.beginPass();
    h.reconciler.mountComponent(h.element("NoSuchWidget"), NodeId::root(), pass);
    assert(false);
  } catch (const UnknownWidgetTypeError& error) {
    assert(error.type() == "NoSuchWidget");
    assert(std::string(error.what()) == "Invalid blessed element \"NoSuchWidget\".");
  }

  // A bad grandchild aborts the pass. The subtree whose id never reached the
  // caller is taken down again, and the aborted pass still draws.
  {
    auto pass = h.updates.beginPass();
    assert(throwsError<UnknownWidgetTypeError>([&] {
      h.reconciler.mountComponent(
        h.element("box", {}, children(child(h.element("text")), child(h.element("NoSuchWidget")))),
        NodeId::root(),
        pass);
    }));
  }
  assert(h.library.createCalls == 2);
  assert(h.library.detachCalls == 2);
  assert(h.registry.size() == 0);
  assert(h.reconciler.mountedCount() == 0);
  assert(h.library.root()->children().empty());
  assert(h.library.redrawRequests == 1);

  // The same failure one level down, inside an update of a mounted parent.
  const NodeId parent = h.mount(h.element("box", {}, children(child(h.keyed("box", "A")))));
  auto failing = h.element("box", {}, children(
    child(h.keyed("box", "A")),
    child(h.element("box", {}, children(child(h.element("text")), child(h.element("NoSuchWidget")))))));
  {
    auto pass = h.updates.beginPass();
    assert(throwsError<UnknownWidgetTypeError>([&] {
      h.reconciler.receiveComponent(parent, h.reconciler.component(parent).currentElement(), failing, pass);
    }));
  }
  assert(h.reconciler.component(parent).renderedChildren().size() == 1);
  assert(h.registry.size() == 2);
  assertIsomorphic(h, parent);
}

void testReorderMovesWithoutRemounting() {
  ReconcilerHarness h;
  const NodeId root = h.mount(h.element("box", {}, children(
    child(h.keyed("box", "A")), child(h.keyed("box", "B")), child(h.keyed("box", "C")))));
  const WidgetHandle rootWidget = h.reconciler.getPublicInstance(root);
  const auto before = rootWidget->children();
  const std::size_t created = h.library.createCalls;

  h.update(root, h.element("box", {}, children(
    child(h.keyed("box", "C")), child(h.keyed("box", "A")), child(h.keyed("box", "B")))));

  const auto& after = rootWidget->children();
  assert(after.size() == 3);
  assert(after[0] == before[2]);
  assert(after[1] == before[0]);
  assert(after[2] == before[1]);
  assert(h.library.createCalls == created);
  assert(h.library.detachCalls == 0);
  assert(h.library.insertCalls == 1);
  assertIsomorphic(h, root);
}

void testEventHandlersFollowTheCurrentElement() {
  ReconcilerHarness h;
  std::vector<std::string> calls;
  auto handler = [&](const std::string& name) {
    return jsi::Value(h.runtime, h.runtime.makeFunction(
      name,
      [&calls, name](jsi::Runtime& rt, const jsi::Value&, const jsi::Value* args, size_t count) {
        std::string entry = name;
        for (size_t index = 0; index < count; ++index) {
          if (args[index].isNumber()) {
            entry += " " + std::to_string(static_cast<int>(args[index].getNumber()));
          } else if (args[index].isString()) {
            entry += " " + args[index].getString(rt).utf8(rt);
          }
        }
        calls.push_back(entry);
        return jsi::Value::undefined();
      }));
  };

  const NodeId id = h.mount(h.element("list", props(
    prop("items", [&] {
      auto array = h.runtime.makeArray(2);
      array.setValueAtIndex(h.runtime, 0, h.runtime.makeString("alpha"));
      array.setValueAtIndex(h.runtime, 1, h.runtime.makeString("beta"));
      return jsi::Value(h.runtime, array);
    }()),
    prop("onClick", handler("first")),
    prop("onSelectItem", handler("select")),
    prop("onPress", handler("press")))));
  const WidgetHandle widget = h.reconciler.getPublicInstance(id);
  const auto& table = h.reconciler.component(id).eventHandlers();
  assert(table.has(WidgetEventType::Click));
  assert(table.has(WidgetEventType::SelectItem));
  // Lists never emit "press".
  assert(!table.has(WidgetEventType::Press));

  widget->emit("click", {1.0, 2.0});
  widget->select(1);
  widget->emit("press");
  widget->emit("no such event");
  assert((calls == std::vector<std::string>{"first 1 2", "select beta 1"}));

  calls.clear();
  h.update(id, h.element("list", props(prop("onClick", handler("second")))));
  widget->emit("click", {3.0, 4.0});
  widget->select(0);
  assert((calls == std::vector<std::string>{"second 3 4"}));

  calls.clear();
  auto pass = h.updates.beginPass();
  h.reconciler.unmountComponent(id);
  h.updates.commit(pass);
  widget->emit("click", {5.0, 6.0});
  assert(calls.empty());
}

void testReceivingCurrentElementIsANoOp() {
  ReconcilerHarness h;
  auto element = h.element("box");
  const NodeId id = h.mount(element);
  const std::size_t redraws = h.library.redrawRequests;
  h.update(id, element);
  assert(h.library.applyCalls == 0);
  assert(h.library.redrawRequests == redraws);
}

void testUnknownNodeOperationsFailLoudly() {
  ReconcilerHarness h;
  const NodeId id = h.mount(h.element("box"));
  {
    auto pass = h.updates.beginPass();
    h.reconciler.unmountComponent(id);
    h.updates.commit(pass);
  }

  assert(throwsError<UnknownNodeError>([&] { h.reconciler.unmountComponent(id); }));
  assert(throwsError<UnknownNodeError>([&] { h.reconciler.getPublicInstance(id); }));
  assert(throwsError<UnknownNodeError>([&] { h.reconciler.component(id); }));
  assert(throwsError<UnknownNodeError>([&] {
    auto pass = h.updates.beginPass();
    h.reconciler.receiveComponent(id, nullptr, h.element("box"), pass);
  }));
  assert(throwsError<UnknownNodeError>([&] {
    auto pass = h.updates.beginPass();
    h.reconciler.mountComponent(h.element("box"), id, pass);
  }));
  assert(h.library.createCalls == 1);
}

} // namespace

bool runReactBlessedComponentTests() {
  testMountUnmountInverse();
  testUpdateKeepsIdentityAndHandle();
  testStructuralIsomorphismAcrossPasses();
  testSingleRedrawPerPass();
  testCallbacksFireChildrenFirst();
  testRefReceivesWidgetAndIsReplaced();
  testUnknownWidgetTypeLeavesNothingBehind();
  testReorderMovesWithoutRemounting();
  testEventHandlersFollowTheCurrentElement();
  testReceivingCurrentElementIsANoOp();
  testUnknownNodeOperationsFailLoudly();
  return true;
}

} // namespace reactblessed::test
