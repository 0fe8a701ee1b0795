#include "blessed/BlessedScreen.h"
#include "blessed/WidgetLibrary.h"
#include "runtime/ReactBlessedBridge.h"
#include "runtime/ReactBlessedRuntime.h"
#include "scheduler/TickScheduler.h"
#include "shared/ReactBlessedErrors.h"
#include "TestElements.h"
#include "TestRuntime.h"

#include <cassert>
#include <exception>
#include <memory>
#include <stdexcept>
#include <string>
#include <vector>

namespace reactblessed::test {

namespace {

namespace jsi = facebook::jsi;

struct RuntimeHarness {
  TickScheduler scheduler;
  std::shared_ptr<Screen> screen = Screen::create(scheduler, ScreenOptions{30, 8});
  BlessedWidgetLibrary library{screen};
  TestRuntime runtime;
  ReactBlessedIDOperations registry;
  ReactBlessedRuntime renderer{runtime, library, registry};

  ElementPtr panel(const std::string& greeting) {
    auto button = createElement(
      runtime,
      "button",
      props(prop("top", jsi::Value(1.0)), prop("content", runtime.makeString("Go"))));
    return createElement(
      runtime,
      "box",
      props(prop("width", jsi::Value(10.0)), prop("height", jsi::Value(3.0))),
      children(text(greeting), child(button)));
  }
};

void testRenderMountsUpdatesAndReplaces() {
  RuntimeHarness h;
  assert(!h.renderer.hasRoot());

  auto failures = h.renderer.render(h.panel("hello"));
  assert(failures.empty());
  assert(h.renderer.hasRoot());
  assert(h.screen->children().size() == 1);
  const WidgetHandle box = h.screen->children()[0];
  assert(box->kind() == WidgetKind::Box);
  assert(box->children().size() == 2);
  assert(box->children()[0]->kind() == WidgetKind::Text);
  assert(h.renderer.getPublicInstance(h.renderer.rootNodeId()) == box);

  // Nothing is painted until the scheduler ticks.
  assert(h.screen->renderCount() == 0);
  assert(h.scheduler.runPendingTasks() == 1);
  assert(h.screen->renderCount() == 1);
  assert(h.screen->lines()[0].substr(0, 5) == "hello");
  assert(h.screen->lines()[1].substr(0, 2) == "Go");

  const NodeId firstRoot = h.renderer.rootNodeId();
  h.renderer.render(h.panel("world"));
  assert(h.renderer.rootNodeId() == firstRoot);
  assert(h.screen->children()[0] == box);
  assert(box->children()[0]->content() == "world");
  h.scheduler.runPendingTasks();
  assert(h.screen->renderCount() == 2);
  assert(h.screen->lines()[0].substr(0, 5) == "world");

  h.renderer.render(createElement(h.runtime, "list"));
  assert(h.renderer.rootNodeId() != firstRoot);
  assert(!h.registry.contains(firstRoot));
  assert(!box->parent());
  assert(h.screen->children().size() == 1);
  assert(h.screen->children()[0]->kind() == WidgetKind::List);

  h.renderer.unmount();
  assert(!h.renderer.hasRoot());
  assert(h.screen->children().empty());
  assert(h.renderer.rootElement() == nullptr);

  // Unmounting twice is a no-op and opens no pass.
  h.renderer.unmount();
  assert(h.renderer.updates().passCount() == 4);
  assert(h.renderer.updates().redrawCount() == 4);
  h.scheduler.runPendingTasks();
  assert(h.screen->renderCount() == 3);
}

void testRenderRecoversAfterAbortedPass() {
  RuntimeHarness h;
  auto keyedBox = [&h](const std::string& key) {
    return child(createElement(h.runtime, "box", props(prop("key", h.runtime.makeString(key)))));
  };
  auto panelOf = [&h](std::vector<ElementChild> kids) {
    return createElement(h.runtime, "box", {}, std::move(kids));
  };

  h.renderer.render(panelOf(children(keyedBox("A"), keyedBox("B"))));
  const WidgetHandle panel = h.screen->children()[0];
  const WidgetHandle widgetA = panel->children()[0];
  assert(h.registry.size() == 3);

  bool threw = false;
  try {
    h.renderer.render(panelOf(children(
      keyedBox("A"),
      child(createElement(h.runtime, "NoSuchWidget")))));
  } catch (const UnknownWidgetTypeError&) {
    threw = true;
  }
  assert(threw);
  // B was already unmounted when the pass stopped; nothing is rolled back.
  assert(panel->children().size() == 1);
  assert(h.registry.size() == 2);

  auto retry = panelOf(children(keyedBox("A"), keyedBox("B")));
  h.renderer.render(retry);
  assert(h.renderer.rootElement() == retry);
  assert(h.screen->children()[0] == panel);
  assert(panel->children().size() == 2);
  assert(panel->children()[0] == widgetA);
  assert(h.registry.size() == 3);

  h.renderer.unmount();
  assert(h.registry.size() == 0);
  assert(h.screen->children().empty());
  assert(h.renderer.reconciler().mountedCount() == 0);
}

void testDestroyingTheRendererUnmounts() {
  TickScheduler scheduler;
  auto screen = Screen::create(scheduler, ScreenOptions{10, 2});
  BlessedWidgetLibrary library(screen);
  TestRuntime runtime;
  ReactBlessedIDOperations registry;
  {
    ReactBlessedRuntime renderer(runtime, library, registry);
    renderer.render(createElement(runtime, "box"));
    assert(screen->children().size() == 1);
  }
  assert(screen->children().empty());
}

jsi::Object makeElementObject(TestRuntime& runtime, const std::string& type) {
  jsi::Object element(runtime);
  element.setProperty(runtime, "type", runtime.makeString(type));
  return element;
}

void testElementFromJsiFlattensChildren() {
  TestRuntime runtime;

  jsi::Object inner = makeElementObject(runtime, "text");
  jsi::Object innerProps(runtime);
  innerProps.setProperty(runtime, "content", runtime.makeString("x"));
  inner.setProperty(runtime, "props", std::move(innerProps));

  jsi::Array nested(runtime, 2);
  nested.setValueAtIndex(runtime, 0, jsi::Value(7.0));
  nested.setValueAtIndex(runtime, 1, std::move(inner));

  jsi::Array list(runtime, 4);
  list.setValueAtIndex(runtime, 0, runtime.makeString("a"));
  list.setValueAtIndex(runtime, 1, jsi::Value::null());
  list.setValueAtIndex(runtime, 2, jsi::Value(true));
  list.setValueAtIndex(runtime, 3, std::move(nested));

  jsi::Object elementProps(runtime);
  elementProps.setProperty(runtime, "width", jsi::Value(5.0));
  elementProps.setProperty(runtime, "children", std::move(list));

  jsi::Object object = makeElementObject(runtime, "box");
  object.setProperty(runtime, "key", runtime.makeString("k"));
  object.setProperty(runtime, "props", std::move(elementProps));

  auto element = elementFromJsi(runtime, jsi::Value(runtime, object));
  assert(element->type == "box");
  assert(element->key == std::optional<std::string>("k"));
  const jsi::Value* width = element->findProp("width");
  assert(width != nullptr && width->getNumber() == 5.0);
  assert(element->findProp("children") == nullptr);

  assert(element->children.size() == 3);
  assert(element->children[0].kind == ChildKind::Text);
  assert(element->children[0].text == "a");
  assert(element->children[1].kind == ChildKind::Text);
  assert(element->children[1].text == "7");
  assert(element->children[2].kind == ChildKind::Element);
  assert(element->children[2].element->type == "text");
  assert(element->children[2].element->findProp("content") != nullptr);
}

void testElementFromJsiRejectsBadInput() {
  TestRuntime runtime;

  bool threw = false;
  try {
    elementFromJsi(runtime, jsi::Value(3.0));
  } catch (const std::invalid_argument&) {
    threw = true;
  }
  assert(threw);

  threw = false;
  try {
    jsi::Object untyped(runtime);
    elementFromJsi(runtime, jsi::Value(runtime, untyped));
  } catch (const std::invalid_argument&) {
    threw = true;
  }
  assert(threw);

  threw = false;
  try {
    jsi::Object element = makeElementObject(runtime, "box");
    element.setProperty(runtime, "props", jsi::Value(1.0));
    elementFromJsi(runtime, jsi::Value(runtime, element));
  } catch (const std::invalid_argument&) {
    threw = true;
  }
  assert(threw);
}

void testGlobalBindingsDriveTheRenderer() {
  RuntimeHarness h;
  installReactBlessedBindings(h.runtime, h.renderer);

  auto api = h.runtime.global().getPropertyAsObject(h.runtime, "ReactBlessed");
  auto render = api.getPropertyAsFunction(h.runtime, "render");
  auto unmount = api.getPropertyAsFunction(h.runtime, "unmount");

  auto result = render.call(h.runtime, makeElementObject(h.runtime, "box"));
  assert(result.isNumber() && result.getNumber() == 0.0);
  assert(h.renderer.hasRoot());
  assert(h.screen->children()[0]->kind() == WidgetKind::Box);

  // A throwing ref is reported as a commit failure, not an exception.
  {
    CapturedLog captured;
    jsi::Object element = makeElementObject(h.runtime, "list");
    element.setProperty(h.runtime, "ref", h.runtime.makeFunction(
      "ref",
      [](jsi::Runtime&, const jsi::Value&, const jsi::Value* args, size_t count) -> jsi::Value {
        if (count > 0 && args[0].isObject()) {
          throw std::runtime_error("ref failed");
        }
        return jsi::Value::undefined();
      }));
    result = render.call(h.runtime, std::move(element));
    assert(result.getNumber() == 1.0);
    assert(captured.count(LogLevel::Error) == 1);
  }
  assert(h.screen->children()[0]->kind() == WidgetKind::List);

  bool threw = false;
  try {
    render.call(h.runtime);
  } catch (const std::exception&) {
    threw = true;
  }
  assert(threw);
  assert(h.renderer.hasRoot());

  unmount.call(h.runtime);
  assert(!h.renderer.hasRoot());
  assert(h.screen->children().empty());
}

} // namespace

bool runReactBlessedRuntimeTests() {
  testRenderMountsUpdatesAndReplaces();
  testRenderRecoversAfterAbortedPass();
  testDestroyingTheRendererUnmounts();
  testElementFromJsiFlattensChildren();
  testElementFromJsiRejectsBadInput();
  testGlobalBindingsDriveTheRenderer();
  return true;
}

} // namespace reactblessed::test
