#include "blessed/BlessedScreen.h"
#include "blessed/WidgetLibrary.h"
#include "runtime/ReactBlessedBridge.h"
#include "runtime/ReactBlessedRuntime.h"
#include "scheduler/TickScheduler.h"
#include "TestRuntime.h"

#include <exception>
#include <iostream>
#include <memory>
#include <string>
#include <utility>
#include <vector>

namespace reactblessed::demo {

namespace jsi = facebook::jsi;

struct DashboardState {
  std::vector<std::string> services;
  double progress{0.0};
  std::string status;
};

jsi::Value stringValue(jsi::Runtime& rt, const std::string& text) {
  return jsi::Value(rt, jsi::String::createFromUtf8(rt, text));
}

PropList props(std::vector<std::pair<std::string, jsi::Value>> entries) {
  PropList list;
  for (auto& entry : entries) {
    list.emplace_back(entry.first, std::move(entry.second));
  }
  return list;
}

ElementPtr buildDashboard(jsi::Runtime& rt, const DashboardState& state, const jsi::Value& onSelect) {
  std::vector<ElementChild> rows;
  for (const auto& service : state.services) {
    std::vector<std::pair<std::string, jsi::Value>> entries;
    entries.emplace_back("key", stringValue(rt, service));
    entries.emplace_back("height", jsi::Value(1.0));
    entries.emplace_back("top", jsi::Value(static_cast<double>(rows.size())));
    entries.emplace_back("content", stringValue(rt, "* " + service));
    rows.push_back(ElementChild::fromElement(createElement(rt, "text", props(std::move(entries)))));
  }

  jsi::Array items(rt, state.services.size());
  for (size_t i = 0; i < state.services.size(); ++i) {
    items.setValueAtIndex(rt, i, stringValue(rt, state.services[i]));
  }

  std::vector<std::pair<std::string, jsi::Value>> listProps;
  listProps.emplace_back("key", stringValue(rt, "services"));
  listProps.emplace_back("label", stringValue(rt, "Services"));
  listProps.emplace_back("border", stringValue(rt, "line"));
  listProps.emplace_back("left", jsi::Value(0.0));
  listProps.emplace_back("top", jsi::Value(0.0));
  listProps.emplace_back("width", stringValue(rt, "50%"));
  listProps.emplace_back("height", jsi::Value(6.0));
  listProps.emplace_back("items", jsi::Value(rt, items));
  listProps.emplace_back("onSelect", jsi::Value(rt, onSelect));
  auto list = createElement(rt, "list", props(std::move(listProps)));

  std::vector<std::pair<std::string, jsi::Value>> panelProps;
  panelProps.emplace_back("key", stringValue(rt, "order"));
  panelProps.emplace_back("label", stringValue(rt, "Order"));
  panelProps.emplace_back("border", stringValue(rt, "line"));
  panelProps.emplace_back("left", stringValue(rt, "50%"));
  panelProps.emplace_back("top", jsi::Value(0.0));
  panelProps.emplace_back("height", jsi::Value(6.0));
  auto panel = createElement(rt, "box", props(std::move(panelProps)), std::move(rows));

  std::vector<std::pair<std::string, jsi::Value>> barProps;
  barProps.emplace_back("key", stringValue(rt, "progress"));
  barProps.emplace_back("top", jsi::Value(6.0));
  barProps.emplace_back("height", jsi::Value(1.0));
  barProps.emplace_back("filled", jsi::Value(state.progress));
  auto bar = createElement(rt, "progressbar", props(std::move(barProps)));

  std::vector<std::pair<std::string, jsi::Value>> statusProps;
  statusProps.emplace_back("key", stringValue(rt, "status"));
  statusProps.emplace_back("top", jsi::Value(7.0));
  auto status = createElement(rt, "text", props(std::move(statusProps)), {ElementChild::fromText(state.status)});

  std::vector<ElementChild> children;
  children.push_back(ElementChild::fromElement(list));
  children.push_back(ElementChild::fromElement(panel));
  children.push_back(ElementChild::fromElement(bar));
  children.push_back(ElementChild::fromElement(status));
  return createElement(rt, "box", {}, std::move(children));
}

void reportFailures(const std::vector<CallbackFailure>& failures) {
  for (const auto& failure : failures) {
    std::cerr << "commit callback #" << failure.index << " failed: " << failure.message << std::endl;
  }
}

int run() {
  TickScheduler scheduler;
  ScreenOptions options;
  options.columns = 48;
  options.rows = 9;
  options.output = &std::cout;
  options.title = "react-blessed dashboard";
  auto screen = Screen::create(scheduler, options);
  BlessedWidgetLibrary library(screen);

  test::TestRuntime runtime;
  ReactBlessedIDOperations registry;
  ReactBlessedRuntime renderer(runtime, library, registry);

  DashboardState state{{"api", "db", "cache"}, 10.0, "starting"};
  jsi::Value onSelect(runtime, runtime.makeFunction(
    "onSelect",
    [&state](jsi::Runtime& rt, const jsi::Value&, const jsi::Value* args, size_t count) -> jsi::Value {
      if (count > 0 && args[0].isString()) {
        state.status = "selected " + args[0].getString(rt).utf8(rt);
      }
      return jsi::Value::undefined();
    }));

  auto frame = [&](const std::string& caption) {
    scheduler.runPendingTasks();
    std::cout << "\x1b[" << (options.rows + 1) << ";1H" << caption << std::endl;
  };

  try {
    reportFailures(renderer.render(buildDashboard(runtime, state, onSelect)));
    frame("mounted");

    state.services = {"cache", "api", "db"};
    state.progress = 60.0;
    reportFailures(renderer.render(buildDashboard(runtime, state, onSelect)));
    frame("reordered");

    // Second row inside the list border.
    screen->dispatchClick(2, 2);
    reportFailures(renderer.render(buildDashboard(runtime, state, onSelect)));
    frame("clicked");

    state.progress = 100.0;
    reportFailures(renderer.render(buildDashboard(runtime, state, onSelect)));
    frame("complete");

    renderer.unmount();
    frame("unmounted");
  } catch (const std::exception& error) {
    std::cerr << "terminal demo failed: " << error.what() << std::endl;
    return 1;
  }
  return 0;
}

} // namespace reactblessed::demo

int main() {
  return reactblessed::demo::run();
}
