#include "react-blessed/ReactBlessedAttributes.h"
#include "TestElements.h"
#include "TestRuntime.h"

#include <cassert>
#include <limits>
#include <stdexcept>
#include <string>

namespace reactblessed::test {

namespace jsi = facebook::jsi;

bool runReactBlessedAttributesTests() {
  TestRuntime runtime;

  auto object = [&runtime]() {
    return jsi::Object(runtime);
  };
  auto noop = [&runtime]() {
    return jsi::Value(runtime, runtime.makeFunction("noop", [](jsi::Runtime&, const jsi::Value&, const jsi::Value*, size_t) {
      return jsi::Value::undefined();
    }));
  };

  // Typed options.
  {
    auto style = object();
    style.setProperty(runtime, "fg", runtime.makeString("white"));
    style.setProperty(runtime, "bold", true);
    auto focus = object();
    focus.setProperty(runtime, "bg", runtime.makeString("blue"));
    style.setProperty(runtime, "focus", std::move(focus));

    auto border = object();
    border.setProperty(runtime, "type", runtime.makeString("line"));
    border.setProperty(runtime, "fg", runtime.makeString("cyan"));

    auto items = runtime.makeArray(2);
    items.setValueAtIndex(runtime, 0, runtime.makeString("one"));
    items.setValueAtIndex(runtime, 1, jsi::Value(2));

    auto element = createElement(runtime, "list", props(
      prop("top", runtime.makeString("center")),
      prop("left", jsi::Value(3)),
      prop("width", runtime.makeString("50%-2")),
      prop("height", jsi::Value(8.0)),
      prop("label", runtime.makeString(" Menu ")),
      prop("content", jsi::Value(42)),
      prop("keys", true),
      prop("mouse", jsi::Value(1)),
      prop("padding", jsi::Value(1)),
      prop("border", jsi::Value(runtime, border)),
      prop("style", jsi::Value(runtime, style)),
      prop("items", jsi::Value(runtime, items)),
      prop("filled", jsi::Value(35.5)),
      prop("hidden", jsi::Value::undefined()),
      prop("onSelectItem", noop()),
      prop("onLater", runtime.makeString("not a handler")),
      prop("scrollbarChar", runtime.makeString("#")),
      prop("tabSize", jsi::Value(4))));

    const WidgetOptions options = resolveWidgetOptions(runtime, *element);
    assert(std::get<std::string>(options.top) == "center");
    assert(std::get<int>(options.left) == 3);
    assert(std::get<std::string>(options.width) == "50%-2");
    assert(std::get<int>(options.height) == 8);
    assert(*options.label == " Menu ");
    assert(*options.content == "42");
    assert(*options.keys);
    assert(*options.mouse);
    assert(options.padding->left == 1 && options.padding->bottom == 1);
    assert(options.border->type == BorderType::Line);
    assert(*options.border->style.fg == "cyan");
    assert(*options.style.base.fg == "white");
    assert(*options.style.base.bold);
    assert(*options.style.focus.bg == "blue");
    assert((*options.items == std::vector<std::string>{"one", "2"}));
    assert(*options.filled == 35.5);
    assert(!options.hidden.has_value());
    assert(!options.bottom.index());
    assert(options.extra.size() == 2);
    assert(std::get<std::string>(options.extra.at("scrollbarChar")) == "#");
    assert(std::get<double>(options.extra.at("tabSize")) == 4.0);
    assert(options.extra.count("onSelectItem") == 0);
    assert(options.extra.count("onLater") == 0);
  }

  // `class` entries apply first, falsy entries drop out, own props win.
  {
    auto base = object();
    base.setProperty(runtime, "width", jsi::Value(10));
    base.setProperty(runtime, "label", runtime.makeString("base"));
    auto baseStyle = object();
    baseStyle.setProperty(runtime, "fg", runtime.makeString("red"));
    base.setProperty(runtime, "style", std::move(baseStyle));

    auto accent = object();
    auto accentStyle = object();
    accentStyle.setProperty(runtime, "bg", runtime.makeString("black"));
    accent.setProperty(runtime, "style", std::move(accentStyle));
    accent.setProperty(runtime, "border", runtime.makeString("bg"));

    auto classes = runtime.makeArray(3);
    classes.setValueAtIndex(runtime, 0, jsi::Value(runtime, base));
    classes.setValueAtIndex(runtime, 1, jsi::Value(false));
    classes.setValueAtIndex(runtime, 2, jsi::Value(runtime, accent));

    auto element = createElement(runtime, "box", props(
      prop("class", jsi::Value(runtime, classes)),
      prop("label", runtime.makeString("own"))));
    const WidgetOptions options = resolveWidgetOptions(runtime, *element);
    assert(std::get<int>(options.width) == 10);
    assert(*options.label == "own");
    assert(*options.style.base.fg == "red");
    assert(*options.style.base.bg == "black");
    assert(options.border->type == BorderType::Bg);
    assert(options.extra.empty());

    auto single = createElement(runtime, "box", props(prop("class", jsi::Value(runtime, base))));
    assert(*resolveWidgetOptions(runtime, *single).label == "base");
  }

  // Reserved props and text elements.
  {
    auto element = createElement(
      runtime,
      "box",
      props(
        prop("key", runtime.makeString("k")),
        prop("ref", noop()),
        prop("children", runtime.makeString("inline"))));
    assert(element->key == std::optional<std::string>("k"));
    assert(element->ref.has_value());
    assert(element->props.empty());
    assert(element->children.size() == 1);
    assert(element->children[0].kind == ChildKind::Text);
    assert(element->children[0].text == "inline");

    const WidgetOptions options = resolveWidgetOptions(runtime, *element);
    assert(!options.content.has_value());
    assert(options.extra.empty());

    auto textElement = createTextElement("hello");
    assert(*resolveWidgetOptions(runtime, *textElement).content == "hello");

    auto numericKey = createElement(runtime, "box", props(prop("key", jsi::Value(7))));
    assert(*numericKey->key == "7");
  }

  // Non-finite numbers are rejected; huge cell counts saturate.
  {
    const double nan = std::numeric_limits<double>::quiet_NaN();
    const double inf = std::numeric_limits<double>::infinity();
    auto rejects = [&](const std::string& name, jsi::Value value) {
      try {
        resolveWidgetOptions(runtime, *createElement(runtime, "box", props(prop(name, std::move(value)))));
      } catch (const std::invalid_argument& error) {
        return std::string(error.what()).find(name) != std::string::npos;
      }
      return false;
    };
    assert(rejects("width", jsi::Value(nan)));
    assert(rejects("width", jsi::Value(inf)));
    assert(rejects("height", jsi::Value(-inf)));
    assert(rejects("padding", jsi::Value(nan)));
    assert(rejects("content", jsi::Value(inf)));
    assert(rejects("content", jsi::Value(nan)));
    assert(rejects("filled", jsi::Value(nan)));

    auto sides = object();
    sides.setProperty(runtime, "left", jsi::Value(inf));
    assert(rejects("left", jsi::Value(runtime, sides)));

    auto element = createElement(runtime, "box", props(
      prop("width", jsi::Value(1e12)),
      prop("height", jsi::Value(-1e12)),
      prop("padding", jsi::Value(1e12)),
      prop("content", jsi::Value(1e20))));
    const WidgetOptions options = resolveWidgetOptions(runtime, *element);
    assert(std::get<int>(options.width) == kMaxCells);
    assert(std::get<int>(options.height) == -kMaxCells);
    assert(options.padding->top == kMaxCells);
    assert(*options.content == "1e+20");

    const WidgetOptions exact = resolveWidgetOptions(
      runtime, *createElement(runtime, "text", props(prop("content", jsi::Value(1e12)))));
    assert(*exact.content == "1000000000000");
  }

  // Wrong shapes for known options are rejected.
  {
    bool rejected = false;
    try {
      resolveWidgetOptions(runtime, *createElement(runtime, "box", props(prop("width", jsi::Value(true)))));
    } catch (const std::invalid_argument& error) {
      rejected = std::string(error.what()).find("width") != std::string::npos;
    }
    assert(rejected);

    rejected = false;
    try {
      resolveWidgetOptions(runtime, *createElement(runtime, "box", props(prop("border", runtime.makeString("dotted")))));
    } catch (const std::invalid_argument&) {
      rejected = true;
    }
    assert(rejected);

    rejected = false;
    try {
      createElement(runtime, "box", props(prop("key", jsi::Value(runtime, object()))));
    } catch (const std::invalid_argument&) {
      rejected = true;
    }
    assert(rejected);

    rejected = false;
    try {
      createElement(runtime, "");
    } catch (const std::invalid_argument&) {
      rejected = true;
    }
    assert(rejected);
  }

  assert(isEventHandlerProp("onClick"));
  assert(!isEventHandlerProp("on"));
  assert(!isEventHandlerProp("online"));

  // Merging keeps fields the newer options leave unset.
  {
    WidgetOptions current;
    current.width = 10;
    current.label = std::string("keep");
    current.style.base.fg = std::string("red");
    WidgetOptions next;
    next.width = std::string("half");
    next.style.base.bg = std::string("blue");
    current.mergeFrom(next);
    assert(std::get<std::string>(current.width) == "half");
    assert(*current.label == "keep");
    assert(*current.style.base.fg == "red");
    assert(*current.style.base.bg == "blue");
    assert(dimensionToString(current.width) == "half");
    assert(isSet(current.width));
    assert(!isSet(current.height));
  }

  return true;
}

} // namespace reactblessed::test
