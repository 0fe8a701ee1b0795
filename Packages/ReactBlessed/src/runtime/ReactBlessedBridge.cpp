#include "runtime/ReactBlessedBridge.h"

#include "runtime/ReactBlessedRuntime.h"

#include <stdexcept>
#include <string>
#include <utility>

namespace reactblessed {

namespace {

void appendChildren(jsi::Runtime& runtime, const jsi::Value& value, std::vector<ElementChild>& out) {
  if (value.isNull() || value.isUndefined() || value.isBool()) {
    return;
  }
  if (value.isString()) {
    out.push_back(ElementChild::fromText(value.getString(runtime).utf8(runtime)));
    return;
  }
  if (value.isNumber()) {
    out.push_back(ElementChild::fromText(coerceKey(runtime, value)));
    return;
  }
  if (!value.isObject()) {
    throw std::invalid_argument("Unsupported child value");
  }

  auto object = value.getObject(runtime);
  if (object.isArray(runtime)) {
    auto array = object.getArray(runtime);
    const auto count = array.size(runtime);
    for (std::size_t index = 0; index < count; ++index) {
      appendChildren(runtime, array.getValueAtIndex(runtime, index), out);
    }
    return;
  }
  out.push_back(ElementChild::fromElement(elementFromJsi(runtime, value)));
}

} // namespace

std::vector<ElementChild> childrenFromJsi(jsi::Runtime& runtime, const jsi::Value& value) {
  std::vector<ElementChild> children;
  appendChildren(runtime, value, children);
  return children;
}

ElementPtr elementFromJsi(jsi::Runtime& runtime, const jsi::Value& value) {
  if (!value.isObject()) {
    throw std::invalid_argument("Element must be an object");
  }
  auto object = value.getObject(runtime);
  auto type = object.getProperty(runtime, "type");
  if (!type.isString()) {
    throw std::invalid_argument("Element type must be a string");
  }

  PropList props;
  std::vector<ElementChild> children;

  auto propsValue = object.getProperty(runtime, "props");
  if (propsValue.isObject()) {
    auto propsObject = propsValue.getObject(runtime);
    auto names = propsObject.getPropertyNames(runtime);
    const auto count = names.size(runtime);
    for (std::size_t index = 0; index < count; ++index) {
      const auto name = names.getValueAtIndex(runtime, index).getString(runtime).utf8(runtime);
      auto prop = propsObject.getProperty(runtime, name.c_str());
      if (name == "children") {
        children = childrenFromJsi(runtime, prop);
        continue;
      }
      props.emplace_back(name, std::move(prop));
    }
  } else if (!propsValue.isUndefined() && !propsValue.isNull()) {
    throw std::invalid_argument("Element props must be an object");
  }

  for (const char* reserved : {"key", "ref"}) {
    auto entry = object.getProperty(runtime, reserved);
    if (!entry.isUndefined()) {
      props.emplace_back(reserved, std::move(entry));
    }
  }

  return createElement(runtime, type.getString(runtime).utf8(runtime), std::move(props), std::move(children));
}

void installReactBlessedBindings(jsi::Runtime& runtime, ReactBlessedRuntime& renderer) {
  jsi::Object api(runtime);

  auto render = jsi::Function::createFromHostFunction(
    runtime,
    jsi::PropNameID::forAscii(runtime, "render"),
    1,
    [&renderer](jsi::Runtime& rt, const jsi::Value&, const jsi::Value* args, size_t count) -> jsi::Value {
      if (count < 1) {
        throw std::invalid_argument("ReactBlessed.render expects an element");
      }
      const auto failures = renderer.render(elementFromJsi(rt, args[0]));
      return jsi::Value(static_cast<double>(failures.size()));
    });

  auto unmount = jsi::Function::createFromHostFunction(
    runtime,
    jsi::PropNameID::forAscii(runtime, "unmount"),
    0,
    [&renderer](jsi::Runtime&, const jsi::Value&, const jsi::Value*, size_t) -> jsi::Value {
      renderer.unmount();
      return jsi::Value::undefined();
    });

  api.setProperty(runtime, "render", std::move(render));
  api.setProperty(runtime, "unmount", std::move(unmount));
  runtime.global().setProperty(runtime, "ReactBlessed", std::move(api));
}

} // namespace reactblessed
