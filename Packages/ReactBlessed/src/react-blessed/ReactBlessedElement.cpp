#include "react-blessed/ReactBlessedElement.h"

#include <cmath>
#include <sstream>
#include <stdexcept>

namespace reactblessed {

namespace {

std::string numberToString(double number) {
  if (!std::isfinite(number)) {
    throw std::invalid_argument("Cannot convert non-finite number to string");
  }
  std::ostringstream out;
  out << number;
  return out.str();
}

std::optional<jsi::Value> takeProp(PropList& props, const std::string& name) {
  for (auto it = props.begin(); it != props.end(); ++it) {
    if (it->first == name) {
      jsi::Value value = std::move(it->second);
      props.erase(it);
      return std::optional<jsi::Value>(std::move(value));
    }
  }
  return std::nullopt;
}

bool isNullish(const jsi::Value& value) {
  return value.isNull() || value.isUndefined();
}

} // namespace

ElementChild ElementChild::fromElement(ElementPtr element) {
  ElementChild child;
  child.kind = ChildKind::Element;
  child.element = std::move(element);
  return child;
}

ElementChild ElementChild::fromText(std::string text) {
  ElementChild child;
  child.kind = ChildKind::Text;
  child.text = std::move(text);
  return child;
}

const jsi::Value* VirtualElement::findProp(const std::string& name) const {
  for (const auto& entry : props) {
    if (entry.first == name) {
      return &entry.second;
    }
  }
  return nullptr;
}

std::string coerceKey(jsi::Runtime& runtime, const jsi::Value& value) {
  if (value.isString()) {
    return value.getString(runtime).utf8(runtime);
  }
  if (value.isNumber()) {
    return numberToString(value.getNumber());
  }
  throw std::invalid_argument("Element key must be a string or a number");
}

ElementPtr createElement(
  jsi::Runtime& runtime,
  std::string type,
  PropList props,
  std::vector<ElementChild> children) {
  if (type.empty()) {
    throw std::invalid_argument("Element type must be a non-empty string");
  }

  auto element = std::make_shared<VirtualElement>();
  element->type = std::move(type);

  if (auto key = takeProp(props, "key")) {
    if (!isNullish(*key)) {
      element->key = coerceKey(runtime, *key);
    }
  }

  if (auto ref = takeProp(props, "ref")) {
    if (!isNullish(*ref)) {
      element->ref = std::move(ref);
    }
  }

  if (auto childrenProp = takeProp(props, "children")) {
    if (children.empty()) {
      if (childrenProp->isString()) {
        children.push_back(ElementChild::fromText(childrenProp->getString(runtime).utf8(runtime)));
      } else if (childrenProp->isNumber()) {
        children.push_back(ElementChild::fromText(numberToString(childrenProp->getNumber())));
      }
    }
  }

  element->props = std::move(props);
  element->children = std::move(children);
  return element;
}

ElementPtr createTextElement(std::string text) {
  auto element = std::make_shared<VirtualElement>();
  element->type = kTextElementType;
  element->textContent = std::move(text);
  return element;
}

} // namespace reactblessed
