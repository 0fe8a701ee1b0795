#pragma once

#include "jsi/jsi.h"

#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace reactblessed {

namespace jsi = facebook::jsi;

struct VirtualElement;

using ElementPtr = std::shared_ptr<const VirtualElement>;

using PropEntry = std::pair<std::string, jsi::Value>;
using PropList = std::vector<PropEntry>;

// Primitive children are rendered as widgets of this type.
inline constexpr const char* kTextElementType = "text";

enum class ChildKind : uint8_t {
  Element,
  Text,
};

struct ElementChild {
  ChildKind kind{ChildKind::Text};
  ElementPtr element{};
  std::string text{};

  static ElementChild fromElement(ElementPtr element);
  static ElementChild fromText(std::string text);
};

// Immutable description of one widget. A new element replaces the old one on
// every update; nothing mutates an element after createElement returns.
struct VirtualElement {
  std::string type;
  std::optional<std::string> key;
  std::optional<jsi::Value> ref;
  PropList props;
  std::vector<ElementChild> children;
  // Set on the synthetic elements that carry primitive children.
  std::optional<std::string> textContent;

  const jsi::Value* findProp(const std::string& name) const;
};

// Builds an element the way JSX would. `key` and `ref` are lifted out of
// `props`; a string or number `children` prop is used when `children` is
// empty. Throws std::invalid_argument for an empty type or a key that is
// neither string nor number.
ElementPtr createElement(
  jsi::Runtime& runtime,
  std::string type,
  PropList props = {},
  std::vector<ElementChild> children = {});

ElementPtr createTextElement(std::string text);

std::string coerceKey(jsi::Runtime& runtime, const jsi::Value& value);

} // namespace reactblessed
