#pragma once

#include "blessed/BlessedOptions.h"
#include "react-blessed/ReactBlessedElement.h"

#include <string>

namespace reactblessed {

// Translates an element's props into widget options. Entries of the `class`
// prop (an object or an array of objects) apply first, then the element's
// own props. `children`, `key`, `ref` and handler props never become options;
// null or undefined values leave the option unset. Throws
// std::invalid_argument when a known option has a value of the wrong shape.
WidgetOptions resolveWidgetOptions(jsi::Runtime& runtime, const VirtualElement& element);

// Applies a single prop. Exposed for the JS bridge and tests.
void applyWidgetProp(
  jsi::Runtime& runtime,
  WidgetOptions& options,
  const std::string& name,
  const jsi::Value& value);

// `on` followed by an uppercase letter.
bool isEventHandlerProp(const std::string& name);

} // namespace reactblessed
