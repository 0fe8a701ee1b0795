#pragma once

#include "react-blessed/ReactBlessedElement.h"

#include <vector>

namespace reactblessed {

class ReactBlessedRuntime;

// Converts a `{type, key, ref, props}` object into an element. `props.children`
// may nest arrays, which flatten; null, undefined and booleans render
// nothing; strings and numbers become text. Throws std::invalid_argument for
// anything else.
ElementPtr elementFromJsi(jsi::Runtime& runtime, const jsi::Value& value);

std::vector<ElementChild> childrenFromJsi(jsi::Runtime& runtime, const jsi::Value& value);

// Publishes `ReactBlessed.render(element)` and `ReactBlessed.unmount()` on the
// global object. `renderer` must outlive the runtime's use of them.
void installReactBlessedBindings(jsi::Runtime& runtime, ReactBlessedRuntime& renderer);

} // namespace reactblessed
