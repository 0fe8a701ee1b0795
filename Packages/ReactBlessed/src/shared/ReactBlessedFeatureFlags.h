#pragma once

namespace reactblessed {

// Route widget-tree mutations through Screen::debouncedRender. When disabled
// every committed pass renders synchronously.
inline constexpr bool enableDebouncedRender = true;

// Report duplicate `key` values among siblings. The first child with a given
// key is kept either way.
inline constexpr bool warnOnDuplicateChildKeys = true;

// Call function refs with `null` when their node unmounts.
inline constexpr bool detachRefsOnUnmount = true;

// Blessed names events with lowercase words ("select item"). Handler props
// join the capitalized words ("onSelectItem").
inline constexpr const char* kEventHandlerPrefix = "on";

} // namespace reactblessed
