#include "react-blessed/ReactMultiChild.h"

#include "shared/ReactBlessedErrorLogger.h"
#include "shared/ReactBlessedFeatureFlags.h"

#include <algorithm>
#include <unordered_map>
#include <unordered_set>
#include <utility>

namespace reactblessed {

namespace {

std::string childName(const ElementPtr& element, std::size_t index) {
  if (element && element->key) {
    return "$" + *element->key;
  }
  return "." + std::to_string(index);
}

void moveInOrder(RenderedChildren& rendered, std::size_t from, std::size_t to) {
  RenderedChild moved = std::move(rendered[from]);
  rendered.erase(rendered.begin() + static_cast<std::ptrdiff_t>(from));
  rendered.insert(rendered.begin() + static_cast<std::ptrdiff_t>(to), std::move(moved));
}

std::size_t positionOf(const RenderedChildren& rendered, const std::string& name) {
  auto it = std::find_if(rendered.begin(), rendered.end(), [&](const RenderedChild& entry) {
    return entry.name == name;
  });
  return static_cast<std::size_t>(it - rendered.begin());
}

} // namespace

bool shouldUpdateReactBlessedComponent(const ElementPtr& prev, const ElementPtr& next) {
  if (!prev || !next) {
    return false;
  }
  return prev->type == next->type && prev->key == next->key;
}

std::vector<FlatChild> ReactMultiChild::flattenChildren(const std::vector<ElementChild>& children) const {
  std::vector<FlatChild> flat;
  flat.reserve(children.size());
  std::unordered_set<std::string> seen;

  for (std::size_t index = 0; index < children.size(); ++index) {
    const auto& child = children[index];
    ElementPtr element = child.kind == ChildKind::Text
      ? createTextElement(child.text)
      : child.element;
    if (!element) {
      continue;
    }

    std::string name = childName(element, index);
    if (!seen.insert(name).second) {
      if (warnOnDuplicateChildKeys) {
        logWarning(
          "Encountered two children with the same key \"" + *element->key +
          "\". Only the first child will be rendered.");
      }
      continue;
    }
    flat.push_back(FlatChild{std::move(name), std::move(element)});
  }
  return flat;
}

void ReactMultiChild::mountChildren(
  RenderedChildren& rendered,
  const std::vector<ElementChild>& children,
  ChildDelegate& delegate) const {
  for (auto& child : flattenChildren(children)) {
    const NodeId id = delegate.mountChild(child.element);
    rendered.push_back(RenderedChild{std::move(child.name), id, std::move(child.element)});
  }
}

void ReactMultiChild::updateChildren(
  RenderedChildren& rendered,
  const std::vector<ElementChild>& nextChildren,
  ChildDelegate& delegate) const {
  auto next = flattenChildren(nextChildren);

  std::unordered_map<std::string, std::size_t> prevByName;
  for (std::size_t index = 0; index < rendered.size(); ++index) {
    prevByName.emplace(rendered[index].name, index);
  }

  // Which next children keep the previous child of the same name.
  std::vector<bool> kept(next.size(), false);
  std::unordered_set<std::string> keptNames;
  for (std::size_t index = 0; index < next.size(); ++index) {
    auto it = prevByName.find(next[index].name);
    if (it != prevByName.end() &&
        shouldUpdateReactBlessedComponent(rendered[it->second].element, next[index].element)) {
      kept[index] = true;
      keptNames.insert(next[index].name);
    }
  }

  for (auto it = rendered.begin(); it != rendered.end();) {
    if (keptNames.count(it->name) != 0) {
      ++it;
      continue;
    }
    delegate.unmountChild(it->id);
    it = rendered.erase(it);
  }

  // `rendered` mirrors the widget order while children are placed.
  for (std::size_t index = 0; index < next.size(); ++index) {
    auto& child = next[index];
    std::size_t position = 0;
    if (kept[index]) {
      position = positionOf(rendered, child.name);
      auto& entry = rendered[position];
      delegate.updateChild(entry.id, entry.element, child.element);
      entry.element = child.element;
    } else {
      const NodeId id = delegate.mountChild(child.element);
      rendered.push_back(RenderedChild{child.name, id, child.element});
      position = rendered.size() - 1;
    }

    if (position != index) {
      delegate.moveChild(rendered[position].id, index);
      moveInOrder(rendered, position, index);
    }
  }
}

void ReactMultiChild::unmountChildren(RenderedChildren& rendered, ChildDelegate& delegate) const {
  while (!rendered.empty()) {
    delegate.unmountChild(rendered.front().id);
    rendered.erase(rendered.begin());
  }
}

} // namespace reactblessed
