#pragma once

#include "blessed/BlessedNode.h"
#include "blessed/BlessedOptions.h"

#include <cstddef>
#include <memory>
#include <string>

namespace reactblessed {

class Screen;

// Operations the reconciler performs against the display library. All of them
// are synchronous and mutate the live widget tree.
class WidgetLibrary {
public:
  virtual ~WidgetLibrary() = default;

  virtual bool hasWidgetType(const std::string& type) const = 0;

  // Throws UnknownWidgetTypeError when `type` names no widget kind.
  virtual WidgetHandle createWidget(const std::string& type, const WidgetOptions& options) = 0;

  virtual void attach(const WidgetHandle& parent, const WidgetHandle& child) = 0;
  virtual void insertAt(const WidgetHandle& parent, const WidgetHandle& child, std::size_t index) = 0;
  virtual void detach(const WidgetHandle& parent, const WidgetHandle& child) = 0;

  virtual void applyOptions(const WidgetHandle& handle, const WidgetOptions& options) = 0;

  virtual void onAnyEvent(const WidgetHandle& handle, AnyEventListener dispatcher) = 0;
  virtual void offAllEvents(const WidgetHandle& handle) = 0;

  virtual void requestDebouncedRedraw() = 0;

  virtual WidgetHandle rootSurface() const = 0;
};

class BlessedWidgetLibrary : public WidgetLibrary {
public:
  explicit BlessedWidgetLibrary(std::shared_ptr<Screen> screen);

  bool hasWidgetType(const std::string& type) const override;
  WidgetHandle createWidget(const std::string& type, const WidgetOptions& options) override;
  void attach(const WidgetHandle& parent, const WidgetHandle& child) override;
  void insertAt(const WidgetHandle& parent, const WidgetHandle& child, std::size_t index) override;
  void detach(const WidgetHandle& parent, const WidgetHandle& child) override;
  void applyOptions(const WidgetHandle& handle, const WidgetOptions& options) override;
  void onAnyEvent(const WidgetHandle& handle, AnyEventListener dispatcher) override;
  void offAllEvents(const WidgetHandle& handle) override;
  void requestDebouncedRedraw() override;
  WidgetHandle rootSurface() const override;

  const std::shared_ptr<Screen>& screen() const {
    return screen_;
  }

private:
  std::shared_ptr<Screen> screen_;
};

} // namespace reactblessed
