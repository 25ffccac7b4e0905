// SPDX-License-Identifier: GPL-3.0-only WITH Qt-GPL-exception-1.0

#pragma once

#include "extensionsystem_global.hpp"

#include <QString>

namespace ExtensionSystem {

namespace Internal {
class PluginSpecPrivate;
class PluginManagerPrivate;
} // Internal

class IPlugin;

class EXTENSIONSYSTEM_EXPORT PluginSpec {
public:
  enum State {
    Registered,
    Initialized,
    Running,
    Stopped,
    Deleted
  };

  ~PluginSpec();

  auto name() const -> QString;
  auto description() const -> QString;
  auto isRequired() const -> bool;
  auto isEnabledByDefault() const -> bool;
  auto isForceEnabled() const -> bool;
  auto isForceDisabled() const -> bool;
  auto isEnabledBySettings() const -> bool;
  auto isEnabled() const -> bool;

  // linked plugin instance
  auto plugin() const -> IPlugin*;

  // state
  auto state() const -> State;
  auto hasError() const -> bool;
  auto errorString() const -> QString;

private:
  PluginSpec();

  Internal::PluginSpecPrivate *d;
  friend class Internal::PluginManagerPrivate;
  friend class Internal::PluginSpecPrivate;
};

} // namespace ExtensionSystem
