// SPDX-License-Identifier: GPL-3.0-only WITH Qt-GPL-exception-1.0

#pragma once

#include "extensionsystem_global.hpp"

#include <QList>
#include <QObject>

namespace ExtensionSystem {
namespace Internal {
class IPluginPrivate;
class PluginSpecPrivate;
}

class Listener;
class PluginManager;
class PluginSpec;

class EXTENSIONSYSTEM_EXPORT IPlugin : public QObject {
  Q_OBJECT

public:
  IPlugin();
  ~IPlugin() override;

  virtual auto initialize(const QStringList &arguments, QString *error_string) -> bool = 0;
  virtual auto extensionsInitialized() -> void {}
  virtual auto aboutToShutdown() -> void {}

  auto pluginSpec() const -> PluginSpec*;
  auto isEnabled() const -> bool;
  auto setEnabled(bool enabled) -> void;

  auto addListener(Listener *listener) -> void;
  auto listeners() const -> QList<Listener*>;

protected:
  virtual auto enabledChanged(bool enabled) -> void { Q_UNUSED(enabled) }

private:
  Internal::IPluginPrivate *d;
  friend class Internal::PluginSpecPrivate;
};

} // namespace ExtensionSystem
