// SPDX-License-Identifier: GPL-3.0-only WITH Qt-GPL-exception-1.0

#pragma once

#include "pluginspec.hpp"
#include "iplugin.hpp"

#include <QStringList>

namespace ExtensionSystem {

class IPlugin;

namespace Internal {

class EXTENSIONSYSTEM_EXPORT PluginSpecPrivate {
public:
  explicit PluginSpecPrivate(PluginSpec *spec);

  auto setPlugin(IPlugin *plugin) -> void;
  auto initializePlugin(const QStringList &arguments) -> bool;
  auto initializeExtensions() -> bool;
  auto applyEnabledState() -> void;
  auto stop() -> void;
  auto kill() -> void;

  QString name;
  QString description;
  bool required = false;
  bool enabled_by_default = false;
  bool force_enabled = false;
  bool force_disabled = false;
  IPlugin *plugin = nullptr;
  PluginSpec::State state = PluginSpec::Registered;
  bool has_error = false;
  QString error_string;

private:
  PluginSpec *q;

  auto reportError(const QString &err) -> bool;
};

} // namespace Internal
} // namespace ExtensionSystem
