// SPDX-License-Identifier: GPL-3.0-only WITH Qt-GPL-exception-1.0

#pragma once

#include "pluginspec.hpp"
#include "pluginmanager.hpp"

#include <QObject>
#include <QStringList>

QT_BEGIN_NAMESPACE
class QSettings;
QT_END_NAMESPACE

namespace ExtensionSystem {

class PluginManager;

namespace Internal {

class PluginSpecPrivate;

class EXTENSIONSYSTEM_EXPORT PluginManagerPrivate : public QObject {
  Q_OBJECT

public:
  PluginManagerPrivate(PluginManager *plugin_manager);
  ~PluginManagerPrivate() override;

  // Plugin operations
  auto addPlugin(IPlugin *plugin, const QString &name, const QString &description, PluginManager::PluginOptions options) -> PluginSpec*;
  auto loadPlugins() -> void;
  auto setPluginEnabled(const QString &name, bool enabled) -> bool;
  auto shutdown() -> void;
  auto setSettings(QSettings *settings) -> void;
  auto readSettings() -> void;
  auto writeSettings() -> void;
  auto pluginByName(const QString &name) const -> PluginSpec*;

  QVector<PluginSpec*> plugin_specs;
  QStringList disabled_plugins;
  QStringList force_enabled_plugins;
  QStringList arguments;
  QSettings *settings = nullptr;
  bool is_initialization_done = false;

  static auto privateSpec(PluginSpec *spec) -> PluginSpecPrivate*;

private:
  PluginManager *q;

  auto applySettings(PluginSpec *spec) const -> void;
  auto stopAll() -> void;
  auto deleteAll() -> void;
};

} // namespace Internal
} // namespace ExtensionSystem
