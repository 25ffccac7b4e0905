// SPDX-License-Identifier: GPL-3.0-only WITH Qt-GPL-exception-1.0

#pragma once

#include "extensionsystem_global.hpp"

#include <QObject>
#include <QStringList>
#include <QVector>

QT_BEGIN_NAMESPACE
class QSettings;
QT_END_NAMESPACE

namespace ExtensionSystem {

class IPlugin;
class PluginSpec;

namespace Internal {
class PluginManagerPrivate;
}

class EXTENSIONSYSTEM_EXPORT PluginManager : public QObject {
  Q_OBJECT

public:
  enum PluginOption {
    NoOptions = 0x0,
    Required = 0x1,
    EnabledByDefault = 0x2
  };
  Q_DECLARE_FLAGS(PluginOptions, PluginOption)

  static auto instance() -> PluginManager*;

  PluginManager();
  ~PluginManager() override;

  // Plugin operations
  static auto addPlugin(IPlugin *plugin, const QString &name, const QString &description, PluginOptions options = NoOptions) -> PluginSpec*;
  static auto loadPlugins() -> void;
  static auto plugins() -> const QVector<PluginSpec*>;
  static auto pluginByName(const QString &name) -> PluginSpec*;
  static auto setPluginEnabled(const QString &name, bool enabled) -> bool;
  static auto hasError() -> bool;
  static auto allErrors() -> const QStringList;
  static auto isInitializationDone() -> bool;
  static auto shutdown() -> void;

  // Settings
  static auto setSettings(QSettings *settings) -> void;
  static auto settings() -> QSettings*;
  static auto writeSettings() -> void;

  // command line arguments
  static auto arguments() -> QStringList;
  static auto setArguments(const QStringList &arguments) -> void;

signals:
  auto pluginsChanged() -> void;
  auto pluginEnabledChanged(ExtensionSystem::PluginSpec *spec) -> void;
  auto initializationDone() -> void;

  friend class Internal::PluginManagerPrivate;
};

} // namespace ExtensionSystem

Q_DECLARE_OPERATORS_FOR_FLAGS(ExtensionSystem::PluginManager::PluginOptions)
