// SPDX-License-Identifier: GPL-3.0-only WITH Qt-GPL-exception-1.0

#include "pluginmanager.hpp"
#include "pluginmanager_p.hpp"
#include "pluginspec_p.hpp"
#include "iplugin.hpp"

#include <utils/qtcassert.hpp>

#include <QCoreApplication>
#include <QSettings>

#include <algorithm>

Q_LOGGING_CATEGORY(pluginLog, "eye.plugins", QtWarningMsg)

static constexpr char C_IGNORED_PLUGINS[] = "Plugins/Ignored";
static constexpr char C_FORCEENABLED_PLUGINS[] = "Plugins/ForceEnabled";

/*!
  \namespace ExtensionSystem
  \inmodule Eye
  \brief The ExtensionSystem namespace provides the callback registry and
  the classes that belong to the plugin manager.
*/

/*!
  \class ExtensionSystem::PluginManager
  \inheaderfile extensionsystem/pluginmanager.hpp
  \inmodule Eye

  \brief The PluginManager class implements the core plugin system that
  manages the plugins, their life cycle, and their enabled state.

  The plugin manager is a singleton that is created in main() and whose
  static functions are used everywhere else. Plugins are built into the
  application and handed over with addPlugin():

  \code
    ExtensionSystem::PluginManager manager;
    ExtensionSystem::PluginManager::addPlugin(new CorePlugin, "Core", "Editor windows", PluginManager::Required);
    ExtensionSystem::PluginManager::loadPlugins();
  \endcode

  loadPlugins() initializes every plugin in registration order and then
  calls IPlugin::extensionsInitialized() in the reverse order. After that
  each optional plugin is switched on or off from the settings:
  \c Plugins/ForceEnabled lists the plugins enabled although they are not by
  default, \c Plugins/Ignored the plugins kept off although they would be.
  setPluginEnabled() changes the state at runtime and writeSettings()
  records it.
*/

/*!
  \fn void ExtensionSystem::PluginManager::pluginEnabledChanged(ExtensionSystem::PluginSpec *spec)
  Emitted after the plugin described by \a spec was switched on or off.
*/

using namespace ExtensionSystem;
using namespace ExtensionSystem::Internal;

static PluginManagerPrivate *d = nullptr;
static PluginManager *m_instance = nullptr;

/*!
  Gets the unique plugin manager instance.
*/
auto PluginManager::instance() -> PluginManager*
{
  return m_instance;
}

/*!
  Creates a plugin manager. Should be done only once per application.
*/
PluginManager::PluginManager()
{
  m_instance = this;
  d = new PluginManagerPrivate(this);
}

PluginManager::~PluginManager()
{
  delete d;
  d = nullptr;
  m_instance = nullptr;
}

/*!
  Registers \a plugin under \a name and takes ownership of it. Returns the
  spec describing it, or \c nullptr if a plugin with that name exists.
*/
auto PluginManager::addPlugin(IPlugin *plugin, const QString &name, const QString &description, const PluginOptions options) -> PluginSpec*
{
  QTC_ASSERT(d, delete plugin; return nullptr);
  return d->addPlugin(plugin, name, description, options);
}

/*!
  Initializes all registered plugins and applies their enabled state.
*/
auto PluginManager::loadPlugins() -> void
{
  d->loadPlugins();
}

auto PluginManager::plugins() -> const QVector<PluginSpec*>
{
  return d->plugin_specs;
}

auto PluginManager::pluginByName(const QString &name) -> PluginSpec*
{
  return d->pluginByName(name);
}

/*!
  Switches the plugin \a name on or off. Returns \c false for unknown or
  broken plugins, and when trying to disable a required plugin.
*/
auto PluginManager::setPluginEnabled(const QString &name, const bool enabled) -> bool
{
  return d->setPluginEnabled(name, enabled);
}

/*!
  Returns whether any plugin has errors.
*/
auto PluginManager::hasError() -> bool
{
  return std::any_of(d->plugin_specs.cbegin(), d->plugin_specs.cend(), [](const PluginSpec *spec) { return spec->hasError(); });
}

auto PluginManager::allErrors() -> const QStringList
{
  QStringList errors;
  for (const auto spec : qAsConst(d->plugin_specs)) {
    if (spec->hasError())
      errors.append(spec->name().append(": ").append(spec->errorString()));
  }
  return errors;
}

auto PluginManager::isInitializationDone() -> bool
{
  return d->is_initialization_done;
}

/*!
  Shuts down and deletes all plugins.
*/
auto PluginManager::shutdown() -> void
{
  d->shutdown();
}

/*!
  Defines the user specific \a settings to use for information about
  enabled and disabled plugins. Needs to be set before the plugins are
  loaded.
*/
auto PluginManager::setSettings(QSettings *settings) -> void
{
  d->setSettings(settings);
}

auto PluginManager::settings() -> QSettings*
{
  return d->settings;
}

auto PluginManager::writeSettings() -> void
{
  d->writeSettings();
}

/*!
  The arguments left over after the application parsed its own options.
  They are passed to IPlugin::initialize().
*/
auto PluginManager::arguments() -> QStringList
{
  return d->arguments;
}

auto PluginManager::setArguments(const QStringList &arguments) -> void
{
  d->arguments = arguments;
}

PluginManagerPrivate::PluginManagerPrivate(PluginManager *plugin_manager) : q(plugin_manager) {}

PluginManagerPrivate::~PluginManagerPrivate()
{
  deleteAll();
  qDeleteAll(plugin_specs);
}

auto PluginManagerPrivate::privateSpec(PluginSpec *spec) -> PluginSpecPrivate*
{
  return spec->d;
}

auto PluginManagerPrivate::addPlugin(IPlugin *plugin, const QString &name, const QString &description, const PluginManager::PluginOptions options) -> PluginSpec*
{
  QTC_ASSERT(plugin, return nullptr);

  if (pluginByName(name)) {
    qCWarning(pluginLog).noquote() << "A plugin named" << name << "is already registered";
    delete plugin;
    return nullptr;
  }

  const auto spec = new PluginSpec;
  const auto spec_d = spec->d;
  spec_d->name = name;
  spec_d->description = description;
  spec_d->required = options.testFlag(PluginManager::Required);
  spec_d->enabled_by_default = options.testFlag(PluginManager::EnabledByDefault);
  spec_d->setPlugin(plugin);
  applySettings(spec);

  plugin_specs.append(spec);
  emit q->pluginsChanged();
  return spec;
}

auto PluginManagerPrivate::loadPlugins() -> void
{
  for (const auto spec : qAsConst(plugin_specs)) {
    qCDebug(pluginLog) << "initializing" << spec->name();
    if (!spec->d->initializePlugin(arguments))
      qCWarning(pluginLog).noquote() << "Plugin" << spec->name() << "failed:" << spec->errorString();
  }

  std::for_each(plugin_specs.crbegin(), plugin_specs.crend(), [](PluginSpec *spec) {
    spec->d->initializeExtensions();
  });

  for (const auto spec : qAsConst(plugin_specs)) {
    spec->d->applyEnabledState();
    qCDebug(pluginLog) << spec->name() << (spec->isEnabled() ? "enabled" : "disabled");
  }

  is_initialization_done = true;
  emit q->pluginsChanged();
  emit q->initializationDone();
}

auto PluginManagerPrivate::setPluginEnabled(const QString &name, const bool enabled) -> bool
{
  const auto spec = pluginByName(name);
  if (!spec) {
    qCWarning(pluginLog).noquote() << "No plugin named" << name;
    return false;
  }

  if (spec->isRequired())
    return enabled;

  if (spec->hasError())
    return false;

  const auto spec_d = spec->d;
  spec_d->force_enabled = enabled && !spec_d->enabled_by_default;
  spec_d->force_disabled = !enabled && spec_d->enabled_by_default;

  if (spec_d->state == PluginSpec::Running && spec_d->plugin->isEnabled() != enabled) {
    spec_d->plugin->setEnabled(enabled);
    qCDebug(pluginLog) << name << (enabled ? "enabled" : "disabled");
    emit q->pluginEnabledChanged(spec);
  }
  return true;
}

auto PluginManagerPrivate::shutdown() -> void
{
  stopAll();
  deleteAll();
}

auto PluginManagerPrivate::stopAll() -> void
{
  std::for_each(plugin_specs.crbegin(), plugin_specs.crend(), [](PluginSpec *spec) {
    spec->d->stop();
  });
}

auto PluginManagerPrivate::deleteAll() -> void
{
  std::for_each(plugin_specs.crbegin(), plugin_specs.crend(), [](PluginSpec *spec) {
    spec->d->kill();
  });
}

auto PluginManagerPrivate::setSettings(QSettings *s) -> void
{
  delete settings;
  settings = s;
  if (settings)
    settings->setParent(this);
  readSettings();
}

auto PluginManagerPrivate::readSettings() -> void
{
  if (settings) {
    disabled_plugins = settings->value(QLatin1String(C_IGNORED_PLUGINS)).toStringList();
    force_enabled_plugins = settings->value(QLatin1String(C_FORCEENABLED_PLUGINS)).toStringList();
  }
  for (const auto spec : qAsConst(plugin_specs))
    applySettings(spec);
}

auto PluginManagerPrivate::applySettings(PluginSpec *spec) const -> void
{
  const auto spec_d = spec->d;
  if (spec_d->required)
    return;
  spec_d->force_enabled = !spec_d->enabled_by_default && force_enabled_plugins.contains(spec_d->name);
  spec_d->force_disabled = spec_d->enabled_by_default && disabled_plugins.contains(spec_d->name);
}

auto PluginManagerPrivate::writeSettings() -> void
{
  if (!settings)
    return;

  QStringList temp_disabled_plugins;
  QStringList temp_force_enabled_plugins;
  for (const auto spec : qAsConst(plugin_specs)) {
    if (spec->isForceEnabled())
      temp_force_enabled_plugins.append(spec->name());
    if (spec->isForceDisabled())
      temp_disabled_plugins.append(spec->name());
  }

  if (temp_disabled_plugins.isEmpty())
    settings->remove(QLatin1String(C_IGNORED_PLUGINS));
  else
    settings->setValue(QLatin1String(C_IGNORED_PLUGINS), temp_disabled_plugins);

  if (temp_force_enabled_plugins.isEmpty())
    settings->remove(QLatin1String(C_FORCEENABLED_PLUGINS));
  else
    settings->setValue(QLatin1String(C_FORCEENABLED_PLUGINS), temp_force_enabled_plugins);

  disabled_plugins = temp_disabled_plugins;
  force_enabled_plugins = temp_force_enabled_plugins;
  settings->sync();
}

auto PluginManagerPrivate::pluginByName(const QString &name) const -> PluginSpec*
{
  const auto it = std::find_if(plugin_specs.cbegin(), plugin_specs.cend(), [&name](const PluginSpec *spec) { return spec->name() == name; });
  return it == plugin_specs.cend() ? nullptr : *it;
}
