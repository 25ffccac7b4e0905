// SPDX-License-Identifier: GPL-3.0-only WITH Qt-GPL-exception-1.0

#include "pluginspec.hpp"
#include "pluginspec_p.hpp"
#include "eventconnector.hpp"
#include "iplugin_p.hpp"

#include <utils/qtcassert.hpp>

#include <QCoreApplication>

/*!
  \class ExtensionSystem::PluginSpec
  \inheaderfile extensionsystem/pluginspec.hpp
  \inmodule Eye

  \brief The PluginSpec class contains the information about a registered
  plugin and its current state.

  A plugin is either required, in which case it is always enabled, or
  optional. Optional plugins are enabled by default or not, and the user
  settings can force them on or off.
*/

/*!
  \enum ExtensionSystem::PluginSpec::State
  \value Registered The plugin was handed to the plugin manager.
  \value Initialized IPlugin::initialize() was called and succeeded.
  \value Running IPlugin::extensionsInitialized() was called.
  \value Stopped IPlugin::aboutToShutdown() was called.
  \value Deleted The plugin instance was deleted.
*/

using namespace ExtensionSystem;
using namespace ExtensionSystem::Internal;

PluginSpec::PluginSpec() : d(new PluginSpecPrivate(this)) {}

PluginSpec::~PluginSpec()
{
  delete d;
  d = nullptr;
}

auto PluginSpec::name() const -> QString
{
  return d->name;
}

auto PluginSpec::description() const -> QString
{
  return d->description;
}

auto PluginSpec::isRequired() const -> bool
{
  return d->required;
}

auto PluginSpec::isEnabledByDefault() const -> bool
{
  return d->enabled_by_default;
}

/*!
  Returns whether the settings enable the plugin although it is not enabled
  by default.
*/
auto PluginSpec::isForceEnabled() const -> bool
{
  return d->force_enabled;
}

/*!
  Returns whether the settings keep the plugin disabled although it is
  enabled by default.
*/
auto PluginSpec::isForceDisabled() const -> bool
{
  return d->force_disabled;
}

auto PluginSpec::isEnabledBySettings() const -> bool
{
  if (d->required)
    return true;
  return d->force_enabled || (d->enabled_by_default && !d->force_disabled);
}

/*!
  Returns whether the plugin is loaded and its listeners are active.
*/
auto PluginSpec::isEnabled() const -> bool
{
  return d->plugin && d->plugin->isEnabled();
}

auto PluginSpec::plugin() const -> IPlugin*
{
  return d->plugin;
}

auto PluginSpec::state() const -> State
{
  return d->state;
}

auto PluginSpec::hasError() const -> bool
{
  return d->has_error;
}

auto PluginSpec::errorString() const -> QString
{
  return d->error_string;
}

PluginSpecPrivate::PluginSpecPrivate(PluginSpec *spec) : q(spec) {}

auto PluginSpecPrivate::setPlugin(IPlugin *plugin) -> void
{
  this->plugin = plugin;
  plugin->d->plugin_spec = q;
}

auto PluginSpecPrivate::reportError(const QString &err) -> bool
{
  error_string = err;
  has_error = true;
  return true;
}

auto PluginSpecPrivate::initializePlugin(const QStringList &arguments) -> bool
{
  if (has_error)
    return false;

  if (state != PluginSpec::Registered) {
    if (state == PluginSpec::Initialized)
      return true;
    reportError(QCoreApplication::translate("PluginSpec", "Initializing the plugin failed because state != Registered"));
    return false;
  }

  if (!plugin) {
    reportError(QCoreApplication::translate("PluginSpec", "Internal error: have no plugin instance to initialize"));
    return false;
  }

  // Required plugins are active from the start, so that the listeners they
  // register during initialization call back right away.
  if (required)
    plugin->setEnabled(true);

  QString err;
  if (!plugin->initialize(arguments, &err)) {
    const auto message = QCoreApplication::translate("PluginSpec", "Plugin initialization failed: %1").arg(err);
    reportError(message);
    plugin->setEnabled(false);
    return false;
  }

  state = PluginSpec::Initialized;
  return true;
}

auto PluginSpecPrivate::initializeExtensions() -> bool
{
  if (has_error)
    return false;

  if (state != PluginSpec::Initialized) {
    if (state == PluginSpec::Running)
      return true;
    reportError(QCoreApplication::translate("PluginSpec", "Cannot perform extensionsInitialized because state != Initialized"));
    return false;
  }

  QTC_ASSERT(plugin, return false);
  plugin->extensionsInitialized();
  state = PluginSpec::Running;
  return true;
}

/*!
  Switches the plugin on or off according to the settings. Plugins that
  failed to load stay off.
*/
auto PluginSpecPrivate::applyEnabledState() -> void
{
  if (!plugin)
    return;

  if (has_error || state != PluginSpec::Running) {
    plugin->setEnabled(false);
    return;
  }
  plugin->setEnabled(q->isEnabledBySettings());
}

auto PluginSpecPrivate::stop() -> void
{
  if (!plugin)
    return;

  if (state == PluginSpec::Running || state == PluginSpec::Initialized)
    plugin->aboutToShutdown();
  state = PluginSpec::Stopped;
}

auto PluginSpecPrivate::kill() -> void
{
  if (!plugin)
    return;

  if (const auto connector = EventConnector::instance()) {
    for (const auto listener : plugin->listeners())
      connector->removeListener(listener);
  }
  delete plugin;
  plugin = nullptr;
  state = PluginSpec::Deleted;
}
