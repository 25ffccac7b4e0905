// SPDX-License-Identifier: GPL-3.0-only WITH Qt-GPL-exception-1.0

#include "iplugin.hpp"
#include "iplugin_p.hpp"
#include "pluginspec.hpp"

#include <utils/qtcassert.hpp>

/*!
  \class ExtensionSystem::IPlugin
  \inheaderfile extensionsystem/iplugin.hpp
  \inmodule Eye

  \brief The IPlugin class is the base class for all plugins.

  Plugins are compiled into the application and registered with
  PluginManager::addPlugin(). Loading a plugin runs initialize(), where it
  registers its listeners with addListener(). Those listeners follow the
  enabled state of the plugin: a plugin that is loaded but not enabled stays
  dormant, its listeners attached but never calling back.

  Required plugins are enabled before initialize() is called, all others
  after every plugin has been initialized, according to the settings.
*/

/*!
  \fn bool ExtensionSystem::IPlugin::initialize(const QStringList &arguments, QString *error_string)
  Called after the plugin has been registered, in registration order.
  Returns whether initialization succeeds. If it does not, \a error_string
  should be set to a user-readable message describing the reason.
*/

/*!
  \fn void ExtensionSystem::IPlugin::extensionsInitialized()
  Called in reverse registration order once every plugin is initialized.
*/

/*!
  \fn void ExtensionSystem::IPlugin::aboutToShutdown()
  Called during shutdown in the reverse order of initialization.
*/

using namespace ExtensionSystem;

IPlugin::IPlugin() : d(new Internal::IPluginPrivate()) {}

IPlugin::~IPlugin()
{
  delete d;
  d = nullptr;
}

auto IPlugin::pluginSpec() const -> PluginSpec*
{
  return d->plugin_spec;
}

auto IPlugin::isEnabled() const -> bool
{
  return d->enabled;
}

/*!
  Enables or disables all listeners registered by this plugin.
*/
auto IPlugin::setEnabled(const bool enabled) -> void
{
  if (d->enabled == enabled)
    return;

  d->enabled = enabled;
  for (const auto &listener : qAsConst(d->listeners)) {
    if (listener)
      listener->setEnabled(enabled);
  }
  enabledChanged(enabled);
}

/*!
  Takes \a listener under the control of this plugin's enabled state. The
  listener stays owned by the EventConnector.
*/
auto IPlugin::addListener(Listener *listener) -> void
{
  QTC_ASSERT(listener, return);
  listener->setEnabled(d->enabled);
  d->listeners.append(listener);
}

auto IPlugin::listeners() const -> QList<Listener*>
{
  QList<Listener*> result;
  for (const auto &listener : qAsConst(d->listeners)) {
    if (listener)
      result.append(listener);
  }
  return result;
}
