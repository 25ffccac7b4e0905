// SPDX-License-Identifier: GPL-3.0-only WITH Qt-GPL-exception-1.0

#include "filemonitor-plugin.hpp"

#include "filemonitor-monitor.hpp"

#include <core/core-constants.hpp>
#include <core/core-editor.hpp>

#include <extensionsystem/connector.hpp>

#include <utils/qtcassert.hpp>

/*!
    \class Eye::Plugin::FileMonitor::FileMonitorPlugin
    \inheaderfile filemonitor/filemonitor-plugin.hpp
    \inmodule Eye

    \brief The FileMonitorPlugin class makes editors emit
    Editor::fileModifiedExternally() when their file changes on disk.

    An editor is monitored once it opened or saved its file. Monitoring is
    paused while the editor writes the file, so it does not notice its own
    saving.
*/

using namespace Eye::Plugin::Core;

namespace Eye::Plugin::FileMonitor {

FileMonitorPlugin::FileMonitorPlugin() = default;

FileMonitorPlugin::~FileMonitorPlugin()
{
  for (const auto &watch : qAsConst(m_watches)) {
    disconnect(watch.connection);
    disconnect(watch.destroyed);
  }
  m_watches.clear();
}

auto FileMonitorPlugin::initialize(const QStringList &arguments, QString *error_message) -> bool
{
  Q_UNUSED(arguments)
  Q_UNUSED(error_message)

  m_monitor = new Monitor(this);

  const QStringList editors{QLatin1String(Constants::C_EDITOR)};
  const auto on_open = [this](QObject *sender, const QVariantList &arguments) {
    if (const auto editor = qobject_cast<Editor*>(sender); editor && !arguments.isEmpty())
      startMonitoring(editor, arguments.constFirst().toString());
  };
  addListener(ExtensionSystem::registerSignal(editors, QLatin1String("fileOpened"), on_open, QLatin1String("monitorOnOpen")));
  addListener(ExtensionSystem::registerSignal(editors, QLatin1String("fileSaved"), on_open, QLatin1String("monitorOnSave")));
  addListener(ExtensionSystem::registerSignal(editors, QLatin1String("fileSavedAs"), on_open, QLatin1String("monitorOnSaveAs")));
  addListener(ExtensionSystem::registerSignal(editors, QLatin1String("fileAboutToBeSaved"), [this](QObject *sender, const QVariantList &) {
    if (const auto editor = qobject_cast<Editor*>(sender))
      pauseMonitoring(editor);
  }, QLatin1String("pauseMonitorOnSave")));
  return true;
}

auto FileMonitorPlugin::watcher(Editor *editor) const -> SingleFileWatcher*
{
  return m_watches.value(editor).watcher.get();
}

/*!
    Monitors \a path for \a editor, unless the editor is monitored already.
*/
auto FileMonitorPlugin::startMonitoring(Editor *editor, const QString &path) -> void
{
  QTC_ASSERT(editor && m_monitor, return);
  if (m_watches.contains(editor) || path.isEmpty())
    return;

  Watch watch;
  watch.watcher = m_monitor->monitorFile(path);
  watch.connection = connect(watch.watcher.get(), &SingleFileWatcher::modified, editor, &Editor::fileModifiedExternally);
  watch.destroyed = connect(editor, &QObject::destroyed, this, [this, editor] { m_watches.remove(editor); });
  m_watches.insert(editor, watch);
}

auto FileMonitorPlugin::pauseMonitoring(Editor *editor) -> void
{
  const auto it = m_watches.find(editor);
  if (it == m_watches.end())
    return;
  disconnect(it->connection);
  disconnect(it->destroyed);
  m_watches.erase(it);
}

auto FileMonitorPlugin::enabledChanged(const bool enabled) -> void
{
  if (!enabled)
    clearWatches();
}

auto FileMonitorPlugin::clearWatches() -> void
{
  for (const auto &watch : qAsConst(m_watches)) {
    disconnect(watch.connection);
    disconnect(watch.destroyed);
  }
  m_watches.clear();
}

} // namespace Eye::Plugin::FileMonitor
