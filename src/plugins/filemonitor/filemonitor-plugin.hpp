// SPDX-License-Identifier: GPL-3.0-only WITH Qt-GPL-exception-1.0

#pragma once

#include "filemonitor-global.hpp"

#include <extensionsystem/iplugin.hpp>

#include <QHash>

#include <memory>

namespace Eye::Plugin::Core {
class Editor;
} // namespace Eye::Plugin::Core

namespace Eye::Plugin::FileMonitor {

class Monitor;
class SingleFileWatcher;

class FILEMONITOR_EXPORT FileMonitorPlugin final : public ExtensionSystem::IPlugin {
  Q_OBJECT

public:
  FileMonitorPlugin();
  ~FileMonitorPlugin() override;

  auto initialize(const QStringList &arguments, QString *error_message) -> bool override;

  auto monitor() const -> Monitor* { return m_monitor; }
  auto watcher(Core::Editor *editor) const -> SingleFileWatcher*;

  auto startMonitoring(Core::Editor *editor, const QString &path) -> void;
  auto pauseMonitoring(Core::Editor *editor) -> void;

protected:
  auto enabledChanged(bool enabled) -> void override;

private:
  struct Watch {
    std::shared_ptr<SingleFileWatcher> watcher;
    QMetaObject::Connection connection;
    QMetaObject::Connection destroyed;
  };

  auto clearWatches() -> void;

  Monitor *m_monitor = nullptr;
  QHash<Core::Editor*, Watch> m_watches;
};

} // namespace Eye::Plugin::FileMonitor
