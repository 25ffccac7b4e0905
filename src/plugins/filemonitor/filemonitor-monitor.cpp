// SPDX-License-Identifier: GPL-3.0-only WITH Qt-GPL-exception-1.0

#include "filemonitor-monitor.hpp"

#include <utils/fileutils.hpp>

#include <QFileInfo>
#include <QFileSystemWatcher>
#include <QPointer>

Q_LOGGING_CATEGORY(fileMonitorLog, "eye.filemonitor", QtWarningMsg)

/*!
    \class Eye::Plugin::FileMonitor::Monitor
    \inheaderfile filemonitor/filemonitor-monitor.hpp
    \inmodule Eye

    \brief The Monitor class watches single files for changes.

    monitorFile() returns the same SingleFileWatcher for the same path as
    long as somebody holds it. The file is no longer watched once the last
    holder releases it.

    A file replaced by renaming another file over it, the usual way of
    writing files atomically, is tracked again.
*/

namespace Eye::Plugin::FileMonitor {

SingleFileWatcher::SingleFileWatcher(const QString &path) : m_path(path) {}

Monitor::Monitor(QObject *parent) : QObject(parent), m_watcher(new QFileSystemWatcher(this))
{
  connect(m_watcher, &QFileSystemWatcher::fileChanged, this, &Monitor::fileChanged);
}

Monitor::~Monitor() = default;

auto Monitor::monitorFile(const QString &path) -> std::shared_ptr<SingleFileWatcher>
{
  const auto absolute = Utils::FileUtils::absolutePath(path);

  if (auto existing = m_watched.value(absolute).lock())
    return existing;

  qCDebug(fileMonitorLog) << "start monitoring" << absolute;
  if (!m_watcher->addPath(absolute))
    qCWarning(fileMonitorLog) << "failed to monitor" << absolute;

  const QPointer<Monitor> self(this);
  std::shared_ptr<SingleFileWatcher> watcher(new SingleFileWatcher(absolute), [self, absolute](SingleFileWatcher *w) {
    // Unless the path was monitored again in between.
    if (self && self->m_watched.value(absolute).expired())
      self->unmonitorFile(absolute);
    delete w;
  });
  m_watched.insert(absolute, watcher);
  return watcher;
}

/*!
    Stops watching \a path. Every SingleFileWatcher of that path stops
    emitting.
*/
auto Monitor::unmonitorFile(const QString &path) -> void
{
  const auto absolute = Utils::FileUtils::absolutePath(path);
  qCDebug(fileMonitorLog) << "stop monitoring" << absolute;
  if (m_watcher->files().contains(absolute))
    m_watcher->removePath(absolute);
  m_watched.remove(absolute);
}

auto Monitor::isMonitored(const QString &path) const -> bool
{
  return !m_watched.value(Utils::FileUtils::absolutePath(path)).expired();
}

auto Monitor::files() const -> QStringList
{
  return m_watcher->files();
}

auto Monitor::fileChanged(const QString &path) -> void
{
  if (!m_watcher->files().contains(path)) {
    qCDebug(fileMonitorLog) << "file has been untracked:" << path;
    if (QFileInfo::exists(path))
      m_watcher->addPath(path);
  }

  if (const auto watcher = m_watched.value(path).lock())
    emit watcher->modified();
}

} // namespace Eye::Plugin::FileMonitor
