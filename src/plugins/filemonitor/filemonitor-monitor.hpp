// SPDX-License-Identifier: GPL-3.0-only WITH Qt-GPL-exception-1.0

#pragma once

#include "filemonitor-global.hpp"

#include <QHash>
#include <QObject>

#include <memory>

QT_BEGIN_NAMESPACE
class QFileSystemWatcher;
QT_END_NAMESPACE

namespace Eye::Plugin::FileMonitor {

class FILEMONITOR_EXPORT SingleFileWatcher : public QObject {
  Q_OBJECT

public:
  explicit SingleFileWatcher(const QString &path);

  auto path() const -> QString { return m_path; }

signals:
  // The file was touched, modified, replaced or removed.
  auto modified() -> void;

private:
  QString m_path;
};

class FILEMONITOR_EXPORT Monitor : public QObject {
  Q_OBJECT

public:
  explicit Monitor(QObject *parent = nullptr);
  ~Monitor() override;

  auto monitorFile(const QString &path) -> std::shared_ptr<SingleFileWatcher>;
  auto unmonitorFile(const QString &path) -> void;
  auto isMonitored(const QString &path) const -> bool;
  auto files() const -> QStringList;

private:
  auto fileChanged(const QString &path) -> void;

  QFileSystemWatcher *m_watcher;
  QHash<QString, std::weak_ptr<SingleFileWatcher>> m_watched;
};

} // namespace Eye::Plugin::FileMonitor
