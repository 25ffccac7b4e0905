// SPDX-License-Identifier: GPL-3.0-only WITH Qt-GPL-exception-1.0

#pragma once

#include "navhistory-global.hpp"

#include <extensionsystem/iplugin.hpp>

#include <QPointer>
#include <QVariantMap>
#include <QVector>

#include <optional>

namespace Eye::Plugin::Core {
class Editor;
} // namespace Eye::Plugin::Core

namespace Eye::Plugin::NavHistory {

class NAVHISTORY_EXPORT NavHistory : public QObject {
  Q_OBJECT

public:
  struct Entry {
    QPointer<Core::Editor> editor;
    int line = 0;
    int column = 0;
  };

  explicit NavHistory(QObject *parent = nullptr);

  auto push(Core::Editor *editor, int line, int column) -> void;
  auto record(Core::Editor *editor, int line, int column) -> void;
  auto peek() const -> std::optional<Entry>;
  auto size() const -> int { return static_cast<int>(m_entries.size()); }
  auto clear() -> void { m_entries.clear(); }

public slots:
  auto popHistory() -> bool;
  auto popHistory(Eye::Plugin::Core::Editor *current) -> bool;
  auto peekHistory() const -> QVariantMap;

signals:
  auto jumped(Eye::Plugin::Core::Editor *editor, int line, int column) -> void;

private:
  QVector<Entry> m_entries;
};

class NAVHISTORY_EXPORT NavHistoryPlugin final : public ExtensionSystem::IPlugin {
  Q_OBJECT

public:
  NavHistoryPlugin();
  ~NavHistoryPlugin() override;

  auto initialize(const QStringList &arguments, QString *error_message) -> bool override;
  auto extensionsInitialized() -> void override;

  auto history() const -> NavHistory* { return m_history; }

protected:
  auto enabledChanged(bool enabled) -> void override;

private:
  NavHistory *m_history = nullptr;
};

} // namespace Eye::Plugin::NavHistory
