// SPDX-License-Identifier: GPL-3.0-only WITH Qt-GPL-exception-1.0

#include "navhistory-plugin.hpp"

#include <core/core-buffers.hpp>
#include <core/core-constants.hpp>
#include <core/core-editor.hpp>
#include <core/core-interface.hpp>
#include <core/core-script-engine.hpp>

#include <extensionsystem/connector.hpp>

#include <utils/qtcassert.hpp>

Q_LOGGING_CATEGORY(navHistoryLog, "eye.navhistory", QtWarningMsg)

/*!
    \class Eye::Plugin::NavHistory::NavHistoryPlugin
    \inheaderfile navhistory/navhistory-plugin.hpp
    \inmodule Eye

    \brief The NavHistoryPlugin class records where the cursor has been, so
    that scripts can jump back with \c navHistory.popHistory().

    Only the last position of each stay in an editor is kept: moving the
    cursor inside the editor on top of the history replaces its entry.
*/

using namespace Eye::Plugin::Core;

namespace Eye::Plugin::NavHistory {

NavHistory::NavHistory(QObject *parent) : QObject(parent)
{
  setObjectName(QLatin1String("navHistory"));
}

auto NavHistory::push(Editor *editor, const int line, const int column) -> void
{
  QTC_ASSERT(editor, return);
  m_entries.append({editor, line, column});
}

/*!
    Pushes the position, replacing the top entry if it belongs to \a editor.
*/
auto NavHistory::record(Editor *editor, const int line, const int column) -> void
{
  if (!m_entries.isEmpty() && m_entries.constLast().editor == editor)
    m_entries.removeLast();
  push(editor, line, column);
}

/*!
    Returns the top entry, or nothing if the history is empty or its editor
    was destroyed.
*/
auto NavHistory::peek() const -> std::optional<Entry>
{
  if (m_entries.isEmpty() || !m_entries.constLast().editor)
    return std::nullopt;
  return m_entries.constLast();
}

/*!
    Returns the top entry as a map with the keys \c editor, \c line and
    \c column, or an empty map.
*/
auto NavHistory::peekHistory() const -> QVariantMap
{
  const auto entry = peek();
  if (!entry)
    return {};
  return {
    {QLatin1String("editor"), QVariant::fromValue<QObject*>(entry->editor.data())},
    {QLatin1String("line"), entry->line},
    {QLatin1String("column"), entry->column},
  };
}

auto NavHistory::popHistory() -> bool
{
  return popHistory(Buffers::currentBuffer());
}

/*!
    Pops entries until one belongs to a live editor other than \a current,
    then moves the cursor there and focuses that editor. Returns \c false if
    no such entry was left.
*/
auto NavHistory::popHistory(Editor *current) -> bool
{
  while (!m_entries.isEmpty()) {
    const auto entry = m_entries.takeLast();
    if (!entry.editor || entry.editor == current)
      continue;

    qCDebug(navHistoryLog) << "back to" << entry.editor->path() << entry.line << entry.column;
    entry.editor->goto1(entry.line + 1, entry.column + 1);
    entry.editor->giveFocus();
    emit jumped(entry.editor, entry.line, entry.column);
    return true;
  }
  return false;
}

NavHistoryPlugin::NavHistoryPlugin() = default;

NavHistoryPlugin::~NavHistoryPlugin() = default;

auto NavHistoryPlugin::initialize(const QStringList &arguments, QString *error_message) -> bool
{
  Q_UNUSED(arguments)
  Q_UNUSED(error_message)

  m_history = new NavHistory(this);
  const QPointer<NavHistory> history(m_history);
  const auto listener = ExtensionSystem::registerSignal({QLatin1String(Constants::C_EDITOR)}, QLatin1String("cursorPositionChanged"), [history](QObject *sender, const QVariantList &) {
    const auto editor = qobject_cast<Editor*>(sender);
    if (history && editor)
      history->record(editor, editor->cursorLine(), editor->cursorColumn());
  }, QLatin1String("pushHistoryOnCursorMove"));
  addListener(listener);
  return true;
}

auto NavHistoryPlugin::extensionsInitialized() -> void
{
  if (const auto engine = ICore::scriptEngine())
    engine->registerObject(m_history->objectName(), m_history);
}

auto NavHistoryPlugin::enabledChanged(const bool enabled) -> void
{
  if (!enabled)
    m_history->clear();
}

} // namespace Eye::Plugin::NavHistory
