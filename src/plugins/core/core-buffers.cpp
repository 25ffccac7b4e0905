// SPDX-License-Identifier: GPL-3.0-only WITH Qt-GPL-exception-1.0

#include "core-buffers.hpp"

#include "core-constants.hpp"
#include "core-editor.hpp"
#include "core-splitter.hpp"
#include "core-tab-widget.hpp"
#include "core-window.hpp"

#include <extensionsystem/connector.hpp>

#include <utils/fileutils.hpp>
#include <utils/qtcassert.hpp>

#include <QApplication>

using namespace ExtensionSystem;

namespace Eye::Plugin::Core {

/*!
    Returns the active window, or the first one if none is active.
*/
auto Buffers::currentWindow() -> Window*
{
  if (const auto window = qobject_cast<Window*>(QApplication::activeWindow()))
    return window;

  const auto windows = categoryObjects<Window>({QLatin1String(Constants::C_WINDOW)});
  return windows.isEmpty() ? nullptr : windows.first();
}

auto Buffers::currentBuffer() -> Editor*
{
  const auto window = currentWindow();
  return window ? window->currentBuffer() : nullptr;
}

/*!
    Returns an editor having \a path open, or \c nullptr.
*/
auto Buffers::findEditor(const QString &path) -> Editor*
{
  if (path.isEmpty())
    return nullptr;

  const auto absolute_path = Utils::FileUtils::absolutePath(path);
  for (const auto editor : categoryObjects<Editor>({QLatin1String(Constants::C_EDITOR)})) {
    if (editor->path() == absolute_path)
      return editor;
  }
  return nullptr;
}

/*!
    Returns the paths open in all editors, empty for untitled ones.
*/
auto Buffers::listEditors() -> QStringList
{
  QStringList paths;
  for (const auto editor : categoryObjects<Editor>({QLatin1String(Constants::C_EDITOR)}))
    paths.append(editor->path());
  return paths;
}

/*!
    Shows \a path, reusing an editor having it open or opening a new one,
    focuses it and moves to \a line and \a column when given.
*/
auto Buffers::openEditor(const QString &path, const int line, const int column) -> Editor*
{
  auto editor = findEditor(path);
  if (!editor)
    editor = newEditorOpen(path);
  if (!editor)
    return nullptr;

  if (line > 0)
    editor->goto1(line, column);
  editor->giveFocus();
  return editor;
}

/*!
    Opens \a path in a new editor, even if it is open elsewhere. Returns
    \c nullptr if the file cannot be read.
*/
auto Buffers::newEditorOpen(const QString &path, const int line, const int column, TabWidget *tabs) -> Editor*
{
  const auto editor = new Editor;
  if (!editor->openFile(path)) {
    delete editor;
    return nullptr;
  }
  return attach(editor, line, column, tabs);
}

/*!
    Creates an editor sharing the document of \a editor.
*/
auto Buffers::newEditorShare(Editor *editor, const int line, const int column, TabWidget *tabs) -> Editor*
{
  QTC_ASSERT(editor, return nullptr);

  const auto shared = new Editor;
  if (!shared->openDocument(editor)) {
    delete shared;
    return nullptr;
  }
  return attach(shared, line, column, tabs);
}

/*!
    Shares the document of an editor having \a path open if there is one,
    opens the file otherwise.
*/
auto Buffers::newEditorTryShare(const QString &path, const int line, const int column, TabWidget *tabs) -> Editor*
{
  if (const auto old = findEditor(path))
    return newEditorShare(old, line, column, tabs);
  return newEditorOpen(path, line, column, tabs);
}

auto Buffers::defaultTabs() -> TabWidget*
{
  if (const auto current = currentBuffer()) {
    if (const auto tabs = current->parentTabWidget())
      return tabs;
  }

  const auto window = currentWindow();
  if (!window)
    return nullptr;
  for (const auto w : window->splitManager()->allChildren()) {
    if (const auto tabs = qobject_cast<TabWidget*>(w))
      return tabs;
  }
  return nullptr;
}

auto Buffers::attach(Editor *editor, const int line, const int column, TabWidget *tabs) -> Editor*
{
  if (!tabs)
    tabs = defaultTabs();
  if (tabs)
    tabs->addEditor(editor);
  else
    qCWarning(editorLog) << "No tab widget to show" << editor->path();

  if (line > 0)
    editor->goto1(line, column);
  return editor;
}

} // namespace Eye::Plugin::Core
