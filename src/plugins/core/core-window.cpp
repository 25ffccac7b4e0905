// SPDX-License-Identifier: GPL-3.0-only WITH Qt-GPL-exception-1.0

#include "core-window.hpp"

#include "core-constants.hpp"
#include "core-editor.hpp"
#include "core-splitter.hpp"
#include "core-tab-widget.hpp"

#include <utils/fileutils.hpp>
#include <utils/qtcassert.hpp>

#include <QApplication>
#include <QCloseEvent>
#include <QFileDialog>
#include <QMenuBar>

/*!
    \class Eye::Plugin::Core::Window
    \inheaderfile core/core-window.hpp
    \inmodule Eye

    \brief The Window class is a top level window, in the \c window
    category.

    Its central widget is a SplitManager starting with one TabWidget
    holding one empty Editor. The current buffer is the editor of this
    window that last had the focus.
*/

namespace Eye::Plugin::Core {

Window::Window(QWidget *parent) : QMainWindow(parent), CategoryMixin(this), m_split_manager(new SplitManager)
{
  const auto editor = new Editor;
  const auto tabs = new TabWidget;
  tabs->addEditor(editor);

  m_split_manager->splitAt(nullptr, Qt::Horizontal, tabs);
  setCentralWidget(m_split_manager);
  setWindowTitle(QLatin1String(Constants::IDE_DISPLAY_NAME));

  m_last_focus = editor;
  connect(qApp, &QApplication::focusChanged, this, &Window::onFocusChanged);

  addCategory(QLatin1String(Constants::C_WINDOW));
}

Window::~Window() = default;

auto Window::createDefaultMenuBar() -> void
{
  const auto menu = menuBar()->addMenu(tr("&File"));
  menu->addAction(tr("&New"), this, &Window::bufferNew, QKeySequence::New);
  menu->addAction(tr("&Open..."), this, &Window::bufferOpenDialog, QKeySequence::Open);
  menu->addAction(tr("&Save"), this, &Window::bufferSave, QKeySequence::Save);
  menu->addAction(tr("Save &As..."), this, &Window::bufferSaveAs, QKeySequence::SaveAs);
  menu->addAction(tr("&Close"), this, &Window::bufferClose, QKeySequence::Close);
  menu->addSeparator();
  menu->addAction(tr("&Quit"), this, &Window::quitRequested, QKeySequence::Quit);
}

/*!
    Returns the editor of this window that last had the focus, or the first
    editor left if that one is gone.
*/
auto Window::currentBuffer() const -> Editor*
{
  if (m_last_focus && m_last_focus->window() == this)
    return m_last_focus;

  for (const auto w : m_split_manager->allChildren()) {
    if (const auto tabs = qobject_cast<TabWidget*>(w)) {
      if (const auto editor = tabs->currentBuffer())
        return editor;
    }
  }
  return nullptr;
}

/*!
    Opens a new empty editor in the tab widget of the current buffer.
*/
auto Window::bufferNew() -> Editor*
{
  TabWidget *tabs = nullptr;
  if (const auto current = currentBuffer())
    tabs = current->parentTabWidget();
  if (!tabs) {
    for (const auto w : m_split_manager->allChildren()) {
      if ((tabs = qobject_cast<TabWidget*>(w)))
        break;
    }
  }
  if (!tabs) {
    tabs = new TabWidget;
    m_split_manager->splitAt(nullptr, Qt::Horizontal, tabs);
  }

  const auto editor = new Editor;
  tabs->addEditor(editor);
  editor->giveFocus();
  m_last_focus = editor;
  return editor;
}

/*!
    Opens \a path in a new editor. Returns \c nullptr, closing that editor,
    if the file cannot be opened.
*/
auto Window::bufferOpen(const QString &path) -> Editor*
{
  const auto editor = bufferNew();
  if (editor->openFile(path))
    return editor;

  if (const auto tabs = editor->parentTabWidget())
    tabs->closeTab(editor);
  return nullptr;
}

auto Window::bufferOpenDialog() -> void
{
  const auto path = askOpenPath();
  if (path.isEmpty())
    return;

  if (const auto editor = currentBuffer())
    editor->openFile(path);
}

auto Window::bufferSave() -> bool
{
  const auto editor = currentBuffer();
  return editor && editor->saveFile();
}

/*!
    Saves the current buffer under a path chosen by the user.
*/
auto Window::bufferSaveAs() -> bool
{
  const auto editor = currentBuffer();
  return editor && editor->saveFileAs();
}

auto Window::bufferClose() -> bool
{
  const auto editor = currentBuffer();
  if (!editor)
    return false;
  const auto tabs = editor->parentTabWidget();
  return tabs && tabs->closeTab(editor);
}

auto Window::requestClose() -> bool
{
  return m_split_manager->requestClose();
}

auto Window::closeEvent(QCloseEvent *event) -> void
{
  if (requestClose())
    event->accept();
  else
    event->ignore();
}

auto Window::askOpenPath() -> QString
{
  return QFileDialog::getOpenFileName(this, tr("Open file"), Utils::FileUtils::homePath());
}

auto Window::onFocusChanged(QWidget *old, QWidget *now) -> void
{
  Q_UNUSED(old)
  if (!now || !m_split_manager->isAncestorOf(now))
    return;

  for (auto w = now; w; w = w->parentWidget()) {
    if (const auto editor = qobject_cast<Editor*>(w)) {
      m_last_focus = editor;
      return;
    }
  }
}

} // namespace Eye::Plugin::Core
