// SPDX-License-Identifier: GPL-3.0-only WITH Qt-GPL-exception-1.0

#include "core-tab-widget.hpp"

#include "core-constants.hpp"
#include "core-editor.hpp"
#include "core-splitter.hpp"

#include <utils/qtcassert.hpp>

#include <QPointer>

/*!
    \class Eye::Plugin::Core::TabWidget
    \inheaderfile core/core-tab-widget.hpp
    \inmodule Eye

    \brief The TabWidget class shows editors as tabs, in the \c tabwidget
    category.

    The tab bar is hidden while there is at most one tab. Closing a tab asks
    the editor first, see Editor::closeFile(), and deletes it. A tab widget
    left without tabs removes itself from its split manager, unless it is
    the last one there.
*/

namespace Eye::Plugin::Core {

TabBar::TabBar(QWidget *parent) : QTabBar(parent)
{
  setTabsClosable(true);
  setMovable(true);
  setUsesScrollButtons(true);
}

TabWidget::TabWidget(QWidget *parent) : QTabWidget(parent), CategoryMixin(this)
{
  setTabBar(new TabBar(this));
  setDocumentMode(true);
  connect(this, &QTabWidget::tabCloseRequested, this, &TabWidget::onTabCloseRequested);
  connect(this, &QTabWidget::currentChanged, this, &TabWidget::onCurrentChanged);
  updateTabBarVisibility();

  addCategory(QLatin1String(Constants::C_TABWIDGET));
}

TabWidget::~TabWidget() = default;

auto TabWidget::currentBuffer() const -> Editor*
{
  return qobject_cast<Editor*>(currentWidget());
}

auto TabWidget::editors() const -> QList<Editor*>
{
  QList<Editor*> result;
  for (auto i = 0; i < count(); ++i) {
    if (const auto editor = qobject_cast<Editor*>(widget(i)))
      result.append(editor);
  }
  return result;
}

auto TabWidget::addEditor(Editor *editor) -> void
{
  QTC_ASSERT(editor, return);
  addTab(editor, editor->title());
  setTabToolTip(indexOf(editor), editor->toolTip());
  connect(editor, &Editor::titleChanged, this, &TabWidget::onEditorTitleChanged, Qt::UniqueConnection);
}

/*!
    Closes the tab of \a editor if the editor agrees. Returns whether it was
    closed. The editor leaves its categories at once and is deleted later.
*/
auto TabWidget::closeTab(Editor *editor) -> bool
{
  QTC_ASSERT(editor, return false);
  const auto index = indexOf(editor);
  QTC_ASSERT(index >= 0, return false);

  if (!editor->closeFile())
    return false;

  disconnect(editor, &Editor::titleChanged, this, &TabWidget::onEditorTitleChanged);
  // Lookups by category must not find the editor while it waits for deletion.
  const auto categories = editor->categories();
  for (const auto &category : categories)
    editor->removeCategory(category);
  editor->hide();
  editor->setParent(nullptr);
  editor->deleteLater();
  removeIfEmpty();
  return true;
}

/*!
    Closes all tabs, stopping at the first editor refusing to close.
*/
auto TabWidget::requestClose() -> bool
{
  while (count()) {
    const auto editor = qobject_cast<Editor*>(widget(0));
    QTC_ASSERT(editor, removeTab(0); continue);
    if (!closeTab(editor))
      return false;
  }
  return true;
}

auto TabWidget::tabInserted(const int index) -> void
{
  QTabWidget::tabInserted(index);
  updateTabBarVisibility();
}

auto TabWidget::tabRemoved(const int index) -> void
{
  QTabWidget::tabRemoved(index);
  updateTabBarVisibility();
}

auto TabWidget::onTabCloseRequested(const int index) -> void
{
  if (const auto editor = qobject_cast<Editor*>(widget(index)))
    closeTab(editor);
}

auto TabWidget::onCurrentChanged(const int index) -> void
{
  if (index < 0 || !hasFocus())
    return;
  widget(index)->setFocus(Qt::OtherFocusReason);
}

auto TabWidget::onEditorTitleChanged() -> void
{
  const auto editor = qobject_cast<Editor*>(sender());
  const auto index = indexOf(editor);
  if (index < 0)
    return;
  setTabText(index, editor->title());
  setTabToolTip(index, editor->toolTip());
}

auto TabWidget::updateTabBarVisibility() -> void
{
  tabBar()->setVisible(count() > 1);
}

auto TabWidget::removeIfEmpty() -> void
{
  if (count())
    return;

  const auto manager = SplitManager::parentManager(this);
  if (!manager || manager->allChildren().size() <= 1)
    return;

  manager->removeWidget(this);
  deleteLater();
}

} // namespace Eye::Plugin::Core
