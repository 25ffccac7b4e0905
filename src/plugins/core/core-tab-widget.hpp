// SPDX-License-Identifier: GPL-3.0-only WITH Qt-GPL-exception-1.0

#pragma once

#include "core-global.hpp"

#include <extensionsystem/categorymixin.hpp>

#include <QTabBar>
#include <QTabWidget>

namespace Eye::Plugin::Core {

class Editor;

class CORE_EXPORT TabBar : public QTabBar {
  Q_OBJECT

public:
  explicit TabBar(QWidget *parent = nullptr);
};

class CORE_EXPORT TabWidget : public QTabWidget, public ExtensionSystem::CategoryMixin {
  Q_OBJECT

public:
  explicit TabWidget(QWidget *parent = nullptr);
  ~TabWidget() override;

  auto currentBuffer() const -> Q_INVOKABLE Eye::Plugin::Core::Editor*;
  auto editors() const -> QList<Editor*>;

public slots:
  auto addEditor(Eye::Plugin::Core::Editor *editor) -> void;
  auto closeTab(Eye::Plugin::Core::Editor *editor) -> bool;
  auto requestClose() -> bool;

protected:
  auto tabInserted(int index) -> void override;
  auto tabRemoved(int index) -> void override;

private:
  auto onTabCloseRequested(int index) -> void;
  auto onCurrentChanged(int index) -> void;
  auto onEditorTitleChanged() -> void;
  auto updateTabBarVisibility() -> void;
  auto removeIfEmpty() -> void;
};

} // namespace Eye::Plugin::Core
