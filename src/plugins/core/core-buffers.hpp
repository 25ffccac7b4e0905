// SPDX-License-Identifier: GPL-3.0-only WITH Qt-GPL-exception-1.0

#pragma once

#include "core-global.hpp"

#include <QList>
#include <QStringList>

namespace Eye::Plugin::Core {

class Editor;
class TabWidget;
class Window;

/*!
  Helpers to find and open editors across all windows. Where a tab widget
  is optional, the one of the current buffer is used.
*/
class CORE_EXPORT Buffers {
public:
  static auto currentWindow() -> Window*;
  static auto currentBuffer() -> Editor*;
  static auto findEditor(const QString &path) -> Editor*;
  static auto listEditors() -> QStringList;
  static auto openEditor(const QString &path, int line = 0, int column = 0) -> Editor*;
  static auto newEditorOpen(const QString &path, int line = 0, int column = 0, TabWidget *tabs = nullptr) -> Editor*;
  static auto newEditorShare(Editor *editor, int line = 0, int column = 0, TabWidget *tabs = nullptr) -> Editor*;
  static auto newEditorTryShare(const QString &path, int line = 0, int column = 0, TabWidget *tabs = nullptr) -> Editor*;

private:
  static auto defaultTabs() -> TabWidget*;
  static auto attach(Editor *editor, int line, int column, TabWidget *tabs) -> Editor*;
};

} // namespace Eye::Plugin::Core
