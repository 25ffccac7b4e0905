// SPDX-License-Identifier: GPL-3.0-only WITH Qt-GPL-exception-1.0

#pragma once

#include "session-global.hpp"

#include <QJsonObject>
#include <QList>

namespace Eye::Plugin::Core {
class Editor;
class Splitter;
class TabWidget;
class Window;
} // namespace Eye::Plugin::Core

namespace Eye::Plugin::Session {

// Session files are JSON: windows hold a splitter tree whose leaves are tab
// widgets of editors. Binary Qt state is stored as hexadecimal strings.
class SESSION_EXPORT SessionSerializer {
public:
  static auto serializeSession() -> QJsonObject;
  static auto serializeWindow(const Core::Window *window) -> QJsonObject;
  static auto serializeSplitter(const Core::Splitter *splitter) -> QJsonObject;
  static auto serializeTabs(const Core::TabWidget *tabs) -> QJsonObject;
  static auto serializeEditor(const Core::Editor *editor) -> QJsonObject;

  static auto restoreSession(const QJsonObject &session, QString *error_string = nullptr) -> QList<Core::Window*>;

private:
  static auto restoreWindow(const QJsonObject &data) -> Core::Window*;
  static auto restoreSplitter(const QJsonObject &data, Core::Splitter *splitter) -> void;
  static auto resizeSplitter(const QJsonObject &data, Core::Splitter *splitter) -> void;
  static auto restoreTabs(const QJsonObject &data, Core::TabWidget *tabs) -> void;
  static auto restoreEditor(const QJsonObject &data, Core::TabWidget *tabs) -> void;
};

SESSION_EXPORT auto saveSession(const QString &path, QString *error_string = nullptr) -> bool;
SESSION_EXPORT auto restoreSession(const QString &path, QString *error_string = nullptr) -> QList<Core::Window*>;

} // namespace Eye::Plugin::Session
