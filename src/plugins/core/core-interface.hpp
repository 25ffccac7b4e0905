// SPDX-License-Identifier: GPL-3.0-only WITH Qt-GPL-exception-1.0

#pragma once

#include "core-global.hpp"

#include <QList>
#include <QObject>

QT_BEGIN_NAMESPACE
class QSettings;
QT_END_NAMESPACE

namespace Eye::Plugin::Core {

class CorePlugin;
class ScriptEngine;
class Window;

class CORE_EXPORT ICore : public QObject {
  Q_OBJECT
  friend class CorePlugin;

  explicit ICore(ScriptEngine *script_engine);
  ~ICore() override;

public:
  static auto instance() -> ICore*;

  static auto configPath(const QString &rel = {}) -> QString;
  static auto setConfigPath(const QString &path) -> void;
  static auto startupScriptsPath() -> QString;
  static auto settings() -> QSettings*;
  static auto scriptEngine() -> ScriptEngine*;

  static auto createWindow() -> Window*;
  static auto windows() -> QList<Window*>;

signals:
  auto windowCreated(Eye::Plugin::Core::Window *window) -> void;
  auto coreOpened() -> void;
  auto coreAboutToClose() -> void;

private:
  ScriptEngine *m_script_engine;
};

} // namespace Eye::Plugin::Core
