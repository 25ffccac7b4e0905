// SPDX-License-Identifier: GPL-3.0-only WITH Qt-GPL-exception-1.0

#pragma once

#include "core-global.hpp"

#include <QJSValue>
#include <QObject>
#include <QPointer>
#include <QStringList>
#include <QVariantList>

#include <functional>

namespace ExtensionSystem {
class Listener;
} // namespace ExtensionSystem

namespace Eye::Plugin::Core {

class ScriptEngine;

class CORE_EXPORT ScriptApi : public QObject {
  Q_OBJECT

public:
  explicit ScriptApi(ScriptEngine *engine);
  ~ScriptApi() override;

  auto listenerNames() const -> QStringList;

  static auto stringList(const QJSValue &value) -> QStringList;

public slots:
  auto registerSignal(const QJSValue &categories, const QString &signal, const QJSValue &callback, const QString &name = QString()) -> QString;
  auto registerEventFilter(const QJSValue &categories, const QJSValue &event_types, const QJSValue &callback, const QString &name = QString()) -> QString;
  auto registerShortcut(const QJSValue &categories, const QString &keys, const QJSValue &callback, const QString &name = QString(), const QString &context = QString()) -> QString;
  auto defaultEditorConfig(const QJSValue &callback, const QString &name = QString()) -> QString;
  auto defaultWindowConfig(const QJSValue &callback, const QString &name = QString()) -> QString;

  auto categoryObjects(const QJSValue &categories) const -> QJSValue;
  auto setListenerEnabled(const QString &name, bool enabled) const -> bool;
  auto setPluginEnabled(const QString &name, bool enabled) const -> bool;
  auto plugins() const -> QJSValue;

  auto currentWindow() const -> QJSValue;
  auto currentBuffer() const -> QJSValue;
  auto openEditor(const QString &path, int line = 0, int column = 0) const -> QJSValue;
  auto configPath(const QString &rel = QString()) const -> QString;
  auto parentContaining(const QString &path, const QJSValue &patterns) const -> QString;
  auto log(const QString &message) const -> void;

private:
  auto makeCallback(const QString &listener_name, const QJSValue &function) const -> std::function<QJSValue(QObject *, const QVariantList &)>;
  auto callbackError(const QString &listener, const QString &error) const -> void;
  auto track(ExtensionSystem::Listener *listener) -> QString;

  ScriptEngine *m_engine;
  QList<QPointer<ExtensionSystem::Listener>> m_listeners;
};

} // namespace Eye::Plugin::Core
