// SPDX-License-Identifier: GPL-3.0-only WITH Qt-GPL-exception-1.0

#pragma once

#include "core-global.hpp"

#include <QJSValue>
#include <QVariantList>

QT_BEGIN_NAMESPACE
class QJSEngine;
class QObject;
class QString;
QT_END_NAMESPACE

namespace Eye::Plugin::Core {

class ScriptApi;
class ScriptEnginePrivate;

class CORE_EXPORT ScriptEngine {
public:
  ScriptEngine();
  ~ScriptEngine();

  auto registerObject(const QString &name, QObject *obj) const -> void;
  auto evaluate(const QString &program, const QString &file_name = {}, QString *error_message = nullptr) const -> QJSValue;
  auto evaluateFile(const QString &path, QString *error_message = nullptr) const -> bool;
  auto runStartupScripts(const QString &dir) const -> int;

  auto wrap(QObject *obj) const -> QJSValue;
  auto call(const QJSValue &function, QObject *sender, const QVariantList &arguments, QString *error_message = nullptr) const -> QJSValue;

  auto engine() const -> QJSEngine&;
  auto api() const -> ScriptApi*;

private:
  ScriptEnginePrivate *d;
};

} // namespace Eye::Plugin::Core
