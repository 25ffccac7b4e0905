// SPDX-License-Identifier: GPL-3.0-only WITH Qt-GPL-exception-1.0

#include "core-script-engine.hpp"

#include "core-constants.hpp"
#include "core-script-api.hpp"

#include <utils/fileutils.hpp>
#include <utils/qtcassert.hpp>

#include <QCoreApplication>
#include <QDir>
#include <QJSEngine>

#include <memory>

Q_LOGGING_CATEGORY(scriptsLog, "eye.scripts", QtInfoMsg)

/*!
    \class Eye::Plugin::Core::ScriptEngine
    \inheaderfile core/core-script-engine.hpp
    \inmodule Eye

    \brief The ScriptEngine class runs the JavaScript user configuration.

    The global object has two properties: \c eye, the ScriptApi used to
    register callbacks, and \c app, the application object. The \c console
    object is available for debugging output.

    At startup, the \c .js files of the \c startup directory in the
    configuration directory are run in the order of their file names. A
    failing script is reported and the next one still runs.
*/

namespace Eye::Plugin::Core {

class ScriptEnginePrivate {
public:
  QJSEngine m_engine;
  std::unique_ptr<ScriptApi> m_api;
};

ScriptEngine::ScriptEngine() : d(new ScriptEnginePrivate)
{
  d->m_engine.installExtensions(QJSEngine::ConsoleExtension);
  d->m_api = std::make_unique<ScriptApi>(this);
  registerObject(QLatin1String("eye"), d->m_api.get());
  if (QCoreApplication::instance())
    registerObject(QLatin1String("app"), QCoreApplication::instance());
}

ScriptEngine::~ScriptEngine()
{
  delete d;
  d = nullptr;
}

auto ScriptEngine::registerObject(const QString &name, QObject *obj) const -> void
{
  d->m_engine.globalObject().setProperty(name, wrap(obj));
}

/*!
    Wraps \a obj for scripts. The object stays owned by C++, the garbage
    collector never deletes it.
*/
auto ScriptEngine::wrap(QObject *obj) const -> QJSValue
{
  if (!obj)
    return QJSValue(QJSValue::NullValue);
  QJSEngine::setObjectOwnership(obj, QJSEngine::CppOwnership);
  return d->m_engine.newQObject(obj);
}

static auto errorMessage(const QJSValue &error, const QString &file_name) -> QString
{
  const auto line = error.property(QLatin1String("lineNumber")).toInt();
  if (file_name.isEmpty())
    return QCoreApplication::translate("Core::ScriptEngine", "Error at line %1: %2").arg(line).arg(error.toString());
  return QCoreApplication::translate("Core::ScriptEngine", "Error in \"%1\" at line %2: %3").arg(file_name).arg(line).arg(error.toString());
}

/*!
    Evaluates \a program, \a file_name being used in error messages. Returns
    the result, or an undefined value and sets \a error_message on error.
*/
auto ScriptEngine::evaluate(const QString &program, const QString &file_name, QString *error_message) const -> QJSValue
{
  const auto value = d->m_engine.evaluate(program, file_name);

  if (value.isError()) {
    if (error_message)
      *error_message = errorMessage(value, file_name);
    return {};
  }
  return value;
}

auto ScriptEngine::evaluateFile(const QString &path, QString *error_message) const -> bool
{
  Utils::FileReader reader;
  if (!reader.fetch(path, error_message))
    return false;

  QString error;
  evaluate(QString::fromUtf8(reader.data()), path, &error);
  if (!error.isEmpty()) {
    if (error_message)
      *error_message = error;
    return false;
  }
  return true;
}

/*!
    Runs the scripts of \a dir in file name order. Returns the number of
    scripts that ran without error.
*/
auto ScriptEngine::runStartupScripts(const QString &dir) const -> int
{
  const auto files = QDir(dir).entryInfoList({QLatin1String(Constants::SCRIPT_FILTER)}, QDir::Files | QDir::Readable, QDir::Name);
  auto succeeded = 0;
  for (const auto &file : files) {
    qCDebug(scriptsLog) << "running script" << file.absoluteFilePath();
    QString error;
    if (evaluateFile(file.absoluteFilePath(), &error))
      ++succeeded;
    else
      qCWarning(scriptsLog).noquote() << error;
  }
  return succeeded;
}

/*!
    Calls \a function with \a sender, wrapped, followed by \a arguments.
    Returns the result, or an undefined value and sets \a error_message if
    the function raised an error.
*/
auto ScriptEngine::call(const QJSValue &function, QObject *sender, const QVariantList &arguments, QString *error_message) const -> QJSValue
{
  QTC_ASSERT(function.isCallable(), return {});

  QJSValueList args{wrap(sender)};
  for (const auto &argument : arguments)
    args.append(d->m_engine.toScriptValue(argument));

  auto fn = function;
  const auto result = fn.call(args);
  if (result.isError()) {
    if (error_message)
      *error_message = errorMessage(result, {});
    return {};
  }
  return result;
}

auto ScriptEngine::engine() const -> QJSEngine&
{
  return d->m_engine;
}

auto ScriptEngine::api() const -> ScriptApi*
{
  return d->m_api.get();
}

} // namespace Eye::Plugin::Core
