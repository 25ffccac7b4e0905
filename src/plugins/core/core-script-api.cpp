// SPDX-License-Identifier: GPL-3.0-only WITH Qt-GPL-exception-1.0

#include "core-script-api.hpp"

#include "core-buffers.hpp"
#include "core-constants.hpp"
#include "core-editor.hpp"
#include "core-interface.hpp"
#include "core-script-engine.hpp"
#include "core-window.hpp"

#include <extensionsystem/connector.hpp>
#include <extensionsystem/eventconnector.hpp>
#include <extensionsystem/pluginmanager.hpp>
#include <extensionsystem/pluginspec.hpp>

#include <utils/fileutils.hpp>
#include <utils/qtcassert.hpp>

#include <QJSEngine>
#include <QMetaEnum>
#include <QWidget>

/*!
    \class Eye::Plugin::Core::ScriptApi
    \inheaderfile core/core-script-api.hpp
    \inmodule Eye

    \brief The ScriptApi class is the \c eye object of the scripts.

    The registration functions take the categories as a string or an array
    of strings and return the name of the created listener, which can be
    passed to setListenerEnabled(). Callbacks get the object the listener is
    attached to followed by the signal arguments:

    \code
    eye.registerSignal("editor", "fileSaved", function(editor, path) {
        eye.log("saved " + path);
    });
    eye.setListenerEnabled("zoomOnWheel", true);
    \endcode

    An error raised by a callback is logged with the listener name.
*/

namespace Eye::Plugin::Core {

ScriptApi::ScriptApi(ScriptEngine *engine) : m_engine(engine)
{
  setObjectName(QLatin1String("eye"));
}

/*!
    Removes the listeners created by scripts, their callbacks refer to the
    script engine.
*/
ScriptApi::~ScriptApi()
{
  const auto connector = ExtensionSystem::EventConnector::instance();
  if (!connector)
    return;
  for (const auto &listener : qAsConst(m_listeners)) {
    if (listener)
      connector->removeListener(listener);
  }
}

auto ScriptApi::listenerNames() const -> QStringList
{
  QStringList names;
  for (const auto &listener : m_listeners) {
    if (listener)
      names.append(listener->name());
  }
  return names;
}

auto ScriptApi::stringList(const QJSValue &value) -> QStringList
{
  if (value.isArray()) {
    QStringList result;
    const auto length = value.property(QLatin1String("length")).toUInt();
    for (quint32 i = 0; i < length; ++i)
      result.append(value.property(i).toString());
    return result;
  }
  if (value.isUndefined() || value.isNull())
    return {};
  return {value.toString()};
}

auto ScriptApi::callbackError(const QString &listener, const QString &error) const -> void
{
  qCWarning(scriptsLog).noquote() << "Callback of listener" << listener << "failed:" << error;
}

auto ScriptApi::track(ExtensionSystem::Listener *listener) -> QString
{
  QTC_ASSERT(listener, return {});
  m_listeners.append(listener);
  return listener->name();
}

auto ScriptApi::makeCallback(const QString &listener_name, const QJSValue &function) const -> std::function<QJSValue(QObject *, const QVariantList &)>
{
  const QPointer<const ScriptApi> self(this);
  return [self, listener_name, function](QObject *sender, const QVariantList &arguments) -> QJSValue {
    if (!self)
      return {};
    QString error;
    const auto result = self->m_engine->call(function, sender, arguments, &error);
    if (!error.isEmpty())
      self->callbackError(listener_name, error);
    return result;
  };
}

auto ScriptApi::registerSignal(const QJSValue &categories, const QString &signal, const QJSValue &callback, const QString &name) -> QString
{
  if (!callback.isCallable()) {
    qCWarning(scriptsLog).noquote() << "registerSignal: the callback for" << signal << "is not a function";
    return {};
  }

  const auto listener_name = ExtensionSystem::listenerName(name, signal);
  const auto call = makeCallback(listener_name, callback);
  return track(ExtensionSystem::registerSignal(stringList(categories), signal, [call](QObject *sender, const QVariantList &arguments) {
    call(sender, arguments);
  }, listener_name));
}

static auto eventTypes(const QJSValue &types) -> QSet<QEvent::Type>
{
  const auto meta_enum = QMetaEnum::fromType<QEvent::Type>();
  QSet<QEvent::Type> result;
  for (const auto &type : ScriptApi::stringList(types)) {
    auto ok = false;
    auto value = type.toInt(&ok);
    if (!ok)
      value = meta_enum.keyToValue(type.toLatin1().constData(), &ok);
    if (ok)
      result.insert(static_cast<QEvent::Type>(value));
    else
      qCWarning(scriptsLog).noquote() << "Unknown event type" << type;
  }
  return result;
}

/*!
    Registers an event filter. The callback gets the object and the numeric
    event type, and consumes the event by returning \c true. Event types are
    given as numbers or as QEvent::Type key names, such as \c "Wheel".
*/
auto ScriptApi::registerEventFilter(const QJSValue &categories, const QJSValue &event_types, const QJSValue &callback, const QString &name) -> QString
{
  if (!callback.isCallable()) {
    qCWarning(scriptsLog).noquote() << "registerEventFilter: the callback is not a function";
    return {};
  }

  const auto listener_name = ExtensionSystem::listenerName(name, QLatin1String("eventFilter"));
  const auto call = makeCallback(listener_name, callback);
  return track(ExtensionSystem::registerEventFilter(stringList(categories), eventTypes(event_types), [call](QObject *object, QEvent *event) {
    return call(object, {static_cast<int>(event->type())}).toBool();
  }, listener_name));
}

static auto shortcutContext(const QString &context) -> Qt::ShortcutContext
{
  if (context == QLatin1String("window"))
    return Qt::WindowShortcut;
  if (context == QLatin1String("application"))
    return Qt::ApplicationShortcut;
  if (context == QLatin1String("children"))
    return Qt::WidgetWithChildrenShortcut;
  return Qt::WidgetShortcut;
}

/*!
    Registers a shortcut \a keys, in portable text format, on the matching
    widgets. \a context is one of \c "widget", \c "children",
    \c "window" or \c "application"; by default the shortcut is active
    while the widget itself has the focus.
*/
auto ScriptApi::registerShortcut(const QJSValue &categories, const QString &keys, const QJSValue &callback, const QString &name, const QString &context) -> QString
{
  const QKeySequence sequence(keys, QKeySequence::PortableText);
  if (sequence.isEmpty() || !callback.isCallable()) {
    qCWarning(scriptsLog).noquote() << "registerShortcut: invalid keys" << keys << "or callback";
    return {};
  }

  const auto listener_name = ExtensionSystem::listenerName(name, QLatin1String("shortcut"));
  const auto call = makeCallback(listener_name, callback);
  return track(ExtensionSystem::registerShortcut(stringList(categories), sequence, shortcutContext(context), [call](QWidget *widget) {
    call(widget, {});
  }, listener_name));
}

auto ScriptApi::defaultEditorConfig(const QJSValue &callback, const QString &name) -> QString
{
  return registerSignal(QJSValue(QLatin1String(Constants::C_EDITOR)), QLatin1String(Constants::S_CONNECTED), callback, ExtensionSystem::listenerName(name, QLatin1String("defaultEditorConfig")));
}

auto ScriptApi::defaultWindowConfig(const QJSValue &callback, const QString &name) -> QString
{
  return registerSignal(QJSValue(QLatin1String(Constants::C_WINDOW)), QLatin1String(Constants::S_CONNECTED), callback, ExtensionSystem::listenerName(name, QLatin1String("defaultWindowConfig")));
}

auto ScriptApi::categoryObjects(const QJSValue &categories) const -> QJSValue
{
  const auto objects = ExtensionSystem::categoryObjects(stringList(categories));
  auto result = m_engine->engine().newArray(static_cast<uint>(objects.size()));
  for (auto i = 0; i < objects.size(); ++i)
    result.setProperty(static_cast<quint32>(i), m_engine->wrap(objects.at(i)));
  return result;
}

auto ScriptApi::setListenerEnabled(const QString &name, const bool enabled) const -> bool
{
  return ExtensionSystem::setListenerEnabled(name, enabled);
}

auto ScriptApi::setPluginEnabled(const QString &name, const bool enabled) const -> bool
{
  return ExtensionSystem::PluginManager::setPluginEnabled(name, enabled);
}

/*!
    Returns an array describing the plugins, with the properties \c name,
    \c description, \c required, \c enabled and \c error.
*/
auto ScriptApi::plugins() const -> QJSValue
{
  const auto specs = ExtensionSystem::PluginManager::plugins();
  auto &engine = m_engine->engine();
  auto result = engine.newArray(static_cast<uint>(specs.size()));
  for (auto i = 0; i < specs.size(); ++i) {
    const auto spec = specs.at(i);
    auto plugin = engine.newObject();
    plugin.setProperty(QLatin1String("name"), spec->name());
    plugin.setProperty(QLatin1String("description"), spec->description());
    plugin.setProperty(QLatin1String("required"), spec->isRequired());
    plugin.setProperty(QLatin1String("enabled"), spec->isEnabled());
    plugin.setProperty(QLatin1String("error"), spec->errorString());
    result.setProperty(static_cast<quint32>(i), plugin);
  }
  return result;
}

auto ScriptApi::currentWindow() const -> QJSValue
{
  return m_engine->wrap(Buffers::currentWindow());
}

auto ScriptApi::currentBuffer() const -> QJSValue
{
  return m_engine->wrap(Buffers::currentBuffer());
}

auto ScriptApi::openEditor(const QString &path, const int line, const int column) const -> QJSValue
{
  return m_engine->wrap(Buffers::openEditor(path, line, column));
}

auto ScriptApi::configPath(const QString &rel) const -> QString
{
  return ICore::configPath(rel);
}

/*!
    Returns the closest ancestor directory of \a path holding an entry that
    matches \a patterns, a glob or an array of globs, or an empty string.
*/
auto ScriptApi::parentContaining(const QString &path, const QJSValue &patterns) const -> QString
{
  return Utils::FileUtils::parentContaining(path, stringList(patterns));
}

auto ScriptApi::log(const QString &message) const -> void
{
  qCInfo(scriptsLog).noquote() << message;
}

} // namespace Eye::Plugin::Core
