// SPDX-License-Identifier: GPL-3.0-only WITH Qt-GPL-exception-1.0

#include "listener.hpp"

#include <utils/qtcassert.hpp>

#include <QAbstractScrollArea>
#include <QMetaMethod>
#include <QShortcut>
#include <QWidget>

#include <exception>

/*!
  \class ExtensionSystem::Listener
  \inmodule Eye

  \brief The Listener class is the common base of all callback descriptors
  kept by the EventConnector.

  A listener carries a name, used by scripts to find it again, a set of
  categories selecting the objects it is attached to, and an enabled flag.
*/

namespace ExtensionSystem {

static constexpr char connected_signal[] = "connected";
static constexpr char disconnected_signal[] = "disconnected";

Listener::Listener(const QString &name, const QSet<QString> &categories) : m_categories(categories)
{
  setObjectName(name);
}

Listener::~Listener() = default;

auto Listener::setEnabled(const bool enabled) -> void
{
  if (m_enabled == enabled)
    return;

  m_enabled = enabled;
  qCDebug(connectorLog) << "listener" << name() << (enabled ? "enabled" : "disabled");
  emit enabledChanged(enabled);
}

/*!
  Runs \a callback, logging instead of propagating a standard exception so
  that the remaining listeners still get their turn. Returns whether the
  callback completed.
*/
auto Listener::invokeGuarded(const std::function<void()> &callback) const -> bool
{
  try {
    callback();
    return true;
  } catch (const std::exception &e) {
    qCWarning(connectorLog).noquote() << "Callback of listener" << name() << "failed:" << e.what();
  }
  return false;
}

SignalListener::SignalListener(const QString &name, const QSet<QString> &categories, const QString &signal, const Callback &callback) : Listener(name, categories), m_signal(signal), m_callback(callback) {}

/*!
  Returns the index of \a signal in \a meta_object, or -1. A plain name
  matches the first signal declared with that name, a name containing a
  parenthesis is matched as a full signature.
*/
auto SignalListener::findSignal(const QMetaObject *meta_object, const QString &signal) -> int
{
  QTC_ASSERT(meta_object, return -1);

  if (signal.contains(QLatin1Char('('))) {
    const auto normalized = QMetaObject::normalizedSignature(signal.toLatin1().constData());
    return meta_object->indexOfSignal(normalized.constData());
  }

  const auto name = signal.toLatin1();
  for (auto i = 0; i < meta_object->methodCount(); ++i) {
    const auto method = meta_object->method(i);
    if (method.methodType() == QMetaMethod::Signal && method.name() == name)
      return i;
  }
  return -1;
}

auto SignalListener::doConnect(QObject *object) -> void
{
  QTC_ASSERT(object, return);

  if (m_signal == QLatin1String(connected_signal)) {
    invokeCallback(object, {});
    return;
  }

  if (m_signal == QLatin1String(disconnected_signal))
    return;

  const auto index = findSignal(object->metaObject(), m_signal);
  if (index < 0) {
    qCWarning(connectorLog).noquote() << "Listener" << name() << ": no signal" << m_signal << "in" << object->metaObject()->className();
    return;
  }

  // The slot index is one past the methods of Listener, it does not exist
  // in the meta object and is dispatched by qt_metacall below.
  if (!QMetaObject::connect(object, index, this, Listener::staticMetaObject.methodCount(), Qt::DirectConnection)) {
    qCWarning(connectorLog).noquote() << "Listener" << name() << ": cannot connect to" << m_signal;
    return;
  }
  m_signal_indexes.insert(object, index);
}

auto SignalListener::doDisconnect(QObject *object) -> void
{
  QTC_ASSERT(object, return);

  if (m_signal == QLatin1String(disconnected_signal)) {
    invokeCallback(object, {});
    return;
  }

  const auto it = m_signal_indexes.find(object);
  if (it == m_signal_indexes.end())
    return;

  QMetaObject::disconnect(object, it.value(), this, Listener::staticMetaObject.methodCount());
  m_signal_indexes.erase(it);
}

auto SignalListener::objectRemoved(QObject *object) -> void
{
  const auto it = m_signal_indexes.find(object);
  if (it == m_signal_indexes.end())
    return;

  // The object may still emit while it is being destroyed.
  QMetaObject::disconnect(object, it.value(), this, Listener::staticMetaObject.methodCount());
  m_signal_indexes.erase(it);
}

auto SignalListener::qt_metacall(const QMetaObject::Call call, int method_id, void **a) -> int
{
  method_id = Listener::qt_metacall(call, method_id, a);
  if (method_id < 0)
    return method_id;

  if (call == QMetaObject::InvokeMetaMethod) {
    if (method_id == 0)
      dispatch(sender(), a);
    --method_id;
  }
  return method_id;
}

auto SignalListener::dispatch(QObject *sender, void **a) -> void
{
  QTC_ASSERT(sender, return);

  const auto index = m_signal_indexes.value(sender, -1);
  QTC_ASSERT(index >= 0, return);

  const auto method = sender->metaObject()->method(index);
  QVariantList arguments;
  arguments.reserve(method.parameterCount());
  for (auto i = 0; i < method.parameterCount(); ++i) {
    const auto type = method.parameterType(i);
    if (type == QMetaType::UnknownType || type == QMetaType::Void)
      arguments.append(QVariant());
    else
      arguments.append(QVariant(type, a[i + 1]));
  }
  invokeCallback(sender, arguments);
}

auto SignalListener::invokeCallback(QObject *sender, const QVariantList &arguments) -> void
{
  if (!isEnabled() || !m_callback)
    return;

  qCDebug(connectorLog) << "calling" << name() << "for" << m_signal << "of" << sender;
  invokeGuarded([&] { m_callback(sender, arguments); });
}

EventFilterListener::EventFilterListener(const QString &name, const QSet<QString> &categories, const QSet<QEvent::Type> &types, const Callback &callback) : Listener(name, categories), m_types(types), m_callback(callback) {}

/*!
  Installs the filter on \a object. A scroll area gets its mouse events
  through its viewport, so the filter goes on the viewport as well and
  reports the scroll area as the watched object.
*/
auto EventFilterListener::doConnect(QObject *object) -> void
{
  QTC_ASSERT(object, return);
  object->installEventFilter(this);
  if (const auto area = qobject_cast<QAbstractScrollArea*>(object)) {
    area->viewport()->installEventFilter(this);
    m_viewports.insert(area->viewport(), object);
  }
}

auto EventFilterListener::doDisconnect(QObject *object) -> void
{
  QTC_ASSERT(object, return);
  object->removeEventFilter(this);
  for (auto it = m_viewports.begin(); it != m_viewports.end();) {
    if (it.value() == object) {
      it.key()->removeEventFilter(this);
      it = m_viewports.erase(it);
    } else {
      ++it;
    }
  }
}

auto EventFilterListener::objectRemoved(QObject *object) -> void
{
  for (auto it = m_viewports.begin(); it != m_viewports.end();) {
    if (it.value() == object)
      it = m_viewports.erase(it);
    else
      ++it;
  }
}

auto EventFilterListener::eventFilter(QObject *watched, QEvent *event) -> bool
{
  if (!isEnabled() || !m_callback || !m_types.contains(event->type()))
    return false;

  const auto object = m_viewports.value(watched, watched);
  auto consumed = false;
  invokeGuarded([&] { consumed = m_callback(object, event); });
  return consumed;
}

ShortcutListener::ShortcutListener(const QString &name, const QSet<QString> &categories, const QKeySequence &keys, const Qt::ShortcutContext context, const Callback &callback) : Listener(name, categories), m_keys(keys), m_context(context), m_callback(callback) {}

auto ShortcutListener::shortcutFor(QObject *object) const -> QShortcut*
{
  return m_shortcuts.value(object);
}

auto ShortcutListener::doConnect(QObject *object) -> void
{
  const auto widget = qobject_cast<QWidget*>(object);
  if (!widget) {
    qCWarning(connectorLog).noquote() << "Listener" << name() << ": shortcuts need a widget, got" << object;
    return;
  }

  const auto shortcut = new QShortcut(m_keys, widget);
  shortcut->setContext(m_context);
  connect(shortcut, &QShortcut::activated, this, [this, widget] {
    if (!isEnabled() || !m_callback)
      return;
    invokeGuarded([&] { m_callback(widget); });
  });
  m_shortcuts.insert(object, shortcut);
}

auto ShortcutListener::doDisconnect(QObject *object) -> void
{
  delete m_shortcuts.take(object).data();
}

auto ShortcutListener::objectRemoved(QObject *object) -> void
{
  m_shortcuts.remove(object);
}

} // namespace ExtensionSystem
