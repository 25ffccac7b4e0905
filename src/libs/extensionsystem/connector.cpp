// SPDX-License-Identifier: GPL-3.0-only WITH Qt-GPL-exception-1.0

#include "connector.hpp"
#include "eventconnector.hpp"

#include <utils/qtcassert.hpp>

namespace ExtensionSystem {

static auto toSet(const QStringList &categories) -> QSet<QString>
{
  return QSet<QString>(categories.cbegin(), categories.cend());
}

auto listenerName(const QString &name, const QString &hint) -> QString
{
  if (!name.isEmpty())
    return name;

  static auto counter = 0;
  return QString::fromLatin1("%1-%2").arg(hint).arg(++counter);
}

template <typename T>
static auto add(T *listener) -> T*
{
  const auto connector = EventConnector::instance();
  QTC_ASSERT(connector, delete listener; return nullptr);
  // A listener registered again under the same name replaces the old one.
  if (const auto old = connector->listener(listener->name())) {
    qCDebug(connectorLog) << "replacing listener" << old->name();
    connector->removeListener(old);
  }
  connector->addListener(listener);
  return listener;
}

auto registerSignal(const QStringList &categories, const QString &signal, const SignalListener::Callback &callback, const QString &name) -> SignalListener*
{
  return add(new SignalListener(listenerName(name, signal), toSet(categories), signal, callback));
}

auto registerEventFilter(const QStringList &categories, const QSet<QEvent::Type> &types, const EventFilterListener::Callback &callback, const QString &name) -> EventFilterListener*
{
  return add(new EventFilterListener(listenerName(name, QLatin1String("eventFilter")), toSet(categories), types, callback));
}

auto registerShortcut(const QStringList &categories, const QKeySequence &keys, const Qt::ShortcutContext context, const ShortcutListener::Callback &callback, const QString &name) -> ShortcutListener*
{
  return add(new ShortcutListener(listenerName(name, QLatin1String("shortcut")), toSet(categories), keys, context, callback));
}

auto defaultEditorConfig(const std::function<void(QObject *)> &callback, const QString &name) -> SignalListener*
{
  return registerSignal({QLatin1String("editor")}, QLatin1String("connected"), [callback](QObject *editor, const QVariantList &) { callback(editor); }, listenerName(name, QLatin1String("defaultEditorConfig")));
}

auto defaultWindowConfig(const std::function<void(QObject *)> &callback, const QString &name) -> SignalListener*
{
  return registerSignal({QLatin1String("window")}, QLatin1String("connected"), [callback](QObject *window, const QVariantList &) { callback(window); }, listenerName(name, QLatin1String("defaultWindowConfig")));
}

auto categoryObjects(const QStringList &categories) -> QList<QObject*>
{
  const auto connector = EventConnector::instance();
  QTC_ASSERT(connector, return {});
  return connector->objectsMatching(toSet(categories));
}

auto listener(const QString &name) -> Listener*
{
  const auto connector = EventConnector::instance();
  QTC_ASSERT(connector, return nullptr);
  return connector->listener(name);
}

auto setListenerEnabled(const QString &name, const bool enabled) -> bool
{
  const auto l = listener(name);
  if (!l) {
    qCWarning(connectorLog).noquote() << "No listener named" << name;
    return false;
  }
  l->setEnabled(enabled);
  return true;
}

} // namespace ExtensionSystem
