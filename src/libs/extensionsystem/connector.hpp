// SPDX-License-Identifier: GPL-3.0-only WITH Qt-GPL-exception-1.0

#pragma once

#include "extensionsystem_global.hpp"
#include "listener.hpp"

#include <QList>
#include <QStringList>

namespace ExtensionSystem {

// Registration helpers. The returned listener is owned by the EventConnector
// and replaces any listener of the same name. An empty name is replaced by a
// generated, unique one.

EXTENSIONSYSTEM_EXPORT auto listenerName(const QString &name, const QString &hint) -> QString;

EXTENSIONSYSTEM_EXPORT auto registerSignal(const QStringList &categories, const QString &signal, const SignalListener::Callback &callback, const QString &name = {}) -> SignalListener*;
EXTENSIONSYSTEM_EXPORT auto registerEventFilter(const QStringList &categories, const QSet<QEvent::Type> &types, const EventFilterListener::Callback &callback, const QString &name = {}) -> EventFilterListener*;
EXTENSIONSYSTEM_EXPORT auto registerShortcut(const QStringList &categories, const QKeySequence &keys, Qt::ShortcutContext context, const ShortcutListener::Callback &callback, const QString &name = {}) -> ShortcutListener*;

// Called once for every editor, respectively window, as soon as it exists.
EXTENSIONSYSTEM_EXPORT auto defaultEditorConfig(const std::function<void(QObject *)> &callback, const QString &name = {}) -> SignalListener*;
EXTENSIONSYSTEM_EXPORT auto defaultWindowConfig(const std::function<void(QObject *)> &callback, const QString &name = {}) -> SignalListener*;

EXTENSIONSYSTEM_EXPORT auto categoryObjects(const QStringList &categories) -> QList<QObject*>;
EXTENSIONSYSTEM_EXPORT auto listener(const QString &name) -> Listener*;
EXTENSIONSYSTEM_EXPORT auto setListenerEnabled(const QString &name, bool enabled) -> bool;

template <typename T>
auto categoryObjects(const QStringList &categories) -> QList<T*>
{
  QList<T*> result;
  for (const auto object : categoryObjects(categories)) {
    if (const auto t = qobject_cast<T*>(object))
      result.append(t);
  }
  return result;
}

} // namespace ExtensionSystem
