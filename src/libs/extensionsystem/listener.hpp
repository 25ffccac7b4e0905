// SPDX-License-Identifier: GPL-3.0-only WITH Qt-GPL-exception-1.0

#pragma once

#include "extensionsystem_global.hpp"

#include <QEvent>
#include <QHash>
#include <QKeySequence>
#include <QObject>
#include <QPointer>
#include <QSet>
#include <QVariantList>

#include <functional>

QT_BEGIN_NAMESPACE
class QShortcut;
class QWidget;
QT_END_NAMESPACE

namespace ExtensionSystem {

/*!
  A Listener is attached by the EventConnector to every category object
  whose categories intersect its own. Disabled listeners stay attached but
  never call back.
*/
class EXTENSIONSYSTEM_EXPORT Listener : public QObject {
  Q_OBJECT

public:
  Listener(const QString &name, const QSet<QString> &categories);
  ~Listener() override;

  auto name() const -> QString { return objectName(); }
  auto categories() const -> const QSet<QString>& { return m_categories; }
  auto isEnabled() const -> bool { return m_enabled; }
  auto setEnabled(bool enabled) -> void;

  virtual auto doConnect(QObject *object) -> void = 0;
  virtual auto doDisconnect(QObject *object) -> void = 0;
  // Called when a category object goes away without a disconnect.
  virtual auto objectRemoved(QObject *object) -> void { Q_UNUSED(object) }

signals:
  auto enabledChanged(bool enabled) -> void;

protected:
  auto invokeGuarded(const std::function<void()> &callback) const -> bool;

private:
  QSet<QString> m_categories;
  bool m_enabled = true;
};

class EXTENSIONSYSTEM_EXPORT SignalListener final : public Listener {
public:
  using Callback = std::function<void(QObject *sender, const QVariantList &arguments)>;

  SignalListener(const QString &name, const QSet<QString> &categories, const QString &signal, const Callback &callback);

  auto signalName() const -> QString { return m_signal; }
  auto doConnect(QObject *object) -> void override;
  auto doDisconnect(QObject *object) -> void override;
  auto objectRemoved(QObject *object) -> void override;

  auto qt_metacall(QMetaObject::Call call, int method_id, void **a) -> int override;

  static auto findSignal(const QMetaObject *meta_object, const QString &signal) -> int;

private:
  auto dispatch(QObject *sender, void **a) -> void;
  auto invokeCallback(QObject *sender, const QVariantList &arguments) -> void;

  QString m_signal;
  Callback m_callback;
  QHash<QObject*, int> m_signal_indexes;
};

class EXTENSIONSYSTEM_EXPORT EventFilterListener final : public Listener {
public:
  using Callback = std::function<bool(QObject *object, QEvent *event)>;

  EventFilterListener(const QString &name, const QSet<QString> &categories, const QSet<QEvent::Type> &types, const Callback &callback);

  auto eventTypes() const -> const QSet<QEvent::Type>& { return m_types; }
  auto doConnect(QObject *object) -> void override;
  auto doDisconnect(QObject *object) -> void override;
  auto objectRemoved(QObject *object) -> void override;

protected:
  auto eventFilter(QObject *watched, QEvent *event) -> bool override;

private:
  QSet<QEvent::Type> m_types;
  Callback m_callback;
  QHash<QObject*, QObject*> m_viewports;
};

class EXTENSIONSYSTEM_EXPORT ShortcutListener final : public Listener {
public:
  using Callback = std::function<void(QWidget *widget)>;

  ShortcutListener(const QString &name, const QSet<QString> &categories, const QKeySequence &keys, Qt::ShortcutContext context, const Callback &callback);

  auto keys() const -> QKeySequence { return m_keys; }
  auto shortcutFor(QObject *object) const -> QShortcut*;
  auto doConnect(QObject *object) -> void override;
  auto doDisconnect(QObject *object) -> void override;
  auto objectRemoved(QObject *object) -> void override;

private:
  QKeySequence m_keys;
  Qt::ShortcutContext m_context;
  Callback m_callback;
  QHash<QObject*, QPointer<QShortcut>> m_shortcuts;
};

} // namespace ExtensionSystem
