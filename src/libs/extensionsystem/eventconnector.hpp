// SPDX-License-Identifier: GPL-3.0-only WITH Qt-GPL-exception-1.0

#pragma once

#include "extensionsystem_global.hpp"

#include <QList>
#include <QObject>
#include <QSet>

namespace ExtensionSystem {

class CategoryMixin;
class Listener;

/*!
  The EventConnector matches listeners to category objects. It owns the
  listeners and tracks the live category objects, both in registration
  order.
*/
class EXTENSIONSYSTEM_EXPORT EventConnector : public QObject {
  Q_OBJECT

public:
  static auto instance() -> EventConnector*;

  EventConnector();
  ~EventConnector() override;

  auto addListener(Listener *listener) -> void;
  auto removeListener(Listener *listener) -> void;
  auto listeners() const -> QList<Listener*> { return m_listeners; }
  auto listener(const QString &name) const -> Listener*;

  auto addObject(CategoryMixin *object) -> void;
  auto removeObject(CategoryMixin *object) -> void;
  auto categoryAdded(CategoryMixin *object, const QString &category) -> void;
  auto categoryRemoved(CategoryMixin *object, const QString &category) -> void;

  auto objects() const -> QList<CategoryMixin*> { return m_objects; }
  auto objectsMatching(const QSet<QString> &categories) const -> QList<QObject*>;

signals:
  auto listenerAdded(ExtensionSystem::Listener *listener) -> void;
  auto aboutToRemoveListener(ExtensionSystem::Listener *listener) -> void;

private:
  auto doConnect(CategoryMixin *object, Listener *listener, const QString &category) const -> void;
  auto doDisconnect(CategoryMixin *object, Listener *listener, const QString &category) const -> void;

  QList<Listener*> m_listeners;
  QList<CategoryMixin*> m_objects;
};

} // namespace ExtensionSystem
