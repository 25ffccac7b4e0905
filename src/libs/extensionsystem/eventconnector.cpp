// SPDX-License-Identifier: GPL-3.0-only WITH Qt-GPL-exception-1.0

#include "eventconnector.hpp"

#include "categorymixin.hpp"
#include "listener.hpp"

#include <utils/qtcassert.hpp>

Q_LOGGING_CATEGORY(connectorLog, "eye.connector", QtWarningMsg)

/*!
  \class ExtensionSystem::EventConnector
  \inmodule Eye

  \brief The EventConnector class connects listeners to the category objects
  they select.

  A listener is connected to an object as soon as they share at least one
  category, and disconnected once they share none. Each (listener, object)
  pair is connected at most once, whatever the number of shared categories.

  Objects register themselves through CategoryMixin and are forgotten
  without callbacks when they are destroyed.
*/

namespace ExtensionSystem {

Q_GLOBAL_STATIC(EventConnector, theConnector)

auto EventConnector::instance() -> EventConnector*
{
  return theConnector();
}

EventConnector::EventConnector() = default;

EventConnector::~EventConnector()
{
  qDeleteAll(m_listeners);
}

auto EventConnector::addListener(Listener *listener) -> void
{
  QTC_ASSERT(listener, return);
  QTC_ASSERT(!m_listeners.contains(listener), return);

  listener->setParent(this);
  m_listeners.append(listener);
  emit listenerAdded(listener);

  // Copy, callbacks may create or destroy category objects.
  const auto objects = m_objects;
  for (const auto object : objects) {
    if (!m_listeners.contains(listener))
      return;
    if (!m_objects.contains(object))
      continue;
    const auto common = object->categories() & listener->categories();
    if (!common.isEmpty())
      doConnect(object, listener, *common.constBegin());
  }
}

auto EventConnector::removeListener(Listener *listener) -> void
{
  QTC_ASSERT(listener, return);
  if (!m_listeners.removeOne(listener))
    return;

  emit aboutToRemoveListener(listener);
  for (const auto object : qAsConst(m_objects)) {
    const auto common = object->categories() & listener->categories();
    if (!common.isEmpty())
      doDisconnect(object, listener, *common.constBegin());
  }
  delete listener;
}

auto EventConnector::listener(const QString &name) const -> Listener*
{
  for (const auto listener : m_listeners) {
    if (listener->name() == name)
      return listener;
  }
  return nullptr;
}

auto EventConnector::addObject(CategoryMixin *object) -> void
{
  QTC_ASSERT(object, return);
  QTC_ASSERT(!m_objects.contains(object), return);

  m_objects.append(object);
  const auto listeners = m_listeners;
  for (const auto listener : listeners) {
    if (!m_objects.contains(object))
      return;
    if (!m_listeners.contains(listener))
      continue;
    const auto common = object->categories() & listener->categories();
    if (!common.isEmpty())
      doConnect(object, listener, *common.constBegin());
  }
}

auto EventConnector::removeObject(CategoryMixin *object) -> void
{
  if (!m_objects.removeOne(object))
    return;

  qCDebug(connectorLog) << "forgetting" << object->categoryObject();
  for (const auto listener : qAsConst(m_listeners))
    listener->objectRemoved(object->categoryObject());
}

auto EventConnector::categoryAdded(CategoryMixin *object, const QString &category) -> void
{
  QTC_ASSERT(object && m_objects.contains(object), return);

  const auto listeners = m_listeners;
  for (const auto listener : listeners) {
    if (!m_objects.contains(object))
      return;
    if (!m_listeners.contains(listener))
      continue;
    if (!listener->categories().contains(category))
      continue;
    // Already connected through another category.
    auto common = object->categories() & listener->categories();
    common.remove(category);
    if (common.isEmpty())
      doConnect(object, listener, category);
  }
}

auto EventConnector::categoryRemoved(CategoryMixin *object, const QString &category) -> void
{
  QTC_ASSERT(object && m_objects.contains(object), return);

  const auto listeners = m_listeners;
  for (const auto listener : listeners) {
    if (!m_objects.contains(object))
      return;
    if (!m_listeners.contains(listener))
      continue;
    if (!listener->categories().contains(category))
      continue;
    if ((object->categories() & listener->categories()).isEmpty())
      doDisconnect(object, listener, category);
  }
}

auto EventConnector::objectsMatching(const QSet<QString> &categories) const -> QList<QObject*>
{
  QList<QObject*> result;
  for (const auto object : m_objects) {
    if (object->categories().contains(categories))
      result.append(object->categoryObject());
  }
  return result;
}

auto EventConnector::doConnect(CategoryMixin *object, Listener *listener, const QString &category) const -> void
{
  qCDebug(connectorLog) << "connecting" << listener->name() << "to" << object->categoryObject() << "through" << category;
  listener->doConnect(object->categoryObject());
}

auto EventConnector::doDisconnect(CategoryMixin *object, Listener *listener, const QString &category) const -> void
{
  qCDebug(connectorLog) << "disconnecting" << listener->name() << "from" << object->categoryObject() << "through" << category;
  listener->doDisconnect(object->categoryObject());
}

} // namespace ExtensionSystem
