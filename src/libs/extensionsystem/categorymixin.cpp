// SPDX-License-Identifier: GPL-3.0-only WITH Qt-GPL-exception-1.0

#include "categorymixin.hpp"
#include "eventconnector.hpp"

#include <utils/qtcassert.hpp>

namespace ExtensionSystem {

CategoryMixin::CategoryMixin(QObject *object) : m_object(object)
{
  QTC_CHECK(m_object);
  if (const auto connector = EventConnector::instance())
    connector->addObject(this);
}

CategoryMixin::~CategoryMixin()
{
  if (const auto connector = EventConnector::instance())
    connector->removeObject(this);
}

auto CategoryMixin::addCategory(const QString &category) -> void
{
  if (m_categories.contains(category))
    return;

  m_categories.insert(category);
  if (const auto connector = EventConnector::instance())
    connector->categoryAdded(this, category);
}

auto CategoryMixin::removeCategory(const QString &category) -> void
{
  if (!m_categories.remove(category))
    return;

  if (const auto connector = EventConnector::instance())
    connector->categoryRemoved(this, category);
}

} // namespace ExtensionSystem
