// SPDX-License-Identifier: GPL-3.0-only WITH Qt-GPL-exception-1.0

#pragma once

#include "extensionsystem_global.hpp"

#include <QSet>
#include <QString>

QT_BEGIN_NAMESPACE
class QObject;
QT_END_NAMESPACE

namespace ExtensionSystem {

/*!
  Mixed into QObject subclasses that listeners can attach to. The object is
  known to the EventConnector for its whole lifetime; adding or removing a
  category connects or disconnects the matching listeners.
*/
class EXTENSIONSYSTEM_EXPORT CategoryMixin {
public:
  explicit CategoryMixin(QObject *object);
  virtual ~CategoryMixin();

  auto categoryObject() const -> QObject* { return m_object; }
  auto categories() const -> const QSet<QString>& { return m_categories; }
  auto hasCategory(const QString &category) const -> bool { return m_categories.contains(category); }
  auto addCategory(const QString &category) -> void;
  auto removeCategory(const QString &category) -> void;

private:
  Q_DISABLE_COPY(CategoryMixin)

  QObject *m_object;
  QSet<QString> m_categories;
};

} // namespace ExtensionSystem
