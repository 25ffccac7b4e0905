// SPDX-License-Identifier: GPL-3.0-only WITH Qt-GPL-exception-1.0

#pragma once

#include "core-global.hpp"

#include <extensionsystem/categorymixin.hpp>

#include <QSplitter>

QT_BEGIN_NAMESPACE
class QSplitterHandle;
QT_END_NAMESPACE

namespace Eye::Plugin::Core {

/*! A splitter level with 1-pixel wide handles, in the \c splitter category. */
class CORE_EXPORT Splitter : public QSplitter, public ExtensionSystem::CategoryMixin {
  Q_OBJECT

public:
  explicit Splitter(Qt::Orientation orientation, QWidget *parent = nullptr);
  ~Splitter() override;

protected:
  auto createHandle() -> QSplitterHandle* override;
};

class CORE_EXPORT SplitManager : public QWidget, public ExtensionSystem::CategoryMixin {
  Q_OBJECT

public:
  explicit SplitManager(QWidget *parent = nullptr);
  ~SplitManager() override;

  static auto parentManager(const QWidget *widget) -> SplitManager*;

  auto root() const -> Splitter* { return m_root; }
  auto splitAt(QWidget *location, Qt::Orientation orientation, QWidget *widget) -> void;
  auto removeWidget(QWidget *widget) -> void;
  auto balanceSplits(Splitter *splitter) -> void;
  auto allChildren() const -> QList<QWidget*>;
  auto allSplitters() const -> QList<Splitter*>;

public slots:
  auto balanceSplitsRecursive() -> void;
  auto requestClose() -> bool;

private:
  Splitter *m_root;
};

} // namespace Eye::Plugin::Core
