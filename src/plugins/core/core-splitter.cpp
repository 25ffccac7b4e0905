// SPDX-License-Identifier: GPL-3.0-only WITH Qt-GPL-exception-1.0

#include "core-splitter.hpp"

#include "core-constants.hpp"

#include <utils/qtcassert.hpp>

#include <QPaintEvent>
#include <QPainter>
#include <QPointer>
#include <QSplitterHandle>
#include <QStackedLayout>

#include <functional>

/*!
    \class Eye::Plugin::Core::SplitManager
    \inheaderfile core/core-splitter.hpp
    \inmodule Eye

    \brief The SplitManager class lays out widgets in nested splitters of
    any depth, in the \c splitmanager category.

    For example, tab widgets can be laid out this way:

    \code
    +--+----+----+
    |  |    |    |
    +--+----+    |
    |       |    |
    |       +----+
    |       |    |
    +-------+----+
    \endcode

    The levels are Splitter widgets created and removed as needed, the root
    level is horizontal and always exists.
*/

namespace Eye::Plugin::Core {
namespace Internal {

class MiniSplitterHandle final : public QSplitterHandle {
public:
  MiniSplitterHandle(const Qt::Orientation orientation, QSplitter *parent) : QSplitterHandle(orientation, parent)
  {
    setMask(QRegion(contentsRect()));
    setAttribute(Qt::WA_MouseNoMask, true);
  }

protected:
  auto resizeEvent(QResizeEvent *event) -> void override;
  auto paintEvent(QPaintEvent *event) -> void override;
};

auto MiniSplitterHandle::resizeEvent(QResizeEvent *event) -> void
{
  if (orientation() == Qt::Horizontal)
    setContentsMargins(2, 0, 2, 0);
  else
    setContentsMargins(0, 2, 0, 2);

  setMask(QRegion(contentsRect()));
  QSplitterHandle::resizeEvent(event);
}

auto MiniSplitterHandle::paintEvent(QPaintEvent *event) -> void
{
  QPainter painter(this);
  painter.fillRect(event->rect(), palette().color(QPalette::Dark));
}

} // namespace Internal

Splitter::Splitter(const Qt::Orientation orientation, QWidget *parent) : QSplitter(orientation, parent), CategoryMixin(this)
{
  setHandleWidth(1);
  setChildrenCollapsible(false);
  setProperty("minisplitter", true);

  addCategory(QLatin1String(Constants::C_SPLITTER));
}

Splitter::~Splitter() = default;

auto Splitter::createHandle() -> QSplitterHandle*
{
  return new Internal::MiniSplitterHandle(orientation(), this);
}

SplitManager::SplitManager(QWidget *parent) : QWidget(parent), CategoryMixin(this), m_root(new Splitter(Qt::Horizontal))
{
  const auto layout = new QStackedLayout(this);
  layout->addWidget(m_root);

  addCategory(QLatin1String(Constants::C_SPLITMANAGER));
}

SplitManager::~SplitManager() = default;

/*!
    Returns the split manager containing \a widget, at any depth.
*/
auto SplitManager::parentManager(const QWidget *widget) -> SplitManager*
{
  for (auto w = widget ? widget->parentWidget() : nullptr; w; w = w->parentWidget()) {
    if (const auto manager = qobject_cast<SplitManager*>(w))
      return manager;
  }
  return nullptr;
}

/*!
    Inserts \a widget next to \a location, or in the root splitter when
    \a location is \c nullptr. If the splitter holding \a location has a
    different \a orientation, a new splitter takes the place of
    \a location and holds both widgets.
*/
auto SplitManager::splitAt(QWidget *location, const Qt::Orientation orientation, QWidget *widget) -> void
{
  QTC_ASSERT(widget, return);

  Splitter *parent;
  int pos;
  if (location) {
    parent = qobject_cast<Splitter*>(location->parentWidget());
    QTC_ASSERT(parent, return);
    pos = parent->indexOf(location);
  } else {
    parent = m_root;
    pos = 0;
  }

  if (parent->orientation() == orientation) {
    parent->insertWidget(pos + 1, widget);
  } else {
    const auto split = new Splitter(orientation);
    parent->insertWidget(pos, split);
    if (location)
      split->addWidget(location);
    split->addWidget(widget);
  }
}

/*!
    Takes \a widget out of the layout, the caller becomes responsible for
    it. Splitters left empty are deleted, except the root.
*/
auto SplitManager::removeWidget(QWidget *widget) -> void
{
  QTC_ASSERT(widget, return);

  const auto parent = qobject_cast<Splitter*>(widget->parentWidget());
  widget->setParent(nullptr);
  if (parent && parent != m_root && !parent->count()) {
    removeWidget(parent);
    parent->deleteLater();
  }
}

/*!
    Gives the same size to all widgets of \a splitter.
*/
auto SplitManager::balanceSplits(Splitter *splitter) -> void
{
  QTC_ASSERT(splitter, return);
  splitter->setSizes(QList<int>(splitter->count(), 1));
}

auto SplitManager::balanceSplitsRecursive() -> void
{
  for (const auto splitter : allSplitters())
    balanceSplits(splitter);
}

auto SplitManager::allSplitters() const -> QList<Splitter*>
{
  QList<Splitter*> result{m_root};
  for (auto i = 0; i < result.size(); ++i) {
    const auto splitter = result.at(i);
    for (auto j = 0; j < splitter->count(); ++j) {
      if (const auto sub = qobject_cast<Splitter*>(splitter->widget(j)))
        result.append(sub);
    }
  }
  return result;
}

/*!
    Returns the widgets laid out, splitters excluded, in depth-first order.
*/
auto SplitManager::allChildren() const -> QList<QWidget*>
{
  QList<QWidget*> result;
  const std::function<void(const Splitter *)> collect = [&](const Splitter *splitter) {
    for (auto i = 0; i < splitter->count(); ++i) {
      const auto w = splitter->widget(i);
      if (const auto sub = qobject_cast<Splitter*>(w))
        collect(sub);
      else
        result.append(w);
    }
  };
  collect(m_root);
  return result;
}

/*!
    Asks every widget laid out to close, stopping at the first refusal.
    Widgets without a \c requestClose() slot always agree.
*/
auto SplitManager::requestClose() -> bool
{
  QList<QPointer<QWidget>> children;
  for (const auto w : allChildren())
    children.append(w);

  for (const auto &child : qAsConst(children)) {
    if (!child)
      continue;
    auto accepted = true;
    if (child->metaObject()->indexOfMethod("requestClose()") >= 0)
      QMetaObject::invokeMethod(child.data(), "requestClose", Qt::DirectConnection, Q_RETURN_ARG(bool, accepted));
    if (!accepted)
      return false;
  }
  return true;
}

} // namespace Eye::Plugin::Core
