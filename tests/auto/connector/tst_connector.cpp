// SPDX-License-Identifier: GPL-3.0-only WITH Qt-GPL-exception-1.0

#include <extensionsystem/categorymixin.hpp>
#include <extensionsystem/connector.hpp>
#include <extensionsystem/eventconnector.hpp>

#include <QShortcut>
#include <QWidget>
#include <QtTest>

#include <stdexcept>

using namespace ExtensionSystem;

class CategoryWidget : public QWidget, public CategoryMixin {
  Q_OBJECT

public:
  explicit CategoryWidget(const QStringList &categories = {}) : CategoryMixin(this)
  {
    for (const auto &category : categories)
      addCategory(category);
  }

  auto fire(const QString &text, int number) -> void { emit somethingHappened(text, number); }
  auto pingReceivers() const -> int { return receivers(SIGNAL(pinged())); }

signals:
  void somethingHappened(const QString &text, int number);
  void pinged();
};

class tst_Connector : public QObject {
  Q_OBJECT

private slots:
  void cleanup();

  void connectedOnRegistration();
  void connectedOnCreation();
  void connectedOncePerObject();
  void categoryAddedAndRemoved();
  void signalArguments();
  void signalBySignature();
  void unknownSignal();
  void disabledListener();
  void destroyedObjectIsForgotten();
  void removedObjectIsDisconnected();
  void throwingCallback();
  void objectsMatching();
  void eventFilter();
  void shortcut();
  void sameNameReplaces();
  void removeListener();
};

void tst_Connector::cleanup()
{
  const auto connector = EventConnector::instance();
  for (const auto listener : connector->listeners())
    connector->removeListener(listener);
}

void tst_Connector::connectedOnRegistration()
{
  CategoryWidget a({"foo"});
  CategoryWidget b({"bar"});

  QList<QObject*> seen;
  registerSignal({"foo"}, "connected", [&](QObject *sender, const QVariantList &) { seen << sender; });
  QCOMPARE(seen, QList<QObject*>{&a});
}

void tst_Connector::connectedOnCreation()
{
  QList<QObject*> seen;
  registerSignal({"foo"}, "connected", [&](QObject *sender, const QVariantList &) { seen << sender; });

  CategoryWidget a;
  QVERIFY(seen.isEmpty());
  a.addCategory("foo");
  QCOMPARE(seen, QList<QObject*>{&a});

  CategoryWidget b({"foo"});
  QCOMPARE(seen, (QList<QObject*>{&a, &b}));
}

void tst_Connector::connectedOncePerObject()
{
  CategoryWidget a({"foo", "bar"});

  auto connected = 0;
  auto pinged = 0;
  registerSignal({"foo", "bar"}, "connected", [&](QObject *, const QVariantList &) { ++connected; });
  registerSignal({"foo", "bar"}, "pinged", [&](QObject *, const QVariantList &) { ++pinged; });
  a.addCategory("baz");
  emit a.pinged();

  QCOMPARE(connected, 1);
  QCOMPARE(pinged, 1);
}

void tst_Connector::categoryAddedAndRemoved()
{
  CategoryWidget a({"foo"});

  QStringList events;
  registerSignal({"foo", "bar"}, "connected", [&](QObject *, const QVariantList &) { events << "connected"; });
  registerSignal({"foo", "bar"}, "disconnected", [&](QObject *, const QVariantList &) { events << "disconnected"; });
  registerSignal({"foo", "bar"}, "pinged", [&](QObject *, const QVariantList &) { events << "pinged"; });

  a.addCategory("bar");
  a.removeCategory("foo");
  emit a.pinged();
  QCOMPARE(events, (QStringList{"connected", "pinged"}));

  a.removeCategory("bar");
  emit a.pinged();
  QCOMPARE(events, (QStringList{"connected", "pinged", "disconnected"}));
}

void tst_Connector::signalArguments()
{
  CategoryWidget a({"foo"});

  QObject *sender = nullptr;
  QVariantList arguments;
  registerSignal({"foo"}, "somethingHappened", [&](QObject *s, const QVariantList &args) {
    sender = s;
    arguments = args;
  });

  a.fire("hello", 42);
  QCOMPARE(sender, &a);
  QCOMPARE(arguments, (QVariantList{QString("hello"), 42}));
}

void tst_Connector::signalBySignature()
{
  CategoryWidget a({"foo"});

  auto count = 0;
  registerSignal({"foo"}, "somethingHappened(QString, int)", [&](QObject *, const QVariantList &) { ++count; });
  a.fire("x", 1);
  QCOMPARE(count, 1);
}

void tst_Connector::unknownSignal()
{
  CategoryWidget a({"foo"});

  QTest::ignoreMessage(QtWarningMsg, QRegularExpression("no signal noSuchSignal"));
  const auto listener = registerSignal({"foo"}, "noSuchSignal", [](QObject *, const QVariantList &) {});
  QVERIFY(listener);
}

void tst_Connector::disabledListener()
{
  CategoryWidget a({"foo"});

  auto count = 0;
  const auto listener = registerSignal({"foo"}, "pinged", [&](QObject *, const QVariantList &) { ++count; }, "counter");
  QVERIFY(setListenerEnabled("counter", false));
  QVERIFY(!listener->isEnabled());
  emit a.pinged();
  QCOMPARE(count, 0);

  QVERIFY(setListenerEnabled("counter", true));
  emit a.pinged();
  QCOMPARE(count, 1);

  QTest::ignoreMessage(QtWarningMsg, QRegularExpression("No listener named"));
  QVERIFY(!setListenerEnabled("nobody", true));
}

void tst_Connector::destroyedObjectIsForgotten()
{
  auto disconnected = 0;
  registerSignal({"foo"}, "disconnected", [&](QObject *, const QVariantList &) { ++disconnected; });

  {
    CategoryWidget a({"foo"});
    QCOMPARE(categoryObjects({"foo"}).size(), 1);
  }
  QVERIFY(categoryObjects({"foo"}).isEmpty());
  QCOMPARE(disconnected, 0);

  // Registering afterwards must not touch the dead object.
  auto connected = 0;
  registerSignal({"foo"}, "connected", [&](QObject *, const QVariantList &) { ++connected; });
  QCOMPARE(connected, 0);
}

void tst_Connector::removedObjectIsDisconnected()
{
  CategoryWidget a({"foo"});

  auto count = 0;
  registerSignal({"foo"}, "pinged", [&](QObject *, const QVariantList &) { ++count; });
  QCOMPARE(a.pingReceivers(), 1);

  EventConnector::instance()->removeObject(&a);
  QCOMPARE(a.pingReceivers(), 0);
  emit a.pinged();
  QCOMPARE(count, 0);
}

void tst_Connector::throwingCallback()
{
  CategoryWidget a({"foo"});

  auto count = 0;
  registerSignal({"foo"}, "pinged", [](QObject *, const QVariantList &) { throw std::runtime_error("broken"); }, "thrower");
  registerSignal({"foo"}, "pinged", [&](QObject *, const QVariantList &) { ++count; });

  QTest::ignoreMessage(QtWarningMsg, QRegularExpression("thrower.*broken"));
  emit a.pinged();
  QCOMPARE(count, 1);
}

void tst_Connector::objectsMatching()
{
  CategoryWidget a({"foo"});
  CategoryWidget b({"foo", "bar"});
  CategoryWidget c({"bar"});

  QCOMPARE(categoryObjects({"foo"}), (QList<QObject*>{&a, &b}));
  QCOMPARE(categoryObjects({"foo", "bar"}), QList<QObject*>{&b});
  QCOMPARE(categoryObjects<CategoryWidget>({"bar"}), (QList<CategoryWidget*>{&b, &c}));
  QVERIFY(categoryObjects({"baz"}).isEmpty());
}

void tst_Connector::eventFilter()
{
  CategoryWidget a({"foo"});

  QList<QEvent::Type> seen;
  registerEventFilter({"foo"}, {QEvent::KeyPress}, [&](QObject *object, QEvent *event) {
    seen << event->type();
    return object == &a;
  });

  QKeyEvent press(QEvent::KeyPress, Qt::Key_A, Qt::NoModifier, "a");
  QKeyEvent release(QEvent::KeyRelease, Qt::Key_A, Qt::NoModifier, "a");
  QCoreApplication::sendEvent(&a, &press);
  QCoreApplication::sendEvent(&a, &release);
  QCOMPARE(seen, QList<QEvent::Type>{QEvent::KeyPress});
}

void tst_Connector::shortcut()
{
  CategoryWidget a({"foo"});

  QList<QWidget*> activated;
  const auto listener = registerShortcut({"foo"}, QKeySequence("Ctrl+K"), Qt::WidgetShortcut, [&](QWidget *widget) { activated << widget; });
  const QPointer<QShortcut> shortcut = listener->shortcutFor(&a);
  QVERIFY(shortcut);
  QCOMPARE(shortcut->parent(), &a);
  QCOMPARE(shortcut->key(), QKeySequence("Ctrl+K"));

  emit shortcut->activated();
  QCOMPARE(activated, QList<QWidget*>{&a});

  a.removeCategory("foo");
  QVERIFY(!shortcut);
}

void tst_Connector::sameNameReplaces()
{
  CategoryWidget a({"foo"});

  QStringList calls;
  registerSignal({"foo"}, "pinged", [&](QObject *, const QVariantList &) { calls << "old"; }, "handler");
  registerSignal({"foo"}, "pinged", [&](QObject *, const QVariantList &) { calls << "new"; }, "handler");

  emit a.pinged();
  QCOMPARE(calls, QStringList{"new"});
  QCOMPARE(EventConnector::instance()->listeners().size(), 1);
}

void tst_Connector::removeListener()
{
  CategoryWidget a({"foo"});

  auto count = 0;
  const QPointer<Listener> listener = registerSignal({"foo"}, "pinged", [&](QObject *, const QVariantList &) { ++count; }, "pinger");
  QCOMPARE(ExtensionSystem::listener("pinger"), listener.data());

  EventConnector::instance()->removeListener(listener);
  QVERIFY(!listener);
  emit a.pinged();
  QCOMPARE(count, 0);
}

QTEST_MAIN(tst_Connector)

#include "tst_connector.moc"
