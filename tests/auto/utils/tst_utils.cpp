// SPDX-License-Identifier: GPL-3.0-only WITH Qt-GPL-exception-1.0

#include <utils/fileutils.hpp>
#include <utils/link.hpp>
#include <utils/qtcassert.hpp>

#include <QDir>
#include <QTemporaryDir>
#include <QtTest>

using namespace Utils;

class tst_Utils : public QObject {
  Q_OBJECT

private slots:
  void linkFromString_data();
  void linkFromString();
  void absolutePath();
  void parentContaining();
  void saveAndRead();
  void readMissingFile();
  void saveIntoMissingDirectory();
  void softAssert();
};

void tst_Utils::linkFromString_data()
{
  QTest::addColumn<QString>("input");
  QTest::addColumn<QString>("path");
  QTest::addColumn<int>("line");
  QTest::addColumn<int>("column");

  QTest::newRow("plain") << "main.cpp" << "main.cpp" << 0 << 0;
  QTest::newRow("line") << "main.cpp:12" << "main.cpp" << 12 << 0;
  QTest::newRow("line and column") << "src/main.cpp:12:5" << "src/main.cpp" << 12 << 5;
  QTest::newRow("trailing colon") << "main.cpp:" << "main.cpp:" << 0 << 0;
  QTest::newRow("absolute") << "/tmp/a b.txt:3" << "/tmp/a b.txt" << 3 << 0;
}

void tst_Utils::linkFromString()
{
  QFETCH(QString, input);
  QFETCH(QString, path);
  QFETCH(int, line);
  QFETCH(int, column);

  const auto link = Link::fromString(input);
  QCOMPARE(link.target_file_path, path);
  QCOMPARE(link.target_line, line);
  QCOMPARE(link.target_column, column);
}

void tst_Utils::absolutePath()
{
  QCOMPARE(FileUtils::absolutePath(QString()), QString());
  QCOMPARE(FileUtils::absolutePath(QLatin1String("/tmp/../tmp/./x")), QLatin1String("/tmp/x"));
  QCOMPARE(FileUtils::absolutePath(QLatin1String("x")), QDir::current().absoluteFilePath(QLatin1String("x")));
}

void tst_Utils::parentContaining()
{
  QTemporaryDir dir;
  QVERIFY(dir.isValid());
  const QDir root(dir.path());
  QVERIFY(root.mkpath(QLatin1String("project/src/deep")));
  QVERIFY(root.mkpath(QLatin1String("project/.git")));

  const auto project = root.absoluteFilePath(QLatin1String("project"));
  const auto deep = root.absoluteFilePath(QLatin1String("project/src/deep"));
  QCOMPARE(FileUtils::parentContaining(deep, {QLatin1String(".git")}), project);
  QCOMPARE(FileUtils::parentContaining(deep, {QLatin1String("*.none"), QLatin1String("src")}), project);
  QCOMPARE(FileUtils::parentContaining(deep, {QLatin1String("deep")}), root.absoluteFilePath(QLatin1String("project/src")));
  QCOMPARE(FileUtils::parentContaining(deep, {QLatin1String("no-such-entry-anywhere.xyz")}), QString());
}

void tst_Utils::saveAndRead()
{
  QTemporaryDir dir;
  QVERIFY(dir.isValid());
  const auto path = dir.filePath(QLatin1String("file.txt"));

  {
    FileSaver saver(path);
    QVERIFY(saver.write("first\n"));
    QVERIFY(saver.finalize());
  }
  {
    FileSaver saver(path);
    QVERIFY(saver.write("second\n"));
    QVERIFY(saver.finalize());
  }

  FileReader reader;
  QString error;
  QVERIFY2(reader.fetch(path, &error), qPrintable(error));
  QCOMPARE(reader.data(), QByteArray("second\n"));
  QCOMPARE(QDir(dir.path()).entryList(QDir::Files), QStringList(QLatin1String("file.txt")));
}

void tst_Utils::readMissingFile()
{
  QTemporaryDir dir;
  FileReader reader;
  QString error;
  QVERIFY(!reader.fetch(dir.filePath(QLatin1String("missing")), &error));
  QVERIFY(!error.isEmpty());
}

void tst_Utils::saveIntoMissingDirectory()
{
  QTemporaryDir dir;
  FileSaver saver(dir.filePath(QLatin1String("no/such/dir/file.txt")));
  QVERIFY(!saver.write("data"));
  QString error;
  QVERIFY(!saver.finalize(&error));
  QVERIFY(!error.isEmpty());
}

void tst_Utils::softAssert()
{
  const auto two = 2;
  QTest::ignoreMessage(QtDebugMsg, QRegularExpression("SOFT ASSERT: \"two == 3\" in .*tst_utils\\.cpp:\\d+"));
  QVERIFY(!QTC_GUARD(two == 3));

  auto reached = false;
  QTest::ignoreMessage(QtDebugMsg, QRegularExpression("SOFT ASSERT: \"two < 0\""));
  [&] {
    QTC_ASSERT(two < 0, return);
    reached = true;
  }();
  QVERIFY(!reached);

  QVERIFY(QTC_GUARD(two == 2));
}

QTEST_GUILESS_MAIN(tst_Utils)

#include "tst_utils.moc"
