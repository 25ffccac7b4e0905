// SPDX-License-Identifier: GPL-3.0-only WITH Qt-GPL-exception-1.0

#include <core/core-editor.hpp>

#include <QFile>
#include <QPointer>
#include <QTemporaryDir>
#include <QTextDocument>
#include <QtTest>

using namespace Eye::Plugin::Core;

class TestEditor : public Editor {
public:
  QMessageBox::StandardButton answer = QMessageBox::Cancel;
  QString save_path;
  int asked = 0;

protected:
  auto askUnsavedChanges() -> QMessageBox::StandardButton override
  {
    ++asked;
    return answer;
  }

  auto askSavePath() -> QString override { return save_path; }
};

static auto writeFile(const QString &path, const QByteArray &data) -> bool
{
  QFile file(path);
  if (!file.open(QIODevice::WriteOnly))
    return false;
  return file.write(data) == data.size();
}

static auto readFile(const QString &path) -> QByteArray
{
  QFile file(path);
  if (!file.open(QIODevice::ReadOnly))
    return {};
  return file.readAll();
}

class tst_Editor : public QObject {
  Q_OBJECT

private slots:
  void init();

  void title();
  void openFile();
  void openMissingFile();
  void saveFile();
  void saveFileAs();
  void saveCanceled();
  void closeFile_data();
  void closeFile();
  void reloadFile();
  void sharedDocument();
  void sharedDocumentReleasesOwn();
  void gotoLine();
  void encoding();
  void searchExpression_data();
  void searchExpression();
  void findForwardAndBackward();

private:
  std::unique_ptr<QTemporaryDir> m_dir;
};

void tst_Editor::init()
{
  m_dir = std::make_unique<QTemporaryDir>();
  QVERIFY(m_dir->isValid());
}

void tst_Editor::title()
{
  TestEditor editor;
  QSignalSpy changed(&editor, &Editor::titleChanged);
  QCOMPARE(editor.title(), QString("<untitled>"));

  editor.setPlainText("text");
  QVERIFY(editor.isModified());
  QCOMPARE(editor.title(), QString("<untitled>*"));
  QVERIFY(changed.count() > 0);

  const auto path = m_dir->filePath("notes.txt");
  QVERIFY(editor.saveFileAs(path));
  QCOMPARE(editor.title(), QString("notes.txt"));
  QCOMPARE(editor.windowTitle(), QString("notes.txt"));
}

void tst_Editor::openFile()
{
  const auto path = m_dir->filePath("a.txt");
  QVERIFY(writeFile(path, "line 1\nline 2\n"));

  TestEditor editor;
  QSignalSpy about(&editor, &Editor::fileAboutToBeOpened);
  QSignalSpy opened(&editor, &Editor::fileOpened);
  QVERIFY(editor.openFile(path));

  QCOMPARE(editor.toPlainText(), QString("line 1\nline 2"));
  QCOMPARE(editor.path(), path);
  QVERIFY(!editor.isModified());
  QCOMPARE(about.count(), 1);
  QCOMPARE(opened.count(), 1);
  QCOMPARE(opened.first().first().toString(), path);
}

void tst_Editor::openMissingFile()
{
  TestEditor editor;
  editor.setPlainText("kept");
  editor.setModified(false);

  QTest::ignoreMessage(QtWarningMsg, QRegularExpression("missing.txt"));
  QVERIFY(!editor.openFile(m_dir->filePath("missing.txt")));
  QCOMPARE(editor.toPlainText(), QString("kept"));
  QVERIFY(editor.path().isEmpty());
}

void tst_Editor::saveFile()
{
  const auto path = m_dir->filePath("b.txt");
  QVERIFY(writeFile(path, "x\n"));

  TestEditor editor;
  QVERIFY(editor.openFile(path));
  editor.setRemoveTrailingWhitespace(true);
  editor.setPlainText("a  \nb\t\nc");

  QSignalSpy about(&editor, &Editor::fileAboutToBeSaved);
  QSignalSpy saved(&editor, &Editor::fileSaved);
  QSignalSpy saved_as(&editor, &Editor::fileSavedAs);
  QVERIFY(editor.saveFile());

  QCOMPARE(readFile(path), QByteArray("a\nb\nc\n"));
  QVERIFY(!editor.isModified());
  QCOMPARE(about.count(), 1);
  QCOMPARE(saved.count(), 1);
  QCOMPARE(saved_as.count(), 0);

  editor.setUseFinalNewline(false);
  editor.setPlainText("no newline");
  QVERIFY(editor.saveFile());
  QCOMPARE(readFile(path), QByteArray("no newline"));
}

void tst_Editor::saveFileAs()
{
  TestEditor editor;
  editor.setPlainText("content");
  editor.save_path = m_dir->filePath("new.txt");

  QSignalSpy saved_as(&editor, &Editor::fileSavedAs);
  QVERIFY(editor.saveFile());
  QCOMPARE(editor.path(), editor.save_path);
  QCOMPARE(saved_as.count(), 1);
  QCOMPARE(readFile(editor.save_path), QByteArray("content\n"));
}

void tst_Editor::saveCanceled()
{
  TestEditor editor;
  editor.setPlainText("content");
  QVERIFY(!editor.saveFile());
  QVERIFY(editor.isModified());
}

void tst_Editor::closeFile_data()
{
  QTest::addColumn<bool>("modified");
  QTest::addColumn<int>("answer");
  QTest::addColumn<bool>("closed");
  QTest::addColumn<int>("asked");

  QTest::newRow("unmodified") << false << int(QMessageBox::Cancel) << true << 0;
  QTest::newRow("cancel") << true << int(QMessageBox::Cancel) << false << 1;
  QTest::newRow("discard") << true << int(QMessageBox::Discard) << true << 1;
  QTest::newRow("save") << true << int(QMessageBox::Save) << true << 1;
}

void tst_Editor::closeFile()
{
  QFETCH(bool, modified);
  QFETCH(int, answer);
  QFETCH(bool, closed);
  QFETCH(int, asked);

  const auto path = m_dir->filePath("c.txt");
  QVERIFY(writeFile(path, "old\n"));

  TestEditor editor;
  QVERIFY(editor.openFile(path));
  if (modified)
    editor.setPlainText("new");
  editor.answer = static_cast<QMessageBox::StandardButton>(answer);

  QCOMPARE(editor.closeFile(), closed);
  QCOMPARE(editor.asked, asked);
  if (answer == QMessageBox::Save && modified)
    QCOMPARE(readFile(path), QByteArray("new\n"));
}

void tst_Editor::reloadFile()
{
  const auto path = m_dir->filePath("d.txt");
  QVERIFY(writeFile(path, "one\ntwo\nthree\n"));

  TestEditor editor;
  QVERIFY(editor.openFile(path));
  editor.goto1(2, 3);

  QVERIFY(writeFile(path, "ONE\nTWO\nTHREE\nFOUR\n"));
  QVERIFY(editor.reloadFile());
  QCOMPARE(editor.toPlainText(), QString("ONE\nTWO\nTHREE\nFOUR"));
  QVERIFY(!editor.isModified());
  QCOMPARE(editor.cursorLine(), 1);
  QCOMPARE(editor.cursorColumn(), 2);

  editor.undo();
  QCOMPARE(editor.toPlainText(), QString("one\ntwo\nthree"));
}

void tst_Editor::sharedDocument()
{
  const auto path = m_dir->filePath("e.txt");
  QVERIFY(writeFile(path, "shared\n"));

  auto first = std::make_unique<TestEditor>();
  QVERIFY(first->openFile(path));

  TestEditor second;
  QVERIFY(second.openDocument(first.get()));
  QCOMPARE(second.document(), first->document());
  QCOMPARE(second.path(), path);

  first->appendPlainText("more");
  QVERIFY(second.isModified());
  QCOMPARE(second.toPlainText(), QString("shared\nmore"));

  first.reset();
  QCOMPARE(second.toPlainText(), QString("shared\nmore"));
}

void tst_Editor::sharedDocumentReleasesOwn()
{
  TestEditor first;
  first.setPlainText("first");

  TestEditor second;
  const QPointer<QTextDocument> own = second.document();
  QTextDocument *shown_when_destroyed = nullptr;
  connect(own.data(), &QObject::destroyed, this, [&] { shown_when_destroyed = second.document(); });

  QVERIFY(second.openDocument(&first));
  QVERIFY(!own);
  QCOMPARE(shown_when_destroyed, first.document());
  QCOMPARE(second.toPlainText(), QString("first"));
}

void tst_Editor::gotoLine()
{
  TestEditor editor;
  editor.setPlainText("abc\ndefgh\ni");

  QSignalSpy jumped(&editor, &Editor::positionJumped);
  editor.goto1(2, 4);
  QCOMPARE(editor.cursorLine(), 1);
  QCOMPARE(editor.cursorColumn(), 3);
  QCOMPARE(jumped.count(), 1);
  QCOMPARE(jumped.first().at(0).toInt(), 1);
  QCOMPARE(jumped.first().at(1).toInt(), 3);

  editor.goto1(3);
  QCOMPARE(editor.cursorLine(), 2);
  QCOMPARE(editor.cursorColumn(), 0);

  editor.goto1(100, 100);
  QCOMPARE(editor.cursorLine(), 2);
  QCOMPARE(editor.cursorColumn(), 1);
}

void tst_Editor::encoding()
{
  const auto path = m_dir->filePath("latin1.txt");
  QVERIFY(writeFile(path, "caf\xe9\n"));

  TestEditor editor;
  QVERIFY(editor.setEncoding("ISO-8859-1"));
  QVERIFY(editor.openFile(path));
  QCOMPARE(editor.toPlainText(), QString::fromUtf8("caf\xc3\xa9"));

  QTest::ignoreMessage(QtWarningMsg, QRegularExpression("Unknown encoding"));
  QVERIFY(!editor.setEncoding("no-such-encoding"));
  QCOMPARE(editor.encoding(), QString("ISO-8859-1"));
}

void tst_Editor::searchExpression_data()
{
  QTest::addColumn<QString>("expr");
  QTest::addColumn<bool>("regex");
  QTest::addColumn<int>("sensitivity");
  QTest::addColumn<bool>("wholeWord");
  QTest::addColumn<QString>("subject");
  QTest::addColumn<bool>("matches");

  const auto smart = int(Editor::CaseSensitivity::Smart);
  const auto sensitive = int(Editor::CaseSensitivity::Sensitive);
  const auto insensitive = int(Editor::CaseSensitivity::Insensitive);
  QTest::newRow("smart lower") << "foo" << false << smart << false << "a FOO b" << true;
  QTest::newRow("smart upper") << "Foo" << false << smart << false << "a FOO b" << false;
  QTest::newRow("sensitive") << "foo" << false << sensitive << false << "a FOO b" << false;
  QTest::newRow("insensitive") << "Foo" << false << insensitive << false << "a foo b" << true;
  QTest::newRow("literal dot") << "a.c" << false << sensitive << false << "abc" << false;
  QTest::newRow("regex dot") << "a.c" << true << sensitive << false << "abc" << true;
  QTest::newRow("whole word") << "foo" << false << sensitive << true << "foobar" << false;
  QTest::newRow("whole word hit") << "foo" << false << sensitive << true << "a foo" << true;
}

void tst_Editor::searchExpression()
{
  QFETCH(QString, expr);
  QFETCH(bool, regex);
  QFETCH(int, sensitivity);
  QFETCH(bool, wholeWord);
  QFETCH(QString, subject);
  QFETCH(bool, matches);

  Editor::SearchOptions options;
  options.expr = expr;
  options.is_regex = regex;
  options.case_sensitivity = static_cast<Editor::CaseSensitivity>(sensitivity);
  options.whole_word = wholeWord;
  QCOMPARE(Editor::searchExpression(options).match(subject).hasMatch(), matches);
}

void tst_Editor::findForwardAndBackward()
{
  TestEditor editor;
  editor.setPlainText("foo bar\nfoo baz\nqux");
  editor.moveCursor(QTextCursor::Start);

  QVERIFY(editor.find("foo"));
  QCOMPARE(editor.cursorLine(), 0);
  QVERIFY(editor.findForward());
  QCOMPARE(editor.cursorLine(), 1);

  // wraps around to the first match
  QVERIFY(editor.findForward());
  QCOMPARE(editor.cursorLine(), 0);

  QVERIFY(editor.findBackward());
  QCOMPARE(editor.cursorLine(), 1);

  QVERIFY(!editor.find("nothing"));
}

QTEST_MAIN(tst_Editor)

#include "tst_editor.moc"
