// SPDX-License-Identifier: GPL-3.0-only WITH Qt-GPL-exception-1.0

#include "core-editor.hpp"

#include "core-constants.hpp"
#include "core-tab-widget.hpp"

#include <utils/fileutils.hpp>
#include <utils/qtcassert.hpp>

#include <QCloseEvent>
#include <QFileDialog>
#include <QFileInfo>
#include <QPlainTextDocumentLayout>
#include <QTextBlock>
#include <QTextCodec>
#include <QTextDocument>

#include <utility>

Q_LOGGING_CATEGORY(editorLog, "eye.editor", QtWarningMsg)

/*!
    \class Eye::Plugin::Core::Editor
    \inheaderfile core/core-editor.hpp
    \inmodule Eye

    \brief The Editor class is the text editing widget, in the \c editor
    category.

    An editor edits at most one file, whose absolute path is path(). The
    text is kept in memory as Unicode, the savingOptions() decide how it is
    converted when the file is read or written:

    \list
    \li \c encoding, the codec used on disk, UTF-8 by default.
    \li \c final_newline, on by default. A file ending with a newline is
        shown without it, and saving always appends one.
    \li \c trim_trailing_whitespace, off by default. When on, spaces and tabs
        at the end of lines are removed from the saved file, not from the
        editor.
    \endlist

    Line and column numbers are 0-based, except for goto1().
*/

/*!
    \fn void Eye::Plugin::Core::Editor::fileModifiedExternally()
    Emitted when the file edited was changed on disk by someone else. The
    editor itself does not watch its file, see the FileMonitor plugin.
*/

namespace Eye::Plugin::Core {

static auto newDocument() -> std::shared_ptr<QTextDocument>
{
  auto document = std::make_shared<QTextDocument>();
  document->setDocumentLayout(new QPlainTextDocumentLayout(document.get()));
  return document;
}

Editor::Editor(QWidget *parent) : QPlainTextEdit(parent), CategoryMixin(this), m_document(newDocument())
{
  setDocument(m_document.get());
  connect(this, &QPlainTextEdit::modificationChanged, this, &QWidget::setWindowModified);
  connect(this, &QPlainTextEdit::modificationChanged, this, &Editor::updateTitle);
  updateTitle();

  addCategory(QLatin1String(Constants::C_EDITOR));
}

Editor::~Editor()
{
  // The document may outlive this editor when it is shared.
  setDocument(nullptr);
}

auto Editor::title() const -> QString
{
  auto t = m_path.isEmpty() ? QLatin1String(Constants::UNTITLED) : QFileInfo(m_path).fileName();
  if (isModified())
    t.append(QLatin1Char('*'));
  return t;
}

auto Editor::isModified() const -> bool
{
  return document()->isModified();
}

auto Editor::setModified(const bool modified) -> void
{
  document()->setModified(modified);
}

auto Editor::setPath(const QString &path) -> void
{
  m_path = path;
  updateTitle();
}

auto Editor::updateTitle() -> void
{
  const auto t = title();
  setWindowTitle(t);
  setToolTip(m_path.isEmpty() ? QLatin1String(Constants::UNTITLED) : m_path);

  if (t != m_title) {
    m_title = t;
    emit titleChanged();
  }
}

/*!
    Sets the codec used to read and write files to \a encoding. Returns
    \c false, leaving the encoding unchanged, if no such codec exists.
*/
auto Editor::setEncoding(const QString &encoding) -> bool
{
  const auto codec = QTextCodec::codecForName(encoding.toLatin1());
  if (!codec) {
    qCWarning(editorLog).noquote() << "Unknown encoding" << encoding;
    return false;
  }
  m_saving.encoding = codec->name();
  return true;
}

auto Editor::cursorLine() const -> int
{
  return textCursor().blockNumber();
}

auto Editor::cursorColumn() const -> int
{
  return textCursor().positionInBlock();
}

/*!
    Returns the tab widget showing this editor, if any.
*/
auto Editor::parentTabWidget() const -> TabWidget*
{
  for (auto w = parentWidget(); w; w = w->parentWidget()) {
    if (const auto tabs = qobject_cast<TabWidget*>(w))
      return tabs;
  }
  return nullptr;
}

/*!
    Converts file content \a data to editor text according to \a options.
*/
auto Editor::decodeText(const QByteArray &data, const SavingOptions &options) -> QString
{
  auto codec = QTextCodec::codecForName(options.encoding);
  if (!codec)
    codec = QTextCodec::codecForName("UTF-8");

  auto text = codec->toUnicode(data);
  if (options.final_newline && text.endsWith(QLatin1Char('\n')))
    text.chop(1);
  return text;
}

/*!
    Converts editor \a text to file content according to \a options.
*/
auto Editor::encodeText(const QString &text, const SavingOptions &options) -> QByteArray
{
  auto result = text;
  if (options.trim_trailing_whitespace) {
    static const QRegularExpression trailing(QLatin1String("[ \\t]+$"), QRegularExpression::MultilineOption);
    result.remove(trailing);
  }
  if (options.final_newline)
    result.append(QLatin1Char('\n'));

  auto codec = QTextCodec::codecForName(options.encoding);
  if (!codec)
    codec = QTextCodec::codecForName("UTF-8");
  return codec->fromUnicode(result);
}

auto Editor::readFile(const QString &path, QString *text) const -> bool
{
  Utils::FileReader reader;
  QString error_string;
  if (!reader.fetch(path, &error_string)) {
    qCWarning(editorLog).noquote() << "Cannot read file" << path << ":" << error_string;
    return false;
  }
  *text = decodeText(reader.data(), m_saving);
  return true;
}

/*!
    Opens the file at \a path, after closing the current one. Returns
    \c false if the user kept the current file or if the new one cannot be
    read, in which case the text is left untouched.
*/
auto Editor::openFile(const QString &path) -> bool
{
  if (!closeFile())
    return false;

  const auto absolute_path = Utils::FileUtils::absolutePath(path);

  QString text;
  if (!readFile(absolute_path, &text))
    return false;

  setPath(absolute_path);
  emit fileAboutToBeOpened(absolute_path);
  setPlainText(text);
  setModified(false);
  qCDebug(editorLog) << "opened" << absolute_path;
  emit fileOpened(absolute_path);
  return true;
}

/*!
    Writes the text to the file. Without a path, the user is asked where to
    save and \c false is returned if they cancel. The previous file content
    survives a failed write.
*/
auto Editor::saveFile() -> bool
{
  if (m_path.isEmpty())
    return saveFileAs();
  return writeFile(m_path, false);
}

/*!
    Writes the text to \a path, or to a path chosen by the user if \a path
    is empty, and makes it the path of the editor.
*/
auto Editor::saveFileAs(const QString &path) -> bool
{
  auto target = path.isEmpty() ? askSavePath() : path;
  if (target.isEmpty())
    return false;

  target = Utils::FileUtils::absolutePath(target);
  return writeFile(target, target != m_path);
}

auto Editor::writeFile(const QString &path, const bool new_path) -> bool
{
  const auto data = encodeText(toPlainText(), m_saving);
  emit fileAboutToBeSaved(path);

  Utils::FileSaver saver(path);
  saver.write(data);
  QString error_string;
  if (!saver.finalize(&error_string)) {
    qCWarning(editorLog).noquote() << "Cannot write file" << path << ":" << error_string;
    return false;
  }

  setPath(path);
  setModified(false);
  qCDebug(editorLog) << "saved" << path;
  if (new_path)
    emit fileSavedAs(path);
  else
    emit fileSaved(path);
  return true;
}

/*!
    Returns whether the editor may be closed. An editor with unsaved
    changes asks the user whether to save them, discard them or cancel.
*/
auto Editor::closeFile() -> bool
{
  if (!isModified())
    return true;

  switch (askUnsavedChanges()) {
  case QMessageBox::Discard:
    return true;
  case QMessageBox::Save:
    return saveFile();
  default:
    return false;
  }
}

/*!
    Reads the file again, replacing the text as one undoable change and
    keeping the cursor where it was.
*/
auto Editor::reloadFile() -> bool
{
  QTC_ASSERT(!m_path.isEmpty(), return false);

  QString text;
  if (!readFile(m_path, &text))
    return false;

  const auto line = cursorLine();
  const auto column = cursorColumn();

  QTextCursor cursor(document());
  cursor.beginEditBlock();
  cursor.select(QTextCursor::Document);
  cursor.insertText(text);
  cursor.endEditBlock();
  setModified(false);

  goto1(line + 1, column + 1);
  return true;
}

/*!
    Shows the same document as \a other, edits in one appear in both.
*/
auto Editor::openDocument(Editor *other) -> bool
{
  QTC_ASSERT(other && other != this, return false);

  if (!closeFile())
    return false;

  // The widget still refers to its old document until setDocument() returns.
  const auto previous = std::exchange(m_document, other->m_document);
  setDocument(m_document.get());
  setPath(other->path());
  setWindowModified(isModified());
  updateTitle();
  return true;
}

/*!
    Moves the cursor to \a line and \a column, both starting from 1.
*/
auto Editor::goto1(const int line, const int column) -> void
{
  const auto block_count = document()->blockCount();
  const auto block = document()->findBlockByNumber(qBound(0, line - 1, block_count - 1));
  const auto col = qBound(0, column - 1, block.length() - 1);

  auto cursor = textCursor();
  cursor.setPosition(block.position() + col);
  setTextCursor(cursor);
  ensureCursorVisible();
  emit positionJumped(block.blockNumber(), col);
}

auto Editor::giveFocus() -> void
{
  if (const auto tabs = parentTabWidget())
    tabs->setCurrentWidget(this);
  setFocus(Qt::OtherFocusReason);
}

/*!
    Builds the regular expression searched for with \a options. With
    CaseSensitivity::Smart, the search is case sensitive only if the
    expression contains upper case letters.
*/
auto Editor::searchExpression(const SearchOptions &options) -> QRegularExpression
{
  auto expr = options.is_regex ? options.expr : QRegularExpression::escape(options.expr);
  if (options.whole_word)
    expr = QString::fromLatin1("\\b%1\\b").arg(expr);

  auto case_sensitive = options.case_sensitivity == CaseSensitivity::Sensitive;
  if (options.case_sensitivity == CaseSensitivity::Smart)
    case_sensitive = options.expr.toLower() != options.expr;

  return QRegularExpression(expr, case_sensitive ? QRegularExpression::NoPatternOption : QRegularExpression::CaseInsensitiveOption);
}

auto Editor::find(const QString &expr) -> bool
{
  return find(expr, m_search);
}

/*!
    Searches \a expr forward from the start of the selection, with the other
    fields of \a options. The options are kept for findForward() and
    findBackward().
*/
auto Editor::find(const QString &expr, const SearchOptions &options) -> bool
{
  m_search = options;
  m_search.expr = expr;
  m_search.forward = true;

  if (!searchExpression(m_search).isValid()) {
    qCWarning(editorLog).noquote() << "Invalid search expression" << expr;
    return false;
  }

  auto cursor = textCursor();
  cursor.setPosition(cursor.selectionStart());
  setTextCursor(cursor);
  return findInDirection(true);
}

auto Editor::findForward() -> bool
{
  return findInDirection(true);
}

auto Editor::findBackward() -> bool
{
  return findInDirection(false);
}

auto Editor::findInDirection(const bool forward) -> bool
{
  if (m_search.expr.isEmpty())
    return false;

  m_search.forward = forward;
  const auto expr = searchExpression(m_search);
  const auto flags = forward ? QTextDocument::FindFlags() : QTextDocument::FindBackward;

  if (QPlainTextEdit::find(expr, flags))
    return true;

  if (!m_search.wrap)
    return false;

  const auto saved = textCursor();
  moveCursor(forward ? QTextCursor::Start : QTextCursor::End);
  if (QPlainTextEdit::find(expr, flags))
    return true;

  setTextCursor(saved);
  return false;
}

auto Editor::askUnsavedChanges() -> QMessageBox::StandardButton
{
  return QMessageBox::question(this, tr("Unsaved file"), tr("%1 has been modified, do you want to close it?").arg(windowTitle()), QMessageBox::Discard | QMessageBox::Cancel | QMessageBox::Save);
}

auto Editor::askSavePath() -> QString
{
  return QFileDialog::getSaveFileName(this, tr("Save file"), Utils::FileUtils::homePath());
}

auto Editor::closeEvent(QCloseEvent *event) -> void
{
  if (closeFile())
    event->accept();
  else
    event->ignore();
}

} // namespace Eye::Plugin::Core
