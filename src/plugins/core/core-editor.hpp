// SPDX-License-Identifier: GPL-3.0-only WITH Qt-GPL-exception-1.0

#pragma once

#include "core-global.hpp"

#include <extensionsystem/categorymixin.hpp>

#include <QMessageBox>
#include <QPlainTextEdit>
#include <QRegularExpression>

#include <memory>

QT_BEGIN_NAMESPACE
class QTextDocument;
QT_END_NAMESPACE

namespace Eye::Plugin::Core {

class TabWidget;

class CORE_EXPORT Editor : public QPlainTextEdit, public ExtensionSystem::CategoryMixin {
  Q_OBJECT
  Q_PROPERTY(QString path READ path NOTIFY titleChanged)
  Q_PROPERTY(QString title READ title NOTIFY titleChanged)
  Q_PROPERTY(bool modified READ isModified WRITE setModified)
  Q_PROPERTY(bool finalNewline READ useFinalNewline WRITE setUseFinalNewline)
  Q_PROPERTY(bool trimTrailingWhitespace READ removesTrailingWhitespace WRITE setRemoveTrailingWhitespace)
  Q_PROPERTY(QString encoding READ encoding WRITE setEncoding)

public:
  enum class CaseSensitivity {
    Insensitive,
    Sensitive,
    Smart
  };
  Q_ENUM(CaseSensitivity)

  struct SavingOptions {
    bool trim_trailing_whitespace = false;
    bool final_newline = true;
    QByteArray encoding = "UTF-8";
  };

  struct SearchOptions {
    QString expr;
    bool is_regex = false;
    CaseSensitivity case_sensitivity = CaseSensitivity::Insensitive;
    bool whole_word = false;
    bool wrap = true;
    bool forward = true;
  };

  explicit Editor(QWidget *parent = nullptr);
  ~Editor() override;

  auto path() const -> QString { return m_path; }
  auto title() const -> QString;
  auto isModified() const -> bool;
  auto setModified(bool modified) -> void;

  auto savingOptions() const -> const SavingOptions& { return m_saving; }
  auto useFinalNewline() const -> bool { return m_saving.final_newline; }
  auto setUseFinalNewline(bool use) -> void { m_saving.final_newline = use; }
  auto removesTrailingWhitespace() const -> bool { return m_saving.trim_trailing_whitespace; }
  auto setRemoveTrailingWhitespace(bool remove) -> void { m_saving.trim_trailing_whitespace = remove; }
  auto encoding() const -> QString { return QString::fromLatin1(m_saving.encoding); }
  auto setEncoding(const QString &encoding) -> bool;

  auto searchOptions() const -> const SearchOptions& { return m_search; }
  auto setSearchOptions(const SearchOptions &options) -> void { m_search = options; }

  auto cursorLine() const -> Q_INVOKABLE int;
  auto cursorColumn() const -> Q_INVOKABLE int;
  auto parentTabWidget() const -> Q_INVOKABLE Eye::Plugin::Core::TabWidget*;

  static auto decodeText(const QByteArray &data, const SavingOptions &options) -> QString;
  static auto encodeText(const QString &text, const SavingOptions &options) -> QByteArray;
  static auto searchExpression(const SearchOptions &options) -> QRegularExpression;

public slots:
  auto openFile(const QString &path) -> bool;
  auto saveFile() -> bool;
  auto saveFileAs(const QString &path = QString()) -> bool;
  auto closeFile() -> bool;
  auto reloadFile() -> bool;
  auto openDocument(Eye::Plugin::Core::Editor *other) -> bool;
  auto goto1(int line, int column = 1) -> void;
  auto giveFocus() -> void;
  auto find(const QString &expr) -> bool;
  auto findForward() -> bool;
  auto findBackward() -> bool;

public:
  auto find(const QString &expr, const SearchOptions &options) -> bool;

signals:
  auto titleChanged() -> void;
  auto fileAboutToBeOpened(const QString &path) -> void;
  auto fileOpened(const QString &path) -> void;
  auto fileAboutToBeSaved(const QString &path) -> void;
  auto fileSaved(const QString &path) -> void;
  auto fileSavedAs(const QString &path) -> void;
  auto fileModifiedExternally() -> void;
  auto positionJumped(int line, int column) -> void;

protected:
  virtual auto askUnsavedChanges() -> QMessageBox::StandardButton;
  virtual auto askSavePath() -> QString;

  auto closeEvent(QCloseEvent *event) -> void override;

private:
  auto setPath(const QString &path) -> void;
  auto writeFile(const QString &path, bool new_path) -> bool;
  auto updateTitle() -> void;
  auto findInDirection(bool forward) -> bool;
  auto readFile(const QString &path, QString *text) const -> bool;

  QString m_path;
  QString m_title;
  SavingOptions m_saving;
  SearchOptions m_search;
  std::shared_ptr<QTextDocument> m_document;
};

} // namespace Eye::Plugin::Core
