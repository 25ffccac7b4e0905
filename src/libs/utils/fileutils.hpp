// SPDX-License-Identifier: GPL-3.0-only WITH Qt-GPL-exception-1.0

#pragma once

#include "utils_global.hpp"

#include <QCoreApplication>
#include <QFile>
#include <QStringList>

#include <memory>

QT_BEGIN_NAMESPACE
class QTextStream;
QT_END_NAMESPACE

namespace Utils {

class EYE_UTILS_EXPORT FileUtils {
public:
  static auto homePath() -> QString;
  static auto absolutePath(const QString &path) -> QString;
  static auto parentContaining(const QString &path, const QStringList &patterns) -> QString;
};

class EYE_UTILS_EXPORT FileReader {
  Q_DECLARE_TR_FUNCTIONS(Utils::FileUtils) // sic!

public:
  auto fetch(const QString &file_path, QIODevice::OpenMode mode = QIODevice::NotOpen) -> bool; // QIODevice::ReadOnly is implicit
  auto fetch(const QString &file_path, QIODevice::OpenMode mode, QString *error_string) -> bool;
  auto fetch(const QString &file_path, QString *error_string) -> bool { return fetch(file_path, QIODevice::NotOpen, error_string); }
  auto data() const -> const QByteArray& { return m_data; }
  auto errorString() const -> const QString& { return m_error_string; }

private:
  QByteArray m_data;
  QString m_error_string;
};

class EYE_UTILS_EXPORT FileSaverBase {
  Q_DECLARE_TR_FUNCTIONS(Utils::FileUtils) // sic!

public:
  FileSaverBase();
  virtual ~FileSaverBase();

  auto filePath() const -> QString { return m_file_path; }
  auto hasError() const -> bool { return m_has_error; }
  auto errorString() const -> QString { return m_error_string; }
  virtual auto finalize() -> bool;
  auto finalize(QString *err_str) -> bool;

  auto write(const char *data, int len) -> bool;
  auto write(const QByteArray &bytes) -> bool;
  auto setResult(QTextStream *stream) -> bool;
  auto setResult(bool ok) -> bool;

  auto file() -> QFile* { return m_file.get(); }

protected:
  std::unique_ptr<QFile> m_file;
  QString m_file_path;
  QString m_error_string;
  bool m_has_error = false;

private:
  Q_DISABLE_COPY(FileSaverBase)
};

class EYE_UTILS_EXPORT FileSaver : public FileSaverBase {
  Q_DECLARE_TR_FUNCTIONS(Utils::FileUtils) // sic!

public:
  // QIODevice::WriteOnly is implicit
  explicit FileSaver(const QString &file_path, QIODevice::OpenMode mode = QIODevice::NotOpen);

  auto finalize() -> bool override;
  using FileSaverBase::finalize;

private:
  bool m_is_safe = false;
};

} // namespace Utils
