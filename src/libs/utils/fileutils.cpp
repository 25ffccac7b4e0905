// SPDX-License-Identifier: GPL-3.0-only WITH Qt-GPL-exception-1.0

#include "fileutils.hpp"
#include "savefile.hpp"

#include "qtcassert.hpp"

#include <QDir>
#include <QFileInfo>
#include <QTextStream>

namespace Utils {

auto FileUtils::homePath() -> QString
{
  return QDir::cleanPath(QDir::homePath());
}

auto FileUtils::absolutePath(const QString &path) -> QString
{
  if (path.isEmpty())
    return {};
  return QDir::cleanPath(QFileInfo(path).absoluteFilePath());
}

/*!
  Walks up from \a path and returns the first directory having an entry that
  matches one of the wildcard \a patterns. Returns an empty string once the
  filesystem root was searched without success.
*/
auto FileUtils::parentContaining(const QString &path, const QStringList &patterns) -> QString
{
  QDir dir(absolutePath(path));

  for (;;) {
    if (!dir.entryList(patterns, QDir::AllEntries | QDir::Hidden | QDir::System | QDir::NoDotAndDotDot).isEmpty())
      return dir.absolutePath();
    if (dir.isRoot())
      return {};
    if (!dir.cdUp())
      return {};
  }
}

// FileReader

auto FileReader::fetch(const QString &file_path, const QIODevice::OpenMode mode) -> bool
{
  QTC_ASSERT(!(mode & ~(QIODevice::ReadOnly | QIODevice::Text)), return false);

  QFile file(file_path);
  if (!file.open(QIODevice::ReadOnly | mode)) {
    m_error_string = tr("Cannot open %1 for reading: %2").arg(QDir::toNativeSeparators(file_path), file.errorString());
    return false;
  }
  m_data = file.readAll();
  if (file.error() != QFile::NoError) {
    m_error_string = tr("Cannot read %1: %2").arg(QDir::toNativeSeparators(file_path), file.errorString());
    return false;
  }
  return true;
}

auto FileReader::fetch(const QString &file_path, const QIODevice::OpenMode mode, QString *error_string) -> bool
{
  if (fetch(file_path, mode))
    return true;
  if (error_string)
    *error_string = m_error_string;
  return false;
}

// FileSaverBase

FileSaverBase::FileSaverBase() = default;

FileSaverBase::~FileSaverBase() = default;

auto FileSaverBase::finalize() -> bool
{
  m_file->close();
  setResult(m_file->error() == QFile::NoError);
  m_file.reset();
  return !m_has_error;
}

auto FileSaverBase::finalize(QString *err_str) -> bool
{
  if (finalize())
    return true;
  if (err_str)
    *err_str = errorString();
  return false;
}

auto FileSaverBase::write(const char *data, const int len) -> bool
{
  if (m_has_error)
    return false;
  return setResult(m_file->write(data, len) == len);
}

auto FileSaverBase::write(const QByteArray &bytes) -> bool
{
  if (m_has_error)
    return false;
  return setResult(m_file->write(bytes) == bytes.size());
}

auto FileSaverBase::setResult(const bool ok) -> bool
{
  if (!ok && !m_has_error) {
    if (!m_file->errorString().isEmpty()) {
      m_error_string = tr("Cannot write file %1: %2").arg(QDir::toNativeSeparators(m_file_path), m_file->errorString());
    } else {
      m_error_string = tr("Cannot write file %1. Disk full?").arg(QDir::toNativeSeparators(m_file_path));
    }
    m_has_error = true;
  }
  return ok;
}

auto FileSaverBase::setResult(QTextStream *stream) -> bool
{
  stream->flush();
  return setResult(stream->status() == QTextStream::Ok);
}

// FileSaver

FileSaver::FileSaver(const QString &file_path, const QIODevice::OpenMode mode)
{
  m_file_path = file_path;

  if (mode & (QIODevice::ReadOnly | QIODevice::Append)) {
    m_file = std::make_unique<QFile>(file_path);
    m_is_safe = false;
  } else {
    m_file = std::make_unique<SaveFile>(file_path);
    m_is_safe = true;
  }

  if (!m_file->open(QIODevice::WriteOnly | mode)) {
    const auto err = QFileInfo::exists(file_path) ? tr("Cannot overwrite file %1: %2") : tr("Cannot create file %1: %2");
    m_error_string = err.arg(QDir::toNativeSeparators(file_path), m_file->errorString());
    m_has_error = true;
  }
}

auto FileSaver::finalize() -> bool
{
  if (!m_is_safe)
    return FileSaverBase::finalize();

  const auto sf = static_cast<SaveFile*>(m_file.get());
  if (m_has_error) {
    if (sf->isOpen())
      sf->rollback();
  } else {
    setResult(sf->commit());
  }
  m_file.reset();
  return !m_has_error;
}

} // namespace Utils
