// SPDX-License-Identifier: GPL-3.0-only WITH Qt-GPL-exception-1.0

#include "savefile.hpp"

#include "qtcassert.hpp"

#include <QDir>
#include <QFileInfo>
#include <QTemporaryFile>

#include <cerrno>
#include <cstring>

#ifdef Q_OS_UNIX
#include <cstdio>
#include <sys/stat.h>
#include <unistd.h>
#endif

namespace Utils {

static QFile::Permissions m_umask;

SaveFile::SaveFile(const QString &filename) : m_final_file_name(filename) {}

SaveFile::~SaveFile()
{
  QTC_ASSERT(m_finalized, rollback());
}

auto SaveFile::open(OpenMode flags) -> bool
{
  QTC_ASSERT(!m_final_file_name.isEmpty(), return false);

  QFile target(m_final_file_name);
  if (target.exists() && !target.open(QIODevice::ReadWrite)) {
    setErrorString(target.errorString());
    return false;
  }

  m_temp_file = std::make_unique<QTemporaryFile>(m_final_file_name);
  m_temp_file->setAutoRemove(false);

  if (!m_temp_file->open()) {
    setErrorString(m_temp_file->errorString());
    m_temp_file.reset();
    return false;
  }

  setFileName(m_temp_file->fileName());

  if (!QFile::open(flags))
    return false;

  m_finalized = false;

  // Failing to copy permissions does not stop the save.
  if (target.exists()) {
    setPermissions(target.permissions());
  } else {
    const Permissions read_write = QFile::ReadOwner | QFile::ReadGroup | QFile::ReadOther | QFile::WriteOwner | QFile::WriteGroup | QFile::WriteOther;
    setPermissions(read_write & ~m_umask);
  }

  return true;
}

auto SaveFile::rollback() -> void
{
  close();
  if (m_temp_file)
    m_temp_file->remove();
  m_finalized = true;
}

auto SaveFile::commit() -> bool
{
  QTC_ASSERT(!m_finalized && m_temp_file, return false);
  m_finalized = true;

  if (!flush()) {
    close();
    m_temp_file->remove();
    return false;
  }

  #ifdef Q_OS_UNIX
  fsync(handle());
  #endif

  close();
  m_temp_file->close();

  if (error() != NoError) {
    m_temp_file->remove();
    return false;
  }

  const auto final_file_name = QFileInfo(m_final_file_name).absoluteFilePath();

  // QFile::rename refuses to overwrite, so the target goes first. On POSIX
  // ::rename replaces atomically.
  #ifdef Q_OS_UNIX
  if (::rename(QFile::encodeName(fileName()).constData(), QFile::encodeName(final_file_name).constData()) != 0) {
    setErrorString(tr("Cannot replace %1: %2").arg(QDir::toNativeSeparators(final_file_name), QString::fromLocal8Bit(strerror(errno))));
    QFile::remove(fileName());
    return false;
  }
  #else
  if (QFile::exists(final_file_name) && !QFile::remove(final_file_name)) {
    setErrorString(tr("Cannot remove %1.").arg(QDir::toNativeSeparators(final_file_name)));
    QFile::remove(fileName());
    return false;
  }
  if (!QFile::rename(fileName(), final_file_name)) {
    setErrorString(tr("Cannot rename %1 to %2.").arg(QDir::toNativeSeparators(fileName()), QDir::toNativeSeparators(final_file_name)));
    QFile::remove(fileName());
    return false;
  }
  #endif

  setFileName(final_file_name);
  return true;
}

/*!
  Reads the process umask once so that new files get the permissions the
  user expects. Call it from the main thread during start-up, umask() is not
  thread safe.
*/
auto SaveFile::initializeUmask() -> void
{
  #ifdef Q_OS_UNIX
  const auto mask = umask(0);
  umask(mask);

  static constexpr struct {
    mode_t mode;
    QFile::Permission permission;
  } bits[] = {
    {S_IRUSR, QFile::ReadOwner}, {S_IWUSR, QFile::WriteOwner}, {S_IXUSR, QFile::ExeOwner},
    {S_IRGRP, QFile::ReadGroup}, {S_IWGRP, QFile::WriteGroup}, {S_IXGRP, QFile::ExeGroup},
    {S_IROTH, QFile::ReadOther}, {S_IWOTH, QFile::WriteOther}, {S_IXOTH, QFile::ExeOther},
  };

  m_umask = {};
  for (const auto &bit : bits) {
    if (mask & bit.mode)
      m_umask |= bit.permission;
  }
  #endif
}

} // namespace Utils
