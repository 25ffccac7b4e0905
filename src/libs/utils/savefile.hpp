// SPDX-License-Identifier: GPL-3.0-only WITH Qt-GPL-exception-1.0

#pragma once

#include "utils_global.hpp"

#include <QFile>

#include <memory>

QT_BEGIN_NAMESPACE
class QTemporaryFile;
QT_END_NAMESPACE

namespace Utils {

// Writes go to a temporary file next to the target which replaces the target
// on commit(). The original file is untouched until then.
class EYE_UTILS_EXPORT SaveFile : public QFile {
  Q_OBJECT

public:
  explicit SaveFile(const QString &filename);
  ~SaveFile() override;

  auto open(OpenMode flags = QIODevice::WriteOnly) -> bool override;
  auto rollback() -> void;
  auto commit() -> bool;
  static auto initializeUmask() -> void;

private:
  const QString m_final_file_name;
  std::unique_ptr<QTemporaryFile> m_temp_file;
  bool m_finalized = true;
};

} // namespace Utils
