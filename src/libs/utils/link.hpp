// SPDX-License-Identifier: GPL-3.0-only WITH Qt-GPL-exception-1.0

#pragma once

#include "utils_global.hpp"

#include <QString>
#include <qmetatype.h>

namespace Utils {

// A file location as given on the command line: "path[:line[:column]]".
// Line and column are 1-based, 0 means "not given".
class EYE_UTILS_EXPORT Link {
public:
  Link(const QString &file_path = QString(), const int line = 0, const int column = 0) : target_file_path(file_path), target_line(line), target_column(column) {}

  static auto fromString(const QString &file_name) -> Link;

  auto hasValidTarget() const -> bool { return !target_file_path.isEmpty(); }
  auto hasLine() const -> bool { return target_line > 0; }

  auto operator==(const Link &other) const -> bool
  {
    return target_file_path == other.target_file_path && target_line == other.target_line && target_column == other.target_column;
  }

  auto operator!=(const Link &other) const -> bool { return !(*this == other); }

  QString target_file_path;
  int target_line;
  int target_column;
};

} // namespace Utils

Q_DECLARE_METATYPE(Utils::Link)
