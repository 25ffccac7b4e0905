// SPDX-License-Identifier: GPL-3.0-only WITH Qt-GPL-exception-1.0

#include "link.hpp"

#include <QRegularExpression>

namespace Utils {

/*!
  Splits \a file_name into a path and the optional trailing line and column
  numbers. Only trailing all-digit components are taken as numbers, so
  "a:b.txt" stays a plain path.
*/
auto Link::fromString(const QString &file_name) -> Link
{
  static const QRegularExpression regexp("(?::(\\d+))?(?::(\\d+))?$");

  const auto match = regexp.match(file_name);
  if (!match.hasMatch() || match.capturedLength() == 0)
    return Link(file_name);

  Link link(file_name.left(match.capturedStart()));
  if (!match.captured(1).isEmpty())
    link.target_line = match.captured(1).toInt();
  if (!match.captured(2).isEmpty())
    link.target_column = match.captured(2).toInt();
  return link;
}

} // namespace Utils
