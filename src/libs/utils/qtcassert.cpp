// SPDX-License-Identifier: GPL-3.0-only WITH Qt-GPL-exception-1.0

#include "qtcassert.hpp"

#include <QByteArray>
#include <QDebug>

#if defined(Q_OS_UNIX) && !defined(Q_OS_ANDROID)
#include <execinfo.h>
#include <stdlib.h>
#endif

namespace Utils {

static auto dumpBacktrace(const int max_depth) -> void
{
  #if defined(Q_OS_UNIX) && !defined(Q_OS_ANDROID)
  constexpr auto frame_limit = 100;
  void *frames[frame_limit] = {nullptr};
  const auto size = backtrace(frames, qBound(1, max_depth, frame_limit));
  const auto lines = backtrace_symbols(frames, size);
  for (auto i = 0; i < size; ++i)
    qDebug().noquote() << "  " << lines[i];
  free(lines);
  #else
  Q_UNUSED(max_depth)
  #endif
}

auto writeAssertLocation(const char *condition, const char *file, const int line) -> void
{
  static const auto fatal = qEnvironmentVariableIsSet("EYE_FATAL_ASSERTS");
  static const auto max_depth = qEnvironmentVariableIntValue("EYE_BACKTRACE_MAXDEPTH");

  if (fatal)
    qFatal("SOFT ASSERT made fatal: \"%s\" in %s:%d", condition, file, line);

  qDebug("SOFT ASSERT: \"%s\" in %s:%d", condition, file, line);
  if (max_depth > 0)
    dumpBacktrace(max_depth);
}

} // namespace Utils
