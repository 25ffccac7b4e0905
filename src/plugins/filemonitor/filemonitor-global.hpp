// SPDX-License-Identifier: GPL-3.0-only WITH Qt-GPL-exception-1.0

#pragma once

#include <QLoggingCategory>
#include <qglobal.h>

#if defined(FILEMONITOR_LIBRARY)
#  define FILEMONITOR_EXPORT Q_DECL_EXPORT
#elif defined(FILEMONITOR_STATIC_LIBRARY)
#  define FILEMONITOR_EXPORT
#else
#  define FILEMONITOR_EXPORT Q_DECL_IMPORT
#endif

Q_DECLARE_LOGGING_CATEGORY(fileMonitorLog)
