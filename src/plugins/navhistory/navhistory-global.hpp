// SPDX-License-Identifier: GPL-3.0-only WITH Qt-GPL-exception-1.0

#pragma once

#include <QLoggingCategory>
#include <qglobal.h>

#if defined(NAVHISTORY_LIBRARY)
#  define NAVHISTORY_EXPORT Q_DECL_EXPORT
#elif defined(NAVHISTORY_STATIC_LIBRARY)
#  define NAVHISTORY_EXPORT
#else
#  define NAVHISTORY_EXPORT Q_DECL_IMPORT
#endif

Q_DECLARE_LOGGING_CATEGORY(navHistoryLog)
