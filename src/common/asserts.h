/*
 * SPDX-FileCopyrightText: 2026 Cipherdrive contributors
 * SPDX-FileCopyrightText: 2017 ownCloud GmbH
 * SPDX-License-Identifier: GPL-2.0-or-later
 */

#ifndef CIPHERDRIVE_ASSERTS_H
#define CIPHERDRIVE_ASSERTS_H

#include <qglobal.h>

#if defined(QT_FORCE_ASSERTS) || !defined(QT_NO_DEBUG)
#define CD_ASSERT_MSG qFatal
#else
#define CD_ASSERT_MSG qCritical
#endif

// Default assert: If the condition is false in debug builds, terminate.
//
// Prints a message on failure, even in release builds.
#define CD_ASSERT(cond)                                                                                 \
    if (!(cond)) {                                                                                      \
        CD_ASSERT_MSG("ASSERT: \"%s\" in file %s, line %d %s", #cond, __FILE__, __LINE__, Q_FUNC_INFO); \
    } else {                                                                                            \
    }
#define CD_ASSERT_X(cond, message)                                                                                                \
    if (!(cond)) {                                                                                                                \
        CD_ASSERT_MSG("ASSERT: \"%s\" in file %s, line %d %s with message: %s", #cond, __FILE__, __LINE__, Q_FUNC_INFO, message); \
    } else {                                                                                                                      \
    }

// Enforce condition to be true, even in release builds.
//
// Prints 'message' and aborts execution if 'cond' is false.
#define CD_ENFORCE(cond)                                                                          \
    if (!(cond)) {                                                                                \
        qFatal("ENFORCE: \"%s\" in file %s, line %d %s", #cond, __FILE__, __LINE__, Q_FUNC_INFO); \
    } else {                                                                                      \
    }

[[nodiscard]] inline bool cdEnsureImpl(bool condition, const char *cond, const char *file, int line, const char *info)
{
    if (Q_UNLIKELY(!condition)) {
        CD_ASSERT_MSG("ENSURE: \"%s\" in file %s, line %d %s", cond, file, line, info);
        return false;
    }
    return true;
}

// Like CD_ASSERT, but evaluates to the condition so the caller can bail out
// gracefully in release builds:
//
//     if (!CD_ENSURE(session.isOpen()))
//         return;
#define CD_ENSURE(cond) Q_LIKELY(cdEnsureImpl(cond, #cond, __FILE__, __LINE__, Q_FUNC_INFO))

#endif
