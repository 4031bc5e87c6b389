/*
 * SPDX-FileCopyrightText: 2026 Cipherdrive contributors
 * SPDX-License-Identifier: GPL-2.0-or-later
 */

#ifndef CIPHERDRIVELIB_H
#define CIPHERDRIVELIB_H

#include <QtCore/qglobal.h>

#ifndef CIPHERDRIVESYNC_EXPORT
# if defined(CIPHERDRIVESYNC_LIB)
   /* We are building this library */
#  define CIPHERDRIVESYNC_EXPORT Q_DECL_EXPORT
# else
   /* We are using this library */
#  define CIPHERDRIVESYNC_EXPORT Q_DECL_IMPORT
# endif
#endif

#endif
