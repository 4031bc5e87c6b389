/*
 * SPDX-FileCopyrightText: 2026 Cipherdrive contributors
 * SPDX-License-Identifier: GPL-2.0-or-later
 */

#pragma once

#include "cipherdrivelib.h"
#include "driveerror.h"

#include <QByteArray>

namespace CDC {

/**
 * @brief Symmetric encryption of small metadata strings
 *
 * Implemented by the legacy MasterKey and the current EncryptionKey, and
 * used wherever the kind of key is only known at runtime, e.g. public
 * link keys.
 */
class CIPHERDRIVESYNC_EXPORT MetaCrypter
{
public:
    virtual ~MetaCrypter();

    /// Returns an empty array only if the OpenSSL primitives fail
    [[nodiscard]] virtual QByteArray encryptMeta(const QByteArray &metadata) const = 0;
    [[nodiscard]] virtual DriveResult<QByteArray> decryptMeta(const QByteArray &encrypted) const = 0;
};

}
