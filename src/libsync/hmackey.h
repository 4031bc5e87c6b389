/*
 * SPDX-FileCopyrightText: 2026 Cipherdrive contributors
 * SPDX-License-Identifier: GPL-2.0-or-later
 */

#pragma once

#include "cipherdrivelib.h"
#include "driveerror.h"

#include <QByteArray>

#include <openssl/evp.h>

namespace CDC {

/**
 * @brief Keyed hash for file names and search tokens
 *
 * Derived from the RSA private key so legacy and current accounts end up
 * with the same key.
 */
class CIPHERDRIVESYNC_EXPORT HmacKey
{
public:
    HmacKey() = default;
    explicit HmacKey(const QByteArray &key);

    /// HKDF-SHA256 over the private exponent, info "hmac-sha256-key"
    static DriveResult<HmacKey> fromPrivateKey(EVP_PKEY *privateKey);

    [[nodiscard]] bool isValid() const { return !_key.isEmpty(); }

    /// Lowercase hex HMAC-SHA256 of \a data
    [[nodiscard]] QByteArray hash(const QByteArray &data) const;

private:
    QByteArray _key;
};

}
