/*
 * SPDX-FileCopyrightText: 2026 Cipherdrive contributors
 * SPDX-License-Identifier: GPL-2.0-or-later
 */

#include "hmackey.h"

#include "clientsideencryption.h"
#include "common/constants.h"

#include <QMessageAuthenticationCode>

namespace CDC {

namespace {
const auto hmacKeyInfo = QByteArrayLiteral("hmac-sha256-key");
}

HmacKey::HmacKey(const QByteArray &key)
    : _key(key)
{
}

DriveResult<HmacKey> HmacKey::fromPrivateKey(EVP_PKEY *privateKey)
{
    const auto exponent = EncryptionHelper::rsaPrivateExponent(privateKey);
    if (!exponent) {
        return exponent.error();
    }
    const auto derived = EncryptionHelper::hkdfSha256(*exponent, hmacKeyInfo, Constants::symmetricKeySize);
    if (!derived) {
        return derived.error();
    }
    return HmacKey(*derived);
}

QByteArray HmacKey::hash(const QByteArray &data) const
{
    return QMessageAuthenticationCode::hash(data, _key, QCryptographicHash::Sha256).toHex();
}

}
