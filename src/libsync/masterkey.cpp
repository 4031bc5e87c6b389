/*
 * SPDX-FileCopyrightText: 2026 Cipherdrive contributors
 * SPDX-License-Identifier: GPL-2.0-or-later
 */

#include "masterkey.h"

#include "clientsideencryption.h"
#include "common/constants.h"

#include <QLoggingCategory>

namespace CDC {

Q_LOGGING_CATEGORY(lcMasterKey, "cipherdrive.sync.masterkey", QtInfoMsg)

namespace {
constexpr char v1Prefix[] = "U2FsdGVk";
constexpr char v2Prefix[] = "002";
constexpr int v2PrefixSize = 3;
constexpr int v2HeaderSize = v2PrefixSize + Constants::e2EeNonceSize;
}

MetaCrypter::~MetaCrypter() = default;

MasterKey::MasterKey(const QByteArray &key)
    : _bytes(key)
    , _derivedBytes(EncryptionHelper::pbkdf2Sha512(key, key, 1, Constants::symmetricKeySize))
{
}

bool MasterKey::isV1Format(const QByteArray &encrypted)
{
    return encrypted.startsWith(v1Prefix);
}

bool MasterKey::isV2Format(const QByteArray &encrypted)
{
    return encrypted.startsWith(v2Prefix);
}

QByteArray MasterKey::encryptMeta(const QByteArray &metadata) const
{
    const auto nonce = EncryptionHelper::generateRandomString(Constants::e2EeNonceSize);
    const auto encrypted = EncryptionHelper::encryptSymmetric(_derivedBytes, nonce, metadata);
    if (!encrypted || nonce.isEmpty()) {
        qCWarning(lcMasterKey) << "Could not encrypt metadata";
        return {};
    }
    return QByteArray(v2Prefix) + nonce + encrypted->toBase64();
}

DriveResult<QByteArray> MasterKey::decryptMeta(const QByteArray &encrypted) const
{
    if (isV1Format(encrypted)) {
        return decryptMetaV1(encrypted);
    }
    if (isV2Format(encrypted)) {
        return decryptMetaV2(encrypted);
    }
    return DriveError(DriveErrorCode::ParseError, QStringLiteral("Unknown metadata format"));
}

DriveResult<QByteArray> MasterKey::decryptMetaV1(const QByteArray &encrypted) const
{
    const auto decoded = QByteArray::fromBase64Encoding(encrypted, QByteArray::AbortOnBase64DecodingErrors);
    if (!decoded) {
        return DriveError(DriveErrorCode::ParseError, QStringLiteral("v1 metadata is not valid base64"));
    }
    return EncryptionHelper::decryptSaltedCbc(_bytes, *decoded);
}

DriveResult<QByteArray> MasterKey::decryptMetaV2(const QByteArray &encrypted) const
{
    if (encrypted.size() < v2HeaderSize) {
        return DriveError(DriveErrorCode::ParseError, QStringLiteral("v2 metadata too short"));
    }
    const auto nonce = encrypted.mid(v2PrefixSize, Constants::e2EeNonceSize);
    const auto decoded = QByteArray::fromBase64Encoding(encrypted.mid(v2HeaderSize), QByteArray::AbortOnBase64DecodingErrors);
    if (!decoded) {
        return DriveError(DriveErrorCode::ParseError, QStringLiteral("v2 metadata is not valid base64"));
    }
    return EncryptionHelper::decryptSymmetric(_derivedBytes, nonce, *decoded);
}

MasterKeyRing::MasterKeyRing(const QVector<MasterKey> &keys)
    : _keys(keys)
{
}

MasterKeyRing MasterKeyRing::fromServerList(const MasterKey &loginKey, const QByteArray &serverKeys)
{
    QVector<MasterKey> keys;
    const auto entries = serverKeys.split('|');
    for (const auto &entry : entries) {
        if (entry.isEmpty()) {
            continue;
        }
        MasterKey key(entry);
        if (key.derivedBytes() == loginKey.derivedBytes()) {
            continue;
        }
        keys.append(key);
    }
    keys.append(loginKey);
    qCInfo(lcMasterKey) << "Master key ring holds" << keys.size() << "keys";
    return MasterKeyRing(keys);
}

QByteArray MasterKeyRing::encryptMeta(const QByteArray &metadata) const
{
    if (_keys.isEmpty()) {
        qCWarning(lcMasterKey) << "Cannot encrypt with an empty master key ring";
        return {};
    }
    return _keys.last().encryptMeta(metadata);
}

DriveResult<QByteArray> MasterKeyRing::decryptMeta(const QByteArray &encrypted) const
{
    if (!MasterKey::isV1Format(encrypted) && !MasterKey::isV2Format(encrypted)) {
        return DriveError(DriveErrorCode::ParseError, QStringLiteral("Unknown metadata format"));
    }

    int attempt = 0;
    for (const auto &key : _keys) {
        ++attempt;
        auto decrypted = key.decryptMeta(encrypted);
        if (decrypted) {
            if (attempt > 1) {
                qCDebug(lcMasterKey) << "Metadata decrypted with master key" << attempt << "of" << _keys.size();
            }
            return decrypted;
        }
        if (decrypted.error().code != DriveErrorCode::KeyMismatch) {
            return decrypted;
        }
    }
    return DriveError(DriveErrorCode::KeyMismatch, QStringLiteral("All %1 master keys failed").arg(_keys.size()));
}

}
