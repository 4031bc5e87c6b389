/*
 * SPDX-FileCopyrightText: 2026 Cipherdrive contributors
 * SPDX-License-Identifier: GPL-2.0-or-later
 */

#include "encryptionkey.h"

#include "clientsideencryption.h"
#include "common/constants.h"

#include <QLoggingCategory>

namespace CDC {

Q_LOGGING_CATEGORY(lcEncryptionKey, "cipherdrive.sync.encryptionkey", QtInfoMsg)

namespace {
constexpr char v3Prefix[] = "003";
constexpr int v3PrefixSize = 3;
constexpr int v3HeaderSize = v3PrefixSize + 2 * Constants::e2EeNonceSize;

bool isHexKey(const QByteArray &key)
{
    if (key.size() != 2 * Constants::symmetricKeySize) {
        return false;
    }
    for (const auto c : key) {
        const bool hexDigit = (c >= '0' && c <= '9') || (c >= 'a' && c <= 'f') || (c >= 'A' && c <= 'F');
        if (!hexDigit) {
            return false;
        }
    }
    return true;
}
}

DriveResult<EncryptionKey> EncryptionKey::generate(int fileEncryptionVersion)
{
    switch (fileEncryptionVersion) {
    case 2:
        return fromBytes(EncryptionHelper::generateRandomString(Constants::symmetricKeySize));
    case 3:
        return fromBytes(EncryptionHelper::generateRandom(Constants::symmetricKeySize));
    default:
        break;
    }
    return DriveError(DriveErrorCode::InvalidArgument, QStringLiteral("Unsupported file encryption version %1").arg(fileEncryptionVersion));
}

DriveResult<EncryptionKey> EncryptionKey::fromBytes(const QByteArray &bytes)
{
    if (bytes.size() != Constants::symmetricKeySize) {
        return DriveError(DriveErrorCode::ParseError, QStringLiteral("Key must be %1 bytes, got %2").arg(Constants::symmetricKeySize).arg(bytes.size()));
    }
    return EncryptionKey(bytes);
}

DriveResult<EncryptionKey> EncryptionKey::fromHexString(const QByteArray &hex)
{
    if (!isHexKey(hex)) {
        return DriveError(DriveErrorCode::ParseError, QStringLiteral("Key is not a 64 character hex string"));
    }
    return fromBytes(QByteArray::fromHex(hex));
}

DriveResult<EncryptionKey> EncryptionKey::fromUnknownString(const QByteArray &key)
{
    switch (key.size()) {
    case Constants::symmetricKeySize:
        return fromBytes(key);
    case 2 * Constants::symmetricKeySize:
        return fromHexString(key);
    default:
        break;
    }
    return DriveError(DriveErrorCode::ParseError, QStringLiteral("Key length %1 is neither 32 nor 64").arg(key.size()));
}

QByteArray EncryptionKey::toString(int fileEncryptionVersion) const
{
    if (fileEncryptionVersion >= 3) {
        return _bytes.toHex();
    }
    return _bytes;
}

QByteArray EncryptionKey::encryptMeta(const QByteArray &metadata) const
{
    const auto nonce = EncryptionHelper::generateRandom(Constants::e2EeNonceSize);
    const auto encrypted = EncryptionHelper::encryptSymmetric(_bytes, nonce, metadata);
    if (!encrypted || nonce.isEmpty()) {
        qCWarning(lcEncryptionKey) << "Could not encrypt metadata";
        return {};
    }
    return QByteArray(v3Prefix) + nonce.toHex() + encrypted->toBase64();
}

DriveResult<QByteArray> EncryptionKey::decryptMeta(const QByteArray &encrypted) const
{
    if (!encrypted.startsWith(v3Prefix)) {
        return DriveError(DriveErrorCode::ParseError, QStringLiteral("Unsupported metadata format %1 (allowed: 003)").arg(QString::fromLatin1(encrypted.left(3))));
    }
    if (encrypted.size() < v3HeaderSize) {
        return DriveError(DriveErrorCode::ParseError, QStringLiteral("v3 metadata too short"));
    }
    const auto nonce = QByteArray::fromHex(encrypted.mid(v3PrefixSize, 2 * Constants::e2EeNonceSize));
    if (nonce.size() != Constants::e2EeNonceSize) {
        return DriveError(DriveErrorCode::ParseError, QStringLiteral("v3 metadata nonce is not hex"));
    }
    const auto decoded = QByteArray::fromBase64Encoding(encrypted.mid(v3HeaderSize), QByteArray::AbortOnBase64DecodingErrors);
    if (!decoded) {
        return DriveError(DriveErrorCode::ParseError, QStringLiteral("v3 metadata is not valid base64"));
    }
    return EncryptionHelper::decryptSymmetric(_bytes, nonce, *decoded);
}

DriveResult<QByteArray> EncryptionKey::encryptData(const QByteArray &data) const
{
    const auto nonce = EncryptionHelper::generateRandom(Constants::e2EeNonceSize);
    if (nonce.isEmpty()) {
        return DriveError(DriveErrorCode::CryptoFailure, QStringLiteral("Could not generate a nonce"));
    }
    const auto encrypted = EncryptionHelper::encryptSymmetric(_bytes, nonce, data);
    if (!encrypted) {
        return encrypted.error();
    }
    return nonce + *encrypted;
}

DriveResult<QByteArray> EncryptionKey::decryptData(const QByteArray &data) const
{
    if (data.size() < Constants::e2EeNonceSize + Constants::e2EeTagSize) {
        return DriveError(DriveErrorCode::ParseError, QStringLiteral("Encrypted chunk too short"));
    }
    return EncryptionHelper::decryptSymmetric(_bytes, data.left(Constants::e2EeNonceSize), data.mid(Constants::e2EeNonceSize));
}

MasterKey EncryptionKey::toMasterKey() const
{
    return MasterKey(_bytes);
}

std::unique_ptr<MetaCrypter> metaCrypterFromKeyString(const QByteArray &key)
{
    if (isHexKey(key)) {
        auto encryptionKey = EncryptionKey::fromHexString(key);
        if (encryptionKey) {
            return std::make_unique<EncryptionKey>(*encryptionKey);
        }
    }
    return std::make_unique<MasterKey>(key);
}

}
