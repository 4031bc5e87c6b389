/*
 * SPDX-FileCopyrightText: 2026 Cipherdrive contributors
 * SPDX-License-Identifier: GPL-2.0-or-later
 */

#include "keyhierarchy.h"

#include "clientsideencryption.h"

#include <QLoggingCategory>

namespace CDC {

Q_LOGGING_CATEGORY(lcKeyHierarchy, "cipherdrive.sync.keyhierarchy", QtInfoMsg)

namespace {
constexpr int currentAuthVersion = 3;
constexpr char v3Prefix[] = "003";
}

KeyHierarchy KeyHierarchy::fromMasterKeyRing(int authVersion, const MasterKeyRing &ring)
{
    KeyHierarchy hierarchy;
    hierarchy._authVersion = authVersion;
    hierarchy._masterKeys = ring;
    return hierarchy;
}

KeyHierarchy KeyHierarchy::fromDataEncryptionKey(const EncryptionKey &dek)
{
    KeyHierarchy hierarchy;
    hierarchy._authVersion = currentAuthVersion;
    hierarchy._dek = dek;
    return hierarchy;
}

DriveResult<KeyHierarchy> KeyHierarchy::unlockMasterKeys(int authVersion, const MasterKey &loginKey, const QByteArray &encryptedServerKeys)
{
    if (authVersion < 1 || authVersion >= currentAuthVersion) {
        return DriveError(DriveErrorCode::InvalidArgument, QStringLiteral("Auth version %1 has no master keys").arg(authVersion));
    }
    const auto serverKeys = loginKey.decryptMeta(encryptedServerKeys);
    if (!serverKeys) {
        qCWarning(lcKeyHierarchy) << "Could not decrypt the master key list" << serverKeys.error();
        return serverKeys.error().wrapped(QStringLiteral("decrypt master keys"));
    }
    return fromMasterKeyRing(authVersion, MasterKeyRing::fromServerList(loginKey, *serverKeys));
}

DriveResult<KeyHierarchy> KeyHierarchy::unlockDataEncryptionKey(const EncryptionKey &kek, const QByteArray &encryptedDek)
{
    const auto dekString = kek.decryptMeta(encryptedDek);
    if (!dekString) {
        qCWarning(lcKeyHierarchy) << "Could not decrypt the data encryption key" << dekString.error();
        return dekString.error().wrapped(QStringLiteral("decrypt DEK"));
    }
    const auto dek = EncryptionKey::fromHexString(*dekString);
    if (!dek) {
        return dek.error().wrapped(QStringLiteral("parse DEK"));
    }
    return fromDataEncryptionKey(*dek);
}

DriveResult<void> KeyHierarchy::setKeyPair(const QByteArray &publicKeyBase64, const QByteArray &encryptedPrivateKey)
{
    const auto privateKeyString = decryptMeta(encryptedPrivateKey);
    if (!privateKeyString) {
        return privateKeyString.error().wrapped(QStringLiteral("decrypt private key"));
    }
    auto privateKey = EncryptionHelper::privateKeyFromBase64(*privateKeyString);
    if (!privateKey) {
        return privateKey.error().wrapped(QStringLiteral("parse private key"));
    }
    const auto publicKey = EncryptionHelper::publicKeyFromBase64(publicKeyBase64);
    if (!publicKey) {
        return publicKey.error().wrapped(QStringLiteral("parse public key"));
    }
    const auto hmacKey = HmacKey::fromPrivateKey(*privateKey);
    if (!hmacKey) {
        return hmacKey.error();
    }

    _privateKey = QSharedPointer<PKey>::create(std::move(*privateKey));
    _publicKey = publicKeyBase64;
    _hmacKey = *hmacKey;
    qCInfo(lcKeyHierarchy) << "Key pair installed";
    return {};
}

bool KeyHierarchy::isValid() const
{
    if (_authVersion >= currentAuthVersion) {
        return _dek.isValid();
    }
    return _authVersion > 0 && !_masterKeys.isEmpty();
}

int KeyHierarchy::metadataEncryptionVersion() const
{
    return _authVersion >= currentAuthVersion ? 3 : 2;
}

int KeyHierarchy::fileEncryptionVersion() const
{
    return _authVersion >= currentAuthVersion ? 3 : 2;
}

QByteArray KeyHierarchy::wrapKey(const EncryptionKey &key) const
{
    return encryptMeta(key.toString(fileEncryptionVersion()));
}

DriveResult<EncryptionKey> KeyHierarchy::unwrapKey(const QByteArray &wrapped) const
{
    const auto keyString = decryptMeta(wrapped);
    if (!keyString) {
        return keyString.error();
    }
    return EncryptionKey::fromUnknownString(*keyString);
}

QByteArray KeyHierarchy::encryptMeta(const QByteArray &metadata) const
{
    if (metadataEncryptionVersion() == 3) {
        return _dek.encryptMeta(metadata);
    }
    return _masterKeys.encryptMeta(metadata);
}

DriveResult<QByteArray> KeyHierarchy::decryptMeta(const QByteArray &encrypted) const
{
    if (MasterKey::isV1Format(encrypted) || MasterKey::isV2Format(encrypted)) {
        if (_masterKeys.isEmpty()) {
            return DriveError(DriveErrorCode::KeyMismatch, QStringLiteral("Legacy metadata but no master keys"));
        }
        return _masterKeys.decryptMeta(encrypted);
    }
    if (encrypted.startsWith(v3Prefix)) {
        if (!_dek.isValid()) {
            return DriveError(DriveErrorCode::KeyMismatch, QStringLiteral("Current metadata but no data encryption key"));
        }
        return _dek.decryptMeta(encrypted);
    }
    return DriveError(DriveErrorCode::ParseError, QStringLiteral("Unknown metadata format"));
}

QByteArray KeyHierarchy::hashFileName(const QString &name) const
{
    const auto lowered = name.toLower().toUtf8();
    if (_authVersion < currentAuthVersion) {
        return EncryptionHelper::v2Hash(lowered);
    }
    return _hmacKey.hash(lowered);
}

EVP_PKEY *KeyHierarchy::privateKey() const
{
    if (!_privateKey) {
        return nullptr;
    }
    return *_privateKey;
}

}
